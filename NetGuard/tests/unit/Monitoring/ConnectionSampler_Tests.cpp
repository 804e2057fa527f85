/**
 * ============================================================================
 * NetGuard ConnectionSampler Unit Tests
 * ============================================================================
 */

#include "../../../src/Monitoring/ConnectionSampler.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <vector>

using namespace NetGuard;
using namespace NetGuard::Monitoring;
using namespace std::chrono_literals;

namespace {

	class ConnectionSamplerTest : public ::testing::Test {
	protected:
		void SetUp() override {
			source = std::make_shared<Testing::FakeConnectionSource>();
			options.pollInterval = 50ms;
			options.idleTimeout = 10s;
			options.passBudget = 500ms;
			options.reanalysisCooldown = 60s;
		}

		std::unique_ptr<ConnectionSampler> Make() {
			auto sampler = std::make_unique<ConnectionSampler>(source, options);
			sampler->SetEventCallback([this](const ConnectionEvent& ev) {
				std::lock_guard<std::mutex> lock(mutex);
				events.push_back(ev);
			});
			sampler->SetErrorCallback([this](const Core::NetGuardError& e) {
				std::lock_guard<std::mutex> lock(mutex);
				errors.push_back(e.kind());
			});
			return sampler;
		}

		size_t Count(ConnectionEvent::Type type) {
			std::lock_guard<std::mutex> lock(mutex);
			size_t n = 0;
			for (const auto& ev : events) if (ev.type == type) ++n;
			return n;
		}

		std::shared_ptr<Testing::FakeConnectionSource> source;
		SamplerOptions options;
		std::mutex mutex;
		std::vector<ConnectionEvent> events;
		std::vector<Core::ErrorKind> errors;
	};

}  // namespace

// ============================================================================
// DIFFING
// ============================================================================

/**
 * @brief New connections are reported once, repeats only refresh lastSeen
 */
TEST_F(ConnectionSamplerTest, ReportsNewConnectionsOnce) {
	auto sampler = Make();
	source->SetConnections({
		Testing::MakeConnection("93.184.216.34", "example.com"),
		Testing::MakeConnection("1.1.1.1", "")
	});

	const auto t0 = Core::Clock::now();
	EXPECT_EQ(sampler->Tick(t0), ConnectionSampler::TickResult::Completed);
	EXPECT_EQ(Count(ConnectionEvent::Type::New), 2u);

	EXPECT_EQ(sampler->Tick(t0 + 1s), ConnectionSampler::TickResult::Completed);
	EXPECT_EQ(Count(ConnectionEvent::Type::New), 2u);
	EXPECT_EQ(sampler->ActiveCount(), 2u);
	EXPECT_EQ(sampler->ObservedCount(), 2u);

	for (const auto& c : sampler->Snapshot()) {
		EXPECT_EQ(c.firstSeen, t0);
		EXPECT_EQ(c.lastSeen, t0 + 1s);
	}
}

/**
 * @brief Same endpoint from a different process is a distinct connection
 */
TEST_F(ConnectionSamplerTest, KeyIncludesProcess) {
	auto sampler = Make();
	source->SetConnections({
		Testing::MakeConnection("8.8.8.8", "dns.google", 443, 100),
		Testing::MakeConnection("8.8.8.8", "dns.google", 443, 200)
	});
	sampler->Tick();
	EXPECT_EQ(sampler->ActiveCount(), 2u);
}

/**
 * @brief Connections unseen for longer than the idle timeout are evicted
 */
TEST_F(ConnectionSamplerTest, EvictsIdleConnections) {
	auto sampler = Make();
	const auto t0 = Core::Clock::now();
	source->SetConnections({ Testing::MakeConnection("5.5.5.5", "gone.example") });
	sampler->Tick(t0);

	source->SetConnections({});
	sampler->Tick(t0 + 5s);
	EXPECT_EQ(sampler->ActiveCount(), 1u);

	sampler->Tick(t0 + 11s);
	EXPECT_EQ(sampler->ActiveCount(), 0u);
	EXPECT_EQ(Count(ConnectionEvent::Type::Closed), 1u);
}

/**
 * @brief A late reverse-DNS result fills in the hostname of a known connection
 */
TEST_F(ConnectionSamplerTest, FillsHostnameLater) {
	auto sampler = Make();
	const auto t0 = Core::Clock::now();
	source->SetConnections({ Testing::MakeConnection("7.7.7.7", "") });
	sampler->Tick(t0);
	source->SetConnections({ Testing::MakeConnection("7.7.7.7", "late.example") });
	sampler->Tick(t0 + 1s);

	const auto snap = sampler->Snapshot();
	ASSERT_EQ(snap.size(), 1u);
	EXPECT_EQ(snap[0].remoteHost, "late.example");
	EXPECT_EQ(snap[0].Subject(), "late.example");
}

// ============================================================================
// TIMEOUTS
// ============================================================================

/**
 * @brief A pass over budget reports CaptureTimeout and blocks overlapping passes
 */
TEST_F(ConnectionSamplerTest, SlowPassTimesOutAndSkips) {
	options.passBudget = 30ms;
	auto sampler = Make();
	source->SetConnections({ Testing::MakeConnection("9.9.9.9", "slow.example") });
	source->SetDelay(300ms);

	EXPECT_EQ(sampler->Tick(), ConnectionSampler::TickResult::TimedOut);
	EXPECT_TRUE(sampler->PassInFlight());
	EXPECT_EQ(sampler->Tick(), ConnectionSampler::TickResult::Skipped);
	EXPECT_EQ(sampler->TimedOutPasses(), 1u);
	EXPECT_EQ(sampler->SkippedPasses(), 1u);

	// the abandoned result is discarded
	ASSERT_TRUE(Testing::WaitUntil([&] { return !sampler->PassInFlight(); }));
	EXPECT_EQ(sampler->ActiveCount(), 0u);
	{
		std::lock_guard<std::mutex> lock(mutex);
		ASSERT_EQ(errors.size(), 1u);
		EXPECT_EQ(errors[0], Core::ErrorKind::CaptureTimeout);
	}

	source->SetDelay(0ms);
	EXPECT_EQ(sampler->Tick(), ConnectionSampler::TickResult::Completed);
	EXPECT_EQ(sampler->ActiveCount(), 1u);
}

// ============================================================================
// COOLDOWN & LIFECYCLE
// ============================================================================

/**
 * @brief Re-analysis of a host is gated by the cooldown window
 */
TEST_F(ConnectionSamplerTest, ReanalysisCooldown) {
	auto sampler = Make();
	const auto t0 = Core::Clock::now();
	EXPECT_TRUE(sampler->ShouldAnalyze("example.com", t0));
	EXPECT_FALSE(sampler->ShouldAnalyze("example.com", t0 + 30s));
	EXPECT_TRUE(sampler->ShouldAnalyze("other.example", t0 + 30s));
	EXPECT_TRUE(sampler->ShouldAnalyze("example.com", t0 + 61s));
}

/**
 * @brief The polling thread samples on its own and stops cleanly
 */
TEST_F(ConnectionSamplerTest, StartStop) {
	auto sampler = Make();
	source->SetConnections({ Testing::MakeConnection("4.4.4.4", "poll.example") });

	sampler->Start();
	sampler->Start();
	EXPECT_TRUE(sampler->IsRunning());
	ASSERT_TRUE(Testing::WaitUntil([&] { return source->Calls() >= 2; }));
	EXPECT_EQ(Count(ConnectionEvent::Type::New), 1u);

	sampler->Stop();
	EXPECT_FALSE(sampler->IsRunning());
	const int calls = source->Calls();
	std::this_thread::sleep_for(150ms);
	EXPECT_EQ(source->Calls(), calls);
	sampler->Stop();
}
