/**
 * ============================================================================
 * NetGuard ConnectionSource / BandwidthMonitor Unit Tests
 * ============================================================================
 *
 * Both readers are pointed at a fabricated proc tree.
 */

#include "../../../src/Monitoring/BandwidthMonitor.hpp"
#include "../../../src/Monitoring/ConnectionSource.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace NetGuard;
using namespace NetGuard::Monitoring;

namespace {

	const char* TCP_HEADER =
		"  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n";

	// rem 93.184.216.34:443 established, inode 22222
	const char* ROW_PUBLIC =
		"   0: 0F02000A:C350 22D8B85D:01BB 01 00000000:00000000 00:00000000 00000000  1000        0 22222 1 0 20 4 30 10 -1\n";
	// rem 192.168.1.20:443 established
	const char* ROW_PRIVATE =
		"   1: 0F02000A:C351 1401A8C0:01BB 01 00000000:00000000 00:00000000 00000000  1000        0 33333 1 0 20 4 30 10 -1\n";
	// listening socket
	const char* ROW_LISTEN =
		"   2: 0100007F:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 44444 1 0 100 0 0 10 0\n";
	// rem 127.0.0.1:5432 established
	const char* ROW_LOOPBACK =
		"   3: 0100007F:C352 0100007F:1538 01 00000000:00000000 00:00000000 00000000  1000        0 55555 1 0 20 4 30 10 -1\n";

	std::string DevTable(uint64_t rx, uint64_t tx) {
		return "Inter-|   Receive                                                |  Transmit\n"
			" face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
			"    lo: 9999      9    0    0    0     0          0         0     9999      9    0    0    0     0       0          0\n"
			"  eth0: " + std::to_string(rx) + "      10    0    0    0     0          0         0     " + std::to_string(tx) +
			"      20    0    0    0     0       0          0\n";
	}

	class ProcTreeTest : public ::testing::Test {
	protected:
		ProcTreeTest() : proc("proc") {}

		void SetUp() override {
			std::filesystem::create_directories(proc / "net");
		}

		Testing::TempDir proc;
	};

}  // namespace

// ============================================================================
// ProcNetConnectionSource
// ============================================================================

/**
 * @brief Only established public remote endpoints are reported, with their owner
 */
TEST_F(ProcTreeTest, EnumeratesPublicEstablishedConnections) {
	Testing::WriteFile(proc / "net" / "tcp",
		std::string(TCP_HEADER) + ROW_PUBLIC + ROW_PRIVATE + ROW_LISTEN + ROW_LOOPBACK);
	std::filesystem::create_directories(proc / "4242" / "fd");
	std::filesystem::create_symlink("socket:[22222]", proc / "4242" / "fd" / "7");
	Testing::WriteFile(proc / "4242" / "comm", "firefox\n");

	ProcNetSourceOptions options;
	options.procRoot = proc.Path();
	options.resolveHostnames = false;
	ProcNetConnectionSource source(options);

	const auto connections = source.Enumerate();
	ASSERT_EQ(connections.size(), 1u);
	EXPECT_EQ(connections[0].remoteAddress, "93.184.216.34");
	EXPECT_EQ(connections[0].remotePort, 443);
	EXPECT_EQ(connections[0].processId, 4242u);
	EXPECT_EQ(connections[0].processName, "firefox");
	EXPECT_EQ(connections[0].protocol, "tcp");
	EXPECT_TRUE(connections[0].remoteHost.empty());
	EXPECT_EQ(source.CachedHostnames(), 0u);
}

/**
 * @brief Private addresses are kept when filtering is disabled
 */
TEST_F(ProcTreeTest, PrivateAddressesOptional) {
	Testing::WriteFile(proc / "net" / "tcp", std::string(TCP_HEADER) + ROW_PUBLIC + ROW_PRIVATE);

	ProcNetSourceOptions options;
	options.procRoot = proc.Path();
	options.resolveHostnames = false;
	options.skipPrivateAddresses = false;
	ProcNetConnectionSource source(options);

	const auto connections = source.Enumerate();
	ASSERT_EQ(connections.size(), 2u);
	EXPECT_EQ(connections[1].remoteAddress, "192.168.1.20");
	EXPECT_EQ(connections[1].processId, 0u);
	EXPECT_TRUE(connections[1].processName.empty());
}

/**
 * @brief A missing connection table is a storage error
 */
TEST_F(ProcTreeTest, MissingTableThrows) {
	ProcNetSourceOptions options;
	options.procRoot = proc / "absent";
	ProcNetConnectionSource source(options);
	EXPECT_THROW(source.Enumerate(), Core::StorageError);
}

// ============================================================================
// BandwidthMonitor
// ============================================================================

/**
 * @brief First sample primes the baseline, the second reports throughput
 */
TEST_F(ProcTreeTest, BandwidthFromSuccessiveSamples) {
	Testing::WriteFile(proc / "net" / "dev", DevTable(1000, 2000));
	BandwidthMonitor monitor(proc.Path());

	const auto first = monitor.Sample(3);
	EXPECT_EQ(first.bytesReceived, 1000u);
	EXPECT_EQ(first.bytesSent, 2000u);
	EXPECT_EQ(first.activeConnections, 3u);
	EXPECT_DOUBLE_EQ(first.mbps, 0.0);

	std::this_thread::sleep_for(std::chrono::milliseconds(20));
	Testing::WriteFile(proc / "net" / "dev", DevTable(501000, 502000));
	const auto second = monitor.Sample(3);
	EXPECT_GT(second.mbps, 0.0);
	EXPECT_DOUBLE_EQ(monitor.CurrentMbps(), second.mbps);

	// counters going backwards restart the baseline
	std::this_thread::sleep_for(std::chrono::milliseconds(5));
	Testing::WriteFile(proc / "net" / "dev", DevTable(10, 10));
	EXPECT_DOUBLE_EQ(monitor.Sample(0).mbps, 0.0);
}

/**
 * @brief Unreadable counters raise StorageError
 */
TEST_F(ProcTreeTest, BandwidthMissingCounters) {
	BandwidthMonitor monitor(proc.Path());
	EXPECT_THROW(monitor.Sample(0), Core::StorageError);
}

// ============================================================================
// CaptureBuffer
// ============================================================================

namespace {

	std::shared_ptr<const Core::CapturedTransaction> Capture(const std::string& url, Core::Timestamp at) {
		auto tx = std::make_shared<Core::CapturedTransaction>();
		tx->url = url;
		tx->timestamp = at;
		return tx;
	}

}  // namespace

/**
 * @brief Capacity evicts the oldest capture first
 */
TEST(CaptureBufferTest, CapacityBound) {
	CaptureBuffer buffer(2, std::chrono::minutes(10));
	const auto now = Core::Clock::now();
	buffer.Add(Capture("http://a/", now));
	buffer.Add(Capture("http://b/", now));
	buffer.Add(Capture("http://c/", now));
	buffer.Add(nullptr);

	const auto items = buffer.Snapshot();
	ASSERT_EQ(items.size(), 2u);
	EXPECT_EQ(items[0]->url, "http://b/");
	EXPECT_EQ(items[1]->url, "http://c/");
	EXPECT_EQ(buffer.TotalAdded(), 3u);
}

/**
 * @brief Entries older than the window are pruned
 */
TEST(CaptureBufferTest, WindowPrune) {
	CaptureBuffer buffer(10, std::chrono::minutes(10));
	const auto now = Core::Clock::now();
	buffer.Add(Capture("http://old/", now - std::chrono::minutes(20)));
	EXPECT_EQ(buffer.Size(), 0u);

	buffer.Add(Capture("http://recent/", now));
	EXPECT_EQ(buffer.Size(), 1u);
	buffer.Prune(now + std::chrono::minutes(11));
	EXPECT_EQ(buffer.Size(), 0u);
	EXPECT_EQ(buffer.TotalAdded(), 2u);
}
