/**
 * ============================================================================
 * NetGuard DetectionPipeline Unit Tests
 * ============================================================================
 */

#include "../../../src/Core/DetectionPipeline.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>

using namespace NetGuard;
using namespace NetGuard::Core;

namespace {

	class DetectionPipelineTest : public ::testing::Test {
	protected:
		void SetUp() override {
			extractor = std::make_shared<const Detection::FeatureExtractor>(std::make_shared<const Detection::Lexicon>());
			classifier = std::make_unique<Detection::NaiveBayesClassifier>(extractor);
			decisions = std::make_unique<Detection::DecisionEngine>(Detection::DecisionOptions{}, 50);
		}

		void Train() {
			classifier->Train({
				{ "casino jackpot slots bonus", Label::Gambling },
				{ "togel judi bandar", Label::Gambling },
				{ "library research papers", Label::Benign },
				{ "weather news forecast", Label::Benign }
			});
		}

		std::unique_ptr<DetectionPipeline> Make(PipelineOptions options = {}) {
			auto pipeline = std::make_unique<DetectionPipeline>(*classifier, *decisions, options);
			pipeline->SetCommitFunction([this](const DetectionOutcome& outcome) {
				std::lock_guard<std::mutex> lock(mutex);
				committed.push_back(outcome);
			});
			pipeline->SetErrorCallback([this](const NetGuardError& e) {
				std::lock_guard<std::mutex> lock(mutex);
				errors.push_back(e.kind());
			});
			return pipeline;
		}

		static DetectionRequest Request(const std::string& domain, const std::string& text) {
			DetectionRequest request;
			request.domain = domain;
			request.subject = domain;
			request.text = text;
			request.source = "sampler";
			return request;
		}

		size_t CommittedCount() {
			std::lock_guard<std::mutex> lock(mutex);
			return committed.size();
		}

		std::shared_ptr<const Detection::FeatureExtractor> extractor;
		std::unique_ptr<Detection::NaiveBayesClassifier> classifier;
		std::unique_ptr<Detection::DecisionEngine> decisions;

		std::mutex mutex;
		std::vector<DetectionOutcome> committed;
		std::vector<ErrorKind> errors;
	};

}  // namespace

/**
 * @brief Evaluate runs classification and decision synchronously
 */
TEST_F(DetectionPipelineTest, EvaluateOnCallerThread) {
	Train();
	auto pipeline = Make();
	const auto outcome = pipeline->Evaluate(Request("spin.example", "casino jackpot bonus"));
	EXPECT_EQ(outcome.decision.domain, "spin.example");
	EXPECT_EQ(outcome.decision.verdict, Verdict::Block);
	EXPECT_EQ(outcome.result.subject, "spin.example");
	EXPECT_EQ(outcome.result.modelVersion, 1u);
	EXPECT_FALSE(outcome.result.topTerms.empty());
	EXPECT_EQ(CommittedCount(), 0u);
}

/**
 * @brief Submit before Start is refused without an error report
 */
TEST_F(DetectionPipelineTest, SubmitRequiresStart) {
	Train();
	auto pipeline = Make();
	EXPECT_FALSE(pipeline->Submit(Request("a.example", "casino")));
	EXPECT_TRUE(errors.empty());
}

/**
 * @brief Lane assignment is stable and in range
 */
TEST_F(DetectionPipelineTest, LaneAssignmentIsStable) {
	PipelineOptions options;
	options.lanes = 3;
	auto pipeline = Make(options);
	for (const char* d : { "a.example", "b.example", "casino.example", "news.example" }) {
		const size_t lane = pipeline->LaneFor(d);
		EXPECT_LT(lane, 3u);
		EXPECT_EQ(lane, pipeline->LaneFor(d));
	}

	PipelineOptions zero;
	zero.lanes = 0;
	auto single = Make(zero);
	EXPECT_EQ(single->LaneFor("anything.example"), 0u);
}

/**
 * @brief Decisions for one domain are committed in submission order
 */
TEST_F(DetectionPipelineTest, PerDomainOrderPreserved) {
	Train();
	auto pipeline = Make();
	pipeline->Start();
	ASSERT_TRUE(pipeline->IsRunning());

	constexpr int PER_DOMAIN = 40;
	for (int i = 0; i < PER_DOMAIN; ++i) {
		for (const char* domain : { "one.example", "two.example", "three.example" }) {
			auto request = Request(domain, i % 2 ? "casino jackpot" : "library news");
			request.subject = std::string(domain) + "/" + std::to_string(i);
			ASSERT_TRUE(pipeline->Submit(std::move(request)));
		}
	}
	pipeline->Stop();
	EXPECT_FALSE(pipeline->IsRunning());

	ASSERT_EQ(CommittedCount(), 3u * PER_DOMAIN);
	EXPECT_EQ(pipeline->Processed(), 3u * PER_DOMAIN);

	std::map<std::string, int> next;
	for (const auto& outcome : committed) {
		const std::string& subject = outcome.result.subject;
		const int index = std::stoi(subject.substr(subject.find('/') + 1));
		EXPECT_EQ(index, next[outcome.request.domain]++) << subject;
	}
}

/**
 * @brief Stop drains requests that were already queued
 */
TEST_F(DetectionPipelineTest, StopDrainsQueue) {
	Train();
	auto pipeline = Make();
	pipeline->Start();
	for (int i = 0; i < 100; ++i) {
		ASSERT_TRUE(pipeline->Submit(Request("d" + std::to_string(i) + ".example", "casino")));
	}
	pipeline->Stop();
	EXPECT_EQ(CommittedCount(), 100u);
	EXPECT_FALSE(pipeline->Submit(Request("late.example", "casino")));

	// restart after stop
	pipeline->Start();
	EXPECT_TRUE(pipeline->Submit(Request("again.example", "casino")));
	pipeline->Stop();
	EXPECT_EQ(CommittedCount(), 101u);
}

/**
 * @brief A full lane drops the request and reports CaptureTimeout
 */
TEST_F(DetectionPipelineTest, FullLaneDropsAndReports) {
	Train();
	PipelineOptions options;
	options.lanes = 1;
	options.laneCapacity = 1;
	options.writerCapacity = 1;
	auto pipeline = std::make_unique<DetectionPipeline>(*classifier, *decisions, options);

	std::mutex gateMutex;
	std::condition_variable gateCv;
	bool open = false;
	pipeline->SetCommitFunction([&](const DetectionOutcome&) {
		std::unique_lock<std::mutex> lock(gateMutex);
		gateCv.wait(lock, [&] { return open; });
	});
	std::vector<ErrorKind> reported;
	std::mutex reportedMutex;
	pipeline->SetErrorCallback([&](const NetGuardError& e) {
		std::lock_guard<std::mutex> lock(reportedMutex);
		reported.push_back(e.kind());
	});
	pipeline->Start();

	bool rejected = false;
	for (int i = 0; i < 50 && !rejected; ++i) {
		rejected = !pipeline->Submit(Request("busy.example", "casino"));
		if (!rejected) std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	EXPECT_TRUE(rejected);
	EXPECT_GE(pipeline->Dropped(), 1u);
	{
		std::lock_guard<std::mutex> lock(reportedMutex);
		ASSERT_FALSE(reported.empty());
		EXPECT_EQ(reported[0], ErrorKind::CaptureTimeout);
	}

	{
		std::lock_guard<std::mutex> lock(gateMutex);
		open = true;
	}
	gateCv.notify_all();
	pipeline->Stop();
}

/**
 * @brief Classification failures are reported and the lane keeps running
 */
TEST_F(DetectionPipelineTest, UntrainedModelReportsInsufficientData) {
	auto pipeline = Make();
	pipeline->Start();
	ASSERT_TRUE(pipeline->Submit(Request("early.example", "casino")));
	ASSERT_TRUE(Testing::WaitUntil([&] {
		std::lock_guard<std::mutex> lock(mutex);
		return !errors.empty();
	}));
	{
		std::lock_guard<std::mutex> lock(mutex);
		EXPECT_EQ(errors[0], ErrorKind::InsufficientData);
	}

	Train();
	ASSERT_TRUE(pipeline->Submit(Request("later.example", "casino")));
	pipeline->Stop();
	EXPECT_EQ(CommittedCount(), 1u);
}

/**
 * @brief Commit exceptions are reported and do not stop the writer
 */
TEST_F(DetectionPipelineTest, CommitFailureIsReported) {
	Train();
	auto pipeline = Make();
	int calls = 0;
	pipeline->SetCommitFunction([&](const DetectionOutcome& outcome) {
		++calls;
		if (outcome.request.domain == "bad.example") throw StorageError("commit", "bad.example", "disk full");
	});
	pipeline->Start();
	pipeline->Submit(Request("bad.example", "casino"));
	pipeline->Submit(Request("good.example", "casino"));
	pipeline->Stop();

	EXPECT_EQ(calls, 2);
	EXPECT_EQ(pipeline->Processed(), 1u);
	std::lock_guard<std::mutex> lock(mutex);
	ASSERT_EQ(errors.size(), 1u);
	EXPECT_EQ(errors[0], ErrorKind::Storage);
}
