#pragma once

#include "Errors.hpp"
#include "Types.hpp"
#include "../Detection/DecisionEngine.hpp"
#include "../Detection/NaiveBayesClassifier.hpp"
#include "../Utils/BoundedQueue.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace NetGuard {
	namespace Core {

		struct DetectionRequest {
			std::string domain;       ///< normalized; routing key and enforcement target
			std::string subject;      ///< domain or URL recorded with the result
			std::string text;         ///< extractor input
			std::string source;       ///< "sampler", "interceptor", "manual"
			Timestamp enqueuedAt{};
		};

		struct DetectionOutcome {
			DetectionRequest request;
			ClassificationResult result;
			BlockDecision decision;
		};

		struct PipelineOptions {
			size_t lanes = 4;
			size_t laneCapacity = 256;
			size_t writerCapacity = 1024;
			size_t topTerms = 5;
		};

		/**
		 * @brief Classification lanes feeding a single writer.
		 *
		 * A request is routed to lane hash(domain) % lanes, so decisions for one
		 * domain are produced in submission order while different domains
		 * classify in parallel. Every lane hands its outcome to one writer
		 * thread which calls the commit function; commits are therefore never
		 * concurrent.
		 */
		class DetectionPipeline {
		public:
			using CommitFunction = std::function<void(const DetectionOutcome&)>;
			using ErrorCallback = std::function<void(const NetGuardError&)>;

			DetectionPipeline(const Detection::NaiveBayesClassifier& classifier,
				const Detection::DecisionEngine& decisions, PipelineOptions options);
			~DetectionPipeline();

			DetectionPipeline(const DetectionPipeline&) = delete;
			DetectionPipeline& operator=(const DetectionPipeline&) = delete;

			void SetCommitFunction(CommitFunction commit) { m_commit = std::move(commit); }
			void SetErrorCallback(ErrorCallback callback) { m_onError = std::move(callback); }

			void Start();

			/// Closes the lanes, lets queued requests finish and joins every thread.
			void Stop();

			/**
			 * @brief Queues @p request without blocking.
			 * @return false when the lane is full or the pipeline is stopped; a
			 *         full lane is reported as CaptureTimeout
			 */
			bool Submit(DetectionRequest request);

			/// Classifies and decides on the caller's thread.
			[[nodiscard]] DetectionOutcome Evaluate(const DetectionRequest& request) const;

			[[nodiscard]] size_t LaneFor(const std::string& domain) const noexcept;
			[[nodiscard]] bool IsRunning() const noexcept { return m_running.load(); }
			[[nodiscard]] uint64_t Processed() const noexcept { return m_processed.load(); }
			[[nodiscard]] uint64_t Dropped() const noexcept { return m_dropped.load(); }

		private:
			void laneLoop(size_t index);
			void writerLoop();
			void report(const NetGuardError& error);

			const Detection::NaiveBayesClassifier& m_classifier;
			const Detection::DecisionEngine& m_decisions;
			PipelineOptions m_options;

			CommitFunction m_commit;
			ErrorCallback m_onError;

			std::vector<std::unique_ptr<Utils::BoundedQueue<DetectionRequest>>> m_lanes;
			std::unique_ptr<Utils::BoundedQueue<DetectionOutcome>> m_writerQueue;
			std::vector<std::thread> m_laneThreads;
			std::thread m_writerThread;

			std::atomic<bool> m_running{ false };
			std::atomic<uint64_t> m_processed{ 0 };
			std::atomic<uint64_t> m_dropped{ 0 };
		};

	}  // namespace Core
}  // namespace NetGuard
