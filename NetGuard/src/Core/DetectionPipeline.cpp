#include "DetectionPipeline.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace NetGuard {
	namespace Core {

		DetectionPipeline::DetectionPipeline(const Detection::NaiveBayesClassifier& classifier,
			const Detection::DecisionEngine& decisions, PipelineOptions options)
			: m_classifier(classifier), m_decisions(decisions), m_options(options) {
			if (m_options.lanes == 0) m_options.lanes = 1;
		}

		DetectionPipeline::~DetectionPipeline() {
			Stop();
		}

		void DetectionPipeline::Start() {
			if (m_running.load()) return;

			m_lanes.clear();
			for (size_t i = 0; i < m_options.lanes; ++i) {
				m_lanes.push_back(std::make_unique<Utils::BoundedQueue<DetectionRequest>>(m_options.laneCapacity));
			}
			m_writerQueue = std::make_unique<Utils::BoundedQueue<DetectionOutcome>>(m_options.writerCapacity);

			m_writerThread = std::thread(&DetectionPipeline::writerLoop, this);
			for (size_t i = 0; i < m_options.lanes; ++i) {
				m_laneThreads.emplace_back(&DetectionPipeline::laneLoop, this, i);
			}
			m_running.store(true);
			NG_LOG_DEBUG("Pipeline", "Started %zu classification lanes", m_options.lanes);
		}

		void DetectionPipeline::Stop() {
			if (!m_running.exchange(false)) return;

			for (auto& lane : m_lanes) lane->close();
			for (auto& t : m_laneThreads) {
				if (t.joinable()) t.join();
			}
			m_laneThreads.clear();

			m_writerQueue->close();
			if (m_writerThread.joinable()) m_writerThread.join();

			NG_LOG_DEBUG("Pipeline", "Drained: %llu processed, %llu dropped",
				static_cast<unsigned long long>(m_processed.load()), static_cast<unsigned long long>(m_dropped.load()));
		}

		size_t DetectionPipeline::LaneFor(const std::string& domain) const noexcept {
			return static_cast<size_t>(Utils::StringUtils::StableHash(domain) % m_options.lanes);
		}

		bool DetectionPipeline::Submit(DetectionRequest request) {
			if (!m_running.load()) return false;
			if (request.enqueuedAt == Timestamp{}) request.enqueuedAt = Clock::now();

			const size_t lane = LaneFor(request.domain);
			const std::string domain = request.domain;
			if (m_lanes[lane]->try_push(std::move(request))) return true;
			if (m_lanes[lane]->closed()) return false;

			m_dropped.fetch_add(1);
			report(CaptureTimeout("classify", domain,
				"classification lane " + std::to_string(lane) + " is full; request dropped"));
			return false;
		}

		DetectionOutcome DetectionPipeline::Evaluate(const DetectionRequest& request) const {
			DetectionOutcome outcome;
			outcome.request = request;
			outcome.result = m_classifier.Classify(request.subject.empty() ? request.domain : request.subject,
				request.text, m_options.topTerms);
			outcome.decision = m_decisions.Decide(request.domain, outcome.result);
			return outcome;
		}

		void DetectionPipeline::laneLoop(size_t index) {
			auto& lane = *m_lanes[index];
			while (auto request = lane.pop()) {
				try {
					DetectionOutcome outcome = Evaluate(*request);
					if (!m_writerQueue->push(std::move(outcome))) {
						NG_LOG_WARN("Pipeline", "Writer closed; dropped decision for %s", request->domain.c_str());
					}
				}
				catch (const NetGuardError& e) {
					report(e);
				}
				catch (const std::exception& e) {
					report(NetGuardError(ErrorKind::Internal, "classify", request->domain, e.what()));
				}
			}
		}

		void DetectionPipeline::writerLoop() {
			while (auto outcome = m_writerQueue->pop()) {
				try {
					if (m_commit) m_commit(*outcome);
					m_processed.fetch_add(1);
				}
				catch (const NetGuardError& e) {
					report(e);
				}
				catch (const std::exception& e) {
					report(NetGuardError(ErrorKind::Internal, "commit", outcome->request.domain, e.what()));
				}
			}
		}

		void DetectionPipeline::report(const NetGuardError& error) {
			if (m_onError) {
				m_onError(error);
			}
			else {
				NG_LOG_WARN("Pipeline", "[%s] %s: %s", ErrorKindToString(error.kind()), error.domain().c_str(), error.what());
			}
		}

	}  // namespace Core
}  // namespace NetGuard
