#include "DecisionEngine.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"

#include <algorithm>

namespace NetGuard {
	namespace Detection {

		DecisionEngine::DecisionEngine(DecisionOptions options, int sensitivity)
			: m_options(options), m_sensitivity(50) {
			SetSensitivity(sensitivity);
		}

		double DecisionEngine::ThresholdFor(int sensitivity, const DecisionOptions& options) {
			if (sensitivity < 0 || sensitivity > 100) {
				throw Core::ValidationError("decision", "sensitivity must be within 0..100, got " + std::to_string(sensitivity));
			}
			const double span = options.maxThreshold - options.minThreshold;
			return options.maxThreshold - span * (static_cast<double>(sensitivity) / 100.0);
		}

		void DecisionEngine::SetSensitivity(int sensitivity) {
			(void)ThresholdFor(sensitivity, m_options);
			m_sensitivity.store(sensitivity);
		}

		double DecisionEngine::Threshold() const {
			return ThresholdFor(m_sensitivity.load(), m_options);
		}

		void DecisionEngine::SetOverrides(std::vector<Core::DomainOverride> overrides) {
			std::unique_lock<std::shared_mutex> lock(m_overrideMutex);
			m_overrides = std::move(overrides);
		}

		void DecisionEngine::UpsertOverride(const Core::DomainOverride& ov) {
			std::unique_lock<std::shared_mutex> lock(m_overrideMutex);
			auto it = std::find_if(m_overrides.begin(), m_overrides.end(),
				[&](const Core::DomainOverride& o) { return o.domain == ov.domain; });
			if (it != m_overrides.end()) *it = ov;
			else m_overrides.push_back(ov);
		}

		void DecisionEngine::RemoveOverride(const std::string& domain) {
			std::unique_lock<std::shared_mutex> lock(m_overrideMutex);
			m_overrides.erase(std::remove_if(m_overrides.begin(), m_overrides.end(),
				[&](const Core::DomainOverride& o) { return o.domain == domain; }), m_overrides.end());
		}

		std::optional<Core::DomainOverride> DecisionEngine::FindOverride(const std::string& domain) const {
			std::shared_lock<std::shared_mutex> lock(m_overrideMutex);
			const Core::DomainOverride* best = nullptr;
			for (const auto& ov : m_overrides) {
				if (!Utils::NetworkUtils::DomainMatches(domain, ov.domain)) continue;
				if (!best || ov.domain.size() > best->domain.size()) best = &ov;
			}
			if (!best) return std::nullopt;
			return *best;
		}

		Core::Verdict DecisionEngine::ScoreVerdict(double score) const {
			const double threshold = Threshold();
			if (score >= threshold) return Core::Verdict::Block;
			if (score >= threshold - m_options.observeBand) return Core::Verdict::Observe;
			return Core::Verdict::Allow;
		}

		Core::BlockDecision DecisionEngine::Decide(const std::string& domain, const Core::ClassificationResult& result) const {
			Core::BlockDecision d;
			d.domain = domain;
			d.score = result.score;
			d.timestamp = Core::Clock::now();

			const Core::Verdict fromScore = ScoreVerdict(result.score);

			if (auto ov = FindOverride(domain)) {
				if (ov->kind == Core::OverrideKind::Block) {
					d.verdict = Core::Verdict::Block;
					d.reason = Core::DecisionReason::ManualBlock;
				}
				else {
					d.verdict = Core::Verdict::Allow;
					d.reason = Core::DecisionReason::ManualAllow;
					if (fromScore == Core::Verdict::Block) {
						d.conflict = true;
						NG_LOG_WARN("Decision", "Conflict on %s: manual allow (%s) overrides classifier block, score %.3f >= %.3f",
							domain.c_str(), ov->domain.c_str(), result.score, Threshold());
					}
				}
				return d;
			}

			d.verdict = fromScore;
			d.reason = Core::DecisionReason::Classifier;
			return d;
		}

	}  // namespace Detection
}  // namespace NetGuard
