#pragma once

#include "../Core/Types.hpp"

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace NetGuard {
	namespace Detection {

		struct DecisionOptions {
			double minThreshold = 0.05;   ///< threshold at sensitivity 100
			double maxThreshold = 0.95;   ///< threshold at sensitivity 0
			double observeBand = 0.10;    ///< width of the observe band below the threshold
		};

		/**
		 * @brief Turns a classification into a block/observe/allow verdict.
		 *
		 * Priority: manual overrides, then score >= threshold, then the observe
		 * band [threshold - band, threshold). An override on "example.com" also
		 * covers its subdomains; the longest matching override wins.
		 */
		class DecisionEngine {
		public:
			explicit DecisionEngine(DecisionOptions options = {}, int sensitivity = 50);

			/**
			 * @brief Threshold for @p sensitivity, linear from max (0) down to min (100).
			 * @throws Core::ValidationError outside 0..100
			 */
			[[nodiscard]] static double ThresholdFor(int sensitivity, const DecisionOptions& options);

			/// @throws Core::ValidationError outside 0..100
			void SetSensitivity(int sensitivity);
			[[nodiscard]] int Sensitivity() const noexcept { return m_sensitivity.load(); }
			[[nodiscard]] double Threshold() const;

			void SetOverrides(std::vector<Core::DomainOverride> overrides);
			void UpsertOverride(const Core::DomainOverride& ov);
			void RemoveOverride(const std::string& domain);
			[[nodiscard]] std::optional<Core::DomainOverride> FindOverride(const std::string& domain) const;

			/**
			 * @brief Verdict for @p domain given @p result.
			 *
			 * A manual allow that suppresses a would-be classifier block is flagged
			 * with conflict = true and logged at WARN for operator review.
			 */
			[[nodiscard]] Core::BlockDecision Decide(const std::string& domain, const Core::ClassificationResult& result) const;

			/// Verdict from the score alone, ignoring overrides
			[[nodiscard]] Core::Verdict ScoreVerdict(double score) const;

		private:
			DecisionOptions m_options;
			std::atomic<int> m_sensitivity;

			mutable std::shared_mutex m_overrideMutex;
			std::vector<Core::DomainOverride> m_overrides;
		};

	}  // namespace Detection
}  // namespace NetGuard
