#pragma once

#include "Errors.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace NetGuard {
	namespace Core {

		using Clock = std::chrono::system_clock;
		using Timestamp = Clock::time_point;

		[[nodiscard]] int64_t ToEpochMillis(Timestamp t) noexcept;
		[[nodiscard]] Timestamp FromEpochMillis(int64_t ms) noexcept;
		/// "2026-03-01T12:00:00.000Z"
		[[nodiscard]] std::string FormatTimestamp(Timestamp t);

		// ============================================================================
		// Enumerations
		// ============================================================================

		enum class Label : uint8_t {
			Benign = 0,
			Gambling = 1
		};

		enum class Verdict : uint8_t {
			Allow = 0,
			Observe = 1,
			Block = 2
		};

		enum class DecisionReason : uint8_t {
			Classifier = 0,
			ManualAllow = 1,
			ManualBlock = 2
		};

		enum class SiteSource : uint8_t {
			Auto = 0,
			Manual = 1
		};

		enum class OverrideKind : uint8_t {
			Allow = 0,
			Block = 1
		};

		[[nodiscard]] const char* ToString(Label v) noexcept;
		[[nodiscard]] const char* ToString(Verdict v) noexcept;
		[[nodiscard]] const char* ToString(DecisionReason v) noexcept;
		[[nodiscard]] const char* ToString(SiteSource v) noexcept;
		[[nodiscard]] const char* ToString(OverrideKind v) noexcept;

		[[nodiscard]] std::optional<Label> LabelFromString(const std::string& s) noexcept;
		[[nodiscard]] std::optional<Verdict> VerdictFromString(const std::string& s) noexcept;
		[[nodiscard]] std::optional<DecisionReason> DecisionReasonFromString(const std::string& s) noexcept;
		[[nodiscard]] std::optional<SiteSource> SiteSourceFromString(const std::string& s) noexcept;
		[[nodiscard]] std::optional<OverrideKind> OverrideKindFromString(const std::string& s) noexcept;

		// ============================================================================
		// Monitoring data
		// ============================================================================

		/**
		 * @brief One outbound connection as tracked by the sampler.
		 */
		struct Connection {
			std::string remoteAddress;     ///< textual IP
			std::string remoteHost;        ///< reverse-DNS name, empty when unresolved
			uint16_t remotePort = 0;
			uint32_t processId = 0;
			std::string processName;
			std::string protocol;          ///< "tcp" / "tcp6"
			Timestamp firstSeen{};
			Timestamp lastSeen{};

			/// Host used for classification: resolved name, else the address
			[[nodiscard]] const std::string& Subject() const noexcept {
				return remoteHost.empty() ? remoteAddress : remoteHost;
			}
		};

		/// Ordered multimap: duplicates and original order are preserved
		using HeaderList = std::vector<std::pair<std::string, std::string>>;

		struct CapturedTransaction {
			int64_t id = 0;
			std::string url;
			std::string host;
			std::string method;
			HeaderList requestHeaders;
			std::string requestBody;       ///< excerpt, bounded
			int responseStatus = 0;
			HeaderList responseHeaders;
			std::string responseBody;      ///< excerpt, bounded
			Timestamp timestamp{};
		};

		// ============================================================================
		// Classification
		// ============================================================================

		/// term -> weight; ordered so that iteration and summation are reproducible
		using FeatureVector = std::map<std::string, double>;

		struct TermContribution {
			std::string term;
			double contribution = 0.0;     ///< positive pushes toward gambling
		};

		struct TrainingExample {
			std::string text;
			Label label = Label::Benign;
		};

		struct ClassificationResult {
			std::string subject;           ///< domain or URL that was scored
			double score = 0.0;            ///< gambling probability in [0,1]
			std::vector<TermContribution> topTerms;
			uint64_t modelVersion = 0;
			Timestamp timestamp{};
		};

		struct BlockDecision {
			std::string domain;
			Verdict verdict = Verdict::Allow;
			DecisionReason reason = DecisionReason::Classifier;
			double score = 0.0;
			bool conflict = false;         ///< manual allow overrode a classifier block
			Timestamp timestamp{};
		};

		// ============================================================================
		// Persistent records
		// ============================================================================

		struct BlockedSite {
			int64_t id = 0;
			std::string domain;
			SiteSource source = SiteSource::Auto;
			Timestamp addedAt{};
			bool active = true;
			std::optional<Timestamp> deactivatedAt;
			std::string reason;
		};

		struct DomainOverride {
			std::string domain;
			OverrideKind kind = OverrideKind::Block;
			std::string note;
			Timestamp createdAt{};
		};

		struct DetectionLogEntry {
			int64_t id = 0;
			std::string domain;
			std::string subject;
			double score = 0.0;
			uint64_t modelVersion = 0;
			std::vector<TermContribution> topTerms;
			Verdict verdict = Verdict::Allow;
			DecisionReason reason = DecisionReason::Classifier;
			bool conflict = false;
			std::string source;            ///< "sampler", "interceptor", "manual"
			Timestamp timestamp{};
		};

		struct EnforcementAction {
			int64_t id = 0;
			std::string action;            ///< "add", "remove", "reconcile", "failed"
			std::string domain;
			std::string detail;
			bool success = true;
			Timestamp timestamp{};
		};

		struct ErrorEvent {
			int64_t id = 0;
			ErrorKind kind = ErrorKind::Internal;
			std::string stage;
			std::string domain;
			std::string message;
			Timestamp timestamp{};
		};

		struct FeedbackRecord {
			int64_t id = 0;
			std::string domain;
			Label label = Label::Benign;
			bool consumed = false;         ///< folded into a completed retrain
			Timestamp createdAt{};
		};

		struct BandwidthSample {
			int64_t id = 0;
			uint64_t bytesSent = 0;
			uint64_t bytesReceived = 0;
			double mbps = 0.0;
			uint32_t activeConnections = 0;
			Timestamp timestamp{};
		};

		// ============================================================================
		// Query filters & reports
		// ============================================================================

		struct DetectionFilter {
			std::optional<Timestamp> startTime;
			std::optional<Timestamp> endTime;
			std::optional<std::string> domainSubstring;
			std::optional<Verdict> verdict;
			size_t maxResults = 1000;
			bool sortDescending = true;    ///< newest first
		};

		struct ErrorFilter {
			std::optional<Timestamp> startTime;
			std::optional<Timestamp> endTime;
			std::optional<ErrorKind> kind;
			std::optional<std::string> domainSubstring;
			size_t maxResults = 1000;
		};

		struct EnforcementActionFilter {
			std::optional<Timestamp> startTime;
			std::optional<Timestamp> endTime;
			std::optional<std::string> domainSubstring;
			size_t maxResults = 1000;
		};

		struct EngineStats {
			bool running = false;
			bool devMode = false;
			uint64_t connectionsObserved = 0;
			uint64_t activeConnections = 0;
			uint64_t transactionsCaptured = 0;
			uint64_t blockCount = 0;       ///< active BlockedSite records
			uint64_t totalDetections = 0;
			uint64_t modelVersion = 0;
			std::optional<Timestamp> lastClassification;
			double currentMbps = 0.0;
			int sensitivity = 50;
		};

		struct ModelInfo {
			uint64_t version = 0;
			size_t vocabularySize = 0;
			uint64_t gamblingDocuments = 0;
			uint64_t benignDocuments = 0;
			Timestamp trainedAt{};
		};

		struct ValidationReport {
			size_t total = 0;
			size_t correct = 0;
			double accuracy = 0.0;
		};

		struct CleanupReport {
			size_t detectionsDeleted = 0;
			size_t capturesDeleted = 0;
			size_t errorsDeleted = 0;
			size_t connectionsDeleted = 0;
			size_t bandwidthDeleted = 0;
			size_t actionsDeleted = 0;
		};

	}  // namespace Core
}  // namespace NetGuard
