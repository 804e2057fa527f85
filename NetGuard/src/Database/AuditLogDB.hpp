#pragma once

#include "DatabaseManager.hpp"
#include "../Core/Types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace NetGuard {
	namespace Database {

		// ============================================================================
		// AuditLogDB - append-only decision, enforcement and error history
		// ============================================================================

		/**
		 * @brief Durable audit store queried by the dashboard.
		 *
		 * Rows are only ever inserted; the single exception is Cleanup(), which
		 * removes rows older than a horizon but keeps the newest detection of every
		 * domain that has an active blocked_sites record.
		 *
		 * Also hosts the smaller side tables the engine needs (settings, feedback,
		 * connection log, bandwidth history, captured transactions) since they
		 * share the same retention sweep.
		 *
		 * Thread-safe: every call borrows its own pooled connection.
		 */
		class AuditLogDB {
		public:
			explicit AuditLogDB(DatabaseManager& db) noexcept : m_db(db) {}

			AuditLogDB(const AuditLogDB&) = delete;
			AuditLogDB& operator=(const AuditLogDB&) = delete;

			bool Initialize(DatabaseError* err = nullptr);

			// ============================================================================
			// Appends (return the new row id, 0 on failure)
			// ============================================================================

			int64_t AppendDetection(const Core::DetectionLogEntry& entry, DatabaseError* err = nullptr);
			int64_t AppendEnforcementAction(const Core::EnforcementAction& action, DatabaseError* err = nullptr);
			int64_t AppendError(const Core::ErrorEvent& event, DatabaseError* err = nullptr);
			int64_t AppendCapture(const Core::CapturedTransaction& tx, DatabaseError* err = nullptr);
			int64_t AppendConnection(const Core::Connection& conn, DatabaseError* err = nullptr);
			int64_t AppendBandwidthSample(const Core::BandwidthSample& sample, DatabaseError* err = nullptr);
			int64_t AppendFeedback(const Core::FeedbackRecord& record, DatabaseError* err = nullptr);

			/// Convenience: maps a caught domain error onto an error_events row
			int64_t RecordError(const Core::NetGuardError& error, DatabaseError* err = nullptr);

			// ============================================================================
			// Queries
			// ============================================================================

			std::vector<Core::DetectionLogEntry> QueryDetections(const Core::DetectionFilter& filter,
				DatabaseError* err = nullptr);
			std::vector<Core::ErrorEvent> QueryErrors(const Core::ErrorFilter& filter, DatabaseError* err = nullptr);
			/// Newest first
			std::vector<Core::EnforcementAction> QueryEnforcementActions(const Core::EnforcementActionFilter& filter,
				DatabaseError* err = nullptr);
			/// Newest first; firstSeen and lastSeen both carry the logged time
			std::vector<Core::Connection> RecentConnections(size_t limit, DatabaseError* err = nullptr);

			/// Samples at or after @p since, oldest first; at most the newest @p maxResults
			std::vector<Core::BandwidthSample> BandwidthSince(Core::Timestamp since, size_t maxResults,
				DatabaseError* err = nullptr);
			std::optional<Core::DetectionLogEntry> LatestDetectionFor(const std::string& domain,
				DatabaseError* err = nullptr);

			int64_t CountDetections(DatabaseError* err = nullptr);
			int64_t CountCaptures(DatabaseError* err = nullptr);
			int64_t CountConnections(DatabaseError* err = nullptr);

			// ============================================================================
			// Feedback
			// ============================================================================

			std::vector<Core::FeedbackRecord> ListFeedback(bool includeConsumed, DatabaseError* err = nullptr);

			/// Marks every feedback row with id <= upToId as folded into a model
			bool MarkFeedbackConsumed(int64_t upToId, DatabaseError* err = nullptr);

			// ============================================================================
			// Settings
			// ============================================================================

			std::optional<std::string> GetSetting(const std::string& key, DatabaseError* err = nullptr);
			bool SetSetting(const std::string& key, const std::string& value, DatabaseError* err = nullptr);
			std::map<std::string, std::string> GetAllSettings(DatabaseError* err = nullptr);

			// ============================================================================
			// Retention
			// ============================================================================

			/**
			 * @brief Deletes rows strictly older than @p horizon.
			 *
			 * The newest detection_log row of each domain with an active
			 * blocked_sites record survives regardless of age.
			 */
			bool Cleanup(Core::Timestamp horizon, Core::CleanupReport& report, DatabaseError* err = nullptr);

		private:
			DatabaseManager& m_db;
		};

	}  // namespace Database
}  // namespace NetGuard
