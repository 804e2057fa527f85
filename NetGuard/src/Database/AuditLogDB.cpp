#include "AuditLogDB.hpp"
#include "Schema.hpp"

#include <nlohmann/json.hpp>

#include <variant>

namespace NetGuard {
	namespace Database {

		using Core::ToEpochMillis;
		using Core::FromEpochMillis;

		namespace {

			constexpr const char* SQL_INSERT_DETECTION = R"(
				INSERT INTO detection_log (domain, subject, score, model_version, top_terms,
					verdict, reason, conflict, source, timestamp)
				VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
			)";

			constexpr const char* SQL_INSERT_ENFORCEMENT = R"(
				INSERT INTO enforcement_actions (action, domain, detail, success, timestamp)
				VALUES (?, ?, ?, ?, ?)
			)";

			constexpr const char* SQL_INSERT_ERROR = R"(
				INSERT INTO error_events (kind, stage, domain, message, timestamp)
				VALUES (?, ?, ?, ?, ?)
			)";

			constexpr const char* SQL_INSERT_CAPTURE = R"(
				INSERT INTO captured_transactions (url, host, method, request_headers, request_body,
					response_status, response_headers, response_body, timestamp)
				VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
			)";

			constexpr const char* SQL_INSERT_CONNECTION = R"(
				INSERT INTO connection_log (remote_address, remote_host, remote_port, process_id,
					process_name, protocol, timestamp)
				VALUES (?, ?, ?, ?, ?, ?, ?)
			)";

			constexpr const char* SQL_INSERT_BANDWIDTH = R"(
				INSERT INTO bandwidth_history (bytes_sent, bytes_received, mbps, active_connections, timestamp)
				VALUES (?, ?, ?, ?, ?)
			)";

			constexpr const char* SQL_INSERT_FEEDBACK = R"(
				INSERT INTO training_feedback (domain, label, consumed, created_at) VALUES (?, ?, 0, ?)
			)";

			constexpr const char* SQL_SELECT_DETECTION_COLUMNS = R"(
				SELECT id, domain, subject, score, model_version, top_terms, verdict, reason,
					conflict, source, timestamp FROM detection_log
			)";

			constexpr const char* SQL_UPSERT_SETTING = R"(
				INSERT INTO settings (key, value, updated_at) VALUES (?, ?, ?)
				ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at
			)";

			// keeps the newest detection of each actively blocked domain
			constexpr const char* SQL_CLEANUP_DETECTIONS = R"(
				DELETE FROM detection_log
				WHERE timestamp < ?
				  AND id NOT IN (
					SELECT MAX(d.id) FROM detection_log d
					JOIN blocked_sites b ON b.domain = d.domain AND b.active = 1
					GROUP BY d.domain
				  )
			)";

			using BindValue = std::variant<int64_t, double, std::string>;

			std::string TermsToJson(const std::vector<Core::TermContribution>& terms) {
				nlohmann::json arr = nlohmann::json::array();
				for (const auto& t : terms) {
					arr.push_back({ {"term", t.term}, {"contribution", t.contribution} });
				}
				return arr.dump();
			}

			std::vector<Core::TermContribution> TermsFromJson(const std::string& text) {
				std::vector<Core::TermContribution> out;
				auto j = nlohmann::json::parse(text, nullptr, false);
				if (!j.is_array()) return out;
				for (const auto& item : j) {
					if (!item.is_object()) continue;
					Core::TermContribution tc;
					tc.term = item.value("term", std::string{});
					tc.contribution = item.value("contribution", 0.0);
					out.push_back(std::move(tc));
				}
				return out;
			}

			std::string HeadersToJson(const Core::HeaderList& headers) {
				nlohmann::json arr = nlohmann::json::array();
				for (const auto& [name, value] : headers) {
					arr.push_back(nlohmann::json::array({ name, value }));
				}
				return arr.dump();
			}

			std::vector<uint8_t> ToBlob(const std::string& s) {
				return std::vector<uint8_t>(s.begin(), s.end());
			}

			Core::DetectionLogEntry ReadDetection(const QueryResult& row) {
				Core::DetectionLogEntry e;
				e.id = row.GetInt64(0);
				e.domain = row.GetString(1);
				e.subject = row.GetString(2);
				e.score = row.GetDouble(3);
				e.modelVersion = static_cast<uint64_t>(row.GetInt64(4));
				e.topTerms = TermsFromJson(row.GetString(5));
				e.verdict = Core::VerdictFromString(row.GetString(6)).value_or(Core::Verdict::Allow);
				e.reason = Core::DecisionReasonFromString(row.GetString(7)).value_or(Core::DecisionReason::Classifier);
				e.conflict = row.GetInt(8) != 0;
				e.source = row.GetString(9);
				e.timestamp = FromEpochMillis(row.GetInt64(10));
				return e;
			}

			/// SELECT with a runtime-built WHERE clause
			QueryResult RunDynamicQuery(DatabaseManager& db, const std::string& sql,
				const std::vector<BindValue>& values, DatabaseError* err) {
				auto conn = db.AcquireConnection(err);
				if (!conn) return QueryResult{};
				try {
					auto stmt = std::make_unique<SQLite::Statement>(*conn, sql);
					int index = 1;
					for (const auto& v : values) {
						std::visit([&](const auto& x) { DatabaseManager::bindParameter(*stmt, index, x); }, v);
						++index;
					}
					return QueryResult{ std::move(stmt), conn, &db };
				}
				catch (const SQLite::Exception& ex) {
					DatabaseManager::setError(err, ex, sql, "RunDynamicQuery");
					db.ReleaseConnection(std::move(conn));
					return QueryResult{};
				}
			}

			std::string EscapeLike(const std::string& s) {
				std::string out;
				out.reserve(s.size() + 2);
				for (char c : s) {
					if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
					out.push_back(c);
				}
				return out;
			}

			/// WHERE clauses and their bound values, in placeholder order
			class WhereClause {
			public:
				void TimeRange(const std::optional<Core::Timestamp>& start, const std::optional<Core::Timestamp>& end) {
					if (start) Add("timestamp >= ?", ToEpochMillis(*start));
					if (end) Add("timestamp <= ?", ToEpochMillis(*end));
				}

				void DomainContains(const std::optional<std::string>& substring) {
					if (substring && !substring->empty()) {
						Add("domain LIKE ? ESCAPE '\\'", "%" + EscapeLike(*substring) + "%");
					}
				}

				void Add(const char* clause, BindValue value) {
					m_clauses.emplace_back(clause);
					m_values.push_back(std::move(value));
				}

				/// Appends the WHERE part to @p sql and the LIMIT placeholder after @p orderBy
				std::vector<BindValue> Finish(std::string& sql, const char* orderBy, size_t limit) {
					for (size_t i = 0; i < m_clauses.size(); ++i) {
						sql += (i == 0 ? " WHERE " : " AND ");
						sql += m_clauses[i];
					}
					sql += orderBy;
					sql += " LIMIT ?";
					m_values.emplace_back(static_cast<int64_t>(limit));
					return std::move(m_values);
				}

			private:
				std::vector<std::string> m_clauses;
				std::vector<BindValue> m_values;
			};

		}  // anonymous namespace

		bool AuditLogDB::Initialize(DatabaseError* err) {
			NG_LOG_INFO("AuditLogDB", "Initializing audit log");
			if (!m_db.IsInitialized()) {
				DatabaseManager::setError(err, SQLITE_MISUSE, "DatabaseManager not initialized", "AuditLogDB::Initialize");
				return false;
			}
			return EnsureSchema(m_db, err);
		}

		// ============================================================================
		// Appends
		// ============================================================================

		int64_t AuditLogDB::AppendDetection(const Core::DetectionLogEntry& e, DatabaseError* err) {
			const auto ts = e.timestamp == Core::Timestamp{} ? Core::Clock::now() : e.timestamp;
			return m_db.InsertWithParams(SQL_INSERT_DETECTION, err,
				e.domain, e.subject, e.score, static_cast<int64_t>(e.modelVersion), TermsToJson(e.topTerms),
				std::string(Core::ToString(e.verdict)), std::string(Core::ToString(e.reason)),
				e.conflict, e.source, ToEpochMillis(ts));
		}

		int64_t AuditLogDB::AppendEnforcementAction(const Core::EnforcementAction& a, DatabaseError* err) {
			const auto ts = a.timestamp == Core::Timestamp{} ? Core::Clock::now() : a.timestamp;
			return m_db.InsertWithParams(SQL_INSERT_ENFORCEMENT, err,
				a.action, a.domain, a.detail, a.success, ToEpochMillis(ts));
		}

		int64_t AuditLogDB::AppendError(const Core::ErrorEvent& e, DatabaseError* err) {
			const auto ts = e.timestamp == Core::Timestamp{} ? Core::Clock::now() : e.timestamp;
			return m_db.InsertWithParams(SQL_INSERT_ERROR, err,
				std::string(Core::ErrorKindToString(e.kind)), e.stage, e.domain, e.message, ToEpochMillis(ts));
		}

		int64_t AuditLogDB::RecordError(const Core::NetGuardError& error, DatabaseError* err) {
			Core::ErrorEvent e;
			e.kind = error.kind();
			e.stage = error.stage();
			e.domain = error.domain();
			e.message = error.what();
			e.timestamp = error.timestamp();
			return AppendError(e, err);
		}

		int64_t AuditLogDB::AppendCapture(const Core::CapturedTransaction& tx, DatabaseError* err) {
			const auto ts = tx.timestamp == Core::Timestamp{} ? Core::Clock::now() : tx.timestamp;
			return m_db.InsertWithParams(SQL_INSERT_CAPTURE, err,
				tx.url, tx.host, tx.method, HeadersToJson(tx.requestHeaders), ToBlob(tx.requestBody),
				tx.responseStatus, HeadersToJson(tx.responseHeaders), ToBlob(tx.responseBody),
				ToEpochMillis(ts));
		}

		int64_t AuditLogDB::AppendConnection(const Core::Connection& c, DatabaseError* err) {
			const auto ts = c.lastSeen == Core::Timestamp{} ? Core::Clock::now() : c.lastSeen;
			return m_db.InsertWithParams(SQL_INSERT_CONNECTION, err,
				c.remoteAddress, c.remoteHost, static_cast<int64_t>(c.remotePort),
				static_cast<int64_t>(c.processId), c.processName, c.protocol, ToEpochMillis(ts));
		}

		int64_t AuditLogDB::AppendBandwidthSample(const Core::BandwidthSample& s, DatabaseError* err) {
			const auto ts = s.timestamp == Core::Timestamp{} ? Core::Clock::now() : s.timestamp;
			return m_db.InsertWithParams(SQL_INSERT_BANDWIDTH, err,
				static_cast<int64_t>(s.bytesSent), static_cast<int64_t>(s.bytesReceived), s.mbps,
				static_cast<int64_t>(s.activeConnections), ToEpochMillis(ts));
		}

		int64_t AuditLogDB::AppendFeedback(const Core::FeedbackRecord& r, DatabaseError* err) {
			const auto ts = r.createdAt == Core::Timestamp{} ? Core::Clock::now() : r.createdAt;
			return m_db.InsertWithParams(SQL_INSERT_FEEDBACK, err,
				r.domain, std::string(Core::ToString(r.label)), ToEpochMillis(ts));
		}

		// ============================================================================
		// Queries
		// ============================================================================

		std::vector<Core::DetectionLogEntry> AuditLogDB::QueryDetections(const Core::DetectionFilter& filter,
			DatabaseError* err) {
			std::string sql = SQL_SELECT_DETECTION_COLUMNS;
			WhereClause where;
			where.TimeRange(filter.startTime, filter.endTime);
			where.DomainContains(filter.domainSubstring);
			if (filter.verdict) where.Add("verdict = ?", std::string(Core::ToString(*filter.verdict)));
			const auto values = where.Finish(sql,
				filter.sortDescending ? " ORDER BY timestamp DESC, id DESC" : " ORDER BY timestamp ASC, id ASC",
				filter.maxResults);

			std::vector<Core::DetectionLogEntry> out;
			auto rows = RunDynamicQuery(m_db, sql, values, err);
			while (rows.Next(err)) {
				out.push_back(ReadDetection(rows));
			}
			return out;
		}

		std::vector<Core::ErrorEvent> AuditLogDB::QueryErrors(const Core::ErrorFilter& filter, DatabaseError* err) {
			std::string sql = "SELECT id, kind, stage, domain, message, timestamp FROM error_events";
			WhereClause where;
			where.TimeRange(filter.startTime, filter.endTime);
			if (filter.kind) where.Add("kind = ?", std::string(Core::ErrorKindToString(*filter.kind)));
			where.DomainContains(filter.domainSubstring);
			const auto values = where.Finish(sql, " ORDER BY timestamp DESC, id DESC", filter.maxResults);

			std::vector<Core::ErrorEvent> out;
			auto rows = RunDynamicQuery(m_db, sql, values, err);
			while (rows.Next(err)) {
				Core::ErrorEvent e;
				e.id = rows.GetInt64(0);
				if (!Core::ErrorKindFromString(rows.GetString(1), e.kind)) e.kind = Core::ErrorKind::Internal;
				e.stage = rows.GetString(2);
				e.domain = rows.GetString(3);
				e.message = rows.GetString(4);
				e.timestamp = FromEpochMillis(rows.GetInt64(5));
				out.push_back(std::move(e));
			}
			return out;
		}

		std::vector<Core::EnforcementAction> AuditLogDB::QueryEnforcementActions(
			const Core::EnforcementActionFilter& filter, DatabaseError* err) {
			std::string sql = "SELECT id, action, domain, detail, success, timestamp FROM enforcement_actions";
			WhereClause where;
			where.TimeRange(filter.startTime, filter.endTime);
			where.DomainContains(filter.domainSubstring);
			const auto values = where.Finish(sql, " ORDER BY timestamp DESC, id DESC", filter.maxResults);

			std::vector<Core::EnforcementAction> out;
			auto rows = RunDynamicQuery(m_db, sql, values, err);
			while (rows.Next(err)) {
				Core::EnforcementAction a;
				a.id = rows.GetInt64(0);
				a.action = rows.GetString(1);
				a.domain = rows.GetString(2);
				a.detail = rows.GetString(3);
				a.success = rows.GetInt(4) != 0;
				a.timestamp = FromEpochMillis(rows.GetInt64(5));
				out.push_back(std::move(a));
			}
			return out;
		}

		std::vector<Core::Connection> AuditLogDB::RecentConnections(size_t limit, DatabaseError* err) {
			std::vector<Core::Connection> out;
			auto rows = m_db.QueryWithParams(
				"SELECT remote_address, remote_host, remote_port, process_id, process_name, protocol, timestamp "
				"FROM connection_log ORDER BY timestamp DESC, id DESC LIMIT ?", err, static_cast<int64_t>(limit));
			while (rows.Next(err)) {
				Core::Connection c;
				c.remoteAddress = rows.GetString(0);
				c.remoteHost = rows.GetString(1);
				c.remotePort = static_cast<uint16_t>(rows.GetInt64(2));
				c.processId = static_cast<uint32_t>(rows.GetInt64(3));
				c.processName = rows.GetString(4);
				c.protocol = rows.GetString(5);
				c.firstSeen = c.lastSeen = FromEpochMillis(rows.GetInt64(6));
				out.push_back(std::move(c));
			}
			return out;
		}

		std::vector<Core::BandwidthSample> AuditLogDB::BandwidthSince(Core::Timestamp since, size_t maxResults,
			DatabaseError* err) {
			std::vector<Core::BandwidthSample> out;
			// newest maxResults samples, returned oldest first for charting
			auto rows = m_db.QueryWithParams(
				"SELECT * FROM ("
				"SELECT id, bytes_sent, bytes_received, mbps, active_connections, timestamp "
				"FROM bandwidth_history WHERE timestamp >= ? ORDER BY timestamp DESC, id DESC LIMIT ?"
				") ORDER BY timestamp ASC, id ASC", err, ToEpochMillis(since), static_cast<int64_t>(maxResults));
			while (rows.Next(err)) {
				Core::BandwidthSample s;
				s.id = rows.GetInt64(0);
				s.bytesSent = static_cast<uint64_t>(rows.GetInt64(1));
				s.bytesReceived = static_cast<uint64_t>(rows.GetInt64(2));
				s.mbps = rows.GetDouble(3);
				s.activeConnections = static_cast<uint32_t>(rows.GetInt64(4));
				s.timestamp = FromEpochMillis(rows.GetInt64(5));
				out.push_back(s);
			}
			return out;
		}

		std::optional<Core::DetectionLogEntry> AuditLogDB::LatestDetectionFor(const std::string& domain,
			DatabaseError* err) {
			auto rows = m_db.QueryWithParams(std::string(SQL_SELECT_DETECTION_COLUMNS) +
				" WHERE domain = ? ORDER BY id DESC LIMIT 1", err, domain);
			if (rows.Next(err)) return ReadDetection(rows);
			return std::nullopt;
		}

		int64_t AuditLogDB::CountDetections(DatabaseError* err) {
			return m_db.QueryScalar("SELECT COUNT(*) FROM detection_log", 0, err);
		}

		int64_t AuditLogDB::CountCaptures(DatabaseError* err) {
			return m_db.QueryScalar("SELECT COUNT(*) FROM captured_transactions", 0, err);
		}

		int64_t AuditLogDB::CountConnections(DatabaseError* err) {
			return m_db.QueryScalar("SELECT COUNT(*) FROM connection_log", 0, err);
		}

		// ============================================================================
		// Feedback
		// ============================================================================

		std::vector<Core::FeedbackRecord> AuditLogDB::ListFeedback(bool includeConsumed, DatabaseError* err) {
			std::vector<Core::FeedbackRecord> out;
			auto rows = m_db.QueryWithParams(
				"SELECT id, domain, label, consumed, created_at FROM training_feedback "
				"WHERE consumed = 0 OR ? = 1 ORDER BY id ASC", err, includeConsumed);
			while (rows.Next(err)) {
				Core::FeedbackRecord r;
				r.id = rows.GetInt64(0);
				r.domain = rows.GetString(1);
				r.label = Core::LabelFromString(rows.GetString(2)).value_or(Core::Label::Benign);
				r.consumed = rows.GetInt(3) != 0;
				r.createdAt = FromEpochMillis(rows.GetInt64(4));
				out.push_back(std::move(r));
			}
			return out;
		}

		bool AuditLogDB::MarkFeedbackConsumed(int64_t upToId, DatabaseError* err) {
			return m_db.ExecuteWithParams(
				"UPDATE training_feedback SET consumed = 1 WHERE id <= ? AND consumed = 0", err, upToId) >= 0;
		}

		// ============================================================================
		// Settings
		// ============================================================================

		std::optional<std::string> AuditLogDB::GetSetting(const std::string& key, DatabaseError* err) {
			auto rows = m_db.QueryWithParams("SELECT value FROM settings WHERE key = ?", err, key);
			if (rows.Next(err)) return rows.GetString(0);
			return std::nullopt;
		}

		bool AuditLogDB::SetSetting(const std::string& key, const std::string& value, DatabaseError* err) {
			return m_db.ExecuteWithParams(SQL_UPSERT_SETTING, err, key, value,
				ToEpochMillis(Core::Clock::now())) >= 0;
		}

		std::map<std::string, std::string> AuditLogDB::GetAllSettings(DatabaseError* err) {
			std::map<std::string, std::string> out;
			auto rows = m_db.QueryWithParams("SELECT key, value FROM settings ORDER BY key", err);
			while (rows.Next(err)) {
				out.emplace(rows.GetString(0), rows.GetString(1));
			}
			return out;
		}

		// ============================================================================
		// Retention
		// ============================================================================

		bool AuditLogDB::Cleanup(Core::Timestamp horizon, Core::CleanupReport& report, DatabaseError* err) {
			const int64_t cutoff = ToEpochMillis(horizon);
			report = Core::CleanupReport{};

			auto txn = m_db.BeginTransaction(Transaction::Type::Immediate, err);
			if (!txn) return false;

			const auto sweep = [&](const char* sql, size_t& counter) {
				const int n = txn->ExecuteWithParams(sql, err, cutoff);
				if (n < 0) return false;
				counter = static_cast<size_t>(n);
				return true;
			};

			if (!sweep(SQL_CLEANUP_DETECTIONS, report.detectionsDeleted)) return false;
			if (!sweep("DELETE FROM captured_transactions WHERE timestamp < ?", report.capturesDeleted)) return false;
			if (!sweep("DELETE FROM error_events WHERE timestamp < ?", report.errorsDeleted)) return false;
			if (!sweep("DELETE FROM connection_log WHERE timestamp < ?", report.connectionsDeleted)) return false;
			if (!sweep("DELETE FROM bandwidth_history WHERE timestamp < ?", report.bandwidthDeleted)) return false;
			if (!sweep("DELETE FROM enforcement_actions WHERE timestamp < ?", report.actionsDeleted)) return false;

			if (!txn->Commit(err)) return false;

			NG_LOG_INFO("AuditLogDB", "Cleanup before %s: %zu detections, %zu captures, %zu errors removed",
				Core::FormatTimestamp(horizon).c_str(), report.detectionsDeleted, report.capturesDeleted,
				report.errorsDeleted);
			return true;
		}

	}  // namespace Database
}  // namespace NetGuard
