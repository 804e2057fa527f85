#include "Schema.hpp"

namespace NetGuard {
	namespace Database {

		namespace {

			constexpr const char* SQL_CREATE_SETTINGS = R"(
				CREATE TABLE IF NOT EXISTS settings (
					key TEXT PRIMARY KEY NOT NULL,
					value TEXT NOT NULL,
					updated_at INTEGER NOT NULL
				) WITHOUT ROWID;
			)";

			constexpr const char* SQL_CREATE_BLOCKED_SITES = R"(
				CREATE TABLE IF NOT EXISTS blocked_sites (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					domain TEXT NOT NULL,
					source TEXT NOT NULL CHECK(source IN ('auto', 'manual')),
					added_at INTEGER NOT NULL,
					active INTEGER NOT NULL DEFAULT 1,
					deactivated_at INTEGER,
					reason TEXT NOT NULL DEFAULT ''
				);
			)";

			// at most one active record per domain
			constexpr const char* SQL_CREATE_BLOCKED_SITES_ACTIVE_INDEX = R"(
				CREATE UNIQUE INDEX IF NOT EXISTS idx_blocked_sites_active
				ON blocked_sites(domain) WHERE active = 1;
			)";

			constexpr const char* SQL_CREATE_BLOCKED_SITES_DOMAIN_INDEX = R"(
				CREATE INDEX IF NOT EXISTS idx_blocked_sites_domain ON blocked_sites(domain);
			)";

			constexpr const char* SQL_CREATE_DOMAIN_OVERRIDES = R"(
				CREATE TABLE IF NOT EXISTS domain_overrides (
					domain TEXT PRIMARY KEY NOT NULL,
					kind TEXT NOT NULL CHECK(kind IN ('allow', 'block')),
					note TEXT NOT NULL DEFAULT '',
					created_at INTEGER NOT NULL
				) WITHOUT ROWID;
			)";

			constexpr const char* SQL_CREATE_TRAINING_FEEDBACK = R"(
				CREATE TABLE IF NOT EXISTS training_feedback (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					domain TEXT NOT NULL,
					label TEXT NOT NULL CHECK(label IN ('gambling', 'benign')),
					consumed INTEGER NOT NULL DEFAULT 0,
					created_at INTEGER NOT NULL
				);
			)";

			constexpr const char* SQL_CREATE_DETECTION_LOG = R"(
				CREATE TABLE IF NOT EXISTS detection_log (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					domain TEXT NOT NULL,
					subject TEXT NOT NULL,
					score REAL NOT NULL,
					model_version INTEGER NOT NULL,
					top_terms TEXT NOT NULL DEFAULT '[]',
					verdict TEXT NOT NULL,
					reason TEXT NOT NULL,
					conflict INTEGER NOT NULL DEFAULT 0,
					source TEXT NOT NULL DEFAULT '',
					timestamp INTEGER NOT NULL
				);
			)";

			constexpr const char* SQL_CREATE_DETECTION_LOG_INDICES = R"(
				CREATE INDEX IF NOT EXISTS idx_detection_log_time ON detection_log(timestamp);
				CREATE INDEX IF NOT EXISTS idx_detection_log_domain ON detection_log(domain, id);
			)";

			constexpr const char* SQL_CREATE_ENFORCEMENT_ACTIONS = R"(
				CREATE TABLE IF NOT EXISTS enforcement_actions (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					action TEXT NOT NULL,
					domain TEXT NOT NULL DEFAULT '',
					detail TEXT NOT NULL DEFAULT '',
					success INTEGER NOT NULL,
					timestamp INTEGER NOT NULL
				);
				CREATE INDEX IF NOT EXISTS idx_enforcement_actions_time ON enforcement_actions(timestamp);
			)";

			constexpr const char* SQL_CREATE_ERROR_EVENTS = R"(
				CREATE TABLE IF NOT EXISTS error_events (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					kind TEXT NOT NULL,
					stage TEXT NOT NULL,
					domain TEXT NOT NULL DEFAULT '',
					message TEXT NOT NULL,
					timestamp INTEGER NOT NULL
				);
				CREATE INDEX IF NOT EXISTS idx_error_events_time ON error_events(timestamp);
			)";

			constexpr const char* SQL_CREATE_CAPTURED_TRANSACTIONS = R"(
				CREATE TABLE IF NOT EXISTS captured_transactions (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					url TEXT NOT NULL,
					host TEXT NOT NULL,
					method TEXT NOT NULL,
					request_headers TEXT NOT NULL DEFAULT '[]',
					request_body BLOB,
					response_status INTEGER NOT NULL,
					response_headers TEXT NOT NULL DEFAULT '[]',
					response_body BLOB,
					timestamp INTEGER NOT NULL
				);
				CREATE INDEX IF NOT EXISTS idx_captured_transactions_time ON captured_transactions(timestamp);
			)";

			constexpr const char* SQL_CREATE_CONNECTION_LOG = R"(
				CREATE TABLE IF NOT EXISTS connection_log (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					remote_address TEXT NOT NULL,
					remote_host TEXT NOT NULL DEFAULT '',
					remote_port INTEGER NOT NULL,
					process_id INTEGER NOT NULL,
					process_name TEXT NOT NULL DEFAULT '',
					protocol TEXT NOT NULL,
					timestamp INTEGER NOT NULL
				);
				CREATE INDEX IF NOT EXISTS idx_connection_log_time ON connection_log(timestamp);
			)";

			constexpr const char* SQL_CREATE_BANDWIDTH_HISTORY = R"(
				CREATE TABLE IF NOT EXISTS bandwidth_history (
					id INTEGER PRIMARY KEY AUTOINCREMENT,
					bytes_sent INTEGER NOT NULL,
					bytes_received INTEGER NOT NULL,
					mbps REAL NOT NULL,
					active_connections INTEGER NOT NULL,
					timestamp INTEGER NOT NULL
				);
				CREATE INDEX IF NOT EXISTS idx_bandwidth_history_time ON bandwidth_history(timestamp);
			)";

		}  // anonymous namespace

		bool EnsureSchema(DatabaseManager& db, DatabaseError* err) {
			const std::vector<std::string> ddl = {
				SQL_CREATE_SETTINGS,
				SQL_CREATE_BLOCKED_SITES,
				SQL_CREATE_BLOCKED_SITES_ACTIVE_INDEX,
				SQL_CREATE_BLOCKED_SITES_DOMAIN_INDEX,
				SQL_CREATE_DOMAIN_OVERRIDES,
				SQL_CREATE_TRAINING_FEEDBACK,
				SQL_CREATE_DETECTION_LOG,
				SQL_CREATE_DETECTION_LOG_INDICES,
				SQL_CREATE_ENFORCEMENT_ACTIONS,
				SQL_CREATE_ERROR_EVENTS,
				SQL_CREATE_CAPTURED_TRANSACTIONS,
				SQL_CREATE_CONNECTION_LOG,
				SQL_CREATE_BANDWIDTH_HISTORY
			};

			const int current = db.GetSchemaVersion(err);
			if (current > NETGUARD_SCHEMA_VERSION) {
				DatabaseManager::setError(err, SQLITE_SCHEMA,
					"Database schema " + std::to_string(current) + " is newer than supported " +
					std::to_string(NETGUARD_SCHEMA_VERSION), "EnsureSchema");
				return false;
			}

			if (!db.ExecuteMany(ddl, err)) {
				NG_LOG_ERROR("Database", "Schema creation failed: %s", err ? err->message.c_str() : "");
				return false;
			}

			if (current != NETGUARD_SCHEMA_VERSION) {
				if (!db.SetSchemaVersion(NETGUARD_SCHEMA_VERSION, err)) return false;
				NG_LOG_INFO("Database", "Schema initialized at version %d", NETGUARD_SCHEMA_VERSION);
			}
			return true;
		}

	}  // namespace Database
}  // namespace NetGuard
