#include "BlockedSiteStore.hpp"
#include "Schema.hpp"

namespace NetGuard {
	namespace Database {

		using Core::ToEpochMillis;
		using Core::FromEpochMillis;

		namespace {

			constexpr const char* SQL_INSERT_SITE = R"(
				INSERT OR IGNORE INTO blocked_sites (domain, source, added_at, active, deactivated_at, reason)
				VALUES (?, ?, ?, ?, ?, ?)
			)";

			constexpr const char* SQL_DEACTIVATE_SITE = R"(
				UPDATE blocked_sites SET active = 0, deactivated_at = ?
				WHERE domain = ? AND active = 1
			)";

			constexpr const char* SQL_MARK_MANUAL = R"(
				UPDATE blocked_sites SET source = ?, reason = ?
				WHERE domain = ? AND active = 1
			)";

			constexpr const char* SQL_SELECT_SITE_COLUMNS = R"(
				SELECT id, domain, source, added_at, active, deactivated_at, reason FROM blocked_sites
			)";

			constexpr const char* SQL_UPSERT_OVERRIDE = R"(
				INSERT INTO domain_overrides (domain, kind, note, created_at) VALUES (?, ?, ?, ?)
				ON CONFLICT(domain) DO UPDATE SET kind = excluded.kind, note = excluded.note,
					created_at = excluded.created_at
			)";

			constexpr const char* SQL_HISTORY_EXISTS = R"(
				SELECT COUNT(*) FROM blocked_sites WHERE domain = ? AND added_at = ? AND active = 0
			)";

			constexpr int EXPORT_FORMAT_VERSION = 1;

			Core::BlockedSite ReadSite(const QueryResult& row) {
				Core::BlockedSite s;
				s.id = row.GetInt64(0);
				s.domain = row.GetString(1);
				s.source = Core::SiteSourceFromString(row.GetString(2)).value_or(Core::SiteSource::Auto);
				s.addedAt = FromEpochMillis(row.GetInt64(3));
				s.active = row.GetInt(4) != 0;
				if (!row.IsNull(5)) s.deactivatedAt = FromEpochMillis(row.GetInt64(5));
				s.reason = row.GetString(6);
				return s;
			}

			std::optional<int64_t> OptionalMillis(const std::optional<Core::Timestamp>& t) {
				if (!t) return std::nullopt;
				return ToEpochMillis(*t);
			}

		}  // anonymous namespace

		bool BlockedSiteStore::Initialize(DatabaseError* err) {
			if (!m_db.IsInitialized()) {
				DatabaseManager::setError(err, SQLITE_MISUSE, "DatabaseManager not initialized", "BlockedSiteStore::Initialize");
				return false;
			}
			return EnsureSchema(m_db, err);
		}

		bool BlockedSiteStore::AddSite(const Core::BlockedSite& site, bool* inserted, DatabaseError* err) {
			const auto added = site.addedAt == Core::Timestamp{} ? Core::Clock::now() : site.addedAt;
			const int n = m_db.ExecuteWithParams(SQL_INSERT_SITE, err,
				site.domain, std::string(Core::ToString(site.source)), ToEpochMillis(added),
				true, std::optional<int64_t>{}, site.reason);
			if (n < 0) return false;
			if (inserted) *inserted = n > 0;
			if (n > 0) {
				NG_LOG_INFO("BlockedSiteStore", "Blocked %s (%s)", site.domain.c_str(), Core::ToString(site.source));
			}
			return true;
		}

		bool BlockedSiteStore::MarkManual(const std::string& domain, const std::string& reason, bool* changed,
			DatabaseError* err) {
			const int n = m_db.ExecuteWithParams(SQL_MARK_MANUAL, err,
				std::string(Core::ToString(Core::SiteSource::Manual)), reason, domain);
			if (n < 0) return false;
			if (changed) *changed = n > 0;
			return true;
		}

		bool BlockedSiteStore::Deactivate(const std::string& domain, Core::Timestamp when, bool* changed, DatabaseError* err) {
			const int n = m_db.ExecuteWithParams(SQL_DEACTIVATE_SITE, err, ToEpochMillis(when), domain);
			if (n < 0) return false;
			if (changed) *changed = n > 0;
			if (n > 0) NG_LOG_INFO("BlockedSiteStore", "Unblocked %s", domain.c_str());
			return true;
		}

		bool BlockedSiteStore::IsActive(const std::string& domain, DatabaseError* err) {
			return m_db.QueryScalar("SELECT COUNT(*) FROM blocked_sites WHERE domain = ? AND active = 1",
				0, err, domain) > 0;
		}

		std::optional<Core::BlockedSite> BlockedSiteStore::GetActive(const std::string& domain, DatabaseError* err) {
			auto rows = m_db.QueryWithParams(std::string(SQL_SELECT_SITE_COLUMNS) +
				" WHERE domain = ? AND active = 1", err, domain);
			if (rows.Next(err)) return ReadSite(rows);
			return std::nullopt;
		}

		std::vector<Core::BlockedSite> BlockedSiteStore::ActiveSites(DatabaseError* err) {
			std::vector<Core::BlockedSite> out;
			auto rows = m_db.QueryWithParams(std::string(SQL_SELECT_SITE_COLUMNS) +
				" WHERE active = 1 ORDER BY domain", err);
			while (rows.Next(err)) out.push_back(ReadSite(rows));
			return out;
		}

		std::vector<Core::BlockedSite> BlockedSiteStore::AllSites(DatabaseError* err) {
			std::vector<Core::BlockedSite> out;
			auto rows = m_db.QueryWithParams(std::string(SQL_SELECT_SITE_COLUMNS) + " ORDER BY id", err);
			while (rows.Next(err)) out.push_back(ReadSite(rows));
			return out;
		}

		std::vector<std::string> BlockedSiteStore::ActiveDomains(DatabaseError* err) {
			std::vector<std::string> out;
			auto rows = m_db.QueryWithParams("SELECT domain FROM blocked_sites WHERE active = 1 ORDER BY domain", err);
			while (rows.Next(err)) out.push_back(rows.GetString(0));
			return out;
		}

		int64_t BlockedSiteStore::CountActive(DatabaseError* err) {
			return m_db.QueryScalar("SELECT COUNT(*) FROM blocked_sites WHERE active = 1", 0, err);
		}

		// ============================================================================
		// Overrides
		// ============================================================================

		bool BlockedSiteStore::SetOverride(const Core::DomainOverride& ov, DatabaseError* err) {
			const auto created = ov.createdAt == Core::Timestamp{} ? Core::Clock::now() : ov.createdAt;
			return m_db.ExecuteWithParams(SQL_UPSERT_OVERRIDE, err,
				ov.domain, std::string(Core::ToString(ov.kind)), ov.note, ToEpochMillis(created)) >= 0;
		}

		bool BlockedSiteStore::RemoveOverride(const std::string& domain, DatabaseError* err) {
			return m_db.ExecuteWithParams("DELETE FROM domain_overrides WHERE domain = ?", err, domain) >= 0;
		}

		std::optional<Core::DomainOverride> BlockedSiteStore::GetOverride(const std::string& domain, DatabaseError* err) {
			auto rows = m_db.QueryWithParams(
				"SELECT domain, kind, note, created_at FROM domain_overrides WHERE domain = ?", err, domain);
			if (!rows.Next(err)) return std::nullopt;
			Core::DomainOverride ov;
			ov.domain = rows.GetString(0);
			ov.kind = Core::OverrideKindFromString(rows.GetString(1)).value_or(Core::OverrideKind::Block);
			ov.note = rows.GetString(2);
			ov.createdAt = FromEpochMillis(rows.GetInt64(3));
			return ov;
		}

		std::vector<Core::DomainOverride> BlockedSiteStore::ListOverrides(DatabaseError* err) {
			std::vector<Core::DomainOverride> out;
			auto rows = m_db.QueryWithParams(
				"SELECT domain, kind, note, created_at FROM domain_overrides ORDER BY domain", err);
			while (rows.Next(err)) {
				Core::DomainOverride ov;
				ov.domain = rows.GetString(0);
				ov.kind = Core::OverrideKindFromString(rows.GetString(1)).value_or(Core::OverrideKind::Block);
				ov.note = rows.GetString(2);
				ov.createdAt = FromEpochMillis(rows.GetInt64(3));
				out.push_back(std::move(ov));
			}
			return out;
		}

		// ============================================================================
		// Export / import
		// ============================================================================

		int BlockedSiteStore::Import(const std::vector<Core::BlockedSite>& sites, DatabaseError* err) {
			auto txn = m_db.BeginTransaction(Transaction::Type::Immediate, err);
			if (!txn) return -1;

			int written = 0;
			for (const auto& site : sites) {
				if (site.domain.empty()) continue;
				const int64_t added = ToEpochMillis(site.addedAt == Core::Timestamp{} ? Core::Clock::now() : site.addedAt);

				if (!site.active) {
					int64_t present = 0;
					{
						auto rows = txn->QueryWithParams(SQL_HISTORY_EXISTS, err, site.domain, added);
						if (!rows.IsValid()) return -1;
						if (rows.Next(err)) present = rows.GetInt64(0);
					}
					if (present > 0) continue;
				}

				const int n = txn->ExecuteWithParams(SQL_INSERT_SITE, err,
					site.domain, std::string(Core::ToString(site.source)), added, site.active,
					site.active ? std::optional<int64_t>{} : OptionalMillis(site.deactivatedAt), site.reason);
				if (n < 0) return -1;
				written += n;
			}

			if (!txn->Commit(err)) return -1;
			NG_LOG_INFO("BlockedSiteStore", "Imported %d of %zu records", written, sites.size());
			return written;
		}

		nlohmann::json BlockedSiteStore::ToJson(const std::vector<Core::BlockedSite>& sites) {
			nlohmann::json arr = nlohmann::json::array();
			for (const auto& s : sites) {
				nlohmann::json item = {
					{"domain", s.domain},
					{"source", Core::ToString(s.source)},
					{"added_at", ToEpochMillis(s.addedAt)},
					{"active", s.active},
					{"reason", s.reason}
				};
				if (s.deactivatedAt) item["deactivated_at"] = ToEpochMillis(*s.deactivatedAt);
				arr.push_back(std::move(item));
			}
			return { {"version", EXPORT_FORMAT_VERSION}, {"blocked_sites", std::move(arr)} };
		}

		bool BlockedSiteStore::FromJson(const nlohmann::json& doc, std::vector<Core::BlockedSite>& out, std::string* error) {
			const auto fail = [error](const std::string& msg) {
				if (error) *error = msg;
				return false;
			};

			const nlohmann::json* list = &doc;
			if (doc.is_object()) {
				auto it = doc.find("blocked_sites");
				if (it == doc.end()) return fail("missing 'blocked_sites' array");
				list = &*it;
			}
			if (!list->is_array()) return fail("'blocked_sites' is not an array");

			out.clear();
			size_t index = 0;
			for (const auto& item : *list) {
				const std::string where = "blocked_sites[" + std::to_string(index++) + "]";
				if (!item.is_object()) return fail(where + " is not an object");

				auto domain = item.find("domain");
				if (domain == item.end() || !domain->is_string() || domain->get<std::string>().empty()) {
					return fail(where + ".domain must be a non-empty string");
				}

				Core::BlockedSite s;
				s.domain = domain->get<std::string>();

				if (auto it = item.find("source"); it != item.end()) {
					if (!it->is_string()) return fail(where + ".source must be a string");
					auto src = Core::SiteSourceFromString(it->get<std::string>());
					if (!src) return fail(where + ".source must be 'auto' or 'manual'");
					s.source = *src;
				}
				if (auto it = item.find("added_at"); it != item.end()) {
					if (!it->is_number_integer()) return fail(where + ".added_at must be epoch milliseconds");
					s.addedAt = FromEpochMillis(it->get<int64_t>());
				}
				if (auto it = item.find("active"); it != item.end()) {
					if (!it->is_boolean()) return fail(where + ".active must be a boolean");
					s.active = it->get<bool>();
				}
				if (auto it = item.find("deactivated_at"); it != item.end() && !it->is_null()) {
					if (!it->is_number_integer()) return fail(where + ".deactivated_at must be epoch milliseconds");
					s.deactivatedAt = FromEpochMillis(it->get<int64_t>());
				}
				if (auto it = item.find("reason"); it != item.end() && it->is_string()) {
					s.reason = it->get<std::string>();
				}
				out.push_back(std::move(s));
			}
			return true;
		}

	}  // namespace Database
}  // namespace NetGuard
