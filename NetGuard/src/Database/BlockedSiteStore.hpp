#pragma once

#include "DatabaseManager.hpp"
#include "../Core/Types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace NetGuard {
	namespace Database {

		/**
		 * @brief Durable blocked-site set and manual overrides.
		 *
		 * blocked_sites rows are never deleted. Unblocking sets active = 0 and
		 * stamps deactivated_at; a partial unique index guarantees at most one
		 * active row per domain, so AddSite on an already blocked domain is a no-op.
		 */
		class BlockedSiteStore {
		public:
			explicit BlockedSiteStore(DatabaseManager& db) noexcept : m_db(db) {}

			BlockedSiteStore(const BlockedSiteStore&) = delete;
			BlockedSiteStore& operator=(const BlockedSiteStore&) = delete;

			bool Initialize(DatabaseError* err = nullptr);

			// === Blocked sites ===

			/**
			 * @brief Activates a block for @p site.domain.
			 * @param inserted set to false when the domain was already active
			 */
			bool AddSite(const Core::BlockedSite& site, bool* inserted = nullptr, DatabaseError* err = nullptr);

			/**
			 * @brief Turns the active record of @p domain into a manual block with @p reason.
			 *
			 * added_at is kept. @param changed set to false when no active record existed
			 */
			bool MarkManual(const std::string& domain, const std::string& reason,
				bool* changed = nullptr, DatabaseError* err = nullptr);

			/// @param changed set to false when no active record existed
			bool Deactivate(const std::string& domain, Core::Timestamp when,
				bool* changed = nullptr, DatabaseError* err = nullptr);

			bool IsActive(const std::string& domain, DatabaseError* err = nullptr);
			std::optional<Core::BlockedSite> GetActive(const std::string& domain, DatabaseError* err = nullptr);
			std::vector<Core::BlockedSite> ActiveSites(DatabaseError* err = nullptr);
			std::vector<Core::BlockedSite> AllSites(DatabaseError* err = nullptr);
			std::vector<std::string> ActiveDomains(DatabaseError* err = nullptr);
			int64_t CountActive(DatabaseError* err = nullptr);

			// === Overrides ===

			bool SetOverride(const Core::DomainOverride& ov, DatabaseError* err = nullptr);
			bool RemoveOverride(const std::string& domain, DatabaseError* err = nullptr);
			std::optional<Core::DomainOverride> GetOverride(const std::string& domain, DatabaseError* err = nullptr);
			std::vector<Core::DomainOverride> ListOverrides(DatabaseError* err = nullptr);

			// === Export / import ===

			std::vector<Core::BlockedSite> Export(DatabaseError* err = nullptr) { return AllSites(err); }

			/**
			 * @brief Merges exported records into this store in one transaction.
			 *
			 * Active records become active here unless the domain is already active.
			 * Inactive records are kept as history when not already present.
			 * @return number of records written, -1 on failure (nothing written)
			 */
			int Import(const std::vector<Core::BlockedSite>& sites, DatabaseError* err = nullptr);

			static nlohmann::json ToJson(const std::vector<Core::BlockedSite>& sites);

			/// @return false with @p error filled when the document is malformed
			static bool FromJson(const nlohmann::json& doc, std::vector<Core::BlockedSite>& out, std::string* error);

		private:
			DatabaseManager& m_db;
		};

	}  // namespace Database
}  // namespace NetGuard
