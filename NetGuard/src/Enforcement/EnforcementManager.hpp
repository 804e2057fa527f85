#pragma once

#include "HostsFile.hpp"
#include "../Core/Types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace NetGuard {
	namespace Database { class AuditLogDB; }

	namespace Enforcement {

		struct EnforcementOptions {
			std::string redirectAddress = "127.0.0.1";
			bool includeWww = true;     ///< also enforce "www.<domain>"
		};

		struct ReconcileReport {
			std::vector<std::string> added;
			std::vector<std::string> removed;
			bool wrote = false;
		};

		/**
		 * @brief Mirrors the active blocked-site set into the override table.
		 *
		 * Reconcile() is the only writer and runs under a mutex. The table is
		 * rewritten only when the rendered content differs from what is on disk,
		 * so a second pass with an unchanged set performs no write.
		 */
		class EnforcementManager {
		public:
			/// @param audit optional; receives one enforcement_actions row per change
			EnforcementManager(std::unique_ptr<IHostsTableIO> io, EnforcementOptions options,
				Database::AuditLogDB* audit = nullptr);

			/**
			 * @brief Aligns the managed region with @p activeDomains.
			 * @throws Core::PermissionError when the table cannot be read or written;
			 *         the table is left as it was
			 * @throws Core::StorageError on other I/O failures
			 */
			ReconcileReport Reconcile(const std::vector<std::string>& activeDomains);

			/// Host names that @p domains expand to
			[[nodiscard]] std::set<std::string> DesiredHosts(const std::vector<std::string>& domains) const;

			/// Host names currently inside the managed region
			[[nodiscard]] std::set<std::string> EnforcedHosts();

			[[nodiscard]] uint64_t WriteCount() const noexcept { return m_writes.load(); }
			[[nodiscard]] std::string Target() const { return m_io->Describe(); }

		private:
			void recordAction(const std::string& action, const std::string& domain, const std::string& detail, bool success);

			std::unique_ptr<IHostsTableIO> m_io;
			EnforcementOptions m_options;
			Database::AuditLogDB* m_audit;

			std::mutex m_reconcileMutex;
			std::atomic<uint64_t> m_writes{ 0 };
		};

	}  // namespace Enforcement
}  // namespace NetGuard
