#include "EnforcementManager.hpp"
#include "../Database/AuditLogDB.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"

#include <algorithm>
#include <iterator>

namespace NetGuard {
	namespace Enforcement {

		EnforcementManager::EnforcementManager(std::unique_ptr<IHostsTableIO> io, EnforcementOptions options,
			Database::AuditLogDB* audit)
			: m_io(std::move(io)), m_options(std::move(options)), m_audit(audit) {
		}

		std::set<std::string> EnforcementManager::DesiredHosts(const std::vector<std::string>& domains) const {
			std::set<std::string> hosts;
			for (const auto& d : domains) {
				if (d.empty()) continue;
				hosts.insert(d);
				if (m_options.includeWww && !Utils::NetworkUtils::IsValidIpAddress(d) &&
					d.rfind("www.", 0) != 0) {
					hosts.insert("www." + d);
				}
			}
			return hosts;
		}

		std::set<std::string> EnforcementManager::EnforcedHosts() {
			std::lock_guard<std::mutex> lock(m_reconcileMutex);
			return HostsFile::ManagedHosts(m_io->Read());
		}

		ReconcileReport EnforcementManager::Reconcile(const std::vector<std::string>& activeDomains) {
			std::lock_guard<std::mutex> lock(m_reconcileMutex);

			ReconcileReport report;
			const std::set<std::string> desired = DesiredHosts(activeDomains);

			std::string current;
			try {
				current = m_io->Read();
			}
			catch (const Core::NetGuardError& ex) {
				recordAction("failed", {}, std::string("read: ") + ex.what(), false);
				throw;
			}

			const std::set<std::string> enforced = HostsFile::ManagedHosts(current);
			std::set_difference(desired.begin(), desired.end(), enforced.begin(), enforced.end(),
				std::back_inserter(report.added));
			std::set_difference(enforced.begin(), enforced.end(), desired.begin(), desired.end(),
				std::back_inserter(report.removed));

			const std::string next = HostsFile::Render(current, desired, m_options.redirectAddress);
			if (next == current) {
				return report;
			}

			try {
				m_io->Write(next);
			}
			catch (const Core::NetGuardError& ex) {
				NG_LOG_ERROR("Enforcement", "Cannot update %s: %s", m_io->Describe().c_str(), ex.what());
				recordAction("failed", {}, std::string("write: ") + ex.what(), false);
				throw;
			}

			report.wrote = true;
			m_writes.fetch_add(1);

			for (const auto& h : report.added) recordAction("add", h, m_options.redirectAddress, true);
			for (const auto& h : report.removed) recordAction("remove", h, {}, true);
			if (report.added.empty() && report.removed.empty()) {
				recordAction("reconcile", {}, "region rewritten", true);
			}

			NG_LOG_INFO("Enforcement", "Updated %s: +%zu -%zu hosts", m_io->Describe().c_str(),
				report.added.size(), report.removed.size());
			return report;
		}

		void EnforcementManager::recordAction(const std::string& action, const std::string& domain,
			const std::string& detail, bool success) {
			if (!m_audit) return;
			Core::EnforcementAction a;
			a.action = action;
			a.domain = domain;
			a.detail = detail;
			a.success = success;
			a.timestamp = Core::Clock::now();

			Database::DatabaseError err;
			if (m_audit->AppendEnforcementAction(a, &err) == 0) {
				NG_LOG_WARN("Enforcement", "Cannot record '%s' action: %s", action.c_str(), err.message.c_str());
			}
		}

	}  // namespace Enforcement
}  // namespace NetGuard
