#include "ConnectionSource.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"

namespace NetGuard {
	namespace Monitoring {

		namespace NU = Utils::NetworkUtils;

		ProcNetConnectionSource::ProcNetConnectionSource(ProcNetSourceOptions options)
			: m_options(std::move(options)) {
		}

		size_t ProcNetConnectionSource::CachedHostnames() const {
			std::lock_guard<std::mutex> lock(m_cacheMutex);
			return m_hostnames.size();
		}

		std::string ProcNetConnectionSource::resolve(const std::string& address) {
			const auto now = std::chrono::steady_clock::now();
			{
				std::lock_guard<std::mutex> lock(m_cacheMutex);
				auto it = m_hostnames.find(address);
				if (it != m_hostnames.end() && now - it->second.resolvedAt < m_options.hostnameTtl) {
					return it->second.hostname;
				}
			}

			std::string hostname;
			NU::IpAddress ip;
			if (NU::ParseIpAddress(address, ip)) {
				NU::Error err;
				if (!NU::ReverseLookup(ip, hostname, &err)) {
					hostname.clear();
					NG_LOG_TRACE("Sampler", "No reverse name for %s: %s", address.c_str(), err.message.c_str());
				}
			}

			std::lock_guard<std::mutex> lock(m_cacheMutex);
			if (m_hostnames.size() >= m_options.hostnameCacheLimit) {
				m_hostnames.clear();
			}
			m_hostnames[address] = CachedName{ hostname, now };
			return hostname;
		}

		std::vector<Core::Connection> ProcNetConnectionSource::Enumerate() {
			std::vector<NU::ConnectionInfo> raw;
			NU::Error err;
			if (!NU::GetActiveConnections(raw, m_options.procRoot, &err)) {
				if (err.code == EACCES || err.code == EPERM) {
					throw Core::PermissionError("sample", "cannot read connection table: " + err.message, err.code);
				}
				throw Core::StorageError("sample", {}, "cannot read connection table: " + err.message);
			}

			const auto now = Core::Clock::now();
			std::vector<Core::Connection> out;
			out.reserve(raw.size());

			for (const auto& c : raw) {
				if (c.state != NU::TcpState::Established && c.state != NU::TcpState::SynSent) continue;

				const NU::IpAddress remote = c.remoteAddress.Unmapped();
				if (remote.IsLoopback() || remote.IsUnspecified()) continue;
				if (m_options.skipPrivateAddresses && remote.IsPrivate()) continue;

				Core::Connection conn;
				conn.remoteAddress = remote.ToString();
				conn.remotePort = c.remotePort;
				conn.processId = c.processId;
				conn.protocol = NU::ProtocolToString(c.protocol);
				conn.firstSeen = now;
				conn.lastSeen = now;
				if (c.processId != 0) conn.processName = NU::GetProcessName(c.processId, m_options.procRoot);
				if (m_options.resolveHostnames) conn.remoteHost = resolve(conn.remoteAddress);
				out.push_back(std::move(conn));
			}
			return out;
		}

	}  // namespace Monitoring
}  // namespace NetGuard
