#pragma once

#include "../Core/Types.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace NetGuard {
	namespace Monitoring {

		/**
		 * @brief Enumerates the current outbound connections.
		 *
		 * Implementations throw a Core::NetGuardError subclass on failure. Calls
		 * may be slow (name resolution) but are never made concurrently by the
		 * sampler.
		 */
		class IConnectionSource {
		public:
			virtual ~IConnectionSource() = default;
			virtual std::vector<Core::Connection> Enumerate() = 0;
			virtual std::string Name() const = 0;
		};

		struct ProcNetSourceOptions {
			std::filesystem::path procRoot = "/proc";
			bool skipPrivateAddresses = true;
			bool resolveHostnames = true;
			std::chrono::seconds hostnameTtl{ 600 };
			size_t hostnameCacheLimit = 4096;
		};

		/**
		 * @brief Linux source reading /proc/net/tcp{,6}.
		 *
		 * Keeps established and connecting sockets whose remote end is neither
		 * loopback, unspecified nor (optionally) private. Owning process names
		 * come from /proc/<pid>/comm; remote names from a cached reverse lookup.
		 */
		class ProcNetConnectionSource final : public IConnectionSource {
		public:
			explicit ProcNetConnectionSource(ProcNetSourceOptions options = {});

			std::vector<Core::Connection> Enumerate() override;
			std::string Name() const override { return "procnet"; }

			size_t CachedHostnames() const;

		private:
			std::string resolve(const std::string& address);

			struct CachedName {
				std::string hostname;   ///< empty when the lookup failed
				std::chrono::steady_clock::time_point resolvedAt;
			};

			ProcNetSourceOptions m_options;
			mutable std::mutex m_cacheMutex;
			std::unordered_map<std::string, CachedName> m_hostnames;
		};

	}  // namespace Monitoring
}  // namespace NetGuard
