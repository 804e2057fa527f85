#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace NetGuard {
	namespace Utils {
		namespace NetworkUtils {

			// ============================================================================
			// Error Handling
			// ============================================================================

			struct Error {
				int code = 0;            ///< errno / getaddrinfo code
				std::string message;
				std::string context;

				[[nodiscard]] bool HasError() const noexcept { return !message.empty(); }
				void Clear() noexcept { code = 0; message.clear(); context.clear(); }
			};

			// ============================================================================
			// IP Addresses
			// ============================================================================

			enum class IpVersion : uint8_t {
				Unknown = 0,
				IPv4 = 4,
				IPv6 = 6
			};

			/**
			 * @brief IPv4 or IPv6 address in network byte order.
			 *
			 * IPv4 uses the first four bytes of @c bytes.
			 */
			struct IpAddress {
				IpVersion version = IpVersion::Unknown;
				std::array<uint8_t, 16> bytes{};

				[[nodiscard]] bool IsValid() const noexcept { return version != IpVersion::Unknown; }
				[[nodiscard]] bool IsIPv4() const noexcept { return version == IpVersion::IPv4; }
				[[nodiscard]] bool IsIPv6() const noexcept { return version == IpVersion::IPv6; }

				[[nodiscard]] std::string ToString() const;
				[[nodiscard]] bool IsLoopback() const noexcept;
				/// RFC1918, RFC4193 unique-local, link-local and CGNAT ranges
				[[nodiscard]] bool IsPrivate() const noexcept;
				[[nodiscard]] bool IsUnspecified() const noexcept;
				/// ::ffff:a.b.c.d unwrapped to IPv4, anything else returned as is
				[[nodiscard]] IpAddress Unmapped() const noexcept;

				bool operator==(const IpAddress& other) const noexcept {
					return version == other.version && bytes == other.bytes;
				}
			};

			bool ParseIpAddress(std::string_view str, IpAddress& out, Error* err = nullptr) noexcept;
			[[nodiscard]] bool IsValidIpAddress(std::string_view str) noexcept;

			/**
			 * @brief PTR lookup through getnameinfo(NI_NAMEREQD).
			 * @return false when no name is registered or the resolver failed.
			 */
			bool ReverseLookup(const IpAddress& address, std::string& hostname, Error* err = nullptr) noexcept;

			// ============================================================================
			// URLs & Domains
			// ============================================================================

			struct UrlComponents {
				std::string scheme;      ///< lower-cased, empty if absent
				std::string host;        ///< lower-cased, brackets removed for IPv6
				uint16_t port = 0;       ///< 0 when not given
				std::string path;        ///< begins with '/', "/" when absent
				std::string query;       ///< without leading '?'
				std::string fragment;
			};

			/**
			 * @brief Parses absolute URLs and bare authority forms ("host:443", "example.com/x").
			 */
			bool ParseUrl(std::string_view url, UrlComponents& components, Error* err = nullptr) noexcept;

			[[nodiscard]] std::string ExtractHostname(std::string_view url) noexcept;

			/**
			 * @brief Canonical form used for every domain comparison.
			 *
			 * Lower-cases, removes scheme, path, port, trailing dot and one leading
			 * "www." label. Returns empty for input that is not a valid hostname.
			 */
			[[nodiscard]] std::string NormalizeDomain(std::string_view input) noexcept;

			[[nodiscard]] bool IsValidDomain(std::string_view domain) noexcept;

			/// true when @p domain equals @p suffix or ends with "." + suffix
			[[nodiscard]] bool DomainMatches(std::string_view domain, std::string_view suffix) noexcept;

			// ============================================================================
			// Connections (/proc/net)
			// ============================================================================

			enum class ProtocolType : uint8_t {
				TCP = 0,
				TCP6,
				UDP,
				UDP6
			};

			[[nodiscard]] const char* ProtocolToString(ProtocolType p) noexcept;

			enum class TcpState : uint8_t {
				Unknown = 0,
				Established = 0x01,
				SynSent = 0x02,
				SynRecv = 0x03,
				FinWait1 = 0x04,
				FinWait2 = 0x05,
				TimeWait = 0x06,
				Close = 0x07,
				CloseWait = 0x08,
				LastAck = 0x09,
				Listen = 0x0A,
				Closing = 0x0B
			};

			struct ConnectionInfo {
				ProtocolType protocol = ProtocolType::TCP;
				IpAddress localAddress;
				uint16_t localPort = 0;
				IpAddress remoteAddress;
				uint16_t remotePort = 0;
				TcpState state = TcpState::Unknown;
				uint64_t inode = 0;
				uint32_t processId = 0;  ///< 0 when the owning process is not visible
			};

			/**
			 * @brief Parses one /proc/net/{tcp,tcp6,udp,udp6} table.
			 *
			 * Header and malformed lines are skipped. processId is left 0.
			 */
			bool ParseProcNetTable(std::string_view content, ProtocolType protocol,
			                       std::vector<ConnectionInfo>& out, Error* err = nullptr) noexcept;

			/**
			 * @brief Reads TCP/TCP6 tables under @p procRoot and attributes sockets to pids.
			 */
			bool GetActiveConnections(std::vector<ConnectionInfo>& connections,
			                          const std::filesystem::path& procRoot = "/proc",
			                          Error* err = nullptr) noexcept;

			/// Contents of /proc/<pid>/comm without the trailing newline.
			[[nodiscard]] std::string GetProcessName(uint32_t pid,
			                                         const std::filesystem::path& procRoot = "/proc") noexcept;

			// ============================================================================
			// Interface counters (/proc/net/dev)
			// ============================================================================

			struct NetworkStatistics {
				uint64_t bytesSent = 0;
				uint64_t bytesReceived = 0;
				uint64_t packetsSent = 0;
				uint64_t packetsReceived = 0;
				std::chrono::steady_clock::time_point timestamp{};
			};

			struct BandwidthInfo {
				double sendBytesPerSec = 0.0;
				double recvBytesPerSec = 0.0;
				double totalMbps = 0.0;
			};

			/// Sum over all interfaces except loopback.
			bool ParseProcNetDev(std::string_view content, NetworkStatistics& stats, Error* err = nullptr) noexcept;

			bool GetNetworkStatistics(NetworkStatistics& stats,
			                          const std::filesystem::path& procRoot = "/proc",
			                          Error* err = nullptr) noexcept;

			/// false when the samples are not ordered in time or counters went backwards
			bool CalculateBandwidth(const NetworkStatistics& previous, const NetworkStatistics& current,
			                        BandwidthInfo& bandwidth) noexcept;

		}  // namespace NetworkUtils
	}  // namespace Utils
}  // namespace NetGuard
