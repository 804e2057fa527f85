#include "NetworkUtils.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace NetGuard {
	namespace Utils {
		namespace NetworkUtils {

			namespace {

				void SetError(Error* err, int code, std::string msg, std::string ctx = {}) {
					if (err) {
						err->code = code;
						err->message = std::move(msg);
						err->context = std::move(ctx);
					}
				}

				bool ReadWholeFile(const std::filesystem::path& p, std::string& out) {
					std::ifstream in(p, std::ios::binary);
					if (!in) return false;
					std::ostringstream ss;
					ss << in.rdbuf();
					out = ss.str();
					return true;
				}

				bool ParseHex32(std::string_view hex, uint32_t& out) {
					if (hex.empty() || hex.size() > 8) return false;
					uint32_t v = 0;
					for (char c : hex) {
						v <<= 4;
						if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
						else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
						else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
						else return false;
					}
					out = v;
					return true;
				}

				// "0100007F:0050" -> 127.0.0.1:80. Each 32-bit address word is the
				// in-memory value printed as a host-order integer, so copying the
				// parsed word back restores network byte order.
				bool ParseProcEndpoint(std::string_view field, bool v6, IpAddress& addr, uint16_t& port) {
					const size_t colon = field.find(':');
					if (colon == std::string_view::npos) return false;
					const std::string_view hexAddr = field.substr(0, colon);
					const std::string_view hexPort = field.substr(colon + 1);

					uint32_t p = 0;
					if (!ParseHex32(hexPort, p) || p > 0xFFFF) return false;
					port = static_cast<uint16_t>(p);

					const size_t words = v6 ? 4 : 1;
					if (hexAddr.size() != words * 8) return false;

					addr = IpAddress{};
					addr.version = v6 ? IpVersion::IPv6 : IpVersion::IPv4;
					for (size_t w = 0; w < words; ++w) {
						uint32_t word = 0;
						if (!ParseHex32(hexAddr.substr(w * 8, 8), word)) return false;
						std::memcpy(&addr.bytes[w * 4], &word, 4);
					}
					return true;
				}

				bool IsAllDigits(std::string_view s) {
					return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
				}

				std::unordered_map<uint64_t, uint32_t> BuildInodeToPidMap(const std::filesystem::path& procRoot) {
					std::unordered_map<uint64_t, uint32_t> map;
					std::error_code ec;
					std::filesystem::directory_iterator procIt(procRoot, ec);
					if (ec) return map;

					for (const auto& entry : procIt) {
						const std::string name = entry.path().filename().string();
						if (!IsAllDigits(name)) continue;

						const uint32_t pid = static_cast<uint32_t>(std::stoul(name));
						std::error_code fdEc;
						std::filesystem::directory_iterator fdIt(entry.path() / "fd", fdEc);
						if (fdEc) continue; // process exited or not ours to inspect

						for (const auto& fd : fdIt) {
							std::error_code linkEc;
							const auto target = std::filesystem::read_symlink(fd.path(), linkEc);
							if (linkEc) continue;
							const std::string t = target.string();
							// socket:[12345]
							if (t.rfind("socket:[", 0) == 0 && t.back() == ']') {
								const std::string num = t.substr(8, t.size() - 9);
								if (IsAllDigits(num)) {
									map.emplace(std::stoull(num), pid);
								}
							}
						}
					}
					return map;
				}

			}  // namespace

			// ============================================================================
			// IpAddress
			// ============================================================================

			std::string IpAddress::ToString() const {
				char buf[INET6_ADDRSTRLEN] = { 0 };
				if (version == IpVersion::IPv4) {
					if (!::inet_ntop(AF_INET, bytes.data(), buf, sizeof(buf))) return {};
				}
				else if (version == IpVersion::IPv6) {
					if (!::inet_ntop(AF_INET6, bytes.data(), buf, sizeof(buf))) return {};
				}
				else {
					return {};
				}
				return std::string(buf);
			}

			IpAddress IpAddress::Unmapped() const noexcept {
				if (version != IpVersion::IPv6) return *this;
				static constexpr uint8_t prefix[12] = { 0,0,0,0,0,0,0,0,0,0,0xFF,0xFF };
				if (std::memcmp(bytes.data(), prefix, sizeof(prefix)) != 0) return *this;
				IpAddress v4;
				v4.version = IpVersion::IPv4;
				std::memcpy(v4.bytes.data(), bytes.data() + 12, 4);
				return v4;
			}

			bool IpAddress::IsLoopback() const noexcept {
				const IpAddress a = Unmapped();
				if (a.version == IpVersion::IPv4) return a.bytes[0] == 127;
				if (a.version == IpVersion::IPv6) {
					for (size_t i = 0; i < 15; ++i) if (a.bytes[i] != 0) return false;
					return a.bytes[15] == 1;
				}
				return false;
			}

			bool IpAddress::IsUnspecified() const noexcept {
				const IpAddress a = Unmapped();
				const size_t len = a.version == IpVersion::IPv4 ? 4 : 16;
				if (a.version == IpVersion::Unknown) return true;
				for (size_t i = 0; i < len; ++i) if (a.bytes[i] != 0) return false;
				return true;
			}

			bool IpAddress::IsPrivate() const noexcept {
				const IpAddress a = Unmapped();
				if (a.version == IpVersion::IPv4) {
					const uint8_t b0 = a.bytes[0], b1 = a.bytes[1];
					if (b0 == 10) return true;
					if (b0 == 172 && b1 >= 16 && b1 <= 31) return true;
					if (b0 == 192 && b1 == 168) return true;
					if (b0 == 169 && b1 == 254) return true;
					if (b0 == 100 && b1 >= 64 && b1 <= 127) return true;
					return false;
				}
				if (a.version == IpVersion::IPv6) {
					if ((a.bytes[0] & 0xFE) == 0xFC) return true;                       // fc00::/7
					if (a.bytes[0] == 0xFE && (a.bytes[1] & 0xC0) == 0x80) return true; // fe80::/10
					return false;
				}
				return false;
			}

			bool ParseIpAddress(std::string_view str, IpAddress& out, Error* err) noexcept {
				out = IpAddress{};
				std::string s(str);
				if (!s.empty() && s.front() == '[' && s.back() == ']') {
					s = s.substr(1, s.size() - 2);
				}

				if (::inet_pton(AF_INET, s.c_str(), out.bytes.data()) == 1) {
					out.version = IpVersion::IPv4;
					return true;
				}
				if (::inet_pton(AF_INET6, s.c_str(), out.bytes.data()) == 1) {
					out.version = IpVersion::IPv6;
					return true;
				}
				out = IpAddress{};
				SetError(err, EINVAL, "not an IP address", s);
				return false;
			}

			bool IsValidIpAddress(std::string_view str) noexcept {
				IpAddress tmp;
				return ParseIpAddress(str, tmp, nullptr);
			}

			bool ReverseLookup(const IpAddress& address, std::string& hostname, Error* err) noexcept {
				hostname.clear();
				char host[NI_MAXHOST] = { 0 };
				int rc = 0;

				if (address.version == IpVersion::IPv4) {
					sockaddr_in sa{};
					sa.sin_family = AF_INET;
					std::memcpy(&sa.sin_addr, address.bytes.data(), 4);
					rc = ::getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
				}
				else if (address.version == IpVersion::IPv6) {
					sockaddr_in6 sa{};
					sa.sin6_family = AF_INET6;
					std::memcpy(&sa.sin6_addr, address.bytes.data(), 16);
					rc = ::getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
				}
				else {
					SetError(err, EINVAL, "invalid address", "ReverseLookup");
					return false;
				}

				if (rc != 0) {
					SetError(err, rc, ::gai_strerror(rc), address.ToString());
					return false;
				}
				hostname = StringUtils::ToLowerCopy(host);
				return true;
			}

			// ============================================================================
			// URLs & Domains
			// ============================================================================

			bool ParseUrl(std::string_view url, UrlComponents& c, Error* err) noexcept {
				c = UrlComponents{};
				std::string_view rest = url;
				while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front()))) rest.remove_prefix(1);
				while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back()))) rest.remove_suffix(1);
				if (rest.empty()) {
					SetError(err, EINVAL, "empty URL");
					return false;
				}

				const size_t schemeEnd = rest.find("://");
				if (schemeEnd != std::string_view::npos) {
					c.scheme = StringUtils::ToLowerCopy(rest.substr(0, schemeEnd));
					rest.remove_prefix(schemeEnd + 3);
				}

				const size_t fragPos = rest.find('#');
				if (fragPos != std::string_view::npos) {
					c.fragment = std::string(rest.substr(fragPos + 1));
					rest = rest.substr(0, fragPos);
				}

				const size_t pathPos = rest.find_first_of("/?");
				std::string_view authority = rest.substr(0, pathPos);
				std::string_view pathAndQuery = pathPos == std::string_view::npos ? std::string_view{} : rest.substr(pathPos);

				const size_t at = authority.rfind('@');
				if (at != std::string_view::npos) authority.remove_prefix(at + 1);

				std::string_view hostPart = authority;
				std::string_view portPart;
				if (!authority.empty() && authority.front() == '[') {
					const size_t close = authority.find(']');
					if (close == std::string_view::npos) {
						SetError(err, EINVAL, "unterminated IPv6 literal", std::string(url));
						return false;
					}
					hostPart = authority.substr(1, close - 1);
					if (close + 1 < authority.size() && authority[close + 1] == ':') {
						portPart = authority.substr(close + 2);
					}
				}
				else {
					const size_t colon = authority.rfind(':');
					if (colon != std::string_view::npos) {
						hostPart = authority.substr(0, colon);
						portPart = authority.substr(colon + 1);
					}
				}

				if (!portPart.empty()) {
					uint32_t port = 0;
					for (char ch : portPart) {
						if (!std::isdigit(static_cast<unsigned char>(ch))) {
							SetError(err, EINVAL, "invalid port", std::string(url));
							return false;
						}
						port = port * 10 + static_cast<uint32_t>(ch - '0');
						if (port > 65535) {
							SetError(err, EINVAL, "port out of range", std::string(url));
							return false;
						}
					}
					c.port = static_cast<uint16_t>(port);
				}

				c.host = StringUtils::ToLowerCopy(hostPart);
				if (c.host.empty()) {
					SetError(err, EINVAL, "missing host", std::string(url));
					return false;
				}

				const size_t q = pathAndQuery.find('?');
				if (q != std::string_view::npos) {
					c.path = std::string(pathAndQuery.substr(0, q));
					c.query = std::string(pathAndQuery.substr(q + 1));
				}
				else {
					c.path = std::string(pathAndQuery);
				}
				if (c.path.empty()) c.path = "/";
				return true;
			}

			std::string ExtractHostname(std::string_view url) noexcept {
				UrlComponents c;
				if (!ParseUrl(url, c, nullptr)) return {};
				return c.host;
			}

			bool IsValidDomain(std::string_view domain) noexcept {
				if (domain.empty() || domain.size() > 253) return false;
				size_t labelLen = 0;
				char prev = '.';
				for (char ch : domain) {
					const unsigned char c = static_cast<unsigned char>(ch);
					if (ch == '.') {
						if (labelLen == 0 || prev == '-') return false;
						labelLen = 0;
					}
					else if (std::isalnum(c) || ch == '-' || ch == '_') {
						if (labelLen == 0 && ch == '-') return false;
						if (++labelLen > 63) return false;
					}
					else {
						return false;
					}
					prev = ch;
				}
				return labelLen > 0 && prev != '-';
			}

			std::string NormalizeDomain(std::string_view input) noexcept {
				std::string host;
				const std::string trimmed = StringUtils::TrimCopy(input);
				if (IsValidIpAddress(trimmed)) {
					IpAddress ip;
					ParseIpAddress(trimmed, ip, nullptr);
					return ip.ToString();
				}
				if (input.find("://") != std::string_view::npos || input.find_first_of("/:?") != std::string_view::npos) {
					host = ExtractHostname(input);
				}
				else {
					host = StringUtils::TrimCopy(input);
					StringUtils::ToLower(host);
				}

				while (!host.empty() && host.back() == '.') host.pop_back();
				if (StringUtils::StartsWith(host, "www.") && host.size() > 4) {
					host.erase(0, 4);
				}
				if (IsValidIpAddress(host)) return host;
				return IsValidDomain(host) ? host : std::string{};
			}

			bool DomainMatches(std::string_view domain, std::string_view suffix) noexcept {
				if (suffix.empty() || domain.size() < suffix.size()) return false;
				if (domain == suffix) return true;
				return StringUtils::EndsWith(domain, suffix) && domain[domain.size() - suffix.size() - 1] == '.';
			}

			// ============================================================================
			// Connections
			// ============================================================================

			const char* ProtocolToString(ProtocolType p) noexcept {
				switch (p) {
				case ProtocolType::TCP:  return "tcp";
				case ProtocolType::TCP6: return "tcp6";
				case ProtocolType::UDP:  return "udp";
				case ProtocolType::UDP6: return "udp6";
				default:                 return "unknown";
				}
			}

			bool ParseProcNetTable(std::string_view content, ProtocolType protocol,
				std::vector<ConnectionInfo>& out, Error* err) noexcept {
				try {
					const bool v6 = protocol == ProtocolType::TCP6 || protocol == ProtocolType::UDP6;
					std::istringstream in{ std::string(content) };
					std::string line;
					bool first = true;
					while (std::getline(in, line)) {
						if (first) { first = false; continue; } // column header

						std::istringstream ls(line);
						std::string sl, local, remote, st, queues, timer, retr, uid, timeout, inode;
						if (!(ls >> sl >> local >> remote >> st >> queues >> timer >> retr >> uid >> timeout >> inode)) {
							continue;
						}

						ConnectionInfo ci;
						ci.protocol = protocol;
						if (!ParseProcEndpoint(local, v6, ci.localAddress, ci.localPort)) continue;
						if (!ParseProcEndpoint(remote, v6, ci.remoteAddress, ci.remotePort)) continue;

						uint32_t state = 0;
						if (!ParseHex32(st, state)) continue;
						ci.state = static_cast<TcpState>(state);
						if (!IsAllDigits(inode)) continue;
						ci.inode = std::stoull(inode);
						out.push_back(std::move(ci));
					}
					return true;
				}
				catch (const std::exception& e) {
					SetError(err, EIO, e.what(), "ParseProcNetTable");
					return false;
				}
			}

			bool GetActiveConnections(std::vector<ConnectionInfo>& connections,
				const std::filesystem::path& procRoot, Error* err) noexcept {
				connections.clear();
				try {
					std::string content;
					if (!ReadWholeFile(procRoot / "net" / "tcp", content)) {
						SetError(err, ENOENT, "cannot read connection table", (procRoot / "net" / "tcp").string());
						return false;
					}
					if (!ParseProcNetTable(content, ProtocolType::TCP, connections, err)) return false;

					// tcp6 is absent when IPv6 is disabled
					if (ReadWholeFile(procRoot / "net" / "tcp6", content)) {
						if (!ParseProcNetTable(content, ProtocolType::TCP6, connections, err)) return false;
					}

					const auto owners = BuildInodeToPidMap(procRoot);
					for (auto& c : connections) {
						auto it = owners.find(c.inode);
						if (it != owners.end()) c.processId = it->second;
					}
					return true;
				}
				catch (const std::exception& e) {
					SetError(err, EIO, e.what(), "GetActiveConnections");
					return false;
				}
			}

			std::string GetProcessName(uint32_t pid, const std::filesystem::path& procRoot) noexcept {
				if (pid == 0) return {};
				try {
					std::string comm;
					if (!ReadWholeFile(procRoot / std::to_string(pid) / "comm", comm)) return {};
					StringUtils::TrimRight(comm);
					return comm;
				}
				catch (const std::exception&) {
					return {};
				}
			}

			// ============================================================================
			// Interface counters
			// ============================================================================

			bool ParseProcNetDev(std::string_view content, NetworkStatistics& stats, Error* err) noexcept {
				try {
					NetworkStatistics total;
					std::istringstream in{ std::string(content) };
					std::string line;
					bool sawInterface = false;
					while (std::getline(in, line)) {
						const size_t colon = line.find(':');
						if (colon == std::string::npos) continue;
						const std::string iface = StringUtils::TrimCopy(line.substr(0, colon));
						if (iface.empty() || iface.find('|') != std::string::npos) continue;
						sawInterface = true;
						if (iface == "lo") continue;

						std::istringstream fs(line.substr(colon + 1));
						uint64_t f[16] = { 0 };
						size_t n = 0;
						while (n < 16 && (fs >> f[n])) ++n;
						if (n < 10) continue;

						total.bytesReceived += f[0];
						total.packetsReceived += f[1];
						total.bytesSent += f[8];
						total.packetsSent += f[9];
					}
					if (!sawInterface) {
						SetError(err, EINVAL, "no interfaces in counter table", "ParseProcNetDev");
						return false;
					}
					total.timestamp = std::chrono::steady_clock::now();
					stats = total;
					return true;
				}
				catch (const std::exception& e) {
					SetError(err, EIO, e.what(), "ParseProcNetDev");
					return false;
				}
			}

			bool GetNetworkStatistics(NetworkStatistics& stats, const std::filesystem::path& procRoot, Error* err) noexcept {
				std::string content;
				try {
					if (!ReadWholeFile(procRoot / "net" / "dev", content)) {
						SetError(err, ENOENT, "cannot read interface counters", (procRoot / "net" / "dev").string());
						return false;
					}
				}
				catch (const std::exception& e) {
					SetError(err, EIO, e.what(), "GetNetworkStatistics");
					return false;
				}
				return ParseProcNetDev(content, stats, err);
			}

			bool CalculateBandwidth(const NetworkStatistics& previous, const NetworkStatistics& current,
				BandwidthInfo& bandwidth) noexcept {
				const double secs = std::chrono::duration<double>(current.timestamp - previous.timestamp).count();
				if (secs <= 0.0) return false;
				if (current.bytesSent < previous.bytesSent || current.bytesReceived < previous.bytesReceived) {
					return false;
				}
				bandwidth.sendBytesPerSec = static_cast<double>(current.bytesSent - previous.bytesSent) / secs;
				bandwidth.recvBytesPerSec = static_cast<double>(current.bytesReceived - previous.bytesReceived) / secs;
				bandwidth.totalMbps = (bandwidth.sendBytesPerSec + bandwidth.recvBytesPerSec) * 8.0 / 1'000'000.0;
				return true;
			}

		}  // namespace NetworkUtils
	}  // namespace Utils
}  // namespace NetGuard
