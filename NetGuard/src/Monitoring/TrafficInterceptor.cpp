#include "TrafficInterceptor.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace NetGuard {
	namespace Monitoring {

		namespace NU = Utils::NetworkUtils;
		namespace SU = Utils::StringUtils;

		namespace {

			constexpr int ACCEPT_POLL_MS = 200;
			constexpr std::chrono::milliseconds REFUSE_TIMEOUT{ 1000 };
			constexpr size_t RELAY_BUFFER = 16384;

			std::string PeerName(const sockaddr_storage& addr) {
				char host[INET6_ADDRSTRLEN] = {};
				uint16_t port = 0;
				if (addr.ss_family == AF_INET) {
					const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
					::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
					port = ntohs(in->sin_port);
				}
				else if (addr.ss_family == AF_INET6) {
					const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
					::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
					port = ntohs(in6->sin6_port);
				}
				return std::string(host) + ":" + std::to_string(port);
			}

			std::string OriginForm(const NU::UrlComponents& url) {
				std::string target = url.path.empty() ? "/" : url.path;
				if (!url.query.empty()) target += "?" + url.query;
				return target;
			}

			uint16_t DefaultPort(const std::string& scheme) {
				return scheme == "https" ? 443 : 80;
			}

		}  // anonymous namespace

		/// Registers a client socket for the lifetime of its session.
		class TrafficInterceptor::SessionGuard {
		public:
			SessionGuard(TrafficInterceptor& owner, int fd) : m_owner(owner), m_fd(fd) {
				std::lock_guard<std::mutex> lock(m_owner.m_sessionMutex);
				m_owner.m_sessionFds.insert(fd);
			}
			~SessionGuard() {
				std::lock_guard<std::mutex> lock(m_owner.m_sessionMutex);
				m_owner.m_sessionFds.erase(m_fd);
				m_owner.m_idleFds.erase(m_fd);
			}

			SessionGuard(const SessionGuard&) = delete;
			SessionGuard& operator=(const SessionGuard&) = delete;

		private:
			TrafficInterceptor& m_owner;
			int m_fd;
		};

		TrafficInterceptor::TrafficInterceptor(InterceptorOptions options, std::shared_ptr<CertificateAuthority> authority)
			: m_options(std::move(options)), m_authority(std::move(authority)) {}

		TrafficInterceptor::~TrafficInterceptor() {
			Stop();
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		void TrafficInterceptor::Start() {
			if (m_running.load()) return;

			// shared read-only by every session that talks to an https origin
			m_clientContext = CreateClientContext(m_options.verifyUpstream);

			m_listenFd = ListenTcp(m_options.listenAddress, m_options.listenPort, 128, m_boundPort);
			m_pool = std::make_unique<Utils::ThreadPool>(m_options.sessionThreads == 0 ? 64 : m_options.sessionThreads,
				m_options.sessionBacklog, "NetGuard-Intercept");
			m_stopping.store(false);
			m_running.store(true, std::memory_order_release);
			m_acceptThread = std::thread(&TrafficInterceptor::acceptLoop, this);

			if (m_authority) {
				NG_LOG_INFO("Interceptor", "Listening on %s:%u, TLS inspection with root %s",
					m_options.listenAddress.c_str(), m_boundPort, m_authority->Fingerprint().c_str());
			}
			else {
				NG_LOG_WARN("Interceptor", "Listening on %s:%u without a root certificate; HTTPS is relayed uninspected",
					m_options.listenAddress.c_str(), m_boundPort);
			}
		}

		void TrafficInterceptor::Stop() {
			if (!m_running.exchange(false)) return;

			{
				std::lock_guard<std::mutex> lock(m_sessionMutex);
				m_stopping.store(true);
				// idle keep-alive clients and tunnels see end of stream; busy ones finish their exchange
				for (int fd : m_idleFds) ::shutdown(fd, SHUT_RD);
			}

			if (m_acceptThread.joinable()) m_acceptThread.join();
			if (m_listenFd >= 0) {
				::close(m_listenFd);
				m_listenFd = -1;
			}
			if (m_pool) {
				m_pool->shutdown();
				m_pool.reset();
			}
			m_clientContext.reset();
			NG_LOG_INFO("Interceptor", "Stopped after %llu sessions, %llu captures",
				static_cast<unsigned long long>(m_sessions.load()), static_cast<unsigned long long>(m_captured.load()));
		}

		size_t TrafficInterceptor::ActiveSessions() const {
			std::lock_guard<std::mutex> lock(m_sessionMutex);
			return m_sessionFds.size();
		}

		bool TrafficInterceptor::markIdle(int fd) {
			std::lock_guard<std::mutex> lock(m_sessionMutex);
			if (m_stopping.load()) return false;
			m_idleFds.insert(fd);
			return true;
		}

		void TrafficInterceptor::markBusy(int fd) {
			std::lock_guard<std::mutex> lock(m_sessionMutex);
			m_idleFds.erase(fd);
		}

		void TrafficInterceptor::acceptLoop() {
			while (m_running.load(std::memory_order_acquire)) {
				pollfd pfd{ m_listenFd, POLLIN, 0 };
				const int ready = ::poll(&pfd, 1, ACCEPT_POLL_MS);
				if (ready < 0) {
					if (errno == EINTR) continue;
					NG_LOG_ERRNO("Interceptor", "poll on listen socket failed");
					break;
				}
				if (ready == 0) continue;

				sockaddr_storage addr{};
				socklen_t len = sizeof(addr);
				const int fd = ::accept4(m_listenFd, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
				if (fd < 0) {
					if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
						NG_LOG_ERRNO("Interceptor", "accept failed");
					}
					continue;
				}

				const std::string peer = PeerName(addr);
				if (m_pool->try_post([this, fd, peer]() { handleClient(fd, peer); })) continue;
				if (m_pool->is_shutdown()) {
					::close(fd);
					break;
				}
				refuse(fd, peer);
			}
		}

		void TrafficInterceptor::refuse(int fd, const std::string& peer) {
			m_refused.fetch_add(1);
			SocketStream client(fd, peer, REFUSE_TIMEOUT);
			sendError(client, 503, "Service Unavailable");
			report(Core::InterceptionError(peer, "session limit reached (" + std::to_string(m_pool->get_busy_count()) +
				" busy, " + std::to_string(m_pool->get_backlog()) + " waiting), client refused"));
		}

		// ============================================================================
		// Sessions
		// ============================================================================

		void TrafficInterceptor::handleClient(int fd, std::string peer) {
			m_sessions.fetch_add(1);
			SessionGuard guard(*this, fd);
			auto client = std::make_unique<SocketStream>(fd, peer, m_options.ioTimeout);
			BufferedReader reader(*client);

			size_t served = 0;
			try {
				while (true) {
					if (!markIdle(fd)) break;
					if (served > 0) client->SetTimeout(m_options.keepAliveTimeout);

					HttpRequest request;
					bool got = false;
					try {
						got = Http::ReadRequestHead(reader, request, m_options.limits);
					}
					catch (const Core::CaptureTimeout&) {
						// a kept-alive client that sends nothing more is simply closed
						if (served > 0 && reader.Buffered() == 0) break;
						throw;
					}
					markBusy(fd);
					if (!got) break;
					client->SetTimeout(m_options.ioTimeout);

					if (SU::IEquals(request.method, "CONNECT")) {
						handleConnect(request, std::move(client), reader);
						return;
					}

					NU::UrlComponents url;
					if (!NU::ParseUrl(request.target, url) || url.host.empty() || url.scheme.empty()) {
						sendError(*client, 400, "Bad Request");
						report(Core::InterceptionError({}, "proxy request without absolute target: " +
							SU::TruncateUtf8(request.target, 120)));
						break;
					}
					const uint16_t port = url.port != 0 ? url.port : DefaultPort(url.scheme);
					request.target = OriginForm(url);
					++served;
					if (!exchange(*client, reader, request, url.scheme, url.host, port)) break;
				}
			}
			catch (const Core::NetGuardError& e) {
				report(e);
			}
			catch (const std::exception& e) {
				report(Core::InterceptionError(peer, std::string("session failed: ") + e.what()));
			}
		}

		void TrafficInterceptor::handleConnect(const HttpRequest& request, std::unique_ptr<SocketStream> client,
			BufferedReader& reader) {
			NU::UrlComponents authority;
			if (!NU::ParseUrl(request.target, authority) || authority.host.empty()) {
				sendError(*client, 400, "Bad Request");
				throw Core::InterceptionError({}, "malformed CONNECT target: " + SU::TruncateUtf8(request.target, 120));
			}
			const std::string host = authority.host;
			const uint16_t port = authority.port != 0 ? authority.port : 443;

			if (!m_authority) {
				if (!m_reportedNoAuthority.exchange(true)) {
					report(Core::InterceptionError(host,
						"no root certificate configured; encrypted sessions are relayed without inspection"));
				}
				m_tunnels.fetch_add(1);
				relayBlind(*client, reader.TakeBuffered(), host, port);
				return;
			}

			if (reader.Buffered() != 0) {
				throw Core::InterceptionError(host, "client sent data before the tunnel was established");
			}
			m_tunnels.fetch_add(1);
			serveInspected(std::move(client), host, port);
		}

		void TrafficInterceptor::serveInspected(std::unique_ptr<SocketStream> client, const std::string& host,
			uint16_t port) {
			const int fd = client->NativeHandle();
			auto context = m_authority->ServerContextFor(host);
			client->WriteAll("HTTP/1.1 200 Connection Established\r\n\r\n");

			std::unique_ptr<TlsStream> tls;
			try {
				tls = TlsStream::Accept(std::move(client), context.get());
			}
			catch (const Core::InterceptionError& e) {
				throw Core::InterceptionError(host, std::string(e.what()) +
					" (is the NetGuard root certificate installed in the browser?)");
			}

			BufferedReader reader(*tls);
			size_t served = 0;
			while (true) {
				if (!markIdle(fd)) break;
				HttpRequest request;
				bool got = false;
				try {
					got = Http::ReadRequestHead(reader, request, m_options.limits);
				}
				catch (const Core::CaptureTimeout&) {
					if (served > 0 && reader.Buffered() == 0) break;
					throw;
				}
				markBusy(fd);
				if (!got) break;

				// origin-form inside the tunnel; an absolute target is tolerated
				NU::UrlComponents url;
				if (!request.target.empty() && request.target[0] != '/' && NU::ParseUrl(request.target, url)) {
					request.target = OriginForm(url);
				}
				++served;
				if (!exchange(*tls, reader, request, "https", host, port)) break;
			}
			tls->Shutdown();
		}

		void TrafficInterceptor::relayBlind(SocketStream& client, std::string pending, const std::string& host,
			uint16_t port) {
			SocketStream upstream(ConnectTcp(host, port, m_options.connectTimeout), host, m_options.ioTimeout);
			client.WriteAll("HTTP/1.1 200 Connection Established\r\n\r\n");
			if (!pending.empty()) upstream.WriteAll(pending);

			if (!markIdle(client.NativeHandle())) return;
			relay(client, upstream, host);
		}

		void TrafficInterceptor::relay(Stream& client, Stream& upstream, const std::string& host) {
			Stream* ends[2] = { &client, &upstream };
			char buffer[RELAY_BUFFER];
			while (true) {
				// a TLS end may hold decrypted bytes the socket no longer signals
				const bool decoded = client.Pending() > 0 || upstream.Pending() > 0;
				pollfd fds[2] = {
					{ client.NativeHandle(), POLLIN, 0 },
					{ upstream.NativeHandle(), POLLIN, 0 },
				};
				const int ready = ::poll(fds, 2, decoded ? 0 : static_cast<int>(m_options.ioTimeout.count()));
				if (ready < 0) {
					if (errno == EINTR) continue;
					throw Core::InterceptionError(host, std::string("relay poll failed: ") + std::strerror(errno));
				}
				if (ready == 0 && !decoded) {
					throw Core::CaptureTimeout("intercept", host, m_options.ioTimeout);
				}
				for (int i = 0; i < 2; ++i) {
					if (ends[i]->Pending() == 0 && !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
					const size_t n = ends[i]->ReadSome(buffer, sizeof(buffer));
					if (n == 0) return;
					ends[1 - i]->WriteAll(std::string_view(buffer, n));
				}
			}
		}

		// ============================================================================
		// Request/response cycle
		// ============================================================================

		std::unique_ptr<Stream> TrafficInterceptor::openUpstream(const std::string& scheme, const std::string& host,
			uint16_t port) {
			auto socket = std::make_unique<SocketStream>(ConnectTcp(host, port, m_options.connectTimeout), host,
				m_options.ioTimeout);
			if (scheme != "https") return socket;

			return TlsStream::Connect(std::move(socket), m_clientContext.get(), host, m_options.verifyUpstream);
		}

		bool TrafficInterceptor::exchange(Stream& client, BufferedReader& clientReader, HttpRequest& request,
			const std::string& scheme, const std::string& host, uint16_t port) {
			Http::RemoveHeader(request.headers, "Proxy-Connection");
			const size_t excerpt = m_options.bodyExcerptBytes;

			std::unique_ptr<Stream> upstream;
			std::unique_ptr<BufferedReader> upstreamReader;
			std::unique_ptr<BodyReader> responseBody;
			HttpResponse response;
			std::string held;  // response bytes received but not yet released to the client
			try {
				upstream = openUpstream(scheme, host, port);
				upstream->WriteAll(Http::SerializeHead(request));

				uint64_t length = 0;
				BodyReader requestBody(clientReader, Http::RequestFraming(request, length), length, m_options.limits);
				std::string wire;
				while (requestBody.Next(wire, request.body.size() < excerpt ? &request.body : nullptr)) {
					upstream->WriteAll(wire);
					wire.clear();
				}

				upstreamReader = std::make_unique<BufferedReader>(*upstream);
				Http::ReadResponseHead(*upstreamReader, response, m_options.limits);
				const BodyFraming framing = Http::ResponseFraming(response, request.method, length);
				response.closeDelimited = framing == BodyFraming::UntilClose;

				responseBody = std::make_unique<BodyReader>(*upstreamReader, framing, length, m_options.limits);
				while (response.body.size() < excerpt) {
					if (!responseBody->Next(held, &response.body)) break;
				}
			}
			catch (const Core::CaptureTimeout& e) {
				sendError(client, 504, "Gateway Timeout");
				report(Core::CaptureTimeout(e.stage(), host, e.what()));
				return false;
			}
			catch (const Core::InterceptionError& e) {
				sendError(client, 502, "Bad Gateway");
				report(Core::InterceptionError(host, e.what()));
				return false;
			}

			emitCapture(scheme, host, port, request, response);

			// the status line is committed from here on; a failure only drops the connection
			try {
				client.WriteAll(Http::SerializeHead(response) + held);
				std::string wire;
				while (responseBody->Next(wire, nullptr)) {
					client.WriteAll(wire);
					wire.clear();
				}

				if (response.status == 101) {
					const std::string fromUpstream = upstreamReader->TakeBuffered();
					const std::string fromClient = clientReader.TakeBuffered();
					if (!fromUpstream.empty()) client.WriteAll(fromUpstream);
					if (!fromClient.empty()) upstream->WriteAll(fromClient);
					if (markIdle(client.NativeHandle())) relay(client, *upstream, host);
					return false;
				}
			}
			catch (const Core::CaptureTimeout& e) {
				report(Core::CaptureTimeout(e.stage(), host, e.what()));
				return false;
			}
			catch (const Core::InterceptionError& e) {
				report(Core::InterceptionError(host, std::string("relay interrupted: ") + e.what()));
				return false;
			}

			return Http::KeepAlive(request, response);
		}

		void TrafficInterceptor::emitCapture(const std::string& scheme, const std::string& host, uint16_t port,
			const HttpRequest& request, const HttpResponse& response) {
			auto tx = std::make_shared<Core::CapturedTransaction>();
			tx->url = scheme + "://" + host;
			if (port != DefaultPort(scheme)) tx->url += ":" + std::to_string(port);
			tx->url += request.target;
			tx->host = host;
			tx->method = request.method;
			tx->requestHeaders = request.headers;
			tx->requestBody = SU::TruncateUtf8(request.body, m_options.bodyExcerptBytes);
			tx->responseStatus = response.status;
			tx->responseHeaders = response.headers;
			tx->responseBody = SU::TruncateUtf8(response.body, m_options.bodyExcerptBytes);
			tx->timestamp = Core::Clock::now();

			m_captured.fetch_add(1);
			NG_LOG_TRACE("Interceptor", "%s %s -> %d", tx->method.c_str(), tx->url.c_str(), tx->responseStatus);
			if (!m_onCapture) return;
			try {
				m_onCapture(std::move(tx));
			}
			catch (const Core::NetGuardError& e) {
				report(e);
			}
		}

		void TrafficInterceptor::sendError(Stream& client, int status, const char* reason) noexcept {
			HttpResponse response;
			response.status = status;
			response.reason = reason;
			response.body = std::to_string(status) + " " + reason + "\n";
			response.headers = {
				{ "Content-Type", "text/plain" },
				{ "Connection", "close" },
				{ "Content-Length", std::to_string(response.body.size()) },
			};
			try {
				client.WriteAll(Http::Serialize(response));
			}
			catch (const Core::NetGuardError& e) {
				NG_LOG_DEBUG("Interceptor", "Could not send %d to client: %s", status, e.what());
			}
		}

		void TrafficInterceptor::report(const Core::NetGuardError& error) {
			NG_LOG_WARN("Interceptor", "[%s] %s: %s", Core::ErrorKindToString(error.kind()),
				error.domain().empty() ? "-" : error.domain().c_str(), error.what());
			if (m_onError) m_onError(error);
		}

	}  // namespace Monitoring
}  // namespace NetGuard
