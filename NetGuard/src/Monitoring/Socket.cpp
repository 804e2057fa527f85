#include "Socket.hpp"
#include "../Core/Errors.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace NetGuard {
	namespace Monitoring {

		namespace {

			timeval ToTimeval(std::chrono::milliseconds ms) {
				timeval tv{};
				tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
				tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
				return tv;
			}

			std::string ErrnoText(int e) {
				return std::strerror(e);
			}

		}  // anonymous namespace

		SocketStream::SocketStream(int fd, std::string context, std::chrono::milliseconds timeout)
			: m_fd(fd), m_context(std::move(context)), m_timeout(timeout) {
			SetTimeout(timeout);
		}

		SocketStream::~SocketStream() {
			Close();
		}

		void SocketStream::SetTimeout(std::chrono::milliseconds timeout) {
			m_timeout = timeout;
			if (m_fd < 0) return;
			const timeval tv = ToTimeval(timeout);
			::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
			::setsockopt(m_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
		}

		size_t SocketStream::ReadSome(char* buffer, size_t length) {
			while (true) {
				const ssize_t n = ::recv(m_fd, buffer, length, 0);
				if (n >= 0) return static_cast<size_t>(n);
				if (errno == EINTR) continue;
				if (errno == EAGAIN || errno == EWOULDBLOCK) {
					throw Core::CaptureTimeout("intercept", m_context, m_timeout);
				}
				// reset by peer counts as end of stream
				if (errno == ECONNRESET) return 0;
				throw Core::InterceptionError(m_context, "recv failed: " + ErrnoText(errno));
			}
		}

		void SocketStream::WriteAll(std::string_view data) {
			size_t sent = 0;
			while (sent < data.size()) {
				const ssize_t n = ::send(m_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
				if (n < 0) {
					if (errno == EINTR) continue;
					if (errno == EAGAIN || errno == EWOULDBLOCK) {
						throw Core::CaptureTimeout("intercept", m_context, m_timeout);
					}
					throw Core::InterceptionError(m_context, "send failed: " + ErrnoText(errno));
				}
				sent += static_cast<size_t>(n);
			}
		}

		void SocketStream::ShutdownWrite() noexcept {
			if (m_fd >= 0) ::shutdown(m_fd, SHUT_WR);
		}

		void SocketStream::Close() noexcept {
			if (m_fd >= 0) {
				::close(m_fd);
				m_fd = -1;
			}
		}

		int ConnectTcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
			addrinfo hints{};
			hints.ai_family = AF_UNSPEC;
			hints.ai_socktype = SOCK_STREAM;
			addrinfo* result = nullptr;

			const std::string service = std::to_string(port);
			const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
			if (rc != 0) {
				throw Core::InterceptionError(host, std::string("cannot resolve: ") + ::gai_strerror(rc));
			}

			std::string lastError = "no addresses";
			bool timedOut = false;
			for (addrinfo* ai = result; ai; ai = ai->ai_next) {
				const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
				if (fd < 0) {
					lastError = ErrnoText(errno);
					continue;
				}

				int err = 0;
				if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
					if (errno != EINPROGRESS) {
						err = errno;
					}
					else {
						pollfd pfd{ fd, POLLOUT, 0 };
						const int pr = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
						if (pr == 0) {
							timedOut = true;
							err = ETIMEDOUT;
						}
						else if (pr < 0) {
							err = errno;
						}
						else {
							socklen_t len = sizeof(err);
							if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) err = errno;
						}
					}
				}

				if (err == 0) {
					const int flags = ::fcntl(fd, F_GETFL, 0);
					::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
					const int one = 1;
					::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
					::freeaddrinfo(result);
					return fd;
				}
				lastError = ErrnoText(err);
				::close(fd);
			}
			::freeaddrinfo(result);

			if (timedOut) throw Core::CaptureTimeout("connect", host, timeout);
			throw Core::InterceptionError(host, "cannot connect to port " + service + ": " + lastError);
		}

		int ListenTcp(const std::string& address, uint16_t port, int backlog, uint16_t& boundPort) {
			sockaddr_storage storage{};
			socklen_t addrLen = 0;

			auto* v4 = reinterpret_cast<sockaddr_in*>(&storage);
			auto* v6 = reinterpret_cast<sockaddr_in6*>(&storage);
			if (::inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1) {
				v4->sin_family = AF_INET;
				v4->sin_port = htons(port);
				addrLen = sizeof(sockaddr_in);
			}
			else if (::inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1) {
				v6->sin6_family = AF_INET6;
				v6->sin6_port = htons(port);
				addrLen = sizeof(sockaddr_in6);
			}
			else {
				throw Core::InterceptionError({}, "invalid listen address '" + address + "'");
			}

			const int fd = ::socket(storage.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
			if (fd < 0) throw Core::InterceptionError({}, "socket failed: " + ErrnoText(errno));

			const int one = 1;
			::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

			if (::bind(fd, reinterpret_cast<sockaddr*>(&storage), addrLen) != 0 || ::listen(fd, backlog) != 0) {
				const int e = errno;
				::close(fd);
				throw Core::InterceptionError({}, "cannot listen on " + address + ":" + std::to_string(port) + ": " + ErrnoText(e));
			}

			sockaddr_storage bound{};
			socklen_t boundLen = sizeof(bound);
			::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLen);
			boundPort = bound.ss_family == AF_INET6
				? ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port)
				: ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
			return fd;
		}

	}  // namespace Monitoring
}  // namespace NetGuard
