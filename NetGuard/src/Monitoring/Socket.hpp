#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace NetGuard {
	namespace Monitoring {

		/**
		 * @brief Byte stream used by the HTTP parser (plain socket or TLS).
		 *
		 * ReadSome returns 0 at end of stream. A read or write that exceeds the
		 * stream timeout throws Core::CaptureTimeout; other failures throw
		 * Core::InterceptionError.
		 */
		class Stream {
		public:
			virtual ~Stream() = default;
			virtual size_t ReadSome(char* buffer, size_t length) = 0;
			virtual void WriteAll(std::string_view data) = 0;
			virtual int NativeHandle() const noexcept = 0;

			/// Bytes already decoded and readable without touching the socket
			virtual size_t Pending() const noexcept { return 0; }
		};

		/**
		 * @brief Owning TCP socket with send/receive timeouts.
		 */
		class SocketStream final : public Stream {
		public:
			/// @param context host name used in error reports
			SocketStream(int fd, std::string context, std::chrono::milliseconds timeout);
			~SocketStream() override;

			SocketStream(const SocketStream&) = delete;
			SocketStream& operator=(const SocketStream&) = delete;

			size_t ReadSome(char* buffer, size_t length) override;
			void WriteAll(std::string_view data) override;
			int NativeHandle() const noexcept override { return m_fd; }

			void SetTimeout(std::chrono::milliseconds timeout);
			void ShutdownWrite() noexcept;
			void Close() noexcept;

			const std::string& Context() const noexcept { return m_context; }

		private:
			int m_fd;
			std::string m_context;
			std::chrono::milliseconds m_timeout;
		};

		/**
		 * @brief Resolves @p host and connects within @p timeout.
		 * @return connected socket descriptor
		 * @throws Core::CaptureTimeout, Core::InterceptionError
		 */
		int ConnectTcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

		/**
		 * @brief Listening socket bound to @p address:@p port (0 picks a free port).
		 * @throws Core::InterceptionError
		 */
		int ListenTcp(const std::string& address, uint16_t port, int backlog, uint16_t& boundPort);

	}  // namespace Monitoring
}  // namespace NetGuard
