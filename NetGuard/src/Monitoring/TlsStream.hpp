#pragma once

#include "Socket.hpp"

#include <openssl/ssl.h>

#include <memory>
#include <string>

namespace NetGuard {
	namespace Monitoring {

		struct SslCtxDeleter {
			void operator()(SSL_CTX* ctx) const noexcept { SSL_CTX_free(ctx); }
		};
		using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

		/// Most recent OpenSSL error queue entry as text (clears the queue).
		[[nodiscard]] std::string OpenSslErrorText();

		/**
		 * @brief Client context for upstream sessions.
		 * @param verifyPeer check the upstream chain against the system store
		 * @throws Core::InterceptionError
		 */
		[[nodiscard]] SslCtxPtr CreateClientContext(bool verifyPeer);

		/**
		 * @brief TLS session layered over an owned SocketStream.
		 */
		class TlsStream final : public Stream {
		public:
			/**
			 * @brief Server-side handshake with the browser.
			 * @throws Core::InterceptionError, Core::CaptureTimeout
			 */
			static std::unique_ptr<TlsStream> Accept(std::unique_ptr<SocketStream> socket, SSL_CTX* context);

			/**
			 * @brief Client-side handshake with the origin; sends SNI and checks the name.
			 * @throws Core::InterceptionError, Core::CaptureTimeout
			 */
			static std::unique_ptr<TlsStream> Connect(std::unique_ptr<SocketStream> socket, SSL_CTX* context,
				const std::string& host, bool verifyPeer);

			~TlsStream() override;

			TlsStream(const TlsStream&) = delete;
			TlsStream& operator=(const TlsStream&) = delete;

			size_t ReadSome(char* buffer, size_t length) override;
			void WriteAll(std::string_view data) override;
			int NativeHandle() const noexcept override { return m_socket->NativeHandle(); }
			size_t Pending() const noexcept override;

			/// Sends close_notify; errors are ignored since the socket closes next.
			void Shutdown() noexcept;

		private:
			TlsStream(std::unique_ptr<SocketStream> socket, SSL* ssl);

			[[noreturn]] void raise(int result, const char* operation);

			std::unique_ptr<SocketStream> m_socket;
			SSL* m_ssl;
		};

	}  // namespace Monitoring
}  // namespace NetGuard
