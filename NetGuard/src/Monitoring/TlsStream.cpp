#include "TlsStream.hpp"
#include "../Core/Errors.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <climits>
#include <cstring>

namespace NetGuard {
	namespace Monitoring {

		std::string OpenSslErrorText() {
			std::string text;
			unsigned long code = 0;
			while ((code = ERR_get_error()) != 0) {
				char buffer[256];
				ERR_error_string_n(code, buffer, sizeof(buffer));
				if (!text.empty()) text += "; ";
				text += buffer;
			}
			return text.empty() ? std::string("unknown TLS error") : text;
		}

		SslCtxPtr CreateClientContext(bool verifyPeer) {
			SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
			if (!ctx) {
				throw Core::InterceptionError({}, "cannot create client TLS context: " + OpenSslErrorText());
			}
			SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
			if (verifyPeer) {
				if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
					throw Core::InterceptionError({}, "cannot load system trust store: " + OpenSslErrorText());
				}
				SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
			}
			else {
				SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
			}
			return ctx;
		}

		TlsStream::TlsStream(std::unique_ptr<SocketStream> socket, SSL* ssl)
			: m_socket(std::move(socket)), m_ssl(ssl) {}

		TlsStream::~TlsStream() {
			SSL_free(m_ssl);
		}

		std::unique_ptr<TlsStream> TlsStream::Accept(std::unique_ptr<SocketStream> socket, SSL_CTX* context) {
			SSL* ssl = SSL_new(context);
			if (!ssl) throw Core::InterceptionError(socket->Context(), "SSL_new failed: " + OpenSslErrorText());
			SSL_set_fd(ssl, socket->NativeHandle());
			std::unique_ptr<TlsStream> stream(new TlsStream(std::move(socket), ssl));

			const int rc = SSL_accept(ssl);
			if (rc != 1) stream->raise(rc, "client handshake");
			return stream;
		}

		std::unique_ptr<TlsStream> TlsStream::Connect(std::unique_ptr<SocketStream> socket, SSL_CTX* context,
			const std::string& host, bool verifyPeer) {
			SSL* ssl = SSL_new(context);
			if (!ssl) throw Core::InterceptionError(host, "SSL_new failed: " + OpenSslErrorText());
			SSL_set_fd(ssl, socket->NativeHandle());
			std::unique_ptr<TlsStream> stream(new TlsStream(std::move(socket), ssl));

			SSL_set_tlsext_host_name(ssl, host.c_str());
			if (verifyPeer && SSL_set1_host(ssl, host.c_str()) != 1) {
				throw Core::InterceptionError(host, "cannot set expected peer name");
			}

			const int rc = SSL_connect(ssl);
			if (rc != 1) {
				const long verify = SSL_get_verify_result(ssl);
				if (verifyPeer && verify != X509_V_OK) {
					throw Core::InterceptionError(host, std::string("upstream certificate rejected: ") +
						X509_verify_cert_error_string(verify));
				}
				stream->raise(rc, "upstream handshake");
			}
			return stream;
		}

		void TlsStream::raise(int result, const char* operation) {
			const int error = SSL_get_error(m_ssl, result);
			const std::string& context = m_socket->Context();
			switch (error) {
			case SSL_ERROR_WANT_READ:
			case SSL_ERROR_WANT_WRITE:
				// blocking socket with SO_RCVTIMEO / SO_SNDTIMEO expired
				throw Core::CaptureTimeout("intercept", context, std::string(operation) + " timed out");
			case SSL_ERROR_SYSCALL:
				if (errno == EAGAIN || errno == EWOULDBLOCK) {
					throw Core::CaptureTimeout("intercept", context, std::string(operation) + " timed out");
				}
				throw Core::InterceptionError(context, std::string(operation) + " failed: " +
					(errno != 0 ? std::strerror(errno) : "unexpected end of stream"));
			default:
				throw Core::InterceptionError(context, std::string(operation) + " failed: " + OpenSslErrorText());
			}
		}

		size_t TlsStream::Pending() const noexcept {
			const int n = SSL_pending(m_ssl);
			return n > 0 ? static_cast<size_t>(n) : 0;
		}

		size_t TlsStream::ReadSome(char* buffer, size_t length) {
			const int chunk = static_cast<int>(length > INT_MAX ? INT_MAX : length);
			while (true) {
				errno = 0;
				const int n = SSL_read(m_ssl, buffer, chunk);
				if (n > 0) return static_cast<size_t>(n);

				const int error = SSL_get_error(m_ssl, n);
				if (error == SSL_ERROR_ZERO_RETURN) return 0;
				if (error == SSL_ERROR_SYSCALL) {
					if (errno == EINTR) continue;
					// peer closed without close_notify or reset
					if (errno == 0 || errno == ECONNRESET) {
						ERR_clear_error();
						return 0;
					}
				}
				raise(n, "read");
			}
		}

		void TlsStream::WriteAll(std::string_view data) {
			size_t sent = 0;
			while (sent < data.size()) {
				const size_t remaining = data.size() - sent;
				const int chunk = static_cast<int>(remaining > INT_MAX ? INT_MAX : remaining);
				errno = 0;
				const int n = SSL_write(m_ssl, data.data() + sent, chunk);
				if (n <= 0) {
					if (SSL_get_error(m_ssl, n) == SSL_ERROR_SYSCALL && errno == EINTR) continue;
					raise(n, "write");
				}
				sent += static_cast<size_t>(n);
			}
		}

		void TlsStream::Shutdown() noexcept {
			if (SSL_shutdown(m_ssl) < 0) ERR_clear_error();
		}

	}  // namespace Monitoring
}  // namespace NetGuard
