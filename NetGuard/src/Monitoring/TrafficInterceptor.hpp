#pragma once

#include "CertificateAuthority.hpp"
#include "HttpMessage.hpp"
#include "../Core/Errors.hpp"
#include "../Core/Types.hpp"
#include "../Utils/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace NetGuard {
	namespace Monitoring {

		struct InterceptorOptions {
			std::string listenAddress = "127.0.0.1";
			uint16_t listenPort = 8080;                          ///< 0 picks a free port
			std::chrono::milliseconds ioTimeout{ 30000 };        ///< per read/write on either side
			std::chrono::milliseconds connectTimeout{ 10000 };
			std::chrono::milliseconds keepAliveTimeout{ 5000 };  ///< wait for the next request on a kept-alive client
			size_t bodyExcerptBytes = 4096;
			size_t sessionThreads = 64;
			size_t sessionBacklog = 64;                          ///< clients waiting for a session thread; beyond it they get 503
			bool verifyUpstream = true;
			HttpLimits limits;
		};

		/**
		 * @brief Explicit HTTP(S) proxy observing request/response pairs.
		 *
		 * Plain HTTP is forwarded and captured. CONNECT tunnels are terminated with
		 * a leaf certificate minted by the CertificateAuthority; without one they
		 * are relayed blind and only the host is observable.
		 *
		 * Bodies are streamed. The interceptor holds back at most the capture
		 * excerpt of a response, hands the transaction to the capture callback,
		 * then releases the held bytes and relays the remainder as it arrives.
		 * The bytes relayed are the bytes received. A 101 Switching Protocols
		 * response turns the connection into a byte relay for the rest of its life.
		 */
		class TrafficInterceptor {
		public:
			using CaptureCallback = std::function<void(std::shared_ptr<const Core::CapturedTransaction>)>;
			using ErrorCallback = std::function<void(const Core::NetGuardError&)>;

			TrafficInterceptor(InterceptorOptions options, std::shared_ptr<CertificateAuthority> authority);
			~TrafficInterceptor();

			TrafficInterceptor(const TrafficInterceptor&) = delete;
			TrafficInterceptor& operator=(const TrafficInterceptor&) = delete;

			void SetCaptureCallback(CaptureCallback callback) { m_onCapture = std::move(callback); }
			void SetErrorCallback(ErrorCallback callback) { m_onError = std::move(callback); }

			/// @throws Core::InterceptionError when the listen socket cannot be bound
			void Start();

			/// Stops accepting, lets in-flight exchanges complete and joins every session.
			void Stop();

			[[nodiscard]] bool IsRunning() const noexcept { return m_running.load(std::memory_order_acquire); }
			[[nodiscard]] uint16_t BoundPort() const noexcept { return m_boundPort; }
			[[nodiscard]] bool InspectsTls() const noexcept { return m_authority != nullptr; }

			[[nodiscard]] uint64_t CapturedCount() const noexcept { return m_captured.load(); }
			[[nodiscard]] uint64_t TunnelCount() const noexcept { return m_tunnels.load(); }
			[[nodiscard]] uint64_t SessionCount() const noexcept { return m_sessions.load(); }
			[[nodiscard]] uint64_t RefusedCount() const noexcept { return m_refused.load(); }
			[[nodiscard]] size_t ActiveSessions() const;

		private:
			class SessionGuard;

			void acceptLoop();
			void handleClient(int fd, std::string peer);
			void handleConnect(const HttpRequest& request, std::unique_ptr<SocketStream> client, BufferedReader& reader);
			void serveInspected(std::unique_ptr<SocketStream> client, const std::string& host, uint16_t port);
			void relayBlind(SocketStream& client, std::string pending, const std::string& host, uint16_t port);
			void refuse(int fd, const std::string& peer);

			/// Copies bytes both ways until either side closes
			void relay(Stream& client, Stream& upstream, const std::string& host);

			/**
			 * @brief One request/response cycle; the request head has been read from @p clientReader.
			 * @return whether the client connection stays open
			 */
			bool exchange(Stream& client, BufferedReader& clientReader, HttpRequest& request, const std::string& scheme,
				const std::string& host, uint16_t port);

			std::unique_ptr<Stream> openUpstream(const std::string& scheme, const std::string& host, uint16_t port);
			void emitCapture(const std::string& scheme, const std::string& host, uint16_t port,
				const HttpRequest& request, const HttpResponse& response);
			void sendError(Stream& client, int status, const char* reason) noexcept;
			void report(const Core::NetGuardError& error);

			bool markIdle(int fd);
			void markBusy(int fd);

			InterceptorOptions m_options;
			std::shared_ptr<CertificateAuthority> m_authority;
			SslCtxPtr m_clientContext;

			CaptureCallback m_onCapture;
			ErrorCallback m_onError;

			std::atomic<bool> m_running{ false };
			std::atomic<bool> m_stopping{ false };
			int m_listenFd = -1;
			uint16_t m_boundPort = 0;
			std::thread m_acceptThread;
			std::unique_ptr<Utils::ThreadPool> m_pool;

			mutable std::mutex m_sessionMutex;
			std::set<int> m_sessionFds;
			std::set<int> m_idleFds;

			std::atomic<bool> m_reportedNoAuthority{ false };
			std::atomic<uint64_t> m_captured{ 0 };
			std::atomic<uint64_t> m_tunnels{ 0 };
			std::atomic<uint64_t> m_sessions{ 0 };
			std::atomic<uint64_t> m_refused{ 0 };
		};

	}  // namespace Monitoring
}  // namespace NetGuard
