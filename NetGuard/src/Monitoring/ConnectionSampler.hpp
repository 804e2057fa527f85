#pragma once

#include "ConnectionSource.hpp"
#include "../Core/Types.hpp"
#include "../Utils/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace NetGuard {
	namespace Monitoring {

		struct SamplerOptions {
			std::chrono::milliseconds pollInterval{ 2000 };
			std::chrono::milliseconds idleTimeout{ 30000 };
			/// Wait limit for one pass; 0 means the poll interval
			std::chrono::milliseconds passBudget{ 0 };
			std::chrono::milliseconds reanalysisCooldown{ 300000 };
		};

		struct ConnectionEvent {
			enum class Type { New, Closed };
			Type type = Type::New;
			Core::Connection connection;
		};

		/**
		 * @brief Periodic connection table diffing.
		 *
		 * Each tick hands one enumeration to a worker and waits at most the pass
		 * budget for it. A pass that overruns is reported as CaptureTimeout and
		 * its result is discarded when it eventually arrives; until then later
		 * ticks are skipped, so at most one pass is ever in flight.
		 */
		class ConnectionSampler {
		public:
			enum class TickResult { Completed, Skipped, TimedOut, Failed };

			using EventCallback = std::function<void(const ConnectionEvent&)>;
			using ErrorCallback = std::function<void(const Core::NetGuardError&)>;

			ConnectionSampler(std::shared_ptr<IConnectionSource> source, SamplerOptions options);
			~ConnectionSampler();

			ConnectionSampler(const ConnectionSampler&) = delete;
			ConnectionSampler& operator=(const ConnectionSampler&) = delete;

			void SetEventCallback(EventCallback cb);
			void SetErrorCallback(ErrorCallback cb);

			/// Starts the polling thread; no-op when already running
			void Start();

			/// Signals the polling thread and joins it; an in-flight pass is abandoned
			void Stop();
			[[nodiscard]] bool IsRunning() const noexcept { return m_running.load(); }

			/// One sampling pass at @p now; also called by the polling thread
			TickResult Tick(Core::Timestamp now = Core::Clock::now());

			/**
			 * @brief Per-host re-analysis gate.
			 * @return true at most once per cooldown window for @p host
			 */
			bool ShouldAnalyze(const std::string& host, Core::Timestamp now = Core::Clock::now());

			[[nodiscard]] std::vector<Core::Connection> Snapshot() const;
			[[nodiscard]] size_t ActiveCount() const;
			[[nodiscard]] uint64_t ObservedCount() const noexcept { return m_observed.load(); }
			[[nodiscard]] uint64_t SkippedPasses() const noexcept { return m_skipped.load(); }
			[[nodiscard]] uint64_t TimedOutPasses() const noexcept { return m_timedOut.load(); }
			[[nodiscard]] bool PassInFlight() const noexcept { return m_inFlight->load(); }

		private:
			using Key = std::tuple<std::string, uint16_t, uint32_t, std::string>;

			static Key keyOf(const Core::Connection& c);
			void run();
			void reportError(const Core::NetGuardError& error);
			std::vector<ConnectionEvent> apply(std::vector<Core::Connection> current, Core::Timestamp now);

			std::shared_ptr<IConnectionSource> m_source;
			SamplerOptions m_options;
			Utils::ThreadPool m_pool;

			mutable std::mutex m_tableMutex;
			std::map<Key, Core::Connection> m_table;
			std::unordered_map<std::string, Core::Timestamp> m_lastAnalyzed;

			std::mutex m_callbackMutex;
			EventCallback m_onEvent;
			ErrorCallback m_onError;

			std::shared_ptr<std::atomic<bool>> m_inFlight = std::make_shared<std::atomic<bool>>(false);
			std::atomic<uint64_t> m_observed{ 0 };
			std::atomic<uint64_t> m_skipped{ 0 };
			std::atomic<uint64_t> m_timedOut{ 0 };

			std::atomic<bool> m_running{ false };
			std::mutex m_wakeMutex;
			std::condition_variable m_wake;
			std::thread m_thread;
		};

	}  // namespace Monitoring
}  // namespace NetGuard
