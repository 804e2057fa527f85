#include "ConnectionSampler.hpp"
#include "../Utils/Logger.hpp"

#include <future>

namespace NetGuard {
	namespace Monitoring {

		namespace {

			struct InFlightReset {
				std::shared_ptr<std::atomic<bool>> flag;
				~InFlightReset() { flag->store(false); }
			};

		}  // anonymous namespace

		ConnectionSampler::ConnectionSampler(std::shared_ptr<IConnectionSource> source, SamplerOptions options)
			: m_source(std::move(source))
			, m_options(options)
			, m_pool(1, 1, "NetGuard-Sampler") {
			if (m_options.passBudget.count() <= 0) m_options.passBudget = m_options.pollInterval;
		}

		ConnectionSampler::~ConnectionSampler() {
			Stop();
			m_pool.shutdown();
		}

		void ConnectionSampler::SetEventCallback(EventCallback cb) {
			std::lock_guard<std::mutex> lock(m_callbackMutex);
			m_onEvent = std::move(cb);
		}

		void ConnectionSampler::SetErrorCallback(ErrorCallback cb) {
			std::lock_guard<std::mutex> lock(m_callbackMutex);
			m_onError = std::move(cb);
		}

		ConnectionSampler::Key ConnectionSampler::keyOf(const Core::Connection& c) {
			return Key{ c.remoteAddress, c.remotePort, c.processId, c.protocol };
		}

		void ConnectionSampler::Start() {
			bool expected = false;
			if (!m_running.compare_exchange_strong(expected, true)) return;
			m_thread = std::thread([this] { run(); });
			NG_LOG_INFO("Sampler", "Sampling %s every %lld ms", m_source->Name().c_str(),
				static_cast<long long>(m_options.pollInterval.count()));
		}

		void ConnectionSampler::Stop() {
			{
				std::lock_guard<std::mutex> lock(m_wakeMutex);
				if (!m_running.exchange(false) && !m_thread.joinable()) return;
			}
			m_wake.notify_all();
			if (m_thread.joinable()) m_thread.join();
			NG_LOG_INFO("Sampler", "Sampler stopped");
		}

		void ConnectionSampler::run() {
			while (m_running.load()) {
				Tick();
				std::unique_lock<std::mutex> lock(m_wakeMutex);
				m_wake.wait_for(lock, m_options.pollInterval, [this] { return !m_running.load(); });
			}
		}

		void ConnectionSampler::reportError(const Core::NetGuardError& error) {
			ErrorCallback cb;
			{
				std::lock_guard<std::mutex> lock(m_callbackMutex);
				cb = m_onError;
			}
			if (cb) cb(error);
		}

		ConnectionSampler::TickResult ConnectionSampler::Tick(Core::Timestamp now) {
			bool expected = false;
			if (!m_inFlight->compare_exchange_strong(expected, true)) {
				m_skipped.fetch_add(1);
				NG_LOG_DEBUG("Sampler", "Previous pass still running, tick skipped");
				return TickResult::Skipped;
			}

			std::future<std::vector<Core::Connection>> pending;
			try {
				auto source = m_source;
				auto flag = m_inFlight;
				pending = m_pool.submit([source, flag]() {
					InFlightReset reset{ flag };
					return source->Enumerate();
				});
			}
			catch (const Utils::ThreadPoolRejectedException& ex) {
				m_inFlight->store(false);
				NG_LOG_WARN("Sampler", "Cannot schedule pass: %s", ex.what());
				return TickResult::Failed;
			}

			if (pending.wait_for(m_options.passBudget) != std::future_status::ready) {
				m_timedOut.fetch_add(1);
				NG_LOG_WARN("Sampler", "Sampling pass exceeded %lld ms, result will be discarded",
					static_cast<long long>(m_options.passBudget.count()));
				reportError(Core::CaptureTimeout("sample", {}, m_options.passBudget));
				return TickResult::TimedOut;
			}

			std::vector<Core::Connection> current;
			try {
				current = pending.get();
			}
			catch (const Core::NetGuardError& ex) {
				NG_LOG_ERROR("Sampler", "Sampling pass failed: %s", ex.what());
				reportError(ex);
				return TickResult::Failed;
			}
			catch (const std::exception& ex) {
				NG_LOG_ERROR("Sampler", "Sampling pass failed: %s", ex.what());
				reportError(Core::NetGuardError(Core::ErrorKind::Internal, "sample", {}, ex.what()));
				return TickResult::Failed;
			}

			const auto events = apply(std::move(current), now);

			EventCallback cb;
			{
				std::lock_guard<std::mutex> lock(m_callbackMutex);
				cb = m_onEvent;
			}
			if (cb) {
				for (const auto& ev : events) cb(ev);
			}
			return TickResult::Completed;
		}

		std::vector<ConnectionEvent> ConnectionSampler::apply(std::vector<Core::Connection> current, Core::Timestamp now) {
			std::vector<ConnectionEvent> events;
			std::lock_guard<std::mutex> lock(m_tableMutex);

			for (auto& c : current) {
				auto key = keyOf(c);
				auto it = m_table.find(key);
				if (it != m_table.end()) {
					it->second.lastSeen = now;
					if (it->second.remoteHost.empty() && !c.remoteHost.empty()) it->second.remoteHost = c.remoteHost;
					continue;
				}
				c.firstSeen = now;
				c.lastSeen = now;
				m_observed.fetch_add(1);
				events.push_back({ ConnectionEvent::Type::New, c });
				m_table.emplace(std::move(key), std::move(c));
			}

			for (auto it = m_table.begin(); it != m_table.end();) {
				if (now - it->second.lastSeen > m_options.idleTimeout) {
					events.push_back({ ConnectionEvent::Type::Closed, it->second });
					it = m_table.erase(it);
				}
				else {
					++it;
				}
			}

			// cooldown entries older than the window are no longer needed
			for (auto it = m_lastAnalyzed.begin(); it != m_lastAnalyzed.end();) {
				if (now - it->second >= m_options.reanalysisCooldown) it = m_lastAnalyzed.erase(it);
				else ++it;
			}
			return events;
		}

		bool ConnectionSampler::ShouldAnalyze(const std::string& host, Core::Timestamp now) {
			std::lock_guard<std::mutex> lock(m_tableMutex);
			auto it = m_lastAnalyzed.find(host);
			if (it != m_lastAnalyzed.end() && now - it->second < m_options.reanalysisCooldown) return false;
			m_lastAnalyzed[host] = now;
			return true;
		}

		std::vector<Core::Connection> ConnectionSampler::Snapshot() const {
			std::lock_guard<std::mutex> lock(m_tableMutex);
			std::vector<Core::Connection> out;
			out.reserve(m_table.size());
			for (const auto& [key, c] : m_table) out.push_back(c);
			return out;
		}

		size_t ConnectionSampler::ActiveCount() const {
			std::lock_guard<std::mutex> lock(m_tableMutex);
			return m_table.size();
		}

	}  // namespace Monitoring
}  // namespace NetGuard
