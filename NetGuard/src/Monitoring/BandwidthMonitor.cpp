#include "BandwidthMonitor.hpp"

namespace NetGuard {
	namespace Monitoring {

		BandwidthMonitor::BandwidthMonitor(std::filesystem::path procRoot)
			: m_procRoot(std::move(procRoot)) {
		}

		Core::BandwidthSample BandwidthMonitor::Sample(uint32_t activeConnections) {
			Utils::NetworkUtils::NetworkStatistics stats;
			Utils::NetworkUtils::Error err;
			if (!Utils::NetworkUtils::GetNetworkStatistics(stats, m_procRoot, &err)) {
				throw Core::StorageError("bandwidth", {}, "cannot read interface counters: " + err.message);
			}

			Core::BandwidthSample sample;
			sample.bytesSent = stats.bytesSent;
			sample.bytesReceived = stats.bytesReceived;
			sample.activeConnections = activeConnections;
			sample.timestamp = Core::Clock::now();

			std::lock_guard<std::mutex> lock(m_mutex);
			if (m_previous) {
				Utils::NetworkUtils::BandwidthInfo bw;
				if (Utils::NetworkUtils::CalculateBandwidth(*m_previous, stats, bw)) {
					m_currentMbps = bw.totalMbps;
				}
				else {
					// counter reset (interface restart): start a new baseline
					m_currentMbps = 0.0;
				}
			}
			m_previous = stats;
			sample.mbps = m_currentMbps;
			return sample;
		}

		double BandwidthMonitor::CurrentMbps() const {
			std::lock_guard<std::mutex> lock(m_mutex);
			return m_currentMbps;
		}

		// ============================================================================
		// CaptureBuffer
		// ============================================================================

		CaptureBuffer::CaptureBuffer(size_t capacity, std::chrono::milliseconds window)
			: m_capacity(capacity == 0 ? 1 : capacity), m_window(window) {
		}

		void CaptureBuffer::Add(std::shared_ptr<const Core::CapturedTransaction> tx) {
			if (!tx) return;
			std::lock_guard<std::mutex> lock(m_mutex);
			m_items.push_back(std::move(tx));
			++m_totalAdded;
			while (m_items.size() > m_capacity) m_items.pop_front();
			pruneLocked(Core::Clock::now());
		}

		void CaptureBuffer::Prune(Core::Timestamp now) {
			std::lock_guard<std::mutex> lock(m_mutex);
			pruneLocked(now);
		}

		void CaptureBuffer::pruneLocked(Core::Timestamp now) {
			while (!m_items.empty() && now - m_items.front()->timestamp > m_window) {
				m_items.pop_front();
			}
		}

		std::vector<std::shared_ptr<const Core::CapturedTransaction>> CaptureBuffer::Snapshot() const {
			std::lock_guard<std::mutex> lock(m_mutex);
			return { m_items.begin(), m_items.end() };
		}

		size_t CaptureBuffer::Size() const {
			std::lock_guard<std::mutex> lock(m_mutex);
			return m_items.size();
		}

	}  // namespace Monitoring
}  // namespace NetGuard
