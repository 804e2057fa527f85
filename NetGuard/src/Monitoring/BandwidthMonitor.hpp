#pragma once

#include "../Core/Types.hpp"
#include "../Utils/NetworkUtils.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace NetGuard {
	namespace Monitoring {

		/**
		 * @brief Interface throughput from successive /proc/net/dev readings.
		 *
		 * The first Sample() only primes the baseline and reports 0 Mbps.
		 */
		class BandwidthMonitor {
		public:
			explicit BandwidthMonitor(std::filesystem::path procRoot = "/proc");

			/// @throws Core::StorageError when the counters cannot be read
			Core::BandwidthSample Sample(uint32_t activeConnections);

			[[nodiscard]] double CurrentMbps() const;

		private:
			std::filesystem::path m_procRoot;
			mutable std::mutex m_mutex;
			std::optional<Utils::NetworkUtils::NetworkStatistics> m_previous;
			double m_currentMbps = 0.0;
		};

		/**
		 * @brief Bounded, time-windowed store of recent captures.
		 *
		 * Keeps at most @p capacity transactions no older than @p window; the
		 * oldest entry is discarded first.
		 */
		class CaptureBuffer {
		public:
			CaptureBuffer(size_t capacity, std::chrono::milliseconds window);

			void Add(std::shared_ptr<const Core::CapturedTransaction> tx);
			void Prune(Core::Timestamp now = Core::Clock::now());

			[[nodiscard]] std::vector<std::shared_ptr<const Core::CapturedTransaction>> Snapshot() const;
			[[nodiscard]] size_t Size() const;
			[[nodiscard]] uint64_t TotalAdded() const noexcept { return m_totalAdded.load(); }

		private:
			void pruneLocked(Core::Timestamp now);

			size_t m_capacity;
			std::chrono::milliseconds m_window;
			mutable std::mutex m_mutex;
			std::deque<std::shared_ptr<const Core::CapturedTransaction>> m_items;
			std::atomic<uint64_t> m_totalAdded{ 0 };
		};

	}  // namespace Monitoring
}  // namespace NetGuard
