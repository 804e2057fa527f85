#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace NetGuard::Utils {

    /**
     * @brief Multi-producer/multi-consumer FIFO with a fixed capacity.
     *
     * try_push() never blocks and fails when the queue is full or closed;
     * push() waits for room.
     * Consumers block in pop() until an item arrives or the queue is closed
     * and drained.
     */
    template<typename T>
    class BoundedQueue {
    public:
        explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        BoundedQueue(const BoundedQueue&) = delete;
        BoundedQueue& operator=(const BoundedQueue&) = delete;

        /// @return false when full or closed; @p item is left untouched then
        [[nodiscard]] bool try_push(T&& item) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_ || items_.size() >= capacity_) return false;
                items_.push_back(std::move(item));
            }
            not_empty_.notify_one();
            return true;
        }

        /// Blocks while full. @return false when the queue was closed
        bool push(T&& item) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
                if (closed_) return false;
                items_.push_back(std::move(item));
            }
            not_empty_.notify_one();
            return true;
        }

        /// @return nullopt once closed and empty
        std::optional<T> pop() {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
            return take_locked();
        }

        std::optional<T> pop_for(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
            return take_locked();
        }

        /// Rejects further pushes; queued items are still delivered.
        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            not_empty_.notify_all();
            not_full_.notify_all();
        }

        [[nodiscard]] bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        [[nodiscard]] size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

        [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    private:
        std::optional<T> take_locked() {
            if (items_.empty()) return std::nullopt;
            T item = std::move(items_.front());
            items_.pop_front();
            not_full_.notify_one();
            return item;
        }

        const size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        std::deque<T> items_;
        bool closed_ = false;
    };

} // namespace NetGuard::Utils
