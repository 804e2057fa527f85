#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <system_error>

#include <pthread.h>

namespace NetGuard::Utils {

    namespace {
        void set_thread_name(const std::string& name) {
            // kernel limit is 15 chars + NUL
            pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
        }
    }

    // ============================================================================
    // Constructor & Destructor
    // ============================================================================

    ThreadPool::ThreadPool(size_t num_threads, size_t max_backlog, std::string name)
        : name_(std::move(name))
        , thread_count_(num_threads)
        , max_backlog_(max_backlog)
    {
        if (num_threads == 0 || num_threads > MAX_THREADS) {
            throw std::invalid_argument("Thread count " + std::to_string(num_threads) +
                " outside 1.." + std::to_string(MAX_THREADS));
        }

        workers_.reserve(num_threads);
        try {
            for (size_t i = 0; i < num_threads; ++i) {
                workers_.emplace_back(&ThreadPool::worker_thread, this, i);
            }
        }
        catch (const std::system_error& e) {
            NG_LOG_ERROR("ThreadPool", "%s: thread creation failed: %s", name_.c_str(), e.what());
            shutdown();
            throw std::runtime_error(std::string("Worker thread creation failed: ") + e.what());
        }

        NG_LOG_DEBUG("ThreadPool", "%s: %zu workers, backlog %zu", name_.c_str(), num_threads, max_backlog_);
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    // ============================================================================
    // Lifecycle
    // ============================================================================

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_flag_.exchange(true, std::memory_order_acq_rel) && workers_.empty()) return;
        }
        queue_condition_.notify_all();

        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
        workers_.clear();
        NG_LOG_DEBUG("ThreadPool", "%s shut down", name_.c_str());
    }

    // ============================================================================
    // Queries
    // ============================================================================

    bool ThreadPool::is_shutdown() const noexcept {
        return shutdown_flag_.load(std::memory_order_acquire);
    }

    size_t ThreadPool::get_busy_count() const noexcept {
        return busy_count_.load(std::memory_order_acquire);
    }

    size_t ThreadPool::get_backlog() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return task_queue_.size();
    }

    // ============================================================================
    // Scheduling
    // ============================================================================

    ThreadPool::Admission ThreadPool::enqueue(std::function<void()>&& task) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_flag_.load(std::memory_order_acquire)) return Admission::ShutDown;

            const size_t idle = thread_count_ - busy_count_.load(std::memory_order_acquire);
            if (task_queue_.size() >= idle + max_backlog_) return Admission::Saturated;

            task_queue_.push_back(std::move(task));
        }
        queue_condition_.notify_one();
        return Admission::Accepted;
    }

    void ThreadPool::worker_thread(size_t thread_index) {
        set_thread_name(name_ + "-" + std::to_string(thread_index));

        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_condition_.wait(lock, [this] {
                    return !task_queue_.empty() || shutdown_flag_.load(std::memory_order_acquire);
                });
                // after shutdown the queue is drained before the worker exits
                if (task_queue_.empty()) return;

                task = std::move(task_queue_.front());
                task_queue_.pop_front();
                busy_count_.fetch_add(1, std::memory_order_acq_rel);
            }

            try {
                task();
            }
            catch (const std::exception& e) {
                NG_LOG_ERROR("ThreadPool", "%s: task failed: %s", name_.c_str(), e.what());
            }

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                busy_count_.fetch_sub(1, std::memory_order_acq_rel);
            }
        }
    }

} // namespace NetGuard::Utils
