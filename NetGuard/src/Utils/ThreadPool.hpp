#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace NetGuard::Utils {

    /**
     * @brief Thrown by submit() when the pool does not take the task
     */
    class ThreadPoolRejectedException : public std::runtime_error {
    public:
        explicit ThreadPoolRejectedException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /// Every worker is busy and the backlog is full
    class ThreadPoolBusyException : public ThreadPoolRejectedException {
    public:
        using ThreadPoolRejectedException::ThreadPoolRejectedException;
    };

    /// shutdown() has been called
    class ThreadPoolShutdownException : public ThreadPoolRejectedException {
    public:
        using ThreadPoolRejectedException::ThreadPoolRejectedException;
    };

    template<typename F>
    concept Callable = std::invocable<F>;

    /**
     * @brief Fixed set of workers with a bounded FIFO backlog.
     *
     * A task is admitted while the tasks waiting for a worker number fewer than
     * the idle workers plus @c max_backlog. The interceptor runs one client
     * session per task and turns clients away past that point; the sampler
     * runs its enumeration on a single worker so a stuck pass never stacks
     * threads.
     *
     * @note Thread-safe.
     */
    class ThreadPool {
    public:
        static constexpr size_t MAX_THREADS = 256;

        /**
         * @param num_threads Worker count, 1..MAX_THREADS
         * @param max_backlog Tasks allowed to wait once every worker is busy
         * @param name Prefix of the worker thread names
         *
         * @throws std::invalid_argument for a thread count outside the range
         */
        ThreadPool(size_t num_threads, size_t max_backlog, std::string name);

        /// Same as shutdown()
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queues a fire-and-forget task.
         *
         * An exception escaping the task is logged and the worker carries on.
         * @return false when the pool is saturated or shut down
         */
        template<Callable F>
        [[nodiscard]] bool try_post(F&& func);

        /**
         * @brief Queues a task whose result (or exception) arrives through the future.
         *
         * @throws ThreadPoolBusyException when saturated
         * @throws ThreadPoolShutdownException after shutdown()
         */
        template<Callable F>
        auto submit(F&& func) -> std::future<std::invoke_result_t<F>>;

        /**
         * @brief Refuses new tasks, runs the ones already queued and joins the workers.
         *
         * Idempotent. Must not be called from a worker.
         */
        void shutdown();

        [[nodiscard]] bool is_shutdown() const noexcept;
        [[nodiscard]] size_t get_thread_count() const noexcept { return thread_count_; }
        [[nodiscard]] size_t get_busy_count() const noexcept;
        [[nodiscard]] size_t get_backlog() const;

    private:
        enum class Admission {
            Accepted,
            Saturated,
            ShutDown
        };

        Admission enqueue(std::function<void()>&& task);
        void worker_thread(size_t thread_index);

        std::string name_;
        size_t thread_count_;
        size_t max_backlog_;
        std::vector<std::thread> workers_;

        std::deque<std::function<void()>> task_queue_;
        mutable std::mutex queue_mutex_;
        std::condition_variable queue_condition_;

        std::atomic<bool> shutdown_flag_{false};
        std::atomic<size_t> busy_count_{0};
    };

    // ============================================================================
    // Template method implementations
    // ============================================================================

    template<Callable F>
    bool ThreadPool::try_post(F&& func) {
        return enqueue(std::function<void()>(std::forward<F>(func))) == Admission::Accepted;
    }

    template<Callable F>
    auto ThreadPool::submit(F&& func) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        // packaged_task stores any exception in the shared state
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
        std::future<ReturnType> result = task->get_future();

        switch (enqueue([task]() { (*task)(); })) {
        case Admission::Accepted:
            break;
        case Admission::Saturated:
            throw ThreadPoolBusyException(name_ + ": every worker is busy and the backlog is full");
        case Admission::ShutDown:
            throw ThreadPoolShutdownException(name_ + ": thread pool is shutting down");
        }
        return result;
    }

} // namespace NetGuard::Utils
