/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to encode the members of one archive.
 *
 * Tasks return nothing: they report through a ResultChannel that the
 * orchestrator drains, so no counter is ever shared between workers.
 */

#ifndef CBZXL_THREAD_POOL_HPP
#define CBZXL_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace cbzxl {

/**
 * @brief A simple fixed-size thread pool built on std::jthread.
 *
 * Tasks receive the worker's std::stop_token; on destruction the pool
 * requests stop and joins its workers (queued tasks that have not started
 * are dropped).
 */
class ThreadPool {
public:
    using Task = std::function<void(std::stop_token)>;

    /**
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task.
     * @throws std::runtime_error if the pool is shutting down.
     */
    void enqueue(Task task);

    /**
     * @brief Blocks until every enqueued task has finished.
     */
    void wait_idle();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

    /// Tasks that ended with an exception instead of reporting a result.
    [[nodiscard]] std::size_t failed_tasks() const;

private:
    void worker_loop(const std::stop_token& st);
    void finish_task(bool failed);

    mutable std::mutex queue_mutex_;                ///< Protects tasks_, stop_ and pending_
    std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ drops to zero
    std::queue<Task> tasks_;
    bool stop_{false};
    size_t pending_{0};                     ///< Tasks enqueued or running
    size_t failed_tasks_{0};
    std::vector<std::jthread> workers_;
};

/**
 * @brief Unbounded multi-producer, single-consumer result queue.
 */
template <typename T>
class ResultChannel {
public:
    void push(T value) {
        std::lock_guard lock(mtx_);
        items_.push(std::move(value));
        // notified under the lock: the consumer may destroy the channel right after pop()
        cv_.notify_one();
    }

    /// Blocks until a value is available.
    T pop() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [this] { return !items_.empty(); });
        T value = std::move(items_.front());
        items_.pop();
        return value;
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::queue<T> items_;
};

} // namespace cbzxl

#endif // CBZXL_THREAD_POOL_HPP
