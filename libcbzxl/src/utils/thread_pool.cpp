#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>

namespace cbzxl {

static const char* pool_tag() {
    return "ImagePool";
}

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
            if (st.stop_requested() || (stop_ && tasks_.empty())) return;
            if (tasks_.empty()) continue;
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        bool failed = false;
        try {
            task(st);
        } catch (const std::exception& e) {
            failed = true;
            Logger::log(LogLevel::Error, std::string("Image task escaped with an exception: ") + e.what(), pool_tag());
        }
        finish_task(failed);
    }
}

void ThreadPool::finish_task(const bool failed) {
    std::lock_guard lock(queue_mutex_);
    if (failed) ++failed_tasks_;
    if (pending_ > 0) --pending_;
    if (pending_ == 0) idle_cv_.notify_all();
}

void ThreadPool::enqueue(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            Logger::log(LogLevel::Error, "Image task rejected: pool is shutting down", pool_tag());
            throw std::runtime_error("enqueue on a stopped image pool");
        }
        ++pending_;
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

std::size_t ThreadPool::failed_tasks() const {
    std::lock_guard lock(queue_mutex_);
    return failed_tasks_;
}

ThreadPool::~ThreadPool() {
    std::size_t dropped = 0;
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
        dropped = tasks_.size();
        pending_ -= dropped;
        std::queue<Task>().swap(tasks_);
    }
    if (dropped > 0) {
        Logger::log(LogLevel::Debug, std::to_string(dropped) + " queued image tasks dropped at shutdown", pool_tag());
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

} // namespace cbzxl
