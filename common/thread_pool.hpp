#pragma once

// ============================================================
// thread_pool.hpp -- Header-only fixed-size worker pool
//   Used by the server to serve one connection per task.
//   Tasks are fire-and-forget; an exception escaping a task is
//   logged and the worker keeps running.
// ============================================================

#include "logger.hpp"
#include <vector>
#include <thread>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <stdexcept>
#include <string>

class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(size_t num_threads) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    // Queued tasks still run before the workers exit
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a task; throws if the pool is shutting down
    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    // Tasks waiting for a free worker
    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::deque<Task>         tasks_;
    mutable std::mutex       mutex_;
    std::condition_variable  cv_;
    bool                     stop_{false};

    void worker_loop() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Worker task failed: ") + e.what());
            }
        }
    }
};
