#ifndef WORKERPOOL_HPP
#define WORKERPOOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../interfaces/ILogger.hpp"

// Fixed-size thread pool draining a FIFO task queue. A task that throws is
// logged and counted; the worker keeps going.
class WorkerPool {
public:
    WorkerPool(size_t thread_count, std::shared_ptr<ILogger> logger)
        : logger_(logger), shutdown_(false) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for WorkerPool");
        }
        if (thread_count == 0) {
            throw std::invalid_argument("WorkerPool needs at least one thread");
        }
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this] { worker_thread(); });
        }
        logger_->setup("WorkerPool initialized with " + std::to_string(thread_count) + " threads");
    }

    ~WorkerPool() {
        shutdown();
    }

    // Returns false once shutdown has started.
    bool enqueue(std::function<void()> fn) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!shutdown_) {
                task_queue_.push_back(std::move(fn));
                ++outstanding_;
                lock.unlock();
                cv_.notify_one();
                return true;
            }
        }
        logger_->error("Attempted to enqueue task on shutdown pool.");
        return false;
    }

    // Blocks until every enqueued task has finished.
    void waitIdle() {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    }

    // Runs the queued tasks, then joins the workers.
    void shutdown() {
        {
            // Set under the queue lock so a worker between its predicate
            // check and its wait cannot miss the notify below.
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_) {
                return;
            }
            shutdown_ = true;
        }
        logger_->debug("Shutting down WorkerPool...");
        cv_.notify_all();
        for (std::thread& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        logger_->debug("WorkerPool shut down complete.");
    }

    uint64_t failedTasks() const { return failed_tasks_; }

private:
    void worker_thread() {
        while (true) {
            std::function<void()> current_task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return !task_queue_.empty() || shutdown_; });
                if (task_queue_.empty()) {
                    return; // shutdown with nothing left to run
                }
                current_task = std::move(task_queue_.front());
                task_queue_.pop_front();
            }

            try {
                current_task();
            } catch (const std::exception& e) {
                ++failed_tasks_;
                logger_->error("Exception caught in worker thread task: " + std::string(e.what()));
            } catch (...) {
                ++failed_tasks_;
                logger_->error("Unknown exception caught in worker thread task.");
            }

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                --outstanding_;
                if (outstanding_ == 0) {
                    idle_cv_.notify_all();
                }
            }
        }
    }

    std::shared_ptr<ILogger> logger_;
    std::deque<std::function<void()>> task_queue_;
    size_t outstanding_ = 0;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::vector<std::thread> threads_;
    bool shutdown_; // guarded by queue_mutex_
    std::atomic<uint64_t> failed_tasks_{0};
};

#endif // WORKERPOOL_HPP
