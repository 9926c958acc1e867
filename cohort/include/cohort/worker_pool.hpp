#pragma once
// Worker Pool: fixed set of threads draining one shared queue
//
// Workers take the next queued task whenever they are free, so long tasks
// never hold up short ones queued behind a different worker. submit()
// never waits on a result.

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace cohort {

class WorkerPool {
public:
    explicit WorkerPool(size_t workers) {
        if (workers == 0) workers = 1;
        threads_.reserve(workers);
        try {
            for (size_t i = 0; i < workers; ++i) {
                threads_.emplace_back([this]() { run(); });
            }
        } catch (...) {
            // A thread failed to start; the ones already running must be
            // joined before the vector destroys them
            shutdown();
            throw;
        }
    }

    // Drains the queue before joining
    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    void run() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) return;  // stopping and drained
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            job();
        }
    }
};

} // namespace cohort
