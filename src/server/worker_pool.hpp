#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed number of threads draining a FIFO of jobs. Blocking work (model
// inference) goes here so request threads only wait on a future.
class WorkerPool {
public:
    explicit WorkerPool(size_t n_threads) {
        if (n_threads == 0) n_threads = 1;
        workers_.reserve(n_threads);
        for (size_t i = 0; i < n_threads; ++i) {
            workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
        }
    }

    // Queued jobs still run; then the workers are joined.
    ~WorkerPool() {
        {
            std::lock_guard lock(mu_);
            stopping_ = true;
        }
        cv_.notify_all();
        workers_.clear();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Exceptions thrown by fn surface from the returned future's get().
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F&& fn) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        {
            std::lock_guard lock(mu_);
            if (stopping_) {
                throw std::runtime_error("worker pool is shutting down");
            }
            queue_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    size_t size() const { return workers_.size(); }

    size_t pending() const {
        std::lock_guard lock(mu_);
        return queue_.size();
    }

private:
    void worker_loop(std::stop_token st) {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock lock(mu_);
                cv_.wait(lock, [this, &st] {
                    return stopping_ || st.stop_requested() || !queue_.empty();
                });
                if (queue_.empty()) return;
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            job();
        }
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::jthread> workers_;
};
