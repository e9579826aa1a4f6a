#pragma once
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>
#include "utils/Channel.h"

/**
 * @brief Fixed set of workers draining one job channel.
 *
 * Used to run tool handlers. Jobs wait in the channel while every worker
 * is busy; the destructor closes the channel, lets the workers finish what
 * was already queued and joins them.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads) : jobs(std::numeric_limits<size_t>::max()) {
        size_t count = numThreads == 0 ? 1 : numThreads;
        workers.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ~ThreadPool() {
        jobs.close();
        for (auto& worker : workers) {
            if (worker.joinable()) worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shutting down.
    template <class F>
    std::future<std::invoke_result_t<F>> enqueue(F&& f) {
        using Result = std::invoke_result_t<F>;
        // std::function needs a copyable target, packaged_task is move-only.
        auto job = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> result = job->get_future();
        if (!jobs.send([job] { (*job)(); })) {
            throw std::runtime_error("ThreadPool is shutting down");
        }
        return result;
    }

    size_t size() const { return workers.size(); }
    size_t queued() const { return jobs.size(); }

private:
    void workerLoop() {
        while (auto job = jobs.receive()) {
            (*job)();
        }
    }

    Channel<std::function<void()>> jobs;
    std::vector<std::thread> workers;
};
