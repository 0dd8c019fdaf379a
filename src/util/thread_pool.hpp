#ifndef PIIGUARD_UTIL_THREAD_POOL_HPP
#define PIIGUARD_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <memory>
#include <stdexcept>
#include <algorithm>
#include <type_traits>

/**
 * @file thread_pool.hpp
 * @brief A fixed-size thread pool used to run independent scans
 *        (separate documents, or separate windows of one buffer) in parallel.
 *
 * Usage Example:
 *  @code
 *    piiguard::util::ThreadPool pool(4);
 *    auto pending = pool.enqueue([&scanner, &text] { return scanner.scan(text); });
 *    std::vector<RawMatch> matches = pending.get();
 *  @endcode
 *
 * Exceptions thrown by a task are delivered through its future.
 */

namespace piiguard {
namespace util {

/**
 * @class ThreadPool
 * @brief Fixed set of workers pulling std::function tasks from one queue.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of workers; zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Notifies all workers to stop once the queue is drained, then joins them.
     */
    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        ready_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t size() const { return workers_.size(); }

    /**
     * @brief Queue f(args...) and return the future of its result.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using Result = typename std::invoke_result<F, Args...>::type;

        auto job = std::make_shared<std::packaged_task<Result()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<Result> future = job->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            tasks_.emplace([job]() { (*job)(); });
        }
        ready_.notify_one();
        return future;
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable ready_;
    bool stopping_ = false;

    void workerLoop()
    {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                ready_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                // Drain before exiting so every future gets a value.
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_THREAD_POOL_HPP
