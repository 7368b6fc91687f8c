#pragma once
/**
 * TaskScheduler.hpp
 *
 * Bounded worker pool on which asynchronous handlers run.
 *
 * Design notes:
 * - Wraps boost::asio::thread_pool. Workers start on construction.
 * - submit(fn) posts fn and returns a std::future of its result; an exception thrown
 *   by fn is stored in the future, not lost on the worker thread.
 * - submit(fn) called from one of the pool's own workers runs fn inline on that worker,
 *   so a task waiting on work it submitted never starves the pool.
 * - stop() refuses new work, lets already queued tasks finish and joins the workers.
 *   Tasks submitted from a draining worker still run (inline).
 * - submit() from outside the pool after stop() throws std::runtime_error.
 *
 * Thread-safety:
 * - submit/stop are thread-safe. The stopped check and the post happen under one lock,
 *   so every future returned by submit() completes.
 * - The owner calls stop() from a non-worker thread before releasing its reference.
 *   Async handlers keep the scheduler alive, and the destructor must not run on a worker.
 */

#include "courier/config/Config.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace courier::core {

class TaskScheduler {
public:
    explicit TaskScheduler(std::size_t threads = config::DEFAULT_WORKER_THREADS);
    ~TaskScheduler();

    // non-copyable
    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        if (pool_.get_executor().running_in_this_thread()) {
            (*task)();
            return fut;
        }
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_.load()) {
            throw std::runtime_error("TaskScheduler: submit after stop");
        }
        boost::asio::post(pool_, [task]() { (*task)(); });
        return fut;
    }

    void stop();

    std::size_t threadCount() const noexcept { return threads_; }
    bool isStopped() const noexcept { return stopped_.load(); }

private:
    const std::size_t threads_;
    boost::asio::thread_pool pool_;
    std::mutex mtx_; // orders submit's post against stop
    std::atomic<bool> stopped_{false};
};

} // namespace courier::core
