#include "courier/core/TaskScheduler.hpp"

#include <spdlog/spdlog.h>

namespace courier::core {

TaskScheduler::TaskScheduler(std::size_t threads)
    : threads_(threads == 0 ? 1 : threads),
      pool_(threads_) {
    spdlog::debug("TaskScheduler started with {} worker(s)", threads_);
}

TaskScheduler::~TaskScheduler() {
    stop();
}

void TaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_.load()) return;
        stopped_.store(true);
    }
    // joined outside the lock so a concurrent submit() fails fast instead of waiting out the drain
    pool_.join();
    spdlog::debug("TaskScheduler stopped");
}

} // namespace courier::core
