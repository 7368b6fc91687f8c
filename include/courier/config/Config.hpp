#pragma once
#include <chrono>
#include <cstddef>

#include <spdlog/common.h>

namespace courier::config {

using ms = std::chrono::milliseconds;

// TaskScheduler default worker count
constexpr std::size_t DEFAULT_WORKER_THREADS = 4;

// interval at which a waiting Send/Publish re-checks its cancellation token
constexpr ms DEFAULT_CANCELLATION_POLL_INTERVAL_MS = ms(10);

// FollowUpRequestStrategy default suffix/count
constexpr int DEFAULT_FOLLOW_UP_COUNT = 2;

constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL = spdlog::level::info;

} // namespace courier::config
