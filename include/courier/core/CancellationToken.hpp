#pragma once
/**
 * CancellationToken.hpp
 *
 * Cooperative cancellation for Send/Publish.
 *
 *  - CancellationSource owns the shared state and is the only side that can cancel.
 *  - CancellationToken is a cheap copyable view handed to the mediator and on to handlers.
 *  - A source may carry a timeout; once the deadline passes the token reports cancelled.
 *  - A default constructed token is never cancelled.
 *
 * Cancellation only stops the mediator from awaiting; it never undoes handler work.
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <utility>

namespace courier::core {

class CancellationSource;

class CancellationToken {
public:
    CancellationToken() = default;

    static CancellationToken none() { return CancellationToken(); }

    bool canBeCancelled() const noexcept { return static_cast<bool>(state_); }
    bool isCancellationRequested() const noexcept;

    // throws courier::OperationCancelledException when cancelled
    void throwIfCancellationRequested() const;

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(std::chrono::milliseconds timeout);

    CancellationToken token() const { return CancellationToken(state_); }

    void cancel() noexcept;
    bool isCancellationRequested() const noexcept;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace courier::core
