#include "courier/core/CancellationToken.hpp"
#include "courier/exceptions/OperationCancelledException.h"

namespace courier::core {

bool CancellationToken::isCancellationRequested() const noexcept {
    if (!state_) return false;
    if (state_->cancelled.load()) return true;
    return state_->deadline && std::chrono::steady_clock::now() >= *state_->deadline;
}

void CancellationToken::throwIfCancellationRequested() const {
    if (!isCancellationRequested()) return;
    if (state_->cancelled.load()) {
        throw OperationCancelledException("cancellation requested");
    }
    throw OperationCancelledException("timeout elapsed");
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

CancellationSource::CancellationSource(std::chrono::milliseconds timeout)
    : state_(std::make_shared<CancellationToken::State>()) {
    // deadline is written before the state is shared and never modified afterwards
    state_->deadline = std::chrono::steady_clock::now() + timeout;
}

void CancellationSource::cancel() noexcept {
    state_->cancelled.store(true);
}

bool CancellationSource::isCancellationRequested() const noexcept {
    return CancellationToken(state_).isCancellationRequested();
}

} // namespace courier::core
