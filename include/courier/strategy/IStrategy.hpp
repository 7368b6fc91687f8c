#pragma once

#include "courier/core/CancellationToken.hpp"
#include "courier/core/Message.hpp"

#include <memory>

namespace courier::mediator {
class Mediator;
}

namespace courier::strategy {

// Follow-up work embedded in a notification. Consumed once by StrategyNotificationHandler.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual void apply(const mediator::Mediator& mediator, const core::CancellationToken& token) = 0;
};

// Capability shared by every notification that carries a strategy.
class IStrategyNotification : public core::Notification {
public:
    virtual std::shared_ptr<IStrategy> strategy() const = 0;
};

} // namespace courier::strategy
