#pragma once
/**
 * StrategyNotificationHandler.hpp
 *
 * Generic notification handler for every notification type exposing a strategy.
 * It pulls the strategy out of the notification and applies it with the mediator,
 * so the strategy can send further requests the dispatch machinery knows nothing about.
 *
 * - Runs on the TaskScheduler, concurrently with sibling handlers of the same notification.
 * - Holds the mediator weakly: the mediator owns the registry that constructs this handler.
 * - A notification whose strategy() is null is a failure of that handler.
 *
 * Bind it to a concrete notification type with addStrategyHandler<TNotification>().
 */

#include "courier/core/NotificationHandler.hpp"
#include "courier/core/TaskScheduler.hpp"
#include "courier/mediator/Mediator.hpp"
#include "courier/registry/HandlerRegistry.hpp"
#include "courier/strategy/IStrategy.hpp"

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace courier::strategy {

template <typename TNotification>
class StrategyNotificationHandler : public core::AsyncNotificationHandler<TNotification> {
    static_assert(std::is_base_of_v<IStrategyNotification, TNotification>,
                  "StrategyNotificationHandler requires a notification derived from IStrategyNotification");

public:
    StrategyNotificationHandler(std::weak_ptr<const mediator::Mediator> mediator,
                                std::shared_ptr<core::TaskScheduler> scheduler)
        : core::AsyncNotificationHandler<TNotification>(std::move(scheduler)),
          mediator_(std::move(mediator)) {}

protected:
    void handleCore(const TNotification& notification, const core::CancellationToken& token) override {
        auto mediator = mediator_.lock();
        if (!mediator) {
            throw std::runtime_error("StrategyNotificationHandler: mediator no longer available");
        }
        auto strategy = notification.strategy();
        if (!strategy) {
            throw std::runtime_error("StrategyNotificationHandler: notification carries no strategy");
        }
        strategy->apply(*mediator, token);
    }

private:
    std::weak_ptr<const mediator::Mediator> mediator_;
};

template <typename TNotification>
void addStrategyHandler(registry::HandlerRegistry& registry,
                        std::weak_ptr<const mediator::Mediator> mediator,
                        std::shared_ptr<core::TaskScheduler> scheduler) {
    registry.addNotificationHandlerFactory<TNotification>(
        [mediator = std::move(mediator), scheduler = std::move(scheduler)]() {
            return std::make_shared<StrategyNotificationHandler<TNotification>>(mediator, scheduler);
        });
}

} // namespace courier::strategy
