#pragma once
/**
 * FollowUpRequestStrategy.hpp
 *
 * Strategy that re-sends a request of the same family with the follow-up count
 * appended to its message ("Ping" with count 2 -> "Ping2"). TRequest must be default
 * constructible and expose a std::string member named message.
 *
 * StrategyNotification<TRequest> is the notification base carrying such a request;
 * each call to strategy() builds a fresh strategy.
 */

#include "courier/config/Config.hpp"
#include "courier/core/CancellationToken.hpp"
#include "courier/mediator/Mediator.hpp"
#include "courier/strategy/IStrategy.hpp"

#include <memory>
#include <string>
#include <utility>

namespace courier::strategy {

template <typename TRequest>
class FollowUpRequestStrategy : public IStrategy {
public:
    FollowUpRequestStrategy(TRequest seed, int count)
        : seed_(std::move(seed)), count_(count) {}

    void apply(const mediator::Mediator& mediator, const core::CancellationToken& token) override {
        TRequest next;
        next.message = seed_.message + std::to_string(count_);
        mediator.send(next, token);
    }

    const TRequest& seed() const noexcept { return seed_; }
    int count() const noexcept { return count_; }

private:
    TRequest seed_;
    int count_;
};

template <typename TRequest>
class StrategyNotification : public IStrategyNotification {
public:
    explicit StrategyNotification(TRequest request, int followUps = config::DEFAULT_FOLLOW_UP_COUNT)
        : request_(std::move(request)), followUps_(followUps) {}

    std::shared_ptr<IStrategy> strategy() const override {
        return std::make_shared<FollowUpRequestStrategy<TRequest>>(request_, followUps_);
    }

    const TRequest& request() const noexcept { return request_; }

private:
    TRequest request_;
    int followUps_;
};

} // namespace courier::strategy
