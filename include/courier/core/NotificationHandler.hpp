#pragma once
/**
 * NotificationHandler.hpp
 *
 * Base classes adapting a plain action into INotificationHandler.
 * Same threading rules as RequestHandler.hpp: the synchronous base runs inline,
 * the asynchronous base runs on the TaskScheduler and must be shared_ptr owned.
 */

#include "courier/core/INotificationHandler.hpp"
#include "courier/core/TaskScheduler.hpp"

#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <utility>

namespace courier::core {

template <typename TNotification>
class NotificationHandler : public INotificationHandler<TNotification> {
public:
    std::future<void> handle(const TNotification& notification, const CancellationToken& token) final {
        std::promise<void> prom;
        try {
            token.throwIfCancellationRequested();
            handleCore(notification);
            prom.set_value();
        } catch (...) {
            prom.set_exception(std::current_exception());
        }
        return prom.get_future();
    }

protected:
    virtual void handleCore(const TNotification& notification) = 0;
};

template <typename TNotification>
class AsyncNotificationHandler : public INotificationHandler<TNotification>,
                                 public std::enable_shared_from_this<AsyncNotificationHandler<TNotification>> {
public:
    explicit AsyncNotificationHandler(std::shared_ptr<TaskScheduler> scheduler)
        : scheduler_(std::move(scheduler)) {
        if (!scheduler_) {
            throw std::invalid_argument("AsyncNotificationHandler: TaskScheduler is null");
        }
    }

    std::future<void> handle(const TNotification& notification, const CancellationToken& token) final {
        auto self = this->shared_from_this();
        return scheduler_->submit([self, notification, token]() {
            token.throwIfCancellationRequested();
            self->handleCore(notification, token);
        });
    }

protected:
    virtual void handleCore(const TNotification& notification, const CancellationToken& token) = 0;

    std::shared_ptr<TaskScheduler> scheduler_;
};

} // namespace courier::core
