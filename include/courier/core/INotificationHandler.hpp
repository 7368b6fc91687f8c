#pragma once

#include "courier/core/CancellationToken.hpp"

#include <future>

namespace courier::core {

// Capability the mediator requires from a notification handler.
// Zero or more handlers may be registered per concrete notification type.
template <typename TNotification>
class INotificationHandler {
public:
    using Notification = TNotification;

    virtual ~INotificationHandler() = default;

    virtual std::future<void> handle(const TNotification& notification, const CancellationToken& token) = 0;
};

} // namespace courier::core
