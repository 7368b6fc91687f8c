#pragma once
/**
 * HandlerRegistry.hpp
 *
 * Explicit IHandlerFactory: a map from handler interface key to the constructors
 * registered for it. Stands in for a DI container; no scanning, no reflection.
 *
 * Registration kinds:
 *  - addRequestHandler / addNotificationHandler: a shared instance, handed out on
 *    every resolution.
 *  - add*HandlerFactory: a constructor invoked on every resolution (transient handler).
 *
 * Resolution:
 *  - resolveOne throws HandlerAmbiguityException when more than one registration exists.
 *  - a constructor that throws or returns null surfaces as HandlerResolutionException.
 *  - constructors run outside the registry lock, so a constructor may itself use the registry.
 *
 * Thread-safety: all public methods are thread-safe.
 */

#include "courier/core/IHandlerFactory.hpp"
#include "courier/core/INotificationHandler.hpp"
#include "courier/core/IRequestHandler.hpp"
#include "courier/core/TypeKey.hpp"
#include "courier/exceptions/HandlerResolutionException.h"

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace courier::registry {

class HandlerRegistry : public core::IHandlerFactory {
public:
    using Constructor = std::function<std::any()>;

    template <typename TRequest>
    using RequestHandlerPtr = std::shared_ptr<core::IRequestHandler<TRequest>>;
    template <typename TNotification>
    using NotificationHandlerPtr = std::shared_ptr<core::INotificationHandler<TNotification>>;

    HandlerRegistry() = default;

    // non-copyable
    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    template <typename TRequest>
    void addRequestHandler(RequestHandlerPtr<TRequest> handler) {
        if (!handler) {
            throw std::invalid_argument("HandlerRegistry: request handler is null");
        }
        add(core::typeKeyOf<core::IRequestHandler<TRequest>>(),
            [handler]() { return std::any(handler); });
    }

    template <typename TRequest>
    void addRequestHandlerFactory(std::function<RequestHandlerPtr<TRequest>()> ctor) {
        add(core::typeKeyOf<core::IRequestHandler<TRequest>>(), wrap<RequestHandlerPtr<TRequest>>(std::move(ctor)));
    }

    template <typename TNotification>
    void addNotificationHandler(NotificationHandlerPtr<TNotification> handler) {
        if (!handler) {
            throw std::invalid_argument("HandlerRegistry: notification handler is null");
        }
        add(core::typeKeyOf<core::INotificationHandler<TNotification>>(),
            [handler]() { return std::any(handler); });
    }

    template <typename TNotification>
    void addNotificationHandlerFactory(std::function<NotificationHandlerPtr<TNotification>()> ctor) {
        add(core::typeKeyOf<core::INotificationHandler<TNotification>>(),
            wrap<NotificationHandlerPtr<TNotification>>(std::move(ctor)));
    }

    // number of registrations for a handler interface key
    std::size_t registrationCount(const core::TypeKey& handlerType) const;

    void clear();

    std::any resolveOne(const core::TypeKey& handlerType) const override;
    std::vector<std::any> resolveMany(const core::TypeKey& handlerType) const override;

private:
    template <typename THandlerPtr>
    static Constructor wrap(std::function<THandlerPtr()> ctor) {
        if (!ctor) {
            throw std::invalid_argument("HandlerRegistry: handler constructor is empty");
        }
        return [ctor = std::move(ctor)]() {
            THandlerPtr handler = ctor();
            if (!handler) {
                throw HandlerResolutionException("constructor returned null for " +
                                                 core::prettyName(core::TypeKey(typeid(typename THandlerPtr::element_type))));
            }
            return std::any(std::move(handler));
        };
    }

    void add(const core::TypeKey& handlerType, Constructor ctor);
    std::vector<Constructor> snapshot(const core::TypeKey& handlerType) const;
    static std::any construct(const core::TypeKey& handlerType, const Constructor& ctor);

    mutable std::mutex mtx_; // protects constructors_
    std::unordered_map<core::TypeKey, std::vector<Constructor>> constructors_;
};

} // namespace courier::registry
