#pragma once
/**
 * Mediator.hpp
 *
 * Single entry point for sending requests and publishing notifications.
 *
 *  send(request)        resolve exactly one IRequestHandler<Request>, invoke it and wait
 *                       for its response. The handler's own exception is rethrown as is.
 *  sendAsync(request)   same resolution and invocation, returns the handler's future.
 *  publish(notification)
 *                       resolve every INotificationHandler<Notification>, start all of
 *                       them, wait for all. Handlers are not cancelled when a sibling
 *                       fails; once all completed, failures are raised together as
 *                       PublishException (original exceptions inside).
 *
 * Errors:
 *  - HandlerNotFoundException     no request handler registered
 *  - HandlerAmbiguityException    raised by the factory for more than one request handler
 *  - HandlerResolutionException   factory returned something that is not the expected handler
 *  - OperationCancelledException  token cancelled / timed out while waiting (no rollback)
 *
 * The mediator holds no state besides the factory; concurrent calls are independent.
 * Requests and notifications are dispatched by their static (concrete) type.
 */

#include "courier/config/Config.hpp"
#include "courier/core/CancellationToken.hpp"
#include "courier/core/IHandlerFactory.hpp"
#include "courier/core/INotificationHandler.hpp"
#include "courier/core/IRequestHandler.hpp"
#include "courier/core/Message.hpp"
#include "courier/core/TypeKey.hpp"

#include <any>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace courier::mediator {

class Mediator {
public:
    explicit Mediator(std::shared_ptr<const core::IHandlerFactory> factory,
                      std::chrono::milliseconds pollInterval = config::DEFAULT_CANCELLATION_POLL_INTERVAL_MS);

    template <typename TRequest>
    std::future<typename TRequest::Response> sendAsync(const TRequest& request,
                                                       const core::CancellationToken& token = {}) const {
        static_assert(std::is_base_of_v<core::Request<typename TRequest::Response>, TRequest>,
                      "sendAsync() requires a type derived from courier::core::Request<Response>");
        using Handler = core::IRequestHandler<TRequest>;
        const auto key = core::typeKeyOf<Handler>();

        token.throwIfCancellationRequested();
        auto handler = castHandler<Handler>(resolveSingle(key), key);
        logDispatch("Sending", core::typeKeyOf<TRequest>());
        return handler->handle(request, token);
    }

    template <typename TRequest>
    typename TRequest::Response send(const TRequest& request, const core::CancellationToken& token = {}) const {
        auto fut = sendAsync(request, token);
        awaitReady(fut, token);
        try {
            return fut.get();
        } catch (const std::exception& ex) {
            logHandlerFailure(core::typeKeyOf<TRequest>(), ex.what());
            throw;
        }
    }

    template <typename TNotification>
    void publish(const TNotification& notification, const core::CancellationToken& token = {}) const {
        static_assert(std::is_base_of_v<core::Notification, TNotification>,
                      "publish() requires a type derived from courier::core::Notification");
        using Handler = core::INotificationHandler<TNotification>;
        const auto key = core::typeKeyOf<Handler>();

        token.throwIfCancellationRequested();
        auto resolved = resolveAll(key);

        // type-check every handler before any of them runs
        std::vector<std::shared_ptr<Handler>> handlers;
        handlers.reserve(resolved.size());
        for (const auto& candidate : resolved) {
            handlers.push_back(castHandler<Handler>(candidate, key));
        }
        logFanOut(core::typeKeyOf<TNotification>(), handlers.size());

        std::vector<std::future<void>> pending(handlers.size());
        std::vector<std::exception_ptr> failures(handlers.size());
        for (std::size_t i = 0; i < handlers.size(); ++i) {
            try {
                pending[i] = handlers[i]->handle(notification, token);
            } catch (...) {
                failures[i] = std::current_exception();
            }
        }
        for (std::size_t i = 0; i < pending.size(); ++i) {
            if (failures[i]) continue;
            if (!pending[i].valid()) {
                failures[i] = std::make_exception_ptr(std::logic_error("Mediator: handler returned an invalid future"));
                continue;
            }
            awaitReady(pending[i], token);
            try {
                pending[i].get();
            } catch (...) {
                failures[i] = std::current_exception();
            }
        }
        raiseIfFailed(core::typeKeyOf<TNotification>(), failures);
    }

    std::chrono::milliseconds pollInterval() const noexcept { return pollInterval_; }

private:
    template <typename THandler>
    std::shared_ptr<THandler> castHandler(const std::any& candidate, const core::TypeKey& key) const {
        const auto* handler = std::any_cast<std::shared_ptr<THandler>>(&candidate);
        if (handler == nullptr || !*handler) {
            throwWrongHandlerType(key, candidate);
        }
        return *handler;
    }

    template <typename T>
    void awaitReady(std::future<T>& fut, const core::CancellationToken& token) const {
        if (!fut.valid()) {
            throw std::logic_error("Mediator: handler returned an invalid future");
        }
        if (!token.canBeCancelled()) {
            fut.wait();
            return;
        }
        while (fut.wait_for(pollInterval_) != std::future_status::ready) {
            token.throwIfCancellationRequested();
        }
    }

    // throws HandlerNotFoundException when the factory has nothing for key
    std::any resolveSingle(const core::TypeKey& key) const;
    std::vector<std::any> resolveAll(const core::TypeKey& key) const;

    [[noreturn]] void throwWrongHandlerType(const core::TypeKey& key, const std::any& candidate) const;
    void raiseIfFailed(const core::TypeKey& notificationType, std::vector<std::exception_ptr>& failures) const;

    void logDispatch(const char* verb, const core::TypeKey& messageType) const;
    void logFanOut(const core::TypeKey& notificationType, std::size_t handlerCount) const;
    void logHandlerFailure(const core::TypeKey& messageType, const char* what) const;

    std::shared_ptr<const core::IHandlerFactory> factory_;
    std::chrono::milliseconds pollInterval_;
};

} // namespace courier::mediator
