#pragma once
/**
 * RequestHandler.hpp
 *
 * Base classes adapting a plain transform into IRequestHandler.
 *
 *  - RequestHandler<TRequest>: implement handleCore(request) -> response. Runs to
 *    completion on the calling thread; the returned future is already ready.
 *  - AsyncRequestHandler<TRequest>: implement handleCore(request, token) -> response.
 *    Runs on the injected TaskScheduler. The request is copied into the task.
 *    Instances must be owned by a std::shared_ptr (the task keeps the handler alive).
 */

#include "courier/core/IRequestHandler.hpp"
#include "courier/core/TaskScheduler.hpp"

#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <utility>

namespace courier::core {

template <typename TRequest>
class RequestHandler : public IRequestHandler<TRequest> {
public:
    using Response = typename IRequestHandler<TRequest>::Response;

    std::future<Response> handle(const TRequest& request, const CancellationToken& token) final {
        std::promise<Response> prom;
        try {
            token.throwIfCancellationRequested();
            prom.set_value(handleCore(request));
        } catch (...) {
            prom.set_exception(std::current_exception());
        }
        return prom.get_future();
    }

protected:
    virtual Response handleCore(const TRequest& request) = 0;
};

template <typename TRequest>
class AsyncRequestHandler : public IRequestHandler<TRequest>,
                            public std::enable_shared_from_this<AsyncRequestHandler<TRequest>> {
public:
    using Response = typename IRequestHandler<TRequest>::Response;

    explicit AsyncRequestHandler(std::shared_ptr<TaskScheduler> scheduler)
        : scheduler_(std::move(scheduler)) {
        if (!scheduler_) {
            throw std::invalid_argument("AsyncRequestHandler: TaskScheduler is null");
        }
    }

    std::future<Response> handle(const TRequest& request, const CancellationToken& token) final {
        auto self = this->shared_from_this();
        return scheduler_->submit([self, request, token]() {
            token.throwIfCancellationRequested();
            return self->handleCore(request, token);
        });
    }

protected:
    virtual Response handleCore(const TRequest& request, const CancellationToken& token) = 0;

    std::shared_ptr<TaskScheduler> scheduler_;
};

} // namespace courier::core
