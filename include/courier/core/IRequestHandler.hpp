#pragma once
/**
 * IRequestHandler.hpp
 *
 * Capability the mediator requires from a request handler.
 *
 * - One handler is registered per concrete request type.
 * - handle() returns a future so that synchronous and asynchronous handlers share
 *   one shape. A failure of the handler logic travels inside the future and is
 *   rethrown unchanged by Mediator::send().
 */

#include "courier/core/CancellationToken.hpp"

#include <future>

namespace courier::core {

template <typename TRequest>
class IRequestHandler {
public:
    using Request = TRequest;
    using Response = typename TRequest::Response;

    virtual ~IRequestHandler() = default;

    virtual std::future<Response> handle(const TRequest& request, const CancellationToken& token) = 0;
};

} // namespace courier::core
