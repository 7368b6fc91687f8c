#pragma once
/**
 * Message.hpp
 *
 * Request / Notification contracts.
 *
 *  - Request<TResponse>: action expecting exactly one response from exactly one handler.
 *    Concrete requests derive from it and are dispatched by their concrete type.
 *  - Unit: response type for requests that produce nothing.
 *  - Notification: event with no response, handled by zero or more handlers.
 */

namespace courier::core {

struct Unit {
    bool operator==(const Unit&) const noexcept { return true; }
    bool operator!=(const Unit&) const noexcept { return false; }
};

template <typename TResponse>
struct Request {
    using Response = TResponse;
    virtual ~Request() = default;
};

struct Notification {
    virtual ~Notification() = default;
};

} // namespace courier::core
