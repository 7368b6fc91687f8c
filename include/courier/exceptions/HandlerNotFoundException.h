#ifndef COURIER_HANDLER_NOT_FOUND_EXCEPTION_H
#define COURIER_HANDLER_NOT_FOUND_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace courier {

/**
 * @brief Raised by Send when no handler is registered for the request's concrete type.
 */
class HandlerNotFoundException : public std::runtime_error {
public:
    explicit HandlerNotFoundException(const std::string& message)
        : std::runtime_error("Handler Not Found: " + message) {}
};

} // namespace courier

#endif // COURIER_HANDLER_NOT_FOUND_EXCEPTION_H
