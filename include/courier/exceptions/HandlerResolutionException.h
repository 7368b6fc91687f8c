#ifndef COURIER_HANDLER_RESOLUTION_EXCEPTION_H
#define COURIER_HANDLER_RESOLUTION_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace courier {

/**
 * @brief Raised when the handler factory hands back something that is not a handler of the requested type, or a handler constructor fails.
 */
class HandlerResolutionException : public std::runtime_error {
public:
    explicit HandlerResolutionException(const std::string& message)
        : std::runtime_error("Handler Resolution Error: " + message) {}
};

} // namespace courier

#endif // COURIER_HANDLER_RESOLUTION_EXCEPTION_H
