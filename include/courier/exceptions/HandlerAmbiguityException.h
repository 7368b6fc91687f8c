#ifndef COURIER_HANDLER_AMBIGUITY_EXCEPTION_H
#define COURIER_HANDLER_AMBIGUITY_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace courier {

/**
 * @brief Raised when resolution yields more than one handler where exactly one is required.
 *
 * This is a wiring defect. It is surfaced at dispatch time and never resolved by picking one.
 */
class HandlerAmbiguityException : public std::runtime_error {
public:
    explicit HandlerAmbiguityException(const std::string& message)
        : std::runtime_error("Handler Ambiguity: " + message) {}
};

} // namespace courier

#endif // COURIER_HANDLER_AMBIGUITY_EXCEPTION_H
