#ifndef COURIER_OPERATION_CANCELLED_EXCEPTION_H
#define COURIER_OPERATION_CANCELLED_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace courier {

/**
 * @brief Raised when a Send/Publish stops awaiting because its token was cancelled or timed out.
 *
 * Handler side effects that already started are not rolled back.
 */
class OperationCancelledException : public std::runtime_error {
public:
    explicit OperationCancelledException(const std::string& message)
        : std::runtime_error("Operation Cancelled: " + message) {}
};

} // namespace courier

#endif // COURIER_OPERATION_CANCELLED_EXCEPTION_H
