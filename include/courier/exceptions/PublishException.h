#ifndef COURIER_PUBLISH_EXCEPTION_H
#define COURIER_PUBLISH_EXCEPTION_H

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace courier {

/**
 * @brief Aggregate failure of a Publish.
 *
 * Publish lets every notification handler run to completion and then raises this
 * exception if at least one failed. failures() holds the original exceptions, in
 * handler resolution order, so callers can rethrow and inspect each one.
 */
class PublishException : public std::runtime_error {
public:
    PublishException(const std::string& message, std::vector<std::exception_ptr> failures)
        : std::runtime_error("Publish Error: " + message), failures_(std::move(failures)) {}

    const std::vector<std::exception_ptr>& failures() const noexcept { return failures_; }

private:
    std::vector<std::exception_ptr> failures_;
};

} // namespace courier

#endif // COURIER_PUBLISH_EXCEPTION_H
