#include "courier/mediator/Mediator.hpp"
#include "courier/exceptions/HandlerNotFoundException.h"
#include "courier/exceptions/HandlerResolutionException.h"
#include "courier/exceptions/PublishException.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

namespace courier::mediator {

Mediator::Mediator(std::shared_ptr<const core::IHandlerFactory> factory, std::chrono::milliseconds pollInterval)
    : factory_(std::move(factory)),
      pollInterval_(pollInterval.count() > 0 ? pollInterval : config::DEFAULT_CANCELLATION_POLL_INTERVAL_MS) {
    if (!factory_) {
        throw std::invalid_argument("Mediator: IHandlerFactory is null");
    }
}

std::any Mediator::resolveSingle(const core::TypeKey& key) const {
    std::any handler = factory_->resolveOne(key);
    if (!handler.has_value()) {
        spdlog::warn("No handler registered for {}", core::prettyName(key));
        throw HandlerNotFoundException("no handler registered for " + core::prettyName(key));
    }
    return handler;
}

std::vector<std::any> Mediator::resolveAll(const core::TypeKey& key) const {
    return factory_->resolveMany(key);
}

void Mediator::throwWrongHandlerType(const core::TypeKey& key, const std::any& candidate) const {
    std::string got = candidate.has_value() ? core::prettyName(candidate.type()) : std::string("<empty>");
    spdlog::error("Factory returned {} when resolving {}", got, core::prettyName(key));
    throw HandlerResolutionException("expected std::shared_ptr<" + core::prettyName(key) + ">, factory returned " + got);
}

void Mediator::raiseIfFailed(const core::TypeKey& notificationType, std::vector<std::exception_ptr>& failures) const {
    failures.erase(std::remove(failures.begin(), failures.end(), nullptr), failures.end());
    if (failures.empty()) return;

    for (const auto& failure : failures) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& ex) {
            logHandlerFailure(notificationType, ex.what());
        } catch (...) {
            logHandlerFailure(notificationType, "non-standard exception");
        }
    }
    const auto count = failures.size();
    throw PublishException(std::to_string(count) + " handler(s) failed for " + core::prettyName(notificationType),
                           std::move(failures));
}

void Mediator::logDispatch(const char* verb, const core::TypeKey& messageType) const {
    if (!spdlog::default_logger_raw()->should_log(spdlog::level::debug)) return;
    spdlog::debug("{} {}", verb, core::prettyName(messageType));
}

void Mediator::logFanOut(const core::TypeKey& notificationType, std::size_t handlerCount) const {
    if (!spdlog::default_logger_raw()->should_log(spdlog::level::debug)) return;
    spdlog::debug("Publishing {} to {} handler(s)", core::prettyName(notificationType), handlerCount);
}

void Mediator::logHandlerFailure(const core::TypeKey& messageType, const char* what) const {
    spdlog::error("Handler for {} failed: {}", core::prettyName(messageType), what);
}

} // namespace courier::mediator
