#include "courier/registry/HandlerRegistry.hpp"
#include "courier/exceptions/HandlerAmbiguityException.h"
#include "courier/exceptions/HandlerResolutionException.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace courier::registry {

void HandlerRegistry::add(const core::TypeKey& handlerType, Constructor ctor) {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto& slot = constructors_[handlerType];
        slot.push_back(std::move(ctor));
        count = slot.size();
    }
    spdlog::debug("Registered handler for {} ({} registration(s))", core::prettyName(handlerType), count);
}

std::size_t HandlerRegistry::registrationCount(const core::TypeKey& handlerType) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = constructors_.find(handlerType);
    return it == constructors_.end() ? 0 : it->second.size();
}

void HandlerRegistry::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    constructors_.clear();
}

std::vector<HandlerRegistry::Constructor> HandlerRegistry::snapshot(const core::TypeKey& handlerType) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = constructors_.find(handlerType);
    if (it == constructors_.end()) return {};
    return it->second;
}

std::any HandlerRegistry::construct(const core::TypeKey& handlerType, const Constructor& ctor) {
    try {
        return ctor();
    } catch (const HandlerResolutionException&) {
        throw;
    } catch (const std::exception& ex) {
        throw HandlerResolutionException("constructing handler for " + core::prettyName(handlerType) +
                                         " failed: " + ex.what());
    }
}

std::any HandlerRegistry::resolveOne(const core::TypeKey& handlerType) const {
    auto ctors = snapshot(handlerType);
    if (ctors.empty()) {
        return {};
    }
    if (ctors.size() > 1) {
        spdlog::error("{} has {} registrations, exactly one expected", core::prettyName(handlerType), ctors.size());
        throw HandlerAmbiguityException(core::prettyName(handlerType) + " has " + std::to_string(ctors.size()) +
                                        " registrations, exactly one expected");
    }
    return construct(handlerType, ctors.front());
}

std::vector<std::any> HandlerRegistry::resolveMany(const core::TypeKey& handlerType) const {
    auto ctors = snapshot(handlerType);
    std::vector<std::any> handlers;
    handlers.reserve(ctors.size());
    for (const auto& ctor : ctors) {
        handlers.push_back(construct(handlerType, ctor));
    }
    return handlers;
}

} // namespace courier::registry
