#pragma once
/**
 * IHandlerFactory.hpp
 *
 * Resolution interface the mediator consumes. The mediator never constructs handlers.
 *
 *  resolveOne(handlerType)
 *    - empty std::any                 -> no handler registered
 *    - std::shared_ptr<Interface>     -> the single handler
 *    - more than one candidate        -> must throw courier::HandlerAmbiguityException,
 *                                        never pick one silently
 *  resolveMany(handlerType)
 *    - every registered handler, possibly none
 *
 * handlerType is the key of the handler interface (typeKeyOf<IRequestHandler<R>>()).
 * Each returned std::any holds a std::shared_ptr of exactly that interface type;
 * anything else is reported by the mediator as courier::HandlerResolutionException.
 * Lookups must not have side effects visible to the mediator.
 */

#include "courier/core/TypeKey.hpp"

#include <any>
#include <vector>

namespace courier::core {

class IHandlerFactory {
public:
    virtual ~IHandlerFactory() = default;

    virtual std::any resolveOne(const TypeKey& handlerType) const = 0;

    virtual std::vector<std::any> resolveMany(const TypeKey& handlerType) const = 0;
};

} // namespace courier::core
