#pragma once
/**
 * TypeKey.hpp
 *
 * Handler type descriptor used by IHandlerFactory lookups.
 * The key of a handler is the type_index of the handler *interface*
 * (e.g. IRequestHandler<PingRequest>), never of the concrete class.
 */

#include <string>
#include <typeindex>
#include <typeinfo>

namespace courier::core {

using TypeKey = std::type_index;

template <typename T>
TypeKey typeKeyOf() {
    return TypeKey(typeid(T));
}

// human readable (demangled) name for logs and exception messages
std::string prettyName(const TypeKey& key);

} // namespace courier::core
