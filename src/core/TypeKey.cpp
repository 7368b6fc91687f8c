#include "courier/core/TypeKey.hpp"

#include <boost/core/demangle.hpp>

namespace courier::core {

std::string prettyName(const TypeKey& key) {
    return boost::core::demangle(key.name());
}

} // namespace courier::core
