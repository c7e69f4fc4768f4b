#pragma once

#include <limits>
#include <stdexcept>

#include "pool_types.hpp"

namespace gp {

inline Amount checkedAdd(Amount lhs, Amount rhs) {
    if (lhs > std::numeric_limits<Amount>::max() - rhs) {
        throw std::overflow_error("pool amount overflow");
    }
    return lhs + rhs;
}

inline Amount checkedSub(Amount lhs, Amount rhs) {
    if (rhs > lhs) {
        throw std::underflow_error("pool amount underflow");
    }
    return lhs - rhs;
}

} // namespace gp
