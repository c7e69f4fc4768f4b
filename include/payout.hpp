#pragma once

#include "pool_types.hpp"

namespace gp {

struct PayoutBreakdown {
    Amount stake = 0;
    Amount gross = 0;   // stake plus pro-rata share of the losing pool
    Amount profit = 0;
    Amount charity = 0;
    Amount user = 0;
};

// gross = stake + stake * losingTotal / winningTotal, floor division.
// With the charity split half of the profit (rounded down) goes to charity.
PayoutBreakdown computePayout(Amount stake,
                              Amount winningTotal,
                              Amount losingTotal,
                              bool charitySplit);

} // namespace gp
