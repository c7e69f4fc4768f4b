#include "payout.hpp"

#include "checked_math.hpp"
#include "settlement_error.hpp"

#include <sstream>
#include <stdexcept>

#include <boost/multiprecision/cpp_int.hpp>

namespace gp {

PayoutBreakdown computePayout(Amount stake,
                              Amount winningTotal,
                              Amount losingTotal,
                              bool charitySplit) {
    if (stake == 0) {
        throw SettlementError(ErrorCode::NoWinningStake, "stake is zero");
    }
    if (winningTotal == 0) {
        throw SettlementError(ErrorCode::NoWinningStake, "winning side has no volume");
    }
    if (stake > winningTotal) {
        std::ostringstream oss;
        oss << "stake " << stake << " exceeds winning total " << winningTotal;
        throw std::invalid_argument(oss.str());
    }

    using Wide = boost::multiprecision::checked_uint128_t;
    Wide share = Wide(stake) * Wide(losingTotal) / Wide(winningTotal);
    // share <= losingTotal since stake <= winningTotal.
    Amount profit = share.convert_to<Amount>();

    PayoutBreakdown out;
    out.stake = stake;
    out.profit = profit;
    out.gross = checkedAdd(stake, profit);
    out.charity = charitySplit ? profit / 2 : 0;
    out.user = checkedAdd(stake, checkedSub(profit, out.charity));
    return out;
}

} // namespace gp
