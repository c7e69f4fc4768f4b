#pragma once

#include "pool_types.hpp"

#include <cstdint>
#include <string>

namespace gp {

struct PoolConfig {
    std::string deploymentId = "default";
    Address custodyAccount = "pool";
    Address charityAccount; // fixed at deployment, never reassigned
    Amount minBet = 1;
    Amount maxBet = 0;                  // 0: no upper bound
    std::uint64_t bettingDuration = 0;  // seconds; 0: not time-boxed
    std::uint64_t oddsScale = 1000;
    bool charitySplit = true;
    bool pauseBlocksClaims = true;
};

// Overlays GP_DEPLOYMENT_ID, GP_CHARITY_ACCOUNT, GP_MIN_BET, GP_MAX_BET,
// GP_BETTING_DURATION, GP_ODDS_SCALE and GP_CHARITY_SPLIT onto `base`.
PoolConfig loadPoolConfigFromEnv(PoolConfig base = {});

void validatePoolConfig(const PoolConfig& cfg);

// Decimal digits only: no sign, whitespace or suffix, and no wraparound.
bool parseUnsignedText(const std::string& text, std::uint64_t& out);

} // namespace gp
