#include "pool_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace gp {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool readEnv(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }
    out = trim(env);
    return !out.empty();
}

std::uint64_t parseUnsigned(const char* name, const std::string& text) {
    std::uint64_t value = 0;
    if (!parseUnsignedText(text, value)) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned 64-bit integer, got \"" + text + "\"");
    }
    return value;
}

bool parseFlag(const char* name, const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "1" || lowered == "true" || lowered == "on" || lowered == "yes") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "off" || lowered == "no") {
        return false;
    }
    throw std::invalid_argument(std::string(name) + " must be a boolean flag, got \"" + text + "\"");
}

} // namespace

bool parseUnsignedText(const std::string& text, std::uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    bool digits = std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (!digits) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

PoolConfig loadPoolConfigFromEnv(PoolConfig base) {
    std::string value;
    if (readEnv("GP_DEPLOYMENT_ID", value)) {
        base.deploymentId = value;
    }
    if (readEnv("GP_CHARITY_ACCOUNT", value)) {
        base.charityAccount = value;
    }
    if (readEnv("GP_MIN_BET", value)) {
        base.minBet = parseUnsigned("GP_MIN_BET", value);
    }
    if (readEnv("GP_MAX_BET", value)) {
        base.maxBet = parseUnsigned("GP_MAX_BET", value);
    }
    if (readEnv("GP_BETTING_DURATION", value)) {
        base.bettingDuration = parseUnsigned("GP_BETTING_DURATION", value);
    }
    if (readEnv("GP_ODDS_SCALE", value)) {
        base.oddsScale = parseUnsigned("GP_ODDS_SCALE", value);
    }
    if (readEnv("GP_CHARITY_SPLIT", value)) {
        base.charitySplit = parseFlag("GP_CHARITY_SPLIT", value);
    }
    return base;
}

void validatePoolConfig(const PoolConfig& cfg) {
    if (cfg.deploymentId.empty()) {
        throw std::invalid_argument("Pool requires a deploymentId (set PoolConfig::deploymentId or GP_DEPLOYMENT_ID)");
    }
    if (cfg.deploymentId == "default") {
        throw std::invalid_argument(
            "Pool deploymentId cannot be \"default\"; set an environment-specific value such as \"mainnet\" or \"testnet\"");
    }
    if (cfg.custodyAccount.empty()) {
        throw std::invalid_argument("custody account must not be empty");
    }
    if (cfg.charitySplit && cfg.charityAccount.empty()) {
        throw std::invalid_argument("charity split enabled without a charity account");
    }
    if (cfg.charityAccount == cfg.custodyAccount) {
        throw std::invalid_argument("charity account must differ from the custody account");
    }
    if (cfg.minBet == 0) {
        throw std::invalid_argument("minimum bet must be positive");
    }
    if (cfg.maxBet != 0 && cfg.minBet > cfg.maxBet) {
        throw std::invalid_argument("minimum bet exceeds maximum bet");
    }
    if (cfg.oddsScale == 0 || cfg.oddsScale % 2 != 0) {
        throw std::invalid_argument("odds scale must be a positive even number");
    }
}

} // namespace gp
