#pragma once

#include "capabilities.hpp"
#include "oracle.hpp"
#include "pool_config.hpp"
#include "settlement_engine.hpp"
#include "settlement_error.hpp"
#include "vault.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace gp {
namespace testing {

inline PoolConfig testConfig() {
    PoolConfig cfg;
    cfg.deploymentId = "unit-tests";
    cfg.custodyAccount = "pool";
    cfg.charityAccount = "charity";
    return cfg;
}

// Engine wired to in-process capabilities with "operator" as the only operator.
struct PoolFixture {
    std::shared_ptr<OperatorSet> access = std::make_shared<OperatorSet>();
    std::shared_ptr<CircuitBreaker> breaker;
    std::shared_ptr<ReentrancyLock> guard = std::make_shared<ReentrancyLock>();
    std::shared_ptr<Vault> vault;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(1'700'000'000);
    std::unique_ptr<SettlementEngine> engine;

    explicit PoolFixture(PoolConfig cfg = testConfig(), OraclePtr oracle = nullptr) {
        access->grant("operator");
        breaker = std::make_shared<CircuitBreaker>(access);
        vault = std::make_shared<Vault>(cfg.custodyAccount);

        EngineCapabilities caps;
        caps.access = access;
        caps.pause = breaker;
        caps.guard = guard;
        caps.transfers = vault;
        caps.clock = clock;
        caps.oracle = std::move(oracle);
        engine = std::make_unique<SettlementEngine>(std::move(cfg), std::move(caps));
    }

    void fund(const Address& account, Amount amount) { vault->deposit(account, amount); }

    void bet(const Address& bettor, Side side, Amount amount) {
        fund(bettor, amount);
        engine->placeBet(bettor, side, amount);
    }
};

// Runs `fn` and reports the SettlementError code it raised, if any.
template <typename Fn>
std::optional<ErrorCode> errorCodeOf(Fn&& fn) {
    try {
        std::forward<Fn>(fn)();
    } catch (const SettlementError& ex) {
        return ex.code();
    }
    return std::nullopt;
}

} // namespace testing
} // namespace gp
