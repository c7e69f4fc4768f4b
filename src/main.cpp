#include "capabilities.hpp"
#include "oracle.hpp"
#include "pool_config.hpp"
#include "settlement_engine.hpp"
#include "settlement_error.hpp"
#include "vault.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace gp;

namespace {

void printUsage() {
    std::cout << "Commands (one per line):\n"
              << "  fund <account> <amount>\n"
              << "  create <operator>\n"
              << "  bet <bettor> <A|B> <amount>\n"
              << "  resolve <caller> <eventId> [A|B]   (no side: ask the outcome oracle)\n"
              << "  cancel <operator> <eventId>\n"
              << "  claim <bettor> <eventId>\n"
              << "  pause <operator> | unpause <operator>\n"
              << "  withdraw <operator> <recipient> <amount>\n"
              << "  advance <seconds>\n"
              << "  status [eventId] | balance <account> | root | help | quit\n";
}

bool parseSide(const std::string& text, Side& out) {
    if (text == "A" || text == "a") {
        out = Side::A;
        return true;
    }
    if (text == "B" || text == "b") {
        out = Side::B;
        return true;
    }
    return false;
}

bool readUnsigned(std::istream& in, std::uint64_t& out) {
    std::string token;
    return (in >> token) && parseUnsignedText(token, out);
}

void printStatus(const SettlementEngine& engine, EventId id) {
    const EventRecord& record = engine.event(id);
    std::cout << "Event " << id << ": " << toString(record.status);
    if (record.status == EventStatus::Resolved) {
        std::cout << " (side " << toString(winningSide(record.outcome)) << " won)";
    }
    std::cout << "\n  pool A=" << record.totalStakeA << " B=" << record.totalStakeB
              << "  odds A=" << record.oddsA << " B=" << record.oddsB
              << "  held=" << record.heldValue() << "\n";
    for (const auto& bettor : record.participants) {
        const BetRecord& bet = record.bets.at(bettor);
        std::cout << "  " << bettor << " side=" << toString(bet.side) << " stake=" << bet.amount
                  << (bet.claimed ? " settled" : "") << "\n";
    }
}

} // namespace

int main() {
    PoolConfig defaults;
    defaults.deploymentId = "local-cli";
    defaults.charityAccount = "charity";

    PoolConfig config;
    try {
        config = loadPoolConfigFromEnv(defaults);
        validatePoolConfig(config);
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    const char* operatorEnv = std::getenv("GP_OPERATOR");
    std::string operatorAccount = operatorEnv ? operatorEnv : "operator";

    auto access = std::make_shared<OperatorSet>();
    access->grant(operatorAccount);
    auto breaker = std::make_shared<CircuitBreaker>(access);
    auto vault = std::make_shared<Vault>(config.custodyAccount);
    auto clock = std::make_shared<ManualClock>(SystemClock().now());

    EngineCapabilities caps;
    caps.access = access;
    caps.pause = breaker;
    caps.guard = std::make_shared<ReentrancyLock>();
    caps.transfers = vault;
    caps.clock = clock;
    caps.oracle = std::make_shared<SecureCoinFlip>();

    SettlementEngine engine(config, caps);
    engine.setNotificationSink([](const Notification& note) {
        std::cout << "  -> " << describe(note) << "\n";
    });

    std::cout << "GivePool session. deploymentId=" << config.deploymentId
              << " operator=" << operatorAccount << " charity=" << config.charityAccount;
    if (config.bettingDuration != 0) {
        std::cout << " window=" << config.bettingDuration << "s";
    }
    std::cout << "\nType 'help' for commands.\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string cmd;
        if (!(in >> cmd) || cmd[0] == '#') {
            continue;
        }

        try {
            if (cmd == "quit" || cmd == "exit") {
                break;
            } else if (cmd == "help") {
                printUsage();
            } else if (cmd == "fund") {
                std::string account;
                Amount amount = 0;
                if (!(in >> account) || !readUnsigned(in, amount)) {
                    std::cout << "usage: fund <account> <amount>\n";
                    continue;
                }
                vault->deposit(account, amount);
                std::cout << account << " balance " << vault->balanceOf(account) << "\n";
            } else if (cmd == "create") {
                std::string caller;
                if (!(in >> caller)) {
                    std::cout << "usage: create <operator>\n";
                    continue;
                }
                EventId id = engine.createEvent(caller);
                std::cout << "Event " << id << " open for bets\n";
            } else if (cmd == "bet") {
                std::string caller;
                std::string sideText;
                Amount amount = 0;
                Side side = Side::A;
                if (!(in >> caller >> sideText) || !parseSide(sideText, side) || !readUnsigned(in, amount)) {
                    std::cout << "usage: bet <bettor> <A|B> <amount>\n";
                    continue;
                }
                engine.placeBet(caller, side, amount);
            } else if (cmd == "resolve") {
                std::string caller;
                EventId id = 0;
                if (!(in >> caller) || !readUnsigned(in, id)) {
                    std::cout << "usage: resolve <caller> <eventId> [A|B]\n";
                    continue;
                }
                std::optional<bool> outcome;
                std::string sideText;
                if (in >> sideText) {
                    Side side = Side::A;
                    if (!parseSide(sideText, side)) {
                        std::cout << "usage: resolve <caller> <eventId> [A|B]\n";
                        continue;
                    }
                    outcome = side == Side::A;
                }
                engine.resolveEvent(caller, id, outcome);
            } else if (cmd == "cancel") {
                std::string caller;
                EventId id = 0;
                if (!(in >> caller) || !readUnsigned(in, id)) {
                    std::cout << "usage: cancel <operator> <eventId>\n";
                    continue;
                }
                engine.cancelEvent(caller, id);
            } else if (cmd == "claim") {
                std::string caller;
                EventId id = 0;
                if (!(in >> caller) || !readUnsigned(in, id)) {
                    std::cout << "usage: claim <bettor> <eventId>\n";
                    continue;
                }
                auto payout = engine.claimWinnings(caller, id);
                std::cout << caller << " received " << payout.user << " (gross " << payout.gross
                          << ", charity " << payout.charity << ")\n";
            } else if (cmd == "pause" || cmd == "unpause") {
                std::string caller;
                if (!(in >> caller)) {
                    std::cout << "usage: " << cmd << " <operator>\n";
                    continue;
                }
                if (cmd == "pause") {
                    breaker->pause(caller);
                } else {
                    breaker->unpause(caller);
                }
                std::cout << (breaker->isPaused() ? "Pool paused\n" : "Pool running\n");
            } else if (cmd == "withdraw") {
                std::string caller;
                std::string recipient;
                Amount amount = 0;
                if (!(in >> caller >> recipient) || !readUnsigned(in, amount)) {
                    std::cout << "usage: withdraw <operator> <recipient> <amount>\n";
                    continue;
                }
                engine.emergencyWithdraw(caller, recipient, amount);
            } else if (cmd == "advance") {
                Timestamp seconds = 0;
                if (!readUnsigned(in, seconds)) {
                    std::cout << "usage: advance <seconds>\n";
                    continue;
                }
                clock->advance(seconds);
                std::cout << "Clock at " << clock->now() << "\n";
            } else if (cmd == "status") {
                EventId id = 0;
                if (!readUnsigned(in, id)) {
                    auto current = engine.currentEventId();
                    if (!current) {
                        std::cout << "No events yet\n";
                        continue;
                    }
                    id = *current;
                }
                printStatus(engine, id);
            } else if (cmd == "balance") {
                std::string account;
                if (!(in >> account)) {
                    std::cout << "usage: balance <account>\n";
                    continue;
                }
                std::cout << account << " balance " << vault->balanceOf(account) << "\n";
            } else if (cmd == "root") {
                std::string root = engine.auditRoot();
                std::cout << "Audit root (" << engine.auditLog().size()
                          << " entries): " << (root.empty() ? "<empty>" : root) << "\n";
            } else {
                std::cout << "Unknown command '" << cmd << "'. Type 'help'.\n";
            }
        } catch (const SettlementError& ex) {
            std::cout << "Rejected [" << toString(ex.category()) << "] " << ex.what() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    return 0;
}
