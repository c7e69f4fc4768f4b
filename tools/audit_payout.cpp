#include "checked_math.hpp"
#include "payout.hpp"
#include "pool_config.hpp"
#include "settlement_error.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: audit_payout <totalStakeA> <totalStakeB> <winner A|B> <stake> [--no-charity]\n";
        return 1;
    }

    gp::Amount totalA = 0;
    gp::Amount totalB = 0;
    gp::Amount stake = 0;
    if (!gp::parseUnsignedText(argv[1], totalA) || !gp::parseUnsignedText(argv[2], totalB) ||
        !gp::parseUnsignedText(argv[4], stake)) {
        std::cerr << "Stakes must be unsigned integers\n";
        return 1;
    }
    std::string winner = argv[3];
    if (winner != "A" && winner != "B") {
        std::cerr << "Winner must be A or B\n";
        return 1;
    }
    bool charitySplit = !(argc > 5 && std::string(argv[5]) == "--no-charity");

    gp::Amount winningTotal = winner == "A" ? totalA : totalB;
    gp::Amount losingTotal = winner == "A" ? totalB : totalA;

    gp::Amount pool = 0;
    try {
        pool = gp::checkedAdd(totalA, totalB);
    } catch (const std::overflow_error& ex) {
        std::cerr << "Invalid input: " << ex.what() << '\n';
        return 1;
    }

    std::cout << "=== POOL ===\n";
    std::cout << "Side A: " << totalA << "  Side B: " << totalB << "  Winner: " << winner << '\n';
    if (pool > 0) {
        std::cout << "Multiplier for winners: " << std::fixed << std::setprecision(4)
                  << static_cast<double>(pool) / static_cast<double>(winningTotal == 0 ? 1 : winningTotal)
                  << '\n';
    }

    try {
        auto payout = gp::computePayout(stake, winningTotal, losingTotal, charitySplit);
        std::cout << "\n=== PAYOUT FOR STAKE " << stake << " ===\n";
        std::cout << "Gross:   " << payout.gross << '\n';
        std::cout << "Profit:  " << payout.profit << '\n';
        std::cout << "Charity: " << payout.charity << '\n';
        std::cout << "Bettor:  " << payout.user << '\n';
    } catch (const gp::SettlementError& ex) {
        std::cerr << "Payout rejected: " << ex.what() << '\n';
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Invalid input: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
