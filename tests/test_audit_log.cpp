#include "audit_log.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "audit_log_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    if (gp::sha256Hex("abc") != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        fail("sha256 test vector mismatch");
    }

    gp::AuditLog log;
    if (!log.merkleRoot().empty()) {
        fail("empty log has no root");
    }

    for (std::size_t count = 1; count <= 9; ++count) {
        log.append("entry-" + std::to_string(count));
        std::string root = log.merkleRoot();
        for (std::size_t i = 0; i < log.size(); ++i) {
            auto proof = log.merkleProof(i);
            if (!gp::AuditLog::verifyProof(log.leaf(i), proof, root)) {
                fail("proof failed for leaf " + std::to_string(i) + " of " + std::to_string(count));
            }
            if (gp::AuditLog::verifyProof(gp::sha256Hex("forged"), proof, root)) {
                fail("forged leaf verified");
            }
        }
    }

    std::string before = log.merkleRoot();
    log.append("late");
    if (log.merkleRoot() == before || log.size() != 10) {
        fail("a new entry must change the root");
    }
    if (log.leaf(0) != gp::sha256Hex("entry-1")) {
        fail("leaves should be the record hashes");
    }

    std::cout << "audit_log_test passed" << std::endl;
    return 0;
}
