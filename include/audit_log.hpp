#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gp {

std::string sha256Hex(const std::string& data);

struct AuditProofStep {
    std::string hash;
    bool siblingIsLeft = false;
};

// Append-only record of committed pool activity. Each entry is hashed into a
// leaf; the Merkle root over all leaves is what gets published and signed.
class AuditLog {
public:
    void append(const std::string& record);

    std::size_t size() const { return leaves_.size(); }
    const std::string& leaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<AuditProofStep> merkleProof(std::size_t leafIndex) const;

    static bool verifyProof(const std::string& leafHash,
                            const std::vector<AuditProofStep>& proof,
                            const std::string& expectedRoot);

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> leaves_;
};

} // namespace gp
