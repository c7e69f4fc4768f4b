#include "audit_log.hpp"

#include "picosha2.h"

#include <stdexcept>
#include <vector>

namespace gp {

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string AuditLog::hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

void AuditLog::append(const std::string& record) {
    leaves_.push_back(sha256Hex(record));
}

const std::string& AuditLog::leaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        throw std::out_of_range("audit leaf index out of range");
    }
    return leaves_[index];
}

std::string AuditLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<AuditProofStep> AuditLog::merkleProof(std::size_t leafIndex) const {
    if (leafIndex >= leaves_.size()) {
        throw std::out_of_range("audit leaf index out of range");
    }

    std::vector<AuditProofStep> proof;
    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        bool isRight = (index % 2) == 1;
        std::size_t siblingIndex = isRight ? index - 1 : index + 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index; // odd tail is paired with itself
        }
        proof.push_back({ layer[siblingIndex], isRight });

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool AuditLog::verifyProof(const std::string& leafHash,
                           const std::vector<AuditProofStep>& proof,
                           const std::string& expectedRoot) {
    std::string current = leafHash;
    for (const auto& step : proof) {
        current = step.siblingIsLeft ? hashPair(step.hash, current) : hashPair(current, step.hash);
    }
    return !expectedRoot.empty() && current == expectedRoot;
}

} // namespace gp
