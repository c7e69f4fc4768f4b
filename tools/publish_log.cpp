#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex input must have even length");
    }
    std::vector<unsigned char> out(hex.size() / 2);
    std::size_t written = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(), nullptr, &written, nullptr) != 0 ||
        written != out.size()) {
        throw std::invalid_argument("hex input contains non-hex characters");
    }
    return out;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::string requireDeploymentId() {
    const char* env = std::getenv("GP_DEPLOYMENT_ID");
    std::string deploymentId = env ? trim(env) : "";
    if (deploymentId.empty()) {
        throw std::runtime_error("GP_DEPLOYMENT_ID must be set to a non-empty deployment scope");
    }
    if (deploymentId == "default") {
        throw std::runtime_error(
            "GP_DEPLOYMENT_ID cannot be \"default\"; set a deployment-specific value like \"mainnet\" or \"testnet\"");
    }
    return deploymentId;
}

std::string optionalChainId() {
    const char* env = std::getenv("GP_CHAIN_ID");
    return env ? trim(env) : "";
}

void requireEventId(const std::string& eventId) {
    bool digits = !eventId.empty() && std::all_of(eventId.begin(), eventId.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (!digits) {
        throw std::invalid_argument("event id must be a decimal integer");
    }
}

void requireAuditRoot(const std::string& root) {
    if (root.size() != 64) {
        throw std::invalid_argument("audit root must be a 32-byte SHA-256 hex digest");
    }
    (void)hexToBytes(root);
}

// deployment:[chain:]event:root, the statement operators sign after settlement.
std::string buildStatement(const std::string& deploymentId,
                           const std::string& chainId,
                           const std::string& eventId,
                           const std::string& root) {
    std::string message = deploymentId + ":";
    if (!chainId.empty()) {
        message += chainId + ":";
    }
    message += eventId + ":" + root;
    return message;
}

int runSign(const std::string& eventId,
            const std::string& root,
            const std::string& secretKeyHex,
            const std::string& outputPath) {
    std::string deploymentId = requireDeploymentId();
    std::string chainId = optionalChainId();

    std::vector<unsigned char> secretKey = hexToBytes(secretKeyHex);
    if (secretKey.size() != crypto_sign_SECRETKEYBYTES) {
        sodium_memzero(secretKey.data(), secretKey.size());
        std::cerr << "Secret key must be " << crypto_sign_SECRETKEYBYTES << " bytes (hex encoded)\n";
        return 1;
    }
    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    if (crypto_sign_ed25519_sk_to_pk(publicKey.data(), secretKey.data()) != 0) {
        sodium_memzero(secretKey.data(), secretKey.size());
        std::cerr << "Unable to derive public key from secret key\n";
        return 1;
    }

    std::string message = buildStatement(deploymentId, chainId, eventId, root);
    std::vector<unsigned char> signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    int rc = crypto_sign_detached(signature.data(),
                                  &sigLen,
                                  reinterpret_cast<const unsigned char*>(message.data()),
                                  message.size(),
                                  secretKey.data());
    sodium_memzero(secretKey.data(), secretKey.size());
    if (rc != 0) {
        std::cerr << "Signing failed\n";
        return 1;
    }

    std::ostringstream json;
    json << "{\n";
    json << "  \"event_id\": " << eventId << ",\n";
    json << "  \"audit_root\": \"" << root << "\",\n";
    json << "  \"deployment_id\": \"" << deploymentId << "\",\n";
    if (!chainId.empty()) {
        json << "  \"chain_id\": \"" << chainId << "\",\n";
    }
    json << "  \"signature\": \"" << bytesToHex(signature.data(), sigLen) << "\",\n";
    json << "  \"public_key\": \"" << bytesToHex(publicKey.data(), publicKey.size()) << "\"\n";
    json << "}\n";

    if (outputPath.empty()) {
        std::cout << json.str();
        return 0;
    }
    std::ofstream ofs(outputPath);
    if (!ofs) {
        std::cerr << "Unable to open output path: " << outputPath << "\n";
        return 1;
    }
    ofs << json.str();
    return 0;
}

int runVerify(const std::string& eventId,
              const std::string& root,
              const std::string& publicKeyHex,
              const std::string& signatureHex) {
    std::string message = buildStatement(requireDeploymentId(), optionalChainId(), eventId, root);
    std::vector<unsigned char> publicKey = hexToBytes(publicKeyHex);
    std::vector<unsigned char> signature = hexToBytes(signatureHex);
    if (publicKey.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES) {
        std::cerr << "Public key or signature has the wrong length\n";
        return 1;
    }
    bool ok = crypto_sign_verify_detached(signature.data(),
                                          reinterpret_cast<const unsigned char*>(message.data()),
                                          message.size(),
                                          publicKey.data()) == 0;
    std::cout << "Signature: " << (ok ? "valid" : "INVALID") << "\n";
    return ok ? 0 : 2;
}

void printUsage() {
    std::cerr << "Usage: publish_log sign <event_id> <audit_root> <secret_key_hex> [output.json]\n";
    std::cerr << "       publish_log verify <event_id> <audit_root> <public_key_hex> <signature_hex>\n";
    std::cerr << "Environment: GP_DEPLOYMENT_ID is required; optional GP_CHAIN_ID adds chain scoping.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 5) {
        printUsage();
        return 1;
    }
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    std::string mode = argv[1];
    std::string eventId = argv[2];
    std::string root = argv[3];
    try {
        requireEventId(eventId);
        requireAuditRoot(root);
        if (mode == "sign") {
            return runSign(eventId, root, argv[4], argc >= 6 ? argv[5] : "");
        }
        if (mode == "verify" && argc >= 6) {
            return runVerify(eventId, root, argv[4], argv[5]);
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    printUsage();
    return 1;
}
