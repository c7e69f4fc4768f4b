#include "oracle.hpp"

#include "audit_log.hpp"
#include "settlement_error.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace gp {

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

PseudoRandomCoinFlip::PseudoRandomCoinFlip(std::string initialSeed)
    : previous_(std::move(initialSeed)) {}

OracleObservation PseudoRandomCoinFlip::decide(const ResolutionContext& ctx) {
    std::ostringstream preimage;
    preimage << ctx.now << "|" << previous_ << "|" << ctx.eventId;
    std::string digest = sha256Hex(preimage.str());
    previous_ = digest;

    // Last hex digit carries the low bit of the digest.
    unsigned int lowNibble = std::stoul(digest.substr(digest.size() - 1), nullptr, 16);
    OracleObservation out;
    out.outcome = (lowNibble % 2) == 0;
    out.source = "pseudo-random-coin-flip";
    out.evidence = digest;
    return out;
}

OracleObservation SecureCoinFlip::decide(const ResolutionContext& ctx) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    std::vector<unsigned char> draw(16);
    randombytes_buf(draw.data(), draw.size());

    OracleObservation out;
    out.outcome = (draw[0] & 1U) == 0;
    out.source = "secure-coin-flip";
    std::ostringstream evidence;
    evidence << ctx.eventId << ":" << bytesToHex(draw.data(), draw.size());
    out.evidence = evidence.str();
    sodium_memzero(draw.data(), draw.size());
    return out;
}

void StaticObservationFeed::publish(const std::string& marketId, FeedReading reading) {
    if (marketId.empty()) {
        throw std::invalid_argument("market id must not be empty");
    }
    if (!std::isfinite(reading.value)) {
        throw std::invalid_argument("feed reading must be finite");
    }
    readings_[marketId] = std::move(reading);
}

std::optional<FeedReading> StaticObservationFeed::read(const std::string& marketId) {
    auto it = readings_.find(marketId);
    if (it == readings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ThresholdObservationOracle::ThresholdObservationOracle(ObservationFeedPtr feed,
                                                       std::string marketPrefix,
                                                       double threshold)
    : feed_(std::move(feed))
    , marketPrefix_(std::move(marketPrefix))
    , threshold_(threshold) {
    if (!feed_) {
        throw std::invalid_argument("threshold oracle requires an observation feed");
    }
    if (!std::isfinite(threshold_)) {
        throw std::invalid_argument("threshold must be finite");
    }
}

OracleObservation ThresholdObservationOracle::decide(const ResolutionContext& ctx) {
    std::string marketId = marketPrefix_ + std::to_string(ctx.eventId);
    auto reading = feed_->read(marketId);
    if (!reading) {
        throw SettlementError(ErrorCode::OracleUnavailable, "no reading for market " + marketId);
    }

    OracleObservation out;
    out.outcome = reading->value >= threshold_;
    out.source = "threshold:" + marketId;
    std::ostringstream evidence;
    evidence << reading->value << (out.outcome ? ">=" : "<") << threshold_;
    if (!reading->evidence.empty()) {
        evidence << ";" << reading->evidence;
    }
    out.evidence = evidence.str();
    return out;
}

} // namespace gp
