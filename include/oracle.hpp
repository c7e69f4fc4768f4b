#pragma once

#include "pool_types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace gp {

struct ResolutionContext {
    EventId eventId = 0;
    Timestamp now = 0;
    Amount totalStakeA = 0;
    Amount totalStakeB = 0;
};

struct OracleObservation {
    bool outcome = false; // true: side A won
    std::string source;
    std::string evidence;
};

// Pluggable outcome source for resolutions that do not carry an
// operator-supplied result.
class OutcomeOracle {
public:
    virtual ~OutcomeOracle() = default;
    virtual OracleObservation decide(const ResolutionContext& ctx) = 0;
};

using OraclePtr = std::shared_ptr<OutcomeOracle>;

// Placeholder only. The flip is sha256(timestamp | previous output | event id)
// mod 2, so whoever picks the resolution time can steer it.
class PseudoRandomCoinFlip : public OutcomeOracle {
public:
    explicit PseudoRandomCoinFlip(std::string initialSeed = {});

    OracleObservation decide(const ResolutionContext& ctx) override;
    const std::string& previous() const { return previous_; }

private:
    std::string previous_;
};

// libsodium randomness drawn by whoever hosts the engine; fair only if that
// host is trusted.
class SecureCoinFlip : public OutcomeOracle {
public:
    OracleObservation decide(const ResolutionContext& ctx) override;
};

struct FeedReading {
    double value = 0.0;
    std::string evidence;
};

class ObservationFeed {
public:
    virtual ~ObservationFeed() = default;
    virtual std::optional<FeedReading> read(const std::string& marketId) = 0;
};

using ObservationFeedPtr = std::shared_ptr<ObservationFeed>;

// Readings published ahead of resolution, keyed by market id.
class StaticObservationFeed : public ObservationFeed {
public:
    void publish(const std::string& marketId, FeedReading reading);
    std::optional<FeedReading> read(const std::string& marketId) override;

private:
    std::map<std::string, FeedReading> readings_;
};

// Side A wins when the observed value reaches the threshold, e.g.
// "temperature at the venue is at least 30C". Markets are keyed per event as
// <marketPrefix><eventId>.
class ThresholdObservationOracle : public OutcomeOracle {
public:
    ThresholdObservationOracle(ObservationFeedPtr feed, std::string marketPrefix, double threshold);

    OracleObservation decide(const ResolutionContext& ctx) override;

private:
    ObservationFeedPtr feed_;
    std::string marketPrefix_;
    double threshold_;
};

} // namespace gp
