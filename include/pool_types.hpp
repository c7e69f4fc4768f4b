#pragma once

#include <cstdint>
#include <string>

namespace gp {

using Address = std::string;
using Amount = std::uint64_t;
using EventId = std::uint64_t;
using Timestamp = std::uint64_t; // seconds since epoch

enum class Side { A, B };

enum class EventStatus { Open, Resolved, Cancelled };

inline const char* toString(Side side) {
    return side == Side::A ? "A" : "B";
}

inline const char* toString(EventStatus status) {
    switch (status) {
    case EventStatus::Open:
        return "open";
    case EventStatus::Resolved:
        return "resolved";
    case EventStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

inline Side winningSide(bool outcome) {
    return outcome ? Side::A : Side::B;
}

} // namespace gp
