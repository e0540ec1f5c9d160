#pragma once

#include <string>
#include <utility>

enum class AvailabilityReason {
    NONE,
    MISSING_METRICS,
    MISSING_PARAMETERS,
    MISSING_TRADES,
    INSUFFICIENT_TRADES,
};

inline std::string availability_reason_code(AvailabilityReason reason) {
    switch (reason) {
        case AvailabilityReason::MISSING_METRICS:     return "missing_metrics";
        case AvailabilityReason::MISSING_PARAMETERS:  return "missing_parameters";
        case AvailabilityReason::MISSING_TRADES:      return "missing_trades";
        case AvailabilityReason::INSUFFICIENT_TRADES: return "insufficient_trades";
        default: return "";
    }
}

// ---------------------------------------------------------------------------
// ScoreAvailability: why a record was or was not scored
// ---------------------------------------------------------------------------
struct ScoreAvailability {
    bool eligible = true;
    AvailabilityReason reason_code = AvailabilityReason::NONE;
    std::string reason;

    static ScoreAvailability ok() { return ScoreAvailability{}; }

    static ScoreAvailability excluded(AvailabilityReason code, std::string message) {
        ScoreAvailability a;
        a.eligible = false;
        a.reason_code = code;
        a.reason = std::move(message);
        return a;
    }
};
