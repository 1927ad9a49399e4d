#pragma once

#include <stdexcept>
#include <string>

#include "common/Types.h"

namespace confluence {

// Non-monotonic or duplicate bar timestamps. Fatal for the instrument's run.
class OutOfOrderDataError : public std::runtime_error {
public:
    OutOfOrderDataError(const std::string& series, TimestampMs previous, TimestampMs offending)
        : std::runtime_error("Out-of-order bar in " + series + ": " +
                             std::to_string(offending) + " after " + std::to_string(previous)),
          previous_(previous), offending_(offending) {}

    TimestampMs previous() const { return previous_; }
    TimestampMs offending() const { return offending_; }

private:
    TimestampMs previous_;
    TimestampMs offending_;
};

enum class RiskErrorKind {
    UNRESOLVED_UNIT_VALUE,
    NON_POSITIVE_STOP_DISTANCE,
    NON_POSITIVE_BALANCE,
    UNRESOLVED_MIN_INCREMENT,
    BELOW_MIN_INCREMENT
};

inline const char* riskErrorKindToString(RiskErrorKind kind) {
    switch (kind) {
        case RiskErrorKind::UNRESOLVED_UNIT_VALUE: return "UNRESOLVED_UNIT_VALUE";
        case RiskErrorKind::NON_POSITIVE_STOP_DISTANCE: return "NON_POSITIVE_STOP_DISTANCE";
        case RiskErrorKind::NON_POSITIVE_BALANCE: return "NON_POSITIVE_BALANCE";
        case RiskErrorKind::UNRESOLVED_MIN_INCREMENT: return "UNRESOLVED_MIN_INCREMENT";
        case RiskErrorKind::BELOW_MIN_INCREMENT: return "BELOW_MIN_INCREMENT";
    }
    return "UNKNOWN";
}

// Sizing refused. The signal is dropped; no position is opened.
class RiskError : public std::runtime_error {
public:
    RiskError(RiskErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    RiskErrorKind kind() const { return kind_; }

private:
    RiskErrorKind kind_;
};

} // namespace confluence
