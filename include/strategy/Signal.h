#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace confluence {
namespace strategy {

// Trade decision for one instrument on one execution bar
struct Signal {
    std::string instrument;
    Direction direction = Direction::LONG;
    double entry = 0.0;
    double stop = 0.0;
    double target = 0.0;
    double confidence = 0.0;        // [0, 100]
    double size_multiplier = 1.0;
    std::vector<std::string> reasons;
    TimestampMs timestamp = 0;
    std::uint64_t trigger_zone_id = 0;

    double riskDistance() const { return entry > stop ? entry - stop : stop - entry; }
    double rewardDistance() const { return entry > target ? entry - target : target - entry; }
};

inline nlohmann::json toJson(const Signal& signal) {
    nlohmann::json j;
    j["instrument"] = signal.instrument;
    j["direction"] = directionToString(signal.direction);
    j["entry"] = signal.entry;
    j["stop"] = signal.stop;
    j["target"] = signal.target;
    j["confidence"] = signal.confidence;
    j["size_multiplier"] = signal.size_multiplier;
    j["reasons"] = signal.reasons;
    j["timestamp"] = signal.timestamp;
    j["trigger_zone_id"] = signal.trigger_zone_id;
    return j;
}

inline Signal signalFromJson(const nlohmann::json& j) {
    Signal signal;
    signal.instrument = j.value("instrument", std::string());
    signal.direction = j.value("direction", std::string("LONG")) == "SHORT" ? Direction::SHORT : Direction::LONG;
    signal.entry = j.value("entry", 0.0);
    signal.stop = j.value("stop", 0.0);
    signal.target = j.value("target", 0.0);
    signal.confidence = j.value("confidence", 0.0);
    signal.size_multiplier = j.value("size_multiplier", 1.0);
    signal.reasons = j.value("reasons", std::vector<std::string>());
    signal.timestamp = j.value("timestamp", 0LL);
    signal.trigger_zone_id = j.value("trigger_zone_id", static_cast<std::uint64_t>(0));
    return signal;
}

} // namespace strategy
} // namespace confluence
