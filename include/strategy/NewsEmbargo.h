#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/ITradingPermission.h"

namespace confluence {
namespace strategy {

enum class ImpactLevel { NONE, LOW, MEDIUM, HIGH };

struct EmbargoConfig {
    bool enabled = true;
    double minutes_before = 30.0;
    double minutes_after = 15.0;
    bool block_high = true;
    bool block_medium = false;
};

// Scheduled release. An empty code list applies to every instrument.
struct ScheduledEvent {
    TimestampMs timestamp = 0;
    ImpactLevel impact = ImpactLevel::NONE;
    std::string title;
    std::vector<std::string> codes;     // e.g. "USD", "XAU", or a full symbol
};

// Case-insensitive "high"/"medium"/"low"/"none". Throws std::runtime_error otherwise.
ImpactLevel parseImpactLevel(const std::string& text);
std::string impactLevelToString(ImpactLevel impact);

// minutes_to_event > 0 means the release is still ahead
bool isTradingPermitted(ImpactLevel impact, double minutes_to_event, const EmbargoConfig& config);

class ScheduledEmbargoCalendar : public core::ITradingPermission {
public:
    ScheduledEmbargoCalendar(EmbargoConfig config, std::vector<ScheduledEvent> events);

    bool isTradingPermitted(const std::string& instrument, long long ts_ms) const override;

    size_t eventCount() const { return events_.size(); }

private:
    static bool appliesTo(const ScheduledEvent& event, const std::string& instrument);

    EmbargoConfig config_;
    std::vector<ScheduledEvent> events_;
};

} // namespace strategy
} // namespace confluence
