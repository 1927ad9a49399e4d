#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace confluence {
namespace strategy {

// UTC minutes of day, [start, end). A window whose end is not after its
// start wraps past midnight.
struct SessionWindow {
    std::string name;
    int start_minute = 0;
    int end_minute = 0;

    bool contains(int minute_of_day) const;
};

// Entries are admitted only inside one of the windows. Disabled admits everything.
struct SessionConfig {
    bool enabled = false;
    std::vector<SessionWindow> windows = {
        {"london", 7 * 60, 16 * 60},
        {"new_york", 12 * 60, 21 * 60},
    };
};

// "HH:MM", 00:00 to 24:00. Throws std::runtime_error otherwise.
int parseMinuteOfDay(const std::string& text);

class SessionGate {
public:
    explicit SessionGate(SessionConfig config);

    bool isOpen(TimestampMs ts) const;

    // First configured window containing ts
    std::optional<std::string> sessionAt(TimestampMs ts) const;

    static int minuteOfDay(TimestampMs ts);

    const SessionConfig& config() const { return config_; }

private:
    SessionConfig config_;
};

} // namespace strategy
} // namespace confluence
