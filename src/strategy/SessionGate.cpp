#include "strategy/SessionGate.h"

#include <cctype>
#include <stdexcept>

namespace confluence {
namespace strategy {

namespace {
constexpr int MINUTES_PER_DAY = 24 * 60;
}

bool SessionWindow::contains(int minute_of_day) const {
    if (end_minute > start_minute) {
        return minute_of_day >= start_minute && minute_of_day < end_minute;
    }
    return minute_of_day >= start_minute || minute_of_day < end_minute;
}

int parseMinuteOfDay(const std::string& text) {
    const bool shaped = text.size() == 5 && text[2] == ':' &&
        std::isdigit(static_cast<unsigned char>(text[0])) && std::isdigit(static_cast<unsigned char>(text[1])) &&
        std::isdigit(static_cast<unsigned char>(text[3])) && std::isdigit(static_cast<unsigned char>(text[4]));
    if (!shaped) {
        throw std::runtime_error("Session time must be HH:MM: '" + text + "'");
    }
    const int hours = (text[0] - '0') * 10 + (text[1] - '0');
    const int minutes = (text[3] - '0') * 10 + (text[4] - '0');
    const int total = hours * 60 + minutes;
    if (minutes > 59 || total > MINUTES_PER_DAY) {
        throw std::runtime_error("Session time out of range: '" + text + "'");
    }
    return total;
}

SessionGate::SessionGate(SessionConfig config)
    : config_(std::move(config)) {}

int SessionGate::minuteOfDay(TimestampMs ts) {
    const TimestampMs into_day = ts - dayKey(ts) * MS_PER_DAY;
    return static_cast<int>(into_day / MS_PER_MINUTE);
}

std::optional<std::string> SessionGate::sessionAt(TimestampMs ts) const {
    const int minute = minuteOfDay(ts);
    for (const auto& window : config_.windows) {
        if (window.contains(minute)) {
            return window.name;
        }
    }
    return std::nullopt;
}

bool SessionGate::isOpen(TimestampMs ts) const {
    if (!config_.enabled) {
        return true;
    }
    return sessionAt(ts).has_value();
}

} // namespace strategy
} // namespace confluence
