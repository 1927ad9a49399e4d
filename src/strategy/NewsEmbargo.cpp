#include "strategy/NewsEmbargo.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "common/Logger.h"

namespace confluence {
namespace strategy {

namespace {
std::string upperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

ImpactLevel parseImpactLevel(const std::string& text) {
    const std::string value = upperCopy(text);
    if (value == "HIGH") return ImpactLevel::HIGH;
    if (value == "MEDIUM") return ImpactLevel::MEDIUM;
    if (value == "LOW") return ImpactLevel::LOW;
    if (value == "NONE" || value.empty()) return ImpactLevel::NONE;
    throw std::runtime_error("Unknown impact level: " + text);
}

std::string impactLevelToString(ImpactLevel impact) {
    switch (impact) {
        case ImpactLevel::NONE: return "NONE";
        case ImpactLevel::LOW: return "LOW";
        case ImpactLevel::MEDIUM: return "MEDIUM";
        case ImpactLevel::HIGH: return "HIGH";
    }
    return "NONE";
}

bool isTradingPermitted(ImpactLevel impact, double minutes_to_event, const EmbargoConfig& config) {
    if (!config.enabled) {
        return true;
    }

    bool blocking = false;
    switch (impact) {
        case ImpactLevel::HIGH: blocking = config.block_high; break;
        case ImpactLevel::MEDIUM: blocking = config.block_medium; break;
        case ImpactLevel::LOW:
        case ImpactLevel::NONE: blocking = false; break;
    }
    if (!blocking) {
        return true;
    }
    return minutes_to_event > config.minutes_before || minutes_to_event < -config.minutes_after;
}

ScheduledEmbargoCalendar::ScheduledEmbargoCalendar(EmbargoConfig config, std::vector<ScheduledEvent> events)
    : config_(config), events_(std::move(events)) {
    std::sort(events_.begin(), events_.end(),
              [](const ScheduledEvent& a, const ScheduledEvent& b) { return a.timestamp < b.timestamp; });
    for (auto& event : events_) {
        for (auto& code : event.codes) {
            code = upperCopy(code);
        }
    }
}

bool ScheduledEmbargoCalendar::appliesTo(const ScheduledEvent& event, const std::string& instrument) {
    if (event.codes.empty()) {
        return true;
    }
    const std::string symbol = upperCopy(instrument);
    return std::any_of(event.codes.begin(), event.codes.end(), [&](const std::string& code) {
        return code == "*" || symbol.find(code) != std::string::npos;
    });
}

bool ScheduledEmbargoCalendar::isTradingPermitted(const std::string& instrument, long long ts_ms) const {
    const auto window_start = ts_ms - static_cast<long long>(config_.minutes_after * MS_PER_MINUTE);
    auto it = std::lower_bound(events_.begin(), events_.end(), window_start,
        [](const ScheduledEvent& e, long long ts) { return e.timestamp < ts; });

    const auto window_end = ts_ms + static_cast<long long>(config_.minutes_before * MS_PER_MINUTE);
    for (; it != events_.end() && it->timestamp <= window_end; ++it) {
        if (!appliesTo(*it, instrument)) {
            continue;
        }
        const double minutes_to_event =
            static_cast<double>(it->timestamp - ts_ms) / static_cast<double>(MS_PER_MINUTE);
        if (!strategy::isTradingPermitted(it->impact, minutes_to_event, config_)) {
            LOG_INFO("{} embargoed by {} event '{}' ({:.0f} min)", instrument,
                     impactLevelToString(it->impact), it->title, minutes_to_event);
            return false;
        }
    }
    return true;
}

} // namespace strategy
} // namespace confluence
