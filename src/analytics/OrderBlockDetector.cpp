#include "analytics/OrderBlockDetector.h"

#include "common/Logger.h"

namespace confluence {
namespace analytics {

OrderBlockDetector::OrderBlockDetector(OrderBlockConfig config, Resolution resolution)
    : config_(std::move(config)),
      impulse_ratio_(config_.default_impulse_ratio),
      book_(config_.max_zones_per_side) {
    auto it = config_.impulse_ratio.find(resolution);
    if (it != config_.impulse_ratio.end()) {
        impulse_ratio_ = it->second;
    }
}

std::optional<Zone> OrderBlockDetector::detect(const Candle& base, const Candle& follow,
                                               double impulse_ratio, double wick_allowance) {
    const double base_body = base.body();
    if (base_body <= 0.0) {
        return std::nullopt;
    }
    if (follow.body() <= impulse_ratio * base_body) {
        return std::nullopt;
    }

    Zone zone;
    zone.kind = ZoneKind::ORDER_BLOCK;
    zone.formed_at = follow.timestamp;
    const double allowance = base.range() * wick_allowance;

    if (base.isBearish() && follow.isBullish() && follow.close > base.high) {
        zone.polarity = Polarity::BULLISH;
    } else if (base.isBullish() && follow.isBearish() && follow.close < base.low) {
        zone.polarity = Polarity::BEARISH;
    } else {
        return std::nullopt;
    }

    zone.price_low = base.low - allowance;
    zone.price_high = base.high + allowance;
    return zone;
}

std::optional<ZoneStatus> OrderBlockDetector::nextStatus(const Zone& zone, const Candle& bar) {
    if (zone.status == ZoneStatus::INVALIDATED) {
        return std::nullopt;
    }

    if (zone.polarity == Polarity::BULLISH) {
        if (bar.close < zone.price_low) return ZoneStatus::INVALIDATED;
        if (zone.status == ZoneStatus::FRESH && bar.low <= zone.price_high) return ZoneStatus::TESTED;
    } else {
        if (bar.close > zone.price_high) return ZoneStatus::INVALIDATED;
        if (zone.status == ZoneStatus::FRESH && bar.high >= zone.price_low) return ZoneStatus::TESTED;
    }
    return std::nullopt;
}

std::vector<ZoneEvent> OrderBlockDetector::update(const std::vector<Candle>& window, long long bar_index) {
    std::vector<ZoneEvent> events;
    if (window.empty()) {
        return events;
    }
    const Candle& bar = window.back();

    for (auto polarity : {Polarity::BULLISH, Polarity::BEARISH}) {
        for (auto& zone : book_.zones(polarity)) {
            auto next = nextStatus(zone, bar);
            if (!next || !ZoneBook::advance(zone, *next)) {
                continue;
            }
            if (*next == ZoneStatus::TESTED) {
                ++zone.test_count;
            }
            events.push_back({*next == ZoneStatus::TESTED ? ZoneEventType::TESTED
                                                           : ZoneEventType::INVALIDATED,
                              zone, bar.timestamp});
        }
    }

    if (window.size() >= 2) {
        auto zone = detect(window[window.size() - 2], bar, impulse_ratio_, config_.wick_allowance);
        if (zone) {
            zone->id = next_id_++;
            zone->formed_bar = bar_index;
            const Zone& stored = book_.add(*zone);
            events.push_back({ZoneEventType::FORMED, stored, bar.timestamp});
            LOG_DEBUG("Order block {} [{:.5f}, {:.5f}] formed at {}",
                      polarityToString(stored.polarity), stored.price_low, stored.price_high,
                      stored.formed_at);
        }
    }

    book_.pruneOlderThan(bar_index - config_.max_age_bars);
    return events;
}

} // namespace analytics
} // namespace confluence
