#include "analytics/GapDetector.h"

#include <algorithm>
#include <utility>

#include "common/Logger.h"

namespace confluence {
namespace analytics {

GapDetector::GapDetector(GapConfig config, Resolution resolution, double pip_size)
    : config_(std::move(config)),
      min_gap_(0.0),
      book_(config_.max_zones_per_side) {
    double pips = config_.default_min_gap_pips;
    auto it = config_.min_gap_pips.find(resolution);
    if (it != config_.min_gap_pips.end()) {
        pips = it->second;
    }
    min_gap_ = pips * pip_size;
}

std::optional<Zone> GapDetector::detect(const Candle& first, const Candle& middle, const Candle& third,
                                        double min_gap) {
    Zone zone;
    zone.kind = ZoneKind::GAP;
    zone.formed_at = middle.timestamp;

    if (third.low > first.high && third.low - first.high >= min_gap) {
        zone.polarity = Polarity::BULLISH;
        zone.price_low = first.high;
        zone.price_high = third.low;
        return zone;
    }
    if (third.high < first.low && first.low - third.high >= min_gap) {
        zone.polarity = Polarity::BEARISH;
        zone.price_low = third.high;
        zone.price_high = first.low;
        return zone;
    }
    return std::nullopt;
}

std::optional<ZoneEventType> GapDetector::advance(Zone& zone, const Candle& bar) {
    const bool bullish = zone.polarity == Polarity::BULLISH;

    if (zone.status == ZoneStatus::INVALIDATED) {
        // reclaimed: a bullish gap lost below its low closes back above its midpoint
        const bool reclaimed = bullish ? bar.close > zone.midpoint() : bar.close < zone.midpoint();
        return reclaimed ? std::optional<ZoneEventType>(ZoneEventType::FLIPPED) : std::nullopt;
    }

    const bool closed_through = bullish ? bar.close < zone.price_low : bar.close > zone.price_high;
    const bool traded_into = bullish ? bar.low < zone.price_high : bar.high > zone.price_low;

    if (zone.status == ZoneStatus::FLIPPED) {
        if (closed_through) {
            return ZoneEventType::RETIRED;
        }
        if (traded_into) {
            ++zone.test_count;
        }
        return std::nullopt;
    }

    const double height = zone.height();
    if (traded_into && height > 0.0) {
        const double depth = bullish ? zone.price_high - bar.low : bar.high - zone.price_low;
        const double fill = std::clamp(depth / height * 100.0, 0.0, 100.0);
        zone.fill_pct = std::max(zone.fill_pct, fill);
    }

    if (closed_through) {
        zone.fill_pct = 100.0;
        ZoneBook::advance(zone, ZoneStatus::INVALIDATED);
        return ZoneEventType::INVALIDATED;
    }
    if (traded_into) {
        ++zone.test_count;
        if (ZoneBook::advance(zone, ZoneStatus::TESTED)) {
            return ZoneEventType::TESTED;
        }
    }
    return std::nullopt;
}

std::vector<ZoneEvent> GapDetector::update(const std::vector<Candle>& window, long long bar_index) {
    std::vector<ZoneEvent> events;
    if (window.empty()) {
        return events;
    }
    const Candle& bar = window.back();

    std::vector<std::uint64_t> to_flip;
    std::vector<std::uint64_t> to_retire;
    for (auto polarity : {Polarity::BULLISH, Polarity::BEARISH}) {
        for (auto& zone : book_.zones(polarity)) {
            auto event = advance(zone, bar);
            if (!event) {
                continue;
            }
            if (*event == ZoneEventType::FLIPPED) {
                to_flip.push_back(zone.id);
            } else if (*event == ZoneEventType::RETIRED) {
                to_retire.push_back(zone.id);
                events.push_back({*event, zone, bar.timestamp});
            } else {
                events.push_back({*event, zone, bar.timestamp});
            }
        }
    }

    for (auto id : to_retire) {
        book_.retire(id);
    }
    for (auto id : to_flip) {
        if (!book_.flip(id)) {
            continue;
        }
        for (auto polarity : {Polarity::BULLISH, Polarity::BEARISH}) {
            for (const auto& zone : book_.zones(polarity)) {
                if (zone.id == id) {
                    events.push_back({ZoneEventType::FLIPPED, zone, bar.timestamp});
                    LOG_DEBUG("Gap {} flipped to {} at {}", id, polarityToString(zone.polarity),
                              bar.timestamp);
                }
            }
        }
    }

    if (window.size() >= 3) {
        const size_t n = window.size();
        auto zone = detect(window[n - 3], window[n - 2], bar, min_gap_);
        if (zone) {
            zone->id = next_id_++;
            zone->formed_bar = bar_index;
            const Zone& stored = book_.add(*zone);
            events.push_back({ZoneEventType::FORMED, stored, bar.timestamp});
            LOG_DEBUG("Gap {} [{:.5f}, {:.5f}] formed at {}",
                      polarityToString(stored.polarity), stored.price_low, stored.price_high,
                      stored.formed_at);
        }
    }

    book_.pruneOlderThan(bar_index - config_.max_age_bars);
    return events;
}

} // namespace analytics
} // namespace confluence
