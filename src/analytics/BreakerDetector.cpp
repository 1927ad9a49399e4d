#include "analytics/BreakerDetector.h"

#include "common/Logger.h"

namespace confluence {
namespace analytics {

BreakerDetector::BreakerDetector(BreakerConfig config)
    : config_(std::move(config)),
      book_(config_.max_zones_per_side) {}

Zone BreakerDetector::fromBrokenOrderBlock(const Zone& order_block) {
    Zone zone;
    zone.kind = ZoneKind::BREAKER;
    zone.polarity = inverted(order_block.polarity);
    zone.price_low = order_block.price_low;
    zone.price_high = order_block.price_high;
    zone.source_id = order_block.id;
    return zone;
}

std::optional<ZoneStatus> BreakerDetector::nextStatus(const Zone& zone, const Candle& bar) {
    if (zone.status == ZoneStatus::INVALIDATED) {
        return std::nullopt;
    }
    if (zone.polarity == Polarity::BULLISH) {
        if (bar.close < zone.price_low) return ZoneStatus::INVALIDATED;
        if (zone.contains(bar.low)) return ZoneStatus::TESTED;
    } else {
        if (bar.close > zone.price_high) return ZoneStatus::INVALIDATED;
        if (zone.contains(bar.high)) return ZoneStatus::TESTED;
    }
    return std::nullopt;
}

std::vector<ZoneEvent> BreakerDetector::update(const Candle& bar, long long bar_index,
                                               const std::vector<ZoneEvent>& order_block_events) {
    std::vector<ZoneEvent> events;
    if (!config_.enabled) {
        return events;
    }

    std::vector<std::uint64_t> broken;
    for (auto polarity : {Polarity::BULLISH, Polarity::BEARISH}) {
        for (auto& zone : book_.zones(polarity)) {
            const auto next = nextStatus(zone, bar);
            if (!next) {
                continue;
            }
            if (*next == ZoneStatus::INVALIDATED) {
                ZoneBook::advance(zone, ZoneStatus::INVALIDATED);
                events.push_back({ZoneEventType::INVALIDATED, zone, bar.timestamp});
                broken.push_back(zone.id);
                continue;
            }
            // every retest counts, only the first one is reported
            ++zone.test_count;
            if (ZoneBook::advance(zone, ZoneStatus::TESTED)) {
                events.push_back({ZoneEventType::TESTED, zone, bar.timestamp});
            }
        }
    }
    for (auto id : broken) {
        book_.retire(id);
    }

    // new breakers are first evaluated on the next bar
    for (const auto& event : order_block_events) {
        if (event.type != ZoneEventType::INVALIDATED || event.zone.kind != ZoneKind::ORDER_BLOCK) {
            continue;
        }
        Zone zone = fromBrokenOrderBlock(event.zone);
        zone.id = next_id_++;
        zone.formed_at = bar.timestamp;
        zone.formed_bar = bar_index;
        const Zone& stored = book_.add(zone);
        events.push_back({ZoneEventType::FORMED, stored, bar.timestamp});
        LOG_DEBUG("Breaker {} [{:.5f}, {:.5f}] from order block {} at {}",
                  polarityToString(stored.polarity), stored.price_low, stored.price_high,
                  stored.source_id, bar.timestamp);
    }

    book_.pruneOlderThan(bar_index - config_.max_age_bars);
    return events;
}

} // namespace analytics
} // namespace confluence
