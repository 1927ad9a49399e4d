#include "analytics/Zone.h"

#include <algorithm>

namespace confluence {
namespace analytics {

std::string zoneKindToString(ZoneKind kind) {
    switch (kind) {
        case ZoneKind::ORDER_BLOCK: return "ORDER_BLOCK";
        case ZoneKind::GAP: return "GAP";
        case ZoneKind::LIQUIDITY: return "LIQUIDITY";
        case ZoneKind::BREAKER: return "BREAKER";
    }
    return "ORDER_BLOCK";
}

std::string zoneStatusToString(ZoneStatus status) {
    switch (status) {
        case ZoneStatus::FRESH: return "FRESH";
        case ZoneStatus::TESTED: return "TESTED";
        case ZoneStatus::INVALIDATED: return "INVALIDATED";
        case ZoneStatus::FLIPPED: return "FLIPPED";
    }
    return "FRESH";
}

std::string polarityToString(Polarity polarity) {
    return polarity == Polarity::BULLISH ? "BULLISH" : "BEARISH";
}

bool canTransition(ZoneKind kind, ZoneStatus from, ZoneStatus to) {
    if (to == ZoneStatus::FLIPPED) {
        return kind == ZoneKind::GAP && from == ZoneStatus::INVALIDATED;
    }
    if (from == ZoneStatus::INVALIDATED || from == ZoneStatus::FLIPPED) {
        return false;
    }
    return static_cast<int>(to) > static_cast<int>(from);
}

ZoneBook::ZoneBook(size_t max_per_side)
    : max_per_side_(std::max<size_t>(1, max_per_side)) {}

const Zone& ZoneBook::add(Zone zone) {
    auto& side = zones(zone.polarity);
    if (side.size() >= max_per_side_) {
        side.pop_front();
    }
    side.push_back(std::move(zone));
    return side.back();
}

std::deque<Zone>& ZoneBook::zones(Polarity polarity) {
    return polarity == Polarity::BULLISH ? bullish_ : bearish_;
}

const std::deque<Zone>& ZoneBook::zones(Polarity polarity) const {
    return polarity == Polarity::BULLISH ? bullish_ : bearish_;
}

bool ZoneBook::advance(Zone& zone, ZoneStatus to) {
    if (!canTransition(zone.kind, zone.status, to)) {
        return false;
    }
    zone.status = to;
    return true;
}

bool ZoneBook::flip(std::uint64_t id) {
    for (auto* side : {&bullish_, &bearish_}) {
        auto it = std::find_if(side->begin(), side->end(),
                               [id](const Zone& z) { return z.id == id; });
        if (it == side->end()) {
            continue;
        }
        Zone moved = *it;
        if (!advance(moved, ZoneStatus::FLIPPED)) {
            return false;
        }
        moved.polarity = inverted(moved.polarity);
        moved.fill_pct = 0.0;
        moved.test_count = 0;
        side->erase(it);
        add(std::move(moved));
        return true;
    }
    return false;
}

bool ZoneBook::retire(std::uint64_t id) {
    for (auto* side : {&bullish_, &bearish_}) {
        auto it = std::find_if(side->begin(), side->end(),
                               [id](const Zone& z) { return z.id == id; });
        if (it != side->end()) {
            side->erase(it);
            return true;
        }
    }
    return false;
}

void ZoneBook::pruneOlderThan(long long min_bar) {
    for (auto* side : {&bullish_, &bearish_}) {
        side->erase(std::remove_if(side->begin(), side->end(),
                                   [min_bar](const Zone& z) { return z.formed_bar < min_bar; }),
                    side->end());
    }
}

std::vector<Zone> ZoneBook::active(Polarity polarity) const {
    std::vector<Zone> out;
    for (const auto& zone : zones(polarity)) {
        if (zone.isActive()) {
            out.push_back(zone);
        }
    }
    return out;
}

size_t ZoneBook::size() const {
    return bullish_.size() + bearish_.size();
}

} // namespace analytics
} // namespace confluence
