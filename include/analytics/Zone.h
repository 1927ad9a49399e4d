#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "common/Types.h"

namespace confluence {
namespace analytics {

enum class ZoneKind { ORDER_BLOCK, GAP, LIQUIDITY, BREAKER };

// Ordered: a zone only moves forward through these
enum class ZoneStatus { FRESH, TESTED, INVALIDATED, FLIPPED };

enum class Polarity { BULLISH, BEARISH };

struct Zone {
    std::uint64_t id = 0;
    ZoneKind kind = ZoneKind::ORDER_BLOCK;
    Polarity polarity = Polarity::BULLISH;
    double price_low = 0.0;
    double price_high = 0.0;
    TimestampMs formed_at = 0;
    long long formed_bar = 0;
    ZoneStatus status = ZoneStatus::FRESH;
    double fill_pct = 0.0;
    int test_count = 0;
    bool equal_level = false;   // liquidity only: built from two or more swings
    bool session_level = false; // liquidity only: previous-session extreme
    std::uint64_t source_id = 0;    // breaker only: the order block it was built from

    bool contains(double price) const { return price >= price_low && price <= price_high; }
    double height() const { return price_high - price_low; }
    double midpoint() const { return (price_low + price_high) * 0.5; }
    bool isActive() const { return status != ZoneStatus::INVALIDATED; }
};

enum class ZoneEventType { FORMED, TESTED, INVALIDATED, FLIPPED, SWEPT, RETIRED };

struct ZoneEvent {
    ZoneEventType type;
    Zone zone;
    TimestampMs at;
};

inline Polarity polarityOf(Direction d) {
    return d == Direction::LONG ? Polarity::BULLISH : Polarity::BEARISH;
}

inline Polarity inverted(Polarity p) {
    return p == Polarity::BULLISH ? Polarity::BEARISH : Polarity::BULLISH;
}

std::string zoneKindToString(ZoneKind kind);
std::string zoneStatusToString(ZoneStatus status);
std::string polarityToString(Polarity polarity);

// Forward-only. FLIPPED is reachable from INVALIDATED gaps only.
bool canTransition(ZoneKind kind, ZoneStatus from, ZoneStatus to);

// Bounded set of zones per polarity. Oldest are evicted first.
class ZoneBook {
public:
    explicit ZoneBook(size_t max_per_side);

    // Returns the stored zone; may evict the oldest zone of the same polarity
    const Zone& add(Zone zone);

    std::deque<Zone>& zones(Polarity polarity);
    const std::deque<Zone>& zones(Polarity polarity) const;

    // Applies a status change if it is forward; returns false otherwise
    static bool advance(Zone& zone, ZoneStatus to);

    // Moves an invalidated gap to the opposite side as FLIPPED
    bool flip(std::uint64_t id);

    bool retire(std::uint64_t id);

    // Drops zones formed before min_bar
    void pruneOlderThan(long long min_bar);

    std::vector<Zone> active(Polarity polarity) const;
    size_t size() const;

private:
    size_t max_per_side_;
    std::deque<Zone> bullish_;
    std::deque<Zone> bearish_;
};

} // namespace analytics
} // namespace confluence
