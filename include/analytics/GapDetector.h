#pragma once

#include <optional>
#include <vector>

#include "analytics/DetectorConfig.h"
#include "analytics/Zone.h"

namespace confluence {
namespace analytics {

// Three-bar imbalance tracker.
//
// Lifecycle: FRESH -> TESTED (first trade into the band) -> INVALIDATED
// (close beyond the far edge). An invalidated gap that is reclaimed (a later
// close back across its midpoint) becomes FLIPPED with inverted polarity;
// a flipped gap that is closed through is retired.
class GapDetector {
public:
    GapDetector(GapConfig config, Resolution resolution, double pip_size);

    std::vector<ZoneEvent> update(const std::vector<Candle>& window, long long bar_index);

    static std::optional<Zone> detect(const Candle& first, const Candle& middle, const Candle& third,
                                      double min_gap);

    // Applies `bar` to the zone: updates fill_pct and TESTED/INVALIDATED
    // status in place. FLIPPED and RETIRED are only reported; the book
    // applies them.
    static std::optional<ZoneEventType> advance(Zone& zone, const Candle& bar);

    const ZoneBook& book() const { return book_; }
    double minGap() const { return min_gap_; }

private:
    GapConfig config_;
    double min_gap_;
    ZoneBook book_;
    std::uint64_t next_id_ = 1;
};

} // namespace analytics
} // namespace confluence
