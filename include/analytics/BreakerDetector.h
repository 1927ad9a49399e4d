#pragma once

#include <optional>
#include <vector>

#include "analytics/DetectorConfig.h"
#include "analytics/Zone.h"

namespace confluence {
namespace analytics {

// Breaker blocks: an order block closed through keeps its band with the
// opposite polarity. A broken bullish block becomes bearish resistance,
// a broken bearish block becomes bullish support.
class BreakerDetector {
public:
    explicit BreakerDetector(BreakerConfig config);

    // `order_block_events` are the events the order block detector reported for `bar`
    std::vector<ZoneEvent> update(const Candle& bar, long long bar_index,
                                  const std::vector<ZoneEvent>& order_block_events);

    static Zone fromBrokenOrderBlock(const Zone& order_block);

    // A wick into the band is a test; a close beyond the far edge invalidates
    static std::optional<ZoneStatus> nextStatus(const Zone& zone, const Candle& bar);

    const ZoneBook& book() const { return book_; }

private:
    BreakerConfig config_;
    ZoneBook book_;
    std::uint64_t next_id_ = 1;
};

} // namespace analytics
} // namespace confluence
