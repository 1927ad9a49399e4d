#pragma once

#include <optional>
#include <vector>

#include "analytics/DetectorConfig.h"
#include "analytics/Zone.h"

namespace confluence {
namespace analytics {

class OrderBlockDetector {
public:
    OrderBlockDetector(OrderBlockConfig config, Resolution resolution);

    // `window` ends with the bar just closed; bar_index is its ordinal in the series
    std::vector<ZoneEvent> update(const std::vector<Candle>& window, long long bar_index);

    // base = counter-direction bar, follow = impulsive bar right after it
    static std::optional<Zone> detect(const Candle& base, const Candle& follow,
                                      double impulse_ratio, double wick_allowance);

    // Status the zone moves to after `bar`, if any
    static std::optional<ZoneStatus> nextStatus(const Zone& zone, const Candle& bar);

    const ZoneBook& book() const { return book_; }
    double impulseRatio() const { return impulse_ratio_; }

private:
    OrderBlockConfig config_;
    double impulse_ratio_;
    ZoneBook book_;
    std::uint64_t next_id_ = 1;
};

} // namespace analytics
} // namespace confluence
