#pragma once

#include <deque>
#include <optional>
#include <vector>

#include "analytics/DetectorConfig.h"
#include "analytics/StructureAnalyzer.h"
#include "analytics/Zone.h"

namespace confluence {
namespace analytics {

// A wick through a liquidity level that closed back on the originating side.
// polarity is the implied reaction: a sweep of lows is BULLISH.
struct SweepEvent {
    std::uint64_t level_id = 0;
    Polarity polarity = Polarity::BULLISH;
    double level = 0.0;
    double extreme = 0.0;
    TimestampMs timestamp = 0;
    long long bar_index = 0;
    bool session_level = false;
    bool equal_level = false;
};

// Tracks resting liquidity (previous-session extremes, swing extremes and
// equal highs/lows) and reports sweeps. Liquidity levels are zones with
// price_low == price_high == level; highs carry BEARISH polarity, lows BULLISH.
// Status: FRESH (resting), TESTED (swept, consumed), INVALIDATED (accepted beyond).
class SweepDetector {
public:
    explicit SweepDetector(SweepConfig config);

    // new_swings: swings confirmed on this bar; atr: current volatility of the resolution
    std::vector<ZoneEvent> update(const Candle& bar, long long bar_index,
                                  const std::vector<SwingPoint>& new_swings, double atr);

    // Pure check of one level against one bar
    static std::optional<ZoneStatus> nextStatus(const Zone& level, const Candle& bar, double penetration);

    const ZoneBook& book() const { return book_; }

    std::vector<SweepEvent> recentSweeps(long long current_bar) const;

private:
    void addLevel(Polarity polarity, double price, const Candle& bar, long long bar_index,
                  double equal_tolerance, bool session, std::vector<ZoneEvent>& events);
    void rollSession(const Candle& bar, long long bar_index, double equal_tolerance,
                     std::vector<ZoneEvent>& events);

    SweepConfig config_;
    ZoneBook book_;
    std::deque<SweepEvent> sweeps_;
    std::uint64_t next_id_ = 1;

    long long session_day_ = 0;
    bool has_session_ = false;
    double session_high_ = 0.0;
    double session_low_ = 0.0;
};

} // namespace analytics
} // namespace confluence
