#pragma once

#include <optional>
#include <vector>

#include "analytics/BreakerDetector.h"
#include "analytics/DetectorConfig.h"
#include "analytics/GapDetector.h"
#include "analytics/OrderBlockDetector.h"
#include "analytics/RangePosition.h"
#include "analytics/StructureAnalyzer.h"
#include "analytics/SweepDetector.h"

namespace confluence {
namespace analytics {

// Read-only view of one resolution after its latest closed bar
struct TimeframeSnapshot {
    Resolution resolution = Resolution::M15;
    size_t bars = 0;
    TimestampMs timestamp = 0;
    double close = 0.0;
    double atr = 0.0;
    StructureState structure;
    std::optional<SwingPoint> swing_high;
    std::optional<SwingPoint> swing_low;
    std::vector<Zone> order_blocks;     // active only
    std::vector<Zone> gaps;             // active only, FLIPPED included
    std::vector<Zone> breakers;         // active only
    std::vector<Zone> liquidity;        // FRESH levels only
    std::vector<SweepEvent> recent_sweeps;
    RangeReading range;
};

// Structure analyzer plus the zone detectors for one resolution of one instrument
class TimeframeAnalyzer {
public:
    TimeframeAnalyzer(Resolution resolution, const DetectorConfig& config, double pip_size);

    // Throws OutOfOrderDataError; detector state is untouched in that case
    std::vector<ZoneEvent> update(const Candle& candle);

    TimeframeSnapshot snapshot() const;

    Resolution resolution() const { return resolution_; }
    size_t barCount() const { return structure_.barCount(); }
    const StructureAnalyzer& structure() const { return structure_; }
    const OrderBlockDetector& orderBlocks() const { return order_blocks_; }
    const GapDetector& gaps() const { return gaps_; }
    const BreakerDetector& breakers() const { return breakers_; }
    const SweepDetector& sweeps() const { return sweeps_; }

private:
    Resolution resolution_;
    DetectorConfig config_;
    std::vector<Candle> window_;
    double atr_ = 0.0;

    StructureAnalyzer structure_;
    OrderBlockDetector order_blocks_;
    GapDetector gaps_;
    BreakerDetector breakers_;
    SweepDetector sweeps_;
};

} // namespace analytics
} // namespace confluence
