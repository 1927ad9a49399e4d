#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/TimeframeAnalyzer.h"
#include "strategy/Signal.h"
#include "strategy/StrategyConfig.h"

namespace confluence {
namespace strategy {

// Three-resolution view of one instrument at the current execution bar
struct MarketContext {
    std::string instrument;
    double spread = 0.0;
    analytics::TimeframeSnapshot macro;
    analytics::TimeframeSnapshot intermediate;
    analytics::TimeframeSnapshot execution;
};

struct ScoreBreakdown {
    Direction direction = Direction::LONG;
    double score = 0.0;             // normalized, [0, 100]
    double weighted = 0.0;          // sum of weight x credit
    double total_weight = 0.0;
    double size_multiplier = 1.0;
    bool macro_conflict = false;
    bool sweep_confirmed = false;
    std::vector<std::string> reasons;
};

class ConfluenceScorer {
public:
    explicit ConfluenceScorer(ScorerConfig config);

    // Call only while no position is open for the instrument
    std::optional<Signal> evaluate(const MarketContext& context) const;

    // Normalized score for one direction, no gating
    ScoreBreakdown score(Direction direction, const MarketContext& context) const;

    // Newest active zone of the direction's polarity containing price:
    // order blocks first, then breakers, then gaps
    static std::optional<analytics::Zone> triggerZone(Direction direction,
                                                      const analytics::TimeframeSnapshot& execution);

    const ScorerConfig& config() const { return config_; }

private:
    double trendCredit(analytics::Bias bias, Direction direction) const;
    const analytics::RangeReading& rangeFor(const MarketContext& context) const;
    double pickTarget(Direction direction, double entry, double risk, const MarketContext& context) const;

    ScorerConfig config_;
};

} // namespace strategy
} // namespace confluence
