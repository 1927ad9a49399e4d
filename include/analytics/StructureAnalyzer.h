#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "analytics/DetectorConfig.h"
#include "common/Types.h"

namespace confluence {
namespace analytics {

enum class Bias { BULLISH, BEARISH, RANGING };

enum class SwingKind { HIGH, LOW };

struct SwingPoint {
    TimestampMs timestamp = 0;      // bar holding the extreme
    double price = 0.0;
    SwingKind kind = SwingKind::HIGH;
    bool confirmed = false;
    TimestampMs confirmed_at = 0;   // bar that confirmed it, always > timestamp
    bool broken = false;
};

enum class BreakKind { CONTINUATION, CHARACTER_CHANGE };

struct StructureBreak {
    BreakKind kind = BreakKind::CONTINUATION;
    Bias direction = Bias::RANGING;
    double level = 0.0;             // price of the broken swing
    double close = 0.0;
    TimestampMs timestamp = 0;
};

struct StructureState {
    Bias bias = Bias::RANGING;
    std::optional<StructureBreak> last_break;
};

std::string biasToString(Bias bias);
std::string breakKindToString(BreakKind kind);

// Incremental swing/break tracker for one resolution.
//
// A bar becomes a swing once `confirm_window` bars on both sides are strictly
// less extreme, so confirmation happens on a later bar. Breaks on bar t only
// consult swings confirmed before t.
class StructureAnalyzer {
public:
    explicit StructureAnalyzer(StructureConfig config);

    // Throws OutOfOrderDataError on a non-increasing timestamp
    const StructureState& update(const Candle& candle);

    const StructureState& state() const { return state_; }
    const std::deque<SwingPoint>& swings() const { return swings_; }

    // Swings confirmed by the most recent update
    const std::vector<SwingPoint>& newSwings() const { return new_swings_; }

    // True when the most recent update produced a break
    bool brokeOnLastBar() const { return broke_on_last_bar_; }

    std::optional<SwingPoint> lastSwing(SwingKind kind) const;

    size_t barCount() const { return bar_count_; }

private:
    void evaluateBreak(const Candle& candle);
    void confirmSwings(const Candle& candle);
    bool hasDisplacement(const Candle& candle) const;
    SwingPoint* mostRecent(SwingKind kind);

    StructureConfig config_;
    StructureState state_;
    std::deque<Candle> bars_;
    std::deque<SwingPoint> swings_;
    std::vector<SwingPoint> new_swings_;
    bool broke_on_last_bar_ = false;
    size_t bar_count_ = 0;
};

} // namespace analytics
} // namespace confluence
