#include "analytics/TimeframeAnalyzer.h"

#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace confluence {
namespace analytics {

TimeframeAnalyzer::TimeframeAnalyzer(Resolution resolution, const DetectorConfig& config, double pip_size)
    : resolution_(resolution),
      config_(config),
      structure_(config.structure),
      order_blocks_(config.order_block, resolution),
      gaps_(config.gap, resolution, pip_size),
      breakers_(config.breaker),
      sweeps_(config.sweep) {
    config_.atr_period = std::max(1, config_.atr_period);
    config_.window_bars = std::max<size_t>(
        {config_.window_bars, static_cast<size_t>(config_.atr_period) + 1, 3});
    window_.reserve(config_.window_bars + 1);
}

std::vector<ZoneEvent> TimeframeAnalyzer::update(const Candle& candle) {
    // structure validates ordering before anything else mutates
    structure_.update(candle);

    window_.push_back(candle);
    if (window_.size() > config_.window_bars) {
        window_.erase(window_.begin());
    }
    // ATR over the trailing atr_period + 1 bars only
    const size_t atr_span = static_cast<size_t>(config_.atr_period) + 1;
    if (window_.size() >= atr_span) {
        std::vector<Candle> tail(window_.end() - static_cast<std::ptrdiff_t>(atr_span), window_.end());
        atr_ = TechnicalIndicators::calculateATR(tail, config_.atr_period);
    }

    const auto bar_index = static_cast<long long>(structure_.barCount());
    std::vector<ZoneEvent> events = order_blocks_.update(window_, bar_index);
    auto breaker_events = breakers_.update(candle, bar_index, events);
    events.insert(events.end(), breaker_events.begin(), breaker_events.end());
    auto gap_events = gaps_.update(window_, bar_index);
    events.insert(events.end(), gap_events.begin(), gap_events.end());
    auto sweep_events = sweeps_.update(candle, bar_index, structure_.newSwings(), atr_);
    events.insert(events.end(), sweep_events.begin(), sweep_events.end());
    return events;
}

TimeframeSnapshot TimeframeAnalyzer::snapshot() const {
    TimeframeSnapshot snap;
    snap.resolution = resolution_;
    snap.bars = structure_.barCount();
    snap.atr = atr_;
    snap.structure = structure_.state();
    snap.swing_high = structure_.lastSwing(SwingKind::HIGH);
    snap.swing_low = structure_.lastSwing(SwingKind::LOW);
    if (window_.empty()) {
        return snap;
    }

    snap.timestamp = window_.back().timestamp;
    snap.close = window_.back().close;

    for (auto polarity : {Polarity::BULLISH, Polarity::BEARISH}) {
        auto obs = order_blocks_.book().active(polarity);
        snap.order_blocks.insert(snap.order_blocks.end(), obs.begin(), obs.end());
        auto gaps = gaps_.book().active(polarity);
        snap.gaps.insert(snap.gaps.end(), gaps.begin(), gaps.end());
        auto breakers = breakers_.book().active(polarity);
        snap.breakers.insert(snap.breakers.end(), breakers.begin(), breakers.end());
        for (const auto& level : sweeps_.book().zones(polarity)) {
            if (level.status == ZoneStatus::FRESH) {
                snap.liquidity.push_back(level);
            }
        }
    }
    snap.recent_sweeps = sweeps_.recentSweeps(static_cast<long long>(snap.bars));

    if (snap.swing_high && snap.swing_low) {
        snap.range = RangePosition::evaluate(snap.close, snap.swing_high->price, snap.swing_low->price,
                                             config_.range);
    }
    return snap;
}

} // namespace analytics
} // namespace confluence
