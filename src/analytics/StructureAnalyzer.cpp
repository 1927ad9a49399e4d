#include "analytics/StructureAnalyzer.h"

#include <algorithm>

#include "common/Errors.h"
#include "common/Logger.h"

namespace confluence {
namespace analytics {

std::string biasToString(Bias bias) {
    switch (bias) {
        case Bias::BULLISH: return "BULLISH";
        case Bias::BEARISH: return "BEARISH";
        case Bias::RANGING: return "RANGING";
    }
    return "RANGING";
}

std::string breakKindToString(BreakKind kind) {
    return kind == BreakKind::CONTINUATION ? "CONTINUATION" : "CHARACTER_CHANGE";
}

StructureAnalyzer::StructureAnalyzer(StructureConfig config)
    : config_(config) {
    config_.confirm_window = std::max(1, config_.confirm_window);
    config_.displacement_lookback = std::max(1, config_.displacement_lookback);
    config_.max_swings = std::max<size_t>(2, config_.max_swings);
}

const StructureState& StructureAnalyzer::update(const Candle& candle) {
    if (!bars_.empty() && candle.timestamp <= bars_.back().timestamp) {
        throw OutOfOrderDataError("structure", bars_.back().timestamp, candle.timestamp);
    }

    new_swings_.clear();
    broke_on_last_bar_ = false;

    bars_.push_back(candle);
    ++bar_count_;
    const size_t keep = std::max<size_t>(
        2 * static_cast<size_t>(config_.confirm_window) + 1,
        static_cast<size_t>(config_.displacement_lookback) + 1);
    while (bars_.size() > keep) {
        bars_.pop_front();
    }

    // breaks first, so swings confirmed by this bar are not consulted yet
    evaluateBreak(candle);
    confirmSwings(candle);
    return state_;
}

std::optional<SwingPoint> StructureAnalyzer::lastSwing(SwingKind kind) const {
    for (auto it = swings_.rbegin(); it != swings_.rend(); ++it) {
        if (it->kind == kind) {
            return *it;
        }
    }
    return std::nullopt;
}

SwingPoint* StructureAnalyzer::mostRecent(SwingKind kind) {
    for (auto it = swings_.rbegin(); it != swings_.rend(); ++it) {
        if (it->kind == kind) {
            return &(*it);
        }
    }
    return nullptr;
}

bool StructureAnalyzer::hasDisplacement(const Candle& candle) const {
    if (config_.displacement_multiplier <= 0.0) {
        return true;
    }
    // bars_ holds the current bar last; average the ones before it
    if (bars_.size() < 2) {
        return false;
    }
    const size_t prior = bars_.size() - 1;
    const size_t count = std::min(prior, static_cast<size_t>(config_.displacement_lookback));
    double sum = 0.0;
    for (size_t i = prior - count; i < prior; ++i) {
        sum += bars_[i].range();
    }
    const double avg_range = sum / static_cast<double>(count);
    return candle.body() > avg_range * config_.displacement_multiplier;
}

void StructureAnalyzer::evaluateBreak(const Candle& candle) {
    SwingPoint* high = mostRecent(SwingKind::HIGH);
    SwingPoint* low = mostRecent(SwingKind::LOW);

    Bias direction = Bias::RANGING;
    SwingPoint* broken = nullptr;
    if (high && !high->broken && candle.close > high->price) {
        direction = Bias::BULLISH;
        broken = high;
    } else if (low && !low->broken && candle.close < low->price) {
        direction = Bias::BEARISH;
        broken = low;
    }

    if (!broken || !hasDisplacement(candle)) {
        return;
    }

    StructureBreak brk;
    brk.direction = direction;
    brk.level = broken->price;
    brk.close = candle.close;
    brk.timestamp = candle.timestamp;
    const bool flips = state_.bias != Bias::RANGING && state_.bias != direction;
    brk.kind = flips ? BreakKind::CHARACTER_CHANGE : BreakKind::CONTINUATION;

    broken->broken = true;
    state_.bias = direction;
    state_.last_break = brk;
    broke_on_last_bar_ = true;

    LOG_DEBUG("Structure break {} {} at {} (level {:.5f})",
              breakKindToString(brk.kind), biasToString(direction), candle.timestamp, brk.level);
}

void StructureAnalyzer::confirmSwings(const Candle& candle) {
    const size_t n = static_cast<size_t>(config_.confirm_window);
    const size_t span = 2 * n + 1;
    if (bars_.size() < span) {
        return;
    }

    const size_t start = bars_.size() - span;
    const size_t pivot = start + n;
    const Candle& mid = bars_[pivot];

    bool is_high = true;
    bool is_low = true;
    for (size_t i = start; i < bars_.size(); ++i) {
        if (i == pivot) continue;
        if (bars_[i].high >= mid.high) is_high = false;
        if (bars_[i].low <= mid.low) is_low = false;
    }

    auto push = [&](SwingKind kind, double price) {
        SwingPoint swing;
        swing.timestamp = mid.timestamp;
        swing.price = price;
        swing.kind = kind;
        swing.confirmed = true;
        swing.confirmed_at = candle.timestamp;
        swings_.push_back(swing);
        new_swings_.push_back(swing);
        if (swings_.size() > config_.max_swings) {
            swings_.pop_front();
        }
    };

    if (is_high) push(SwingKind::HIGH, mid.high);
    if (is_low) push(SwingKind::LOW, mid.low);
}

} // namespace analytics
} // namespace confluence
