#include "strategy/ConfluenceScorer.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "common/Logger.h"

namespace confluence {
namespace strategy {

using analytics::Bias;
using analytics::Polarity;
using analytics::PriceZone;
using analytics::Zone;

namespace {
Bias biasFor(Direction direction) {
    return direction == Direction::LONG ? Bias::BULLISH : Bias::BEARISH;
}

bool isOpposite(Bias bias, Direction direction) {
    return bias != Bias::RANGING && bias != biasFor(direction);
}

std::string describeZone(const Zone& zone) {
    std::ostringstream oss;
    oss << analytics::polarityToString(zone.polarity) << " "
        << analytics::zoneKindToString(zone.kind) << " #" << zone.id
        << " [" << zone.price_low << ", " << zone.price_high << "] "
        << analytics::zoneStatusToString(zone.status);
    return oss.str();
}

std::optional<Zone> newestContaining(const std::vector<Zone>& zones, Polarity polarity, double price) {
    std::optional<Zone> best;
    for (const auto& zone : zones) {
        if (zone.polarity != polarity || !zone.isActive() || !zone.contains(price)) {
            continue;
        }
        if (!best || zone.formed_bar > best->formed_bar) {
            best = zone;
        }
    }
    return best;
}
}

ConfluenceScorer::ConfluenceScorer(ScorerConfig config)
    : config_(config) {}

double ConfluenceScorer::trendCredit(Bias bias, Direction direction) const {
    if (bias == biasFor(direction)) return 1.0;
    if (bias == Bias::RANGING) return std::clamp(config_.neutral_trend_credit, 0.0, 1.0);
    return 0.0;
}

const analytics::RangeReading& ConfluenceScorer::rangeFor(const MarketContext& context) const {
    return context.intermediate.range.valid ? context.intermediate.range : context.execution.range;
}

std::optional<Zone> ConfluenceScorer::triggerZone(Direction direction,
                                                  const analytics::TimeframeSnapshot& execution) {
    const Polarity polarity = analytics::polarityOf(direction);
    auto zone = newestContaining(execution.order_blocks, polarity, execution.close);
    if (zone) {
        return zone;
    }
    zone = newestContaining(execution.breakers, polarity, execution.close);
    if (zone) {
        return zone;
    }
    return newestContaining(execution.gaps, polarity, execution.close);
}

ScoreBreakdown ConfluenceScorer::score(Direction direction, const MarketContext& context) const {
    ScoreBreakdown out;
    out.direction = direction;
    const Polarity polarity = analytics::polarityOf(direction);
    const auto& exec = context.execution;
    const auto& weights = config_.weights;

    const Bias macro_bias = context.macro.structure.bias;
    const Bias inter_bias = context.intermediate.structure.bias;
    const double macro_credit = trendCredit(macro_bias, direction);
    const double inter_credit = trendCredit(inter_bias, direction);

    out.macro_conflict = isOpposite(macro_bias, direction);
    if (out.macro_conflict) {
        out.size_multiplier *= config_.macro_conflict_multiplier;
        out.reasons.push_back("macro trend conflict (" + analytics::biasToString(macro_bias) + ")");
    } else if (macro_credit > 0.0) {
        out.reasons.push_back("macro trend " + analytics::biasToString(macro_bias));
    }
    if (isOpposite(inter_bias, direction)) {
        out.size_multiplier *= config_.intermediate_conflict_multiplier;
        out.reasons.push_back("intermediate structure conflict (" + analytics::biasToString(inter_bias) + ")");
    } else if (inter_credit > 0.0) {
        out.reasons.push_back("intermediate structure " + analytics::biasToString(inter_bias));
    }

    double ob_credit = 0.0;
    if (auto ob = newestContaining(exec.order_blocks, polarity, exec.close)) {
        ob_credit = 1.0;
        out.reasons.push_back("inside " + describeZone(*ob));
    } else if (auto breaker = newestContaining(exec.breakers, polarity, exec.close)) {
        ob_credit = std::clamp(config_.breaker_credit, 0.0, 1.0);
        out.reasons.push_back("inside " + describeZone(*breaker));
    }

    double gap_credit = 0.0;
    if (auto gap = newestContaining(exec.gaps, polarity, exec.close)) {
        gap_credit = 1.0;
        out.reasons.push_back("inside " + describeZone(*gap));
    }

    double sweep_credit = 0.0;
    for (const auto* snap : {&exec, &context.intermediate}) {
        for (const auto& sweep : snap->recent_sweeps) {
            if (sweep.polarity == polarity) {
                sweep_credit = 1.0;
            }
        }
    }
    if (sweep_credit > 0.0) {
        out.sweep_confirmed = true;
        out.reasons.push_back(direction == Direction::LONG ? "sell-side liquidity swept"
                                                           : "buy-side liquidity swept");
    }

    double range_credit = 0.0;
    const auto& range = rangeFor(context);
    const PriceZone wanted = direction == Direction::LONG ? PriceZone::DISCOUNT : PriceZone::PREMIUM;
    if (range.valid && range.zone == wanted) {
        range_credit = range.optimal ? 1.0 : std::clamp(config_.range_zone_credit, 0.0, 1.0);
        std::ostringstream oss;
        oss << analytics::priceZoneToString(range.zone) << (range.optimal ? " (optimal)" : "")
            << " at " << range.position;
        out.reasons.push_back(oss.str());
    }

    const std::pair<double, double> terms[] = {
        {weights.macro_trend, macro_credit},
        {weights.intermediate_structure, inter_credit},
        {weights.order_block, ob_credit},
        {weights.gap, gap_credit},
        {weights.sweep, sweep_credit},
        {weights.range_position, range_credit},
    };
    for (const auto& term : terms) {
        const double weight = std::max(0.0, term.first);
        out.total_weight += weight;
        out.weighted += weight * term.second;
    }
    out.score = out.total_weight > 0.0 ? 100.0 * (out.weighted / out.total_weight) : 0.0;
    return out;
}

double ConfluenceScorer::pickTarget(Direction direction, double entry, double risk,
                                    const MarketContext& context) const {
    const double min_reward = config_.min_reward_multiple * risk;
    const int sign = directionSign(direction);

    std::optional<double> best;
    for (const auto* snap : {&context.execution, &context.intermediate}) {
        for (const auto& level : snap->liquidity) {
            const double price = level.polarity == Polarity::BEARISH ? level.price_high : level.price_low;
            const double reward = (price - entry) * sign;
            if (reward < min_reward) {
                continue;
            }
            if (!best || reward < (*best - entry) * sign) {
                best = price;
            }
        }
    }
    return best ? *best : entry + sign * min_reward;
}

std::optional<Signal> ConfluenceScorer::evaluate(const MarketContext& context) const {
    const auto& exec = context.execution;
    if (exec.bars == 0) {
        return std::nullopt;
    }

    auto long_zone = triggerZone(Direction::LONG, exec);
    auto short_zone = triggerZone(Direction::SHORT, exec);
    if (long_zone && short_zone) {
        LOG_DEBUG("{}: opposing zones both contain {:.5f}, skipping", context.instrument, exec.close);
        return std::nullopt;
    }
    if (!long_zone && !short_zone) {
        return std::nullopt;
    }

    const Direction direction = long_zone ? Direction::LONG : Direction::SHORT;
    const Zone& trigger = long_zone ? *long_zone : *short_zone;
    ScoreBreakdown breakdown = score(direction, context);

    if (breakdown.macro_conflict) {
        const auto& range = rangeFor(context);
        const bool deep = range.valid &&
            (direction == Direction::LONG ? range.position <= config_.counter_trend_depth
                                          : range.position >= 1.0 - config_.counter_trend_depth);
        if (!config_.allow_counter_trend || !breakdown.sweep_confirmed || !deep) {
            return std::nullopt;
        }
    }

    if (breakdown.score < config_.min_confidence) {
        return std::nullopt;
    }

    const double entry = direction == Direction::LONG ? exec.close + context.spread : exec.close;
    const double buffer = config_.stop_atr_buffer * exec.atr;
    const double stop = direction == Direction::LONG ? trigger.price_low - buffer
                                                     : trigger.price_high + buffer;
    if ((stop - entry) * directionSign(direction) >= 0.0) {
        return std::nullopt;
    }
    const double risk = std::abs(entry - stop);

    Signal signal;
    signal.instrument = context.instrument;
    signal.direction = direction;
    signal.entry = entry;
    signal.stop = stop;
    signal.target = pickTarget(direction, entry, risk, context);
    signal.confidence = breakdown.score;
    signal.size_multiplier = breakdown.size_multiplier;
    signal.reasons = std::move(breakdown.reasons);
    signal.timestamp = exec.timestamp;
    signal.trigger_zone_id = trigger.id;

    LOG_INFO("{} {} signal: entry {:.5f} stop {:.5f} target {:.5f} confidence {:.1f}",
             signal.instrument, directionToString(direction), signal.entry, signal.stop,
             signal.target, signal.confidence);
    return signal;
}

} // namespace strategy
} // namespace confluence
