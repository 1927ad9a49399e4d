#include "analytics/SweepDetector.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace confluence {
namespace analytics {

namespace {
constexpr size_t MAX_SWEEP_HISTORY = 64;

double levelPrice(const Zone& level) {
    // cluster edge facing the resting orders
    return level.polarity == Polarity::BEARISH ? level.price_high : level.price_low;
}
}

SweepDetector::SweepDetector(SweepConfig config)
    : config_(config),
      book_(config.max_levels_per_side) {}

std::optional<ZoneStatus> SweepDetector::nextStatus(const Zone& level, const Candle& bar, double penetration) {
    if (level.status != ZoneStatus::FRESH) {
        return std::nullopt;
    }
    const double price = levelPrice(level);

    if (level.polarity == Polarity::BEARISH) {
        if (bar.high > price + penetration && bar.close < price) return ZoneStatus::TESTED;
        if (bar.close > price + penetration) return ZoneStatus::INVALIDATED;
    } else {
        if (bar.low < price - penetration && bar.close > price) return ZoneStatus::TESTED;
        if (bar.close < price - penetration) return ZoneStatus::INVALIDATED;
    }
    return std::nullopt;
}

std::vector<ZoneEvent> SweepDetector::update(const Candle& bar, long long bar_index,
                                             const std::vector<SwingPoint>& new_swings, double atr) {
    std::vector<ZoneEvent> events;
    const double equal_tolerance = std::max(0.0, config_.equal_tolerance_atr * atr);
    const double penetration = std::max(0.0, config_.penetration_atr * atr);

    if (config_.track_session_levels) {
        rollSession(bar, bar_index, equal_tolerance, events);
    }

    for (auto polarity : {Polarity::BULLISH, Polarity::BEARISH}) {
        for (auto& level : book_.zones(polarity)) {
            auto next = nextStatus(level, bar, penetration);
            if (!next || !ZoneBook::advance(level, *next)) {
                continue;
            }

            if (*next == ZoneStatus::INVALIDATED) {
                events.push_back({ZoneEventType::INVALIDATED, level, bar.timestamp});
                continue;
            }

            ++level.test_count;
            SweepEvent sweep;
            sweep.level_id = level.id;
            sweep.polarity = level.polarity;
            sweep.level = levelPrice(level);
            sweep.extreme = level.polarity == Polarity::BEARISH ? bar.high : bar.low;
            sweep.timestamp = bar.timestamp;
            sweep.bar_index = bar_index;
            sweep.session_level = level.session_level;
            sweep.equal_level = level.equal_level;
            sweeps_.push_back(sweep);
            if (sweeps_.size() > MAX_SWEEP_HISTORY) {
                sweeps_.pop_front();
            }
            events.push_back({ZoneEventType::SWEPT, level, bar.timestamp});
            LOG_DEBUG("Liquidity sweep {} level {:.5f} extreme {:.5f} at {}",
                      polarityToString(sweep.polarity), sweep.level, sweep.extreme, bar.timestamp);
        }
    }

    for (const auto& swing : new_swings) {
        const Polarity polarity = swing.kind == SwingKind::HIGH ? Polarity::BEARISH : Polarity::BULLISH;
        addLevel(polarity, swing.price, bar, bar_index, equal_tolerance, false, events);
    }

    return events;
}

std::vector<SweepEvent> SweepDetector::recentSweeps(long long current_bar) const {
    std::vector<SweepEvent> out;
    for (const auto& sweep : sweeps_) {
        if (current_bar - sweep.bar_index <= config_.recent_sweep_bars) {
            out.push_back(sweep);
        }
    }
    return out;
}

void SweepDetector::addLevel(Polarity polarity, double price, const Candle& bar, long long bar_index,
                             double equal_tolerance, bool session, std::vector<ZoneEvent>& events) {
    for (auto& level : book_.zones(polarity)) {
        if (level.status != ZoneStatus::FRESH) {
            continue;
        }
        if (std::abs(levelPrice(level) - price) <= equal_tolerance) {
            level.price_low = std::min(level.price_low, price);
            level.price_high = std::max(level.price_high, price);
            level.equal_level = true;
            level.session_level = level.session_level || session;
            return;
        }
    }

    Zone level;
    level.id = next_id_++;
    level.kind = ZoneKind::LIQUIDITY;
    level.polarity = polarity;
    level.price_low = price;
    level.price_high = price;
    level.formed_at = bar.timestamp;
    level.formed_bar = bar_index;
    level.session_level = session;
    events.push_back({ZoneEventType::FORMED, book_.add(level), bar.timestamp});
}

void SweepDetector::rollSession(const Candle& bar, long long bar_index, double equal_tolerance,
                                std::vector<ZoneEvent>& events) {
    const long long day = dayKey(bar.timestamp);
    if (!has_session_) {
        has_session_ = true;
        session_day_ = day;
        session_high_ = bar.high;
        session_low_ = bar.low;
        return;
    }

    if (day != session_day_) {
        addLevel(Polarity::BEARISH, session_high_, bar, bar_index, equal_tolerance, true, events);
        addLevel(Polarity::BULLISH, session_low_, bar, bar_index, equal_tolerance, true, events);
        session_day_ = day;
        session_high_ = bar.high;
        session_low_ = bar.low;
        return;
    }

    session_high_ = std::max(session_high_, bar.high);
    session_low_ = std::min(session_low_, bar.low);
}

} // namespace analytics
} // namespace confluence
