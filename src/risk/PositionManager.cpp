#include "risk/PositionManager.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace confluence {
namespace risk {

namespace {
constexpr double SIZE_EPSILON = 1e-9;

ExitReason parseExitReason(const std::string& value) {
    if (value == "TAKE_PROFIT") return ExitReason::TAKE_PROFIT;
    if (value == "TRAILING_STOP") return ExitReason::TRAILING_STOP;
    if (value == "BREAK_EVEN") return ExitReason::BREAK_EVEN;
    if (value == "PARTIAL_TAKE_PROFIT") return ExitReason::PARTIAL_TAKE_PROFIT;
    if (value == "END_OF_DATA") return ExitReason::END_OF_DATA;
    return ExitReason::STOP_LOSS;
}

Direction parseDirection(const std::string& value) {
    return value == "SHORT" ? Direction::SHORT : Direction::LONG;
}
}

std::string exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS: return "STOP_LOSS";
        case ExitReason::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitReason::TRAILING_STOP: return "TRAILING_STOP";
        case ExitReason::BREAK_EVEN: return "BREAK_EVEN";
        case ExitReason::PARTIAL_TAKE_PROFIT: return "PARTIAL_TAKE_PROFIT";
        case ExitReason::END_OF_DATA: return "END_OF_DATA";
    }
    return "STOP_LOSS";
}

nlohmann::json toJson(const Position& position) {
    nlohmann::json j;
    j["instrument"] = position.instrument;
    j["direction"] = directionToString(position.direction);
    j["entry"] = position.entry;
    j["stop"] = position.stop;
    j["target"] = position.target;
    j["size"] = position.size;
    j["initial_size"] = position.initial_size;
    j["initial_risk"] = position.initial_risk;
    j["opened_at"] = position.opened_at;
    j["confidence"] = position.confidence;
    j["anomaly"] = position.anomaly;
    j["realized_pnl"] = position.realized_pnl;
    j["breakeven_applied"] = position.management.breakeven_applied;
    j["trailing_active"] = position.management.trailing_active;
    j["partial_taken"] = position.management.partial_taken;
    j["best_price"] = position.management.best_price;
    return j;
}

Position positionFromJson(const nlohmann::json& j) {
    Position position;
    position.instrument = j.value("instrument", std::string());
    position.direction = parseDirection(j.value("direction", std::string("LONG")));
    position.entry = j.value("entry", 0.0);
    position.stop = j.value("stop", 0.0);
    position.target = j.value("target", 0.0);
    position.size = j.value("size", 0.0);
    position.initial_size = j.value("initial_size", position.size);
    position.initial_risk = j.value("initial_risk", 0.0);
    position.opened_at = j.value("opened_at", 0LL);
    position.confidence = j.value("confidence", 0.0);
    position.anomaly = j.value("anomaly", false);
    position.realized_pnl = j.value("realized_pnl", 0.0);
    position.management.breakeven_applied = j.value("breakeven_applied", false);
    position.management.trailing_active = j.value("trailing_active", false);
    position.management.partial_taken = j.value("partial_taken", false);
    position.management.best_price = j.value("best_price", position.entry);
    return position;
}

nlohmann::json toJson(const TradeRecord& trade) {
    nlohmann::json j;
    j["instrument"] = trade.instrument;
    j["direction"] = directionToString(trade.direction);
    j["entry"] = trade.entry;
    j["exit"] = trade.exit;
    j["size"] = trade.size;
    j["pnl"] = trade.pnl;
    j["open_time"] = trade.open_time;
    j["close_time"] = trade.close_time;
    j["exit_reason"] = exitReasonToString(trade.exit_reason);
    j["confidence"] = trade.confidence;
    j["r_multiple"] = trade.r_multiple;
    return j;
}

TradeRecord tradeFromJson(const nlohmann::json& j) {
    TradeRecord trade;
    trade.instrument = j.value("instrument", std::string());
    trade.direction = parseDirection(j.value("direction", std::string("LONG")));
    trade.entry = j.value("entry", 0.0);
    trade.exit = j.value("exit", 0.0);
    trade.size = j.value("size", 0.0);
    trade.pnl = j.value("pnl", 0.0);
    trade.open_time = j.value("open_time", 0LL);
    trade.close_time = j.value("close_time", 0LL);
    trade.exit_reason = parseExitReason(j.value("exit_reason", std::string("STOP_LOSS")));
    trade.confidence = j.value("confidence", 0.0);
    trade.r_multiple = j.value("r_multiple", 0.0);
    return trade;
}

PositionManager::PositionManager(ManagementConfig config)
    : config_(config) {}

double PositionManager::pnl(Direction direction, double entry, double exit, double size,
                            const InstrumentMeta& meta) {
    return meta.toPriceUnits(exit - entry) * size * directionSign(direction) * meta.unit_value;
}

double PositionManager::unrealized(const Position& position, double price, const InstrumentMeta& meta) {
    return pnl(position.direction, position.entry, price, position.size, meta);
}

TradeRecord PositionManager::fill(const Position& position, double size, double price, TimestampMs ts,
                                  ExitReason reason, const InstrumentMeta& meta) const {
    TradeRecord trade;
    trade.instrument = position.instrument;
    trade.direction = position.direction;
    trade.entry = position.entry;
    trade.exit = price;
    trade.size = size;
    trade.pnl = pnl(position.direction, position.entry, price, size, meta);
    trade.open_time = position.opened_at;
    trade.close_time = ts;
    trade.exit_reason = reason;
    trade.confidence = position.confidence;
    trade.r_multiple = position.initial_risk > 0.0
        ? (price - position.entry) * directionSign(position.direction) / position.initial_risk
        : 0.0;
    return trade;
}

TradeRecord PositionManager::close(Position& position, double price, TimestampMs ts, ExitReason reason,
                                   const InstrumentMeta& meta) const {
    TradeRecord trade = fill(position, position.size, price, ts, reason, meta);
    position.size = 0.0;
    LOG_INFO("{} {} closed {} at {:.5f} (entry {:.5f}, size {:.2f}, pnl {:.2f})",
             trade.instrument, directionToString(trade.direction), exitReasonToString(reason),
             trade.exit, trade.entry, trade.size, trade.pnl);
    return trade;
}

BarOutcome PositionManager::onBar(Position& position, const Candle& bar, const InstrumentMeta& meta) const {
    BarOutcome out;
    const int sign = directionSign(position.direction);
    const bool is_long = sign > 0;
    auto& mgmt = position.management;

    // 1. stop
    const bool stop_hit = is_long ? bar.low <= position.stop : bar.high >= position.stop;
    if (stop_hit) {
        double price = position.stop;
        if ((bar.open - position.stop) * sign < 0.0) {
            price = bar.open;   // gapped through the stop
        }
        const ExitReason reason = mgmt.trailing_active ? ExitReason::TRAILING_STOP
                                : mgmt.breakeven_applied ? ExitReason::BREAK_EVEN
                                : ExitReason::STOP_LOSS;
        out.fills.push_back(close(position, price, bar.timestamp, reason, meta));
        out.closed = true;
        return out;
    }

    // 2. target
    const bool target_hit = position.target > 0.0 &&
        (is_long ? bar.high >= position.target : bar.low <= position.target);
    if (target_hit) {
        out.fills.push_back(close(position, position.target, bar.timestamp, ExitReason::TAKE_PROFIT, meta));
        out.closed = true;
        return out;
    }

    if (mgmt.best_price == 0.0) {
        mgmt.best_price = position.entry;
    }
    mgmt.best_price = is_long ? std::max(mgmt.best_price, bar.high) : std::min(mgmt.best_price, bar.low);
    const double risk = position.initial_risk;
    if (risk <= 0.0) {
        return out;
    }
    const double excursion = (mgmt.best_price - position.entry) * sign;

    // 3. trailing stop
    if (config_.trailing_enabled && excursion >= config_.trailing_start_r * risk) {
        const double candidate = mgmt.best_price - sign * config_.trailing_distance_r * risk;
        if ((candidate - position.stop) * sign > 0.0) {
            position.stop = candidate;
            mgmt.trailing_active = true;
            out.stop_moved = true;
        }
    }

    // 4. break-even
    if (config_.breakeven_enabled && !mgmt.breakeven_applied &&
        excursion >= config_.breakeven_trigger_r * risk) {
        const double level = position.entry + sign * config_.breakeven_offset_pips * meta.pip_size;
        if ((level - position.stop) * sign > 0.0) {
            position.stop = level;
            out.stop_moved = true;
        }
        mgmt.breakeven_applied = true;
    }

    // 5. partial close
    if (config_.partial_enabled && !mgmt.partial_taken &&
        excursion >= config_.partial_close_r * risk) {
        const double increment = meta.min_increment;
        if (!std::isfinite(increment) || increment <= 0.0) {
            LOG_WARN("{}: min increment {} not resolved, partial close skipped",
                     position.instrument, increment);
            mgmt.partial_taken = true;
            return out;
        }
        const double qty = std::floor(position.size * config_.partial_fraction / increment + SIZE_EPSILON) * increment;
        const double remaining = std::round((position.size - qty) / increment) * increment;
        if (qty >= increment - SIZE_EPSILON && remaining >= increment - SIZE_EPSILON) {
            const double level = position.entry + sign * config_.partial_close_r * risk;
            out.fills.push_back(fill(position, qty, level, bar.timestamp, ExitReason::PARTIAL_TAKE_PROFIT, meta));
            position.size = remaining;
            LOG_INFO("{} partial close {:.2f} at {:.5f}, {:.2f} remaining",
                     position.instrument, qty, level, remaining);
        }
        mgmt.partial_taken = true;
    }

    return out;
}

} // namespace risk
} // namespace confluence
