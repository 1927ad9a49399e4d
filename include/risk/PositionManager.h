#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "risk/InstrumentMeta.h"
#include "risk/RiskConfig.h"

namespace confluence {
namespace risk {

enum class ExitReason {
    STOP_LOSS,
    TAKE_PROFIT,
    TRAILING_STOP,
    BREAK_EVEN,
    PARTIAL_TAKE_PROFIT,
    END_OF_DATA
};

std::string exitReasonToString(ExitReason reason);

struct ManagementState {
    bool breakeven_applied = false;
    bool trailing_active = false;
    bool partial_taken = false;
    double best_price = 0.0;        // most favourable price seen since entry
};

struct Position {
    std::string instrument;
    Direction direction = Direction::LONG;
    double entry = 0.0;
    double stop = 0.0;
    double target = 0.0;
    double size = 0.0;
    double initial_size = 0.0;
    double initial_risk = 0.0;      // |entry - initial stop|, in price
    TimestampMs opened_at = 0;
    double confidence = 0.0;
    bool anomaly = false;
    double realized_pnl = 0.0;      // partial fills booked so far
    ManagementState management;
};

struct TradeRecord {
    std::string instrument;
    Direction direction = Direction::LONG;
    double entry = 0.0;
    double exit = 0.0;
    double size = 0.0;
    double pnl = 0.0;
    TimestampMs open_time = 0;
    TimestampMs close_time = 0;
    ExitReason exit_reason = ExitReason::STOP_LOSS;
    double confidence = 0.0;
    double r_multiple = 0.0;
};

nlohmann::json toJson(const Position& position);
Position positionFromJson(const nlohmann::json& j);
nlohmann::json toJson(const TradeRecord& trade);
TradeRecord tradeFromJson(const nlohmann::json& j);

struct BarOutcome {
    std::vector<TradeRecord> fills;     // partial fills first, then the closing fill
    bool closed = false;
    bool stop_moved = false;
};

// Applies one bar to an open position in fixed order: stop-hit, target-hit,
// trailing-stop update, break-even move, partial close. Exit checks run
// before any management update, and the stop wins when both levels trade.
class PositionManager {
public:
    explicit PositionManager(ManagementConfig config);

    BarOutcome onBar(Position& position, const Candle& bar, const InstrumentMeta& meta) const;

    // Closes the remaining size at `price`
    TradeRecord close(Position& position, double price, TimestampMs ts, ExitReason reason,
                      const InstrumentMeta& meta) const;

    // (exit - entry) in price units x size x direction sign x unit value
    static double pnl(Direction direction, double entry, double exit, double size,
                      const InstrumentMeta& meta);

    static double unrealized(const Position& position, double price, const InstrumentMeta& meta);

private:
    TradeRecord fill(const Position& position, double size, double price, TimestampMs ts,
                     ExitReason reason, const InstrumentMeta& meta) const;

    ManagementConfig config_;
};

} // namespace risk
} // namespace confluence
