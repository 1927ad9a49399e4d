#pragma once

#include <functional>
#include <mutex>

#include "common/Types.h"
#include "risk/PositionSizer.h"

namespace confluence {
namespace risk {

enum class AdmissionStatus { ADMITTED, DAILY_LOSS_SUSPENDED, DAILY_TRADE_LIMIT };

struct Admission {
    AdmissionStatus status = AdmissionStatus::ADMITTED;
    OrderSize order;

    bool admitted() const { return status == AdmissionStatus::ADMITTED; }
};

struct AccountSnapshot {
    double balance = 0.0;
    double equity = 0.0;
    int open_positions = 0;
    double daily_loss = 0.0;
    double day_start_balance = 0.0;
    long long day = 0;
    int trades_today = 0;
    bool suspended = false;
};

// Run-wide balance and daily loss bookkeeping. The only shared mutable state
// of a run, so every accessor locks.
class AccountState {
public:
    AccountState(double initial_balance, double daily_loss_limit, int max_daily_trades);

    // Single atomic step: roll the day, check suspension and trade cap, size
    // against the current balance, commit the open position. RiskError from
    // the sizer propagates and nothing is committed.
    Admission sizeAndCommit(TimestampMs ts, const std::function<OrderSize(double balance)>& sizer);

    // Books realized P&L. closes_position releases the open-position slot.
    void realize(double pnl, TimestampMs ts, bool closes_position);

    void markToMarket(double unrealized_pnl);

    bool isSuspended(TimestampMs ts);

    double balance() const;
    double equity() const;
    int openPositions() const;
    double dailyLoss() const;

    AccountSnapshot snapshot() const;
    void restore(const AccountSnapshot& snapshot);

private:
    void rollDay(TimestampMs ts);

    mutable std::recursive_mutex mutex_;
    double daily_loss_limit_;
    int max_daily_trades_;

    double balance_;
    double equity_;
    int open_positions_ = 0;
    double daily_loss_ = 0.0;
    double day_start_balance_;
    long long day_ = 0;
    bool has_day_ = false;
    int trades_today_ = 0;
    bool suspended_ = false;
};

} // namespace risk
} // namespace confluence
