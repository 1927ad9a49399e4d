#include "risk/AccountState.h"

#include "common/Logger.h"

namespace confluence {
namespace risk {

AccountState::AccountState(double initial_balance, double daily_loss_limit, int max_daily_trades)
    : daily_loss_limit_(daily_loss_limit),
      max_daily_trades_(max_daily_trades),
      balance_(initial_balance),
      equity_(initial_balance),
      day_start_balance_(initial_balance) {}

void AccountState::rollDay(TimestampMs ts) {
    const long long day = dayKey(ts);
    if (has_day_ && day == day_) {
        return;
    }
    if (has_day_ && suspended_) {
        LOG_INFO("New trading day, daily loss suspension lifted (loss was {:.2f})", daily_loss_);
    }
    has_day_ = true;
    day_ = day;
    daily_loss_ = 0.0;
    trades_today_ = 0;
    suspended_ = false;
    day_start_balance_ = balance_;
}

Admission AccountState::sizeAndCommit(TimestampMs ts, const std::function<OrderSize(double balance)>& sizer) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    rollDay(ts);

    Admission admission;
    if (suspended_) {
        admission.status = AdmissionStatus::DAILY_LOSS_SUSPENDED;
        return admission;
    }
    if (max_daily_trades_ > 0 && trades_today_ >= max_daily_trades_) {
        admission.status = AdmissionStatus::DAILY_TRADE_LIMIT;
        return admission;
    }

    admission.order = sizer(balance_);
    ++open_positions_;
    ++trades_today_;
    return admission;
}

void AccountState::realize(double pnl, TimestampMs ts, bool closes_position) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    rollDay(ts);

    balance_ += pnl;
    if (closes_position && open_positions_ > 0) {
        --open_positions_;
    }
    if (pnl < 0.0) {
        daily_loss_ += -pnl;
        const double threshold = daily_loss_limit_ * day_start_balance_;
        if (!suspended_ && daily_loss_limit_ > 0.0 && daily_loss_ >= threshold) {
            suspended_ = true;
            LOG_WARN("Daily loss {:.2f} reached limit {:.2f}; new signals suspended for the day",
                     daily_loss_, threshold);
        }
    }
    if (open_positions_ == 0) {
        equity_ = balance_;
    }
}

void AccountState::markToMarket(double unrealized_pnl) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    equity_ = balance_ + unrealized_pnl;
}

bool AccountState::isSuspended(TimestampMs ts) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    rollDay(ts);
    return suspended_;
}

double AccountState::balance() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return balance_;
}

double AccountState::equity() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return equity_;
}

int AccountState::openPositions() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return open_positions_;
}

double AccountState::dailyLoss() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return daily_loss_;
}

AccountSnapshot AccountState::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    AccountSnapshot snap;
    snap.balance = balance_;
    snap.equity = equity_;
    snap.open_positions = open_positions_;
    snap.daily_loss = daily_loss_;
    snap.day_start_balance = day_start_balance_;
    snap.day = day_;
    snap.trades_today = trades_today_;
    snap.suspended = suspended_;
    return snap;
}

void AccountState::restore(const AccountSnapshot& snapshot) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    balance_ = snapshot.balance;
    equity_ = snapshot.equity;
    open_positions_ = snapshot.open_positions;
    daily_loss_ = snapshot.daily_loss;
    day_start_balance_ = snapshot.day_start_balance;
    day_ = snapshot.day;
    has_day_ = true;
    trades_today_ = snapshot.trades_today;
    suspended_ = snapshot.suspended;
}

} // namespace risk
} // namespace confluence
