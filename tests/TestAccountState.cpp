#include "risk/AccountState.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

using namespace confluence;
using namespace confluence::risk;

namespace {
const TimestampMs DAY1 = 1700006400000LL; // 2023-11-15 00:00 UTC
const TimestampMs HOUR = 60 * MS_PER_MINUTE;

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

OrderSize fixedSize(double size) {
    OrderSize order;
    order.size = size;
    return order;
}

void testDailyLossSuspension() {
    AccountState account(10000.0, 0.05, 0);
    int sizer_calls = 0;
    auto sizer = [&](double balance) {
        ++sizer_calls;
        assert(balance > 0.0);
        return fixedSize(0.2);
    };

    auto admission = account.sizeAndCommit(DAY1 + HOUR, sizer);
    assert(admission.admitted());
    assert(near(admission.order.size, 0.2));
    assert(account.openPositions() == 1);

    account.realize(-300.0, DAY1 + 2 * HOUR, true);
    assert(near(account.balance(), 9700.0));
    assert(near(account.dailyLoss(), 300.0));
    assert(!account.isSuspended(DAY1 + 2 * HOUR));
    assert(account.openPositions() == 0);

    // limit is 5% of the start-of-day balance
    account.sizeAndCommit(DAY1 + 3 * HOUR, sizer);
    account.realize(-250.0, DAY1 + 4 * HOUR, true);
    assert(account.isSuspended(DAY1 + 4 * HOUR));

    const int calls_before = sizer_calls;
    admission = account.sizeAndCommit(DAY1 + 5 * HOUR, sizer);
    assert(admission.status == AdmissionStatus::DAILY_LOSS_SUSPENDED);
    assert(sizer_calls == calls_before);
    assert(account.openPositions() == 0);

    // next UTC day lifts the suspension
    admission = account.sizeAndCommit(DAY1 + MS_PER_DAY + HOUR, sizer);
    assert(admission.admitted());
    const auto snap = account.snapshot();
    assert(!snap.suspended);
    assert(near(snap.daily_loss, 0.0));
    assert(near(snap.day_start_balance, 9450.0));
    assert(snap.day == dayKey(DAY1 + MS_PER_DAY));

    std::cout << "[TEST] daily loss suspension PASSED\n";
}

void testTradeCap() {
    AccountState account(10000.0, 0.05, 3);
    auto sizer = [](double) { return fixedSize(0.1); };

    for (int i = 0; i < 3; ++i) {
        assert(account.sizeAndCommit(DAY1 + i * HOUR, sizer).admitted());
        account.realize(10.0, DAY1 + i * HOUR + 1, true);
    }
    assert(account.sizeAndCommit(DAY1 + 4 * HOUR, sizer).status == AdmissionStatus::DAILY_TRADE_LIMIT);
    assert(account.sizeAndCommit(DAY1 + MS_PER_DAY, sizer).admitted());

    std::cout << "[TEST] daily trade cap PASSED\n";
}

void testSizerErrorCommitsNothing() {
    AccountState account(10000.0, 0.05, 0);
    bool threw = false;
    try {
        account.sizeAndCommit(DAY1, [](double) -> OrderSize {
            throw RiskError(RiskErrorKind::NON_POSITIVE_STOP_DISTANCE, "flat stop");
        });
    } catch (const RiskError& e) {
        threw = e.kind() == RiskErrorKind::NON_POSITIVE_STOP_DISTANCE;
    }
    assert(threw);
    assert(account.openPositions() == 0);
    assert(account.snapshot().trades_today == 0);

    std::cout << "[TEST] sizer error commits nothing PASSED\n";
}

void testEquityAndRestore() {
    AccountState account(10000.0, 0.05, 0);
    account.sizeAndCommit(DAY1, [](double) { return fixedSize(0.2); });
    account.markToMarket(-120.0);
    assert(near(account.equity(), 9880.0));
    assert(near(account.balance(), 10000.0));

    // a partial fill keeps the slot open and the mark
    account.realize(50.0, DAY1 + HOUR, false);
    assert(account.openPositions() == 1);
    account.realize(-20.0, DAY1 + 2 * HOUR, true);
    assert(near(account.equity(), 10030.0));

    AccountState copy(1.0, 0.05, 0);
    copy.restore(account.snapshot());
    assert(near(copy.balance(), 10030.0));
    assert(near(copy.dailyLoss(), 20.0));
    assert(copy.snapshot().trades_today == 1);

    std::cout << "[TEST] equity and restore PASSED\n";
}

void testConcurrentRealize() {
    AccountState account(10000.0, 0.0, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&account]() {
            for (int i = 0; i < 250; ++i) {
                account.realize(1.0, DAY1, false);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    assert(near(account.balance(), 11000.0));

    std::cout << "[TEST] concurrent realize PASSED\n";
}
}

int main() {
    testDailyLossSuspension();
    testTradeCap();
    testSizerErrorCommitsNothing();
    testEquityAndRestore();
    testConcurrentRealize();

    std::cout << "[TEST] AccountState PASSED\n";
    return 0;
}
