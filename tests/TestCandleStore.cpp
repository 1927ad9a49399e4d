#include "market/CandleStore.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace confluence;

namespace {
const TimestampMs T0 = 1700006400000LL;   // 2023-11-15 00:00 UTC
const TimestampMs M15 = 15 * MS_PER_MINUTE;

Candle bar(TimestampMs ts, double o, double h, double l, double c, double v = 1.0) {
    return Candle(o, h, l, c, v, ts);
}
}

int main() {
    market::CandleStore store;

    // append keeps strictly increasing order
    store.append("EURUSD", Resolution::M15, bar(T0, 1.0, 1.1, 0.9, 1.05));
    store.append("EURUSD", Resolution::M15, bar(T0 + M15, 1.05, 1.2, 1.0, 1.1));
    bool threw = false;
    try {
        store.append("EURUSD", Resolution::M15, bar(T0 + M15, 1.1, 1.2, 1.0, 1.15));
    } catch (const OutOfOrderDataError& e) {
        threw = true;
        assert(e.previous() == T0 + M15);
        assert(e.offending() == T0 + M15);
    }
    assert(threw);
    assert(store.series("EURUSD", Resolution::M15).size() == 2);

    // a bad batch stores nothing
    threw = false;
    try {
        store.appendAll("EURUSD", Resolution::M15, {
            bar(T0 + 2 * M15, 1.1, 1.2, 1.0, 1.1),
            bar(T0 + 4 * M15, 1.1, 1.2, 1.0, 1.1),
            bar(T0 + 3 * M15, 1.1, 1.2, 1.0, 1.1)
        });
    } catch (const OutOfOrderDataError&) {
        threw = true;
    }
    assert(threw);
    assert(store.series("EURUSD", Resolution::M15).size() == 2);

    // window is bounded by end_ts and count
    store.appendAll("EURUSD", Resolution::M15, {
        bar(T0 + 2 * M15, 1.10, 1.30, 1.05, 1.25),
        bar(T0 + 3 * M15, 1.25, 1.35, 1.20, 1.30)
    });
    auto window = store.window("EURUSD", Resolution::M15, T0 + 2 * M15, 2);
    assert(window.size() == 2);
    assert(window.front().timestamp == T0 + M15);
    assert(window.back().timestamp == T0 + 2 * M15);
    assert(store.window("EURUSD", Resolution::M15, T0 - 1, 5).empty());

    assert(!store.has("EURUSD", Resolution::H1));
    bool missing = false;
    try {
        store.series("GBPUSD", Resolution::M15);
    } catch (const std::out_of_range&) {
        missing = true;
    }
    assert(missing);

    // four M15 bars make one H1 bar
    store.resampleInto("EURUSD", Resolution::M15, Resolution::H1);
    const auto& h1 = store.series("EURUSD", Resolution::H1);
    assert(h1.size() == 1);
    assert(h1[0].timestamp == T0);
    assert(std::abs(h1[0].open - 1.0) < 1e-12);
    assert(std::abs(h1[0].high - 1.35) < 1e-12);
    assert(std::abs(h1[0].low - 0.9) < 1e-12);
    assert(std::abs(h1[0].close - 1.30) < 1e-12);
    assert(std::abs(h1[0].volume - 4.0) < 1e-12);

    bool rejected = false;
    try {
        market::CandleStore::resample(h1, Resolution::H1, Resolution::M15);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    assert(store.instruments().size() == 1);

    std::cout << "[TEST] CandleStore PASSED\n";
    return 0;
}
