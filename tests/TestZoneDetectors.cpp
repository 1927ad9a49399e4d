#include "analytics/BreakerDetector.h"
#include "analytics/GapDetector.h"
#include "analytics/OrderBlockDetector.h"
#include "analytics/RangePosition.h"
#include "analytics/SweepDetector.h"
#include "analytics/TimeframeAnalyzer.h"
#include "analytics/Zone.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace confluence;
using namespace confluence::analytics;

namespace {
const TimestampMs T0 = 1700006400000LL; // 2023-11-15 00:00 UTC
const TimestampMs STEP = 15 * MS_PER_MINUTE;

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

Candle bar(long long index, double open, double high, double low, double close) {
    return Candle(open, high, low, close, 100.0, T0 + index * STEP);
}

void testTransitions() {
    assert(canTransition(ZoneKind::ORDER_BLOCK, ZoneStatus::FRESH, ZoneStatus::TESTED));
    assert(canTransition(ZoneKind::ORDER_BLOCK, ZoneStatus::FRESH, ZoneStatus::INVALIDATED));
    assert(canTransition(ZoneKind::GAP, ZoneStatus::TESTED, ZoneStatus::INVALIDATED));
    assert(!canTransition(ZoneKind::ORDER_BLOCK, ZoneStatus::TESTED, ZoneStatus::FRESH));
    assert(!canTransition(ZoneKind::GAP, ZoneStatus::INVALIDATED, ZoneStatus::TESTED));
    assert(canTransition(ZoneKind::GAP, ZoneStatus::INVALIDATED, ZoneStatus::FLIPPED));
    assert(!canTransition(ZoneKind::ORDER_BLOCK, ZoneStatus::INVALIDATED, ZoneStatus::FLIPPED));
    assert(!canTransition(ZoneKind::LIQUIDITY, ZoneStatus::INVALIDATED, ZoneStatus::FLIPPED));
    assert(!canTransition(ZoneKind::GAP, ZoneStatus::FRESH, ZoneStatus::FLIPPED));
    assert(!canTransition(ZoneKind::GAP, ZoneStatus::FLIPPED, ZoneStatus::INVALIDATED));

    ZoneBook book(2);
    for (std::uint64_t id = 1; id <= 3; ++id) {
        Zone zone;
        zone.id = id;
        zone.formed_bar = static_cast<long long>(id);
        book.add(zone);
    }
    assert(book.zones(Polarity::BULLISH).size() == 2);
    assert(book.zones(Polarity::BULLISH).front().id == 2);
    assert(!book.flip(2));  // FRESH order block cannot flip
    assert(book.retire(3));
    assert(!book.retire(3));
    assert(book.size() == 1);

    std::cout << "[TEST] zone transitions PASSED\n";
}

void testOrderBlock() {
    OrderBlockDetector fast(OrderBlockConfig{}, Resolution::M1);
    OrderBlockDetector slow(OrderBlockConfig{}, Resolution::H4);
    assert(near(fast.impulseRatio(), 2.0));
    assert(near(slow.impulseRatio(), 1.2));

    const Candle base = bar(0, 1.1010, 1.1015, 1.0995, 1.1000);
    const Candle follow = bar(1, 1.1000, 1.1035, 1.0998, 1.1030);

    auto zone = OrderBlockDetector::detect(base, follow, 2.0, 0.1);
    assert(zone);
    assert(zone->polarity == Polarity::BULLISH);
    assert(near(zone->price_low, 1.0993));
    assert(near(zone->price_high, 1.1017));
    assert(zone->formed_at == follow.timestamp);

    // follow-through not impulsive enough
    assert(!OrderBlockDetector::detect(base, follow, 4.0, 0.1));

    // bullish follow that stays inside the base range
    const Candle weak = bar(1, 1.1000, 1.1014, 1.0998, 1.1012);
    assert(!OrderBlockDetector::detect(base, weak, 0.5, 0.1));

    Zone ob = *zone;
    auto next = OrderBlockDetector::nextStatus(ob, bar(2, 1.1030, 1.1032, 1.1010, 1.1025));
    assert(next && *next == ZoneStatus::TESTED);
    assert(ZoneBook::advance(ob, *next));
    // already tested, a second touch is not a new status
    assert(!OrderBlockDetector::nextStatus(ob, bar(3, 1.1025, 1.1030, 1.1012, 1.1020)));
    next = OrderBlockDetector::nextStatus(ob, bar(4, 1.1020, 1.1021, 1.0985, 1.0990));
    assert(next && *next == ZoneStatus::INVALIDATED);
    assert(ZoneBook::advance(ob, *next));
    assert(!ob.isActive());
    assert(!OrderBlockDetector::nextStatus(ob, bar(5, 1.0990, 1.1050, 1.0980, 1.1040)));

    std::vector<Candle> window = {base, follow};
    auto events = fast.update(window, 1);
    assert(events.size() == 1 && events[0].type == ZoneEventType::FORMED);
    assert(fast.book().active(Polarity::BULLISH).size() == 1);

    std::cout << "[TEST] order block detection PASSED\n";
}

void testBreakerBlocks() {
    OrderBlockDetector obs(OrderBlockConfig{}, Resolution::M1);
    BreakerDetector breakers(BreakerConfig{});
    std::vector<Candle> window;

    auto feed = [&](const Candle& candle) {
        window.push_back(candle);
        const auto index = static_cast<long long>(window.size());
        const auto ob_events = obs.update(window, index);
        auto events = breakers.update(candle, index, ob_events);
        return std::make_pair(ob_events, events);
    };

    feed(bar(0, 1.1010, 1.1015, 1.0995, 1.1000));
    auto step = feed(bar(1, 1.1000, 1.1035, 1.0998, 1.1030));
    assert(step.first.size() == 1 && step.first[0].type == ZoneEventType::FORMED);
    assert(step.second.empty());
    const std::uint64_t ob_id = step.first[0].zone.id;

    feed(bar(2, 1.1030, 1.1032, 1.1010, 1.1025));     // order block tested
    step = feed(bar(3, 1.1020, 1.1021, 1.0985, 1.0990));
    assert(step.first.size() == 1 && step.first[0].type == ZoneEventType::INVALIDATED);

    // the broken bullish block comes back as bearish resistance on the same band
    assert(step.second.size() == 1 && step.second[0].type == ZoneEventType::FORMED);
    const Zone breaker = step.second[0].zone;
    assert(breaker.kind == ZoneKind::BREAKER);
    assert(breaker.polarity == Polarity::BEARISH);
    assert(breaker.source_id == ob_id);
    assert(near(breaker.price_low, 1.0993) && near(breaker.price_high, 1.1017));
    assert(breaker.status == ZoneStatus::FRESH);
    assert(breaker.formed_at == T0 + 3 * STEP);
    assert(breakers.book().active(Polarity::BEARISH).size() == 1);

    step = feed(bar(4, 1.0990, 1.1000, 1.0980, 1.0985));
    assert(step.second.size() == 1 && step.second[0].type == ZoneEventType::TESTED);
    step = feed(bar(5, 1.0985, 1.1005, 1.0982, 1.0990));
    assert(step.second.empty());
    assert(breakers.book().zones(Polarity::BEARISH).front().test_count == 2);

    step = feed(bar(6, 1.0990, 1.1025, 1.0988, 1.1022));
    assert(step.second.size() == 1 && step.second[0].type == ZoneEventType::INVALIDATED);
    assert(breakers.book().size() == 0);

    // bullish breaker: support from a broken bearish block
    Zone support = BreakerDetector::fromBrokenOrderBlock(
        [] { Zone ob; ob.id = 4; ob.polarity = Polarity::BEARISH; ob.price_low = 1.0990; ob.price_high = 1.1010; return ob; }());
    assert(support.polarity == Polarity::BULLISH && support.source_id == 4);
    auto next = BreakerDetector::nextStatus(support, bar(7, 1.1030, 1.1032, 1.1005, 1.1020));
    assert(next && *next == ZoneStatus::TESTED);
    assert(!BreakerDetector::nextStatus(support, bar(7, 1.1030, 1.1040, 1.1015, 1.1035)));
    next = BreakerDetector::nextStatus(support, bar(8, 1.1000, 1.1002, 1.0975, 1.0980));
    assert(next && *next == ZoneStatus::INVALIDATED);

    // disabled: broken blocks are not kept
    BreakerConfig off;
    off.enabled = false;
    BreakerDetector disabled(off);
    Zone broken;
    broken.kind = ZoneKind::ORDER_BLOCK;
    broken.status = ZoneStatus::INVALIDATED;
    assert(disabled.update(bar(9, 1.1, 1.1, 1.1, 1.1), 9, {{ZoneEventType::INVALIDATED, broken, T0}}).empty());
    assert(disabled.book().size() == 0);

    // through the analyzer: the breaker shows up in the snapshot
    TimeframeAnalyzer analyzer(Resolution::M15, DetectorConfig{}, 0.0001);
    analyzer.update(bar(0, 1.1010, 1.1015, 1.0995, 1.1000));
    analyzer.update(bar(1, 1.1000, 1.1035, 1.0998, 1.1030));
    analyzer.update(bar(2, 1.1030, 1.1032, 1.1010, 1.1025));
    const auto events = analyzer.update(bar(3, 1.1020, 1.1021, 1.0985, 1.0990));
    bool formed = false;
    for (const auto& event : events) {
        formed = formed || (event.type == ZoneEventType::FORMED && event.zone.kind == ZoneKind::BREAKER);
    }
    assert(formed);
    const auto snap = analyzer.snapshot();
    assert(snap.breakers.size() == 1);
    assert(snap.breakers[0].polarity == Polarity::BEARISH);
    assert(snap.order_blocks.empty());

    std::cout << "[TEST] breaker blocks PASSED\n";
}

void testGapLifecycle() {
    GapDetector detector(GapConfig{}, Resolution::M15, 0.0001);
    assert(near(detector.minGap(), 0.0005));

    std::vector<Candle> window;
    long long index = 0;
    auto feed = [&](const Candle& c) {
        window.push_back(c);
        return detector.update(window, index++);
    };

    // steady uptrend, overlapping bars, no imbalance
    for (int i = 0; i < 15; ++i) {
        const double b = 1.1000 + 0.0005 * i;
        auto events = feed(bar(i, b, b + 0.0010, b - 0.0002, b + 0.0006));
        assert(events.empty());
    }

    assert(feed(bar(15, 1.1076, 1.1112, 1.1074, 1.1110)).empty());

    auto events = feed(bar(16, 1.1110, 1.1130, 1.1100, 1.1125));
    assert(events.size() == 1);
    assert(events[0].type == ZoneEventType::FORMED);
    const Zone formed = events[0].zone;
    assert(formed.polarity == Polarity::BULLISH);
    assert(near(formed.price_low, 1.1080));
    assert(near(formed.price_high, 1.1100));
    assert(formed.formed_at == T0 + 15 * STEP);
    assert(formed.status == ZoneStatus::FRESH);

    events = feed(bar(17, 1.1118, 1.1120, 1.1090, 1.1115));
    assert(events.size() == 1);
    assert(events[0].type == ZoneEventType::TESTED);
    assert(near(events[0].zone.fill_pct, 50.0, 1e-6));
    assert(events[0].zone.test_count == 1);

    events = feed(bar(18, 1.1100, 1.1105, 1.1060, 1.1070));
    assert(events.size() == 1);
    assert(events[0].type == ZoneEventType::INVALIDATED);
    assert(near(events[0].zone.fill_pct, 100.0));
    assert(detector.book().active(Polarity::BULLISH).empty());

    // back into the lost gap, but not past its midpoint
    events = feed(bar(19, 1.1072, 1.1088, 1.1065, 1.1085));
    assert(events.empty());
    assert(detector.book().size() == 1);

    // close back above the midpoint reclaims it
    events = feed(bar(20, 1.1085, 1.1097, 1.1082, 1.1095));
    assert(events.size() == 1);
    assert(events[0].type == ZoneEventType::FLIPPED);
    assert(events[0].zone.polarity == Polarity::BEARISH);
    assert(events[0].zone.status == ZoneStatus::FLIPPED);
    assert(events[0].zone.id == formed.id);
    auto flipped = detector.book().active(Polarity::BEARISH);
    assert(flipped.size() == 1 && flipped[0].fill_pct == 0.0);
    assert(flipped[0].contains(1.1095));

    events = feed(bar(21, 1.1095, 1.1099, 1.1085, 1.1090));
    assert(events.empty());
    assert(detector.book().active(Polarity::BEARISH)[0].test_count == 1);

    events = feed(bar(22, 1.1090, 1.1110, 1.1088, 1.1105));
    assert(events.size() == 1);
    assert(events[0].type == ZoneEventType::RETIRED);
    assert(detector.book().size() == 0);

    std::cout << "[TEST] gap lifecycle PASSED\n";
}

void testSweeps() {
    SweepConfig cfg;
    cfg.track_session_levels = false;
    SweepDetector detector(cfg);
    const double atr = 0.0010;

    SwingPoint high;
    high.kind = SwingKind::HIGH;
    high.price = 1.2000;
    high.timestamp = T0;
    high.confirmed = true;
    high.confirmed_at = T0 + 3 * STEP;

    auto events = detector.update(bar(3, 1.1980, 1.1990, 1.1970, 1.1985), 3, {high}, atr);
    assert(events.size() == 1 && events[0].type == ZoneEventType::FORMED);
    assert(events[0].zone.polarity == Polarity::BEARISH);

    // nearly equal high merges into the same level
    SwingPoint equal = high;
    equal.price = 1.20005;
    events = detector.update(bar(4, 1.1985, 1.1995, 1.1975, 1.1990), 4, {equal}, atr);
    assert(events.empty());
    assert(detector.book().size() == 1);
    const Zone& merged = detector.book().zones(Polarity::BEARISH).front();
    assert(merged.equal_level);
    assert(near(merged.price_high, 1.20005));

    events = detector.update(bar(5, 1.1990, 1.2012, 1.1985, 1.1990), 5, {}, atr);
    assert(events.size() == 1 && events[0].type == ZoneEventType::SWEPT);
    auto sweeps = detector.recentSweeps(5);
    assert(sweeps.size() == 1);
    assert(sweeps[0].polarity == Polarity::BEARISH);
    assert(sweeps[0].equal_level);
    assert(near(sweeps[0].extreme, 1.2012));
    assert(detector.recentSweeps(15).size() == 1);
    assert(detector.recentSweeps(16).empty());

    Zone level;
    level.kind = ZoneKind::LIQUIDITY;
    level.polarity = Polarity::BEARISH;
    level.price_low = level.price_high = 1.2000;
    auto status = SweepDetector::nextStatus(level, bar(6, 1.1995, 1.2015, 1.1990, 1.2010), 0.00005);
    assert(status && *status == ZoneStatus::INVALIDATED);
    level.polarity = Polarity::BULLISH;
    status = SweepDetector::nextStatus(level, bar(6, 1.2005, 1.2010, 1.1990, 1.2002), 0.00005);
    assert(status && *status == ZoneStatus::TESTED);
    // wick did not clear the penetration allowance
    assert(!SweepDetector::nextStatus(level, bar(6, 1.2005, 1.2010, 1.19998, 1.2002), 0.00005));

    std::cout << "[TEST] liquidity sweeps PASSED\n";
}

void testSessionLevels() {
    SweepDetector detector(SweepConfig{});
    const TimestampMs day = MS_PER_DAY;
    assert(detector.update(Candle(1.25, 1.30, 1.20, 1.26, 1.0, T0), 0, {}, 0.01).empty());
    assert(detector.update(Candle(1.26, 1.28, 1.22, 1.27, 1.0, T0 + STEP), 1, {}, 0.01).empty());

    auto events = detector.update(Candle(1.27, 1.28, 1.26, 1.27, 1.0, T0 + day), 2, {}, 0.01);
    assert(events.size() == 2);
    const auto& highs = detector.book().zones(Polarity::BEARISH);
    const auto& lows = detector.book().zones(Polarity::BULLISH);
    assert(highs.size() == 1 && lows.size() == 1);
    assert(highs.front().session_level && near(highs.front().price_high, 1.30));
    assert(lows.front().session_level && near(lows.front().price_low, 1.20));

    std::cout << "[TEST] session levels PASSED\n";
}

void testRangePosition() {
    const RangeConfig cfg;

    auto r = RangePosition::evaluate(1.3, 2.0, 1.0, cfg);
    assert(r.valid && r.zone == PriceZone::DISCOUNT && r.optimal);
    assert(near(r.position, 0.3));

    r = RangePosition::evaluate(1.44, 2.0, 1.0, cfg);
    assert(r.zone == PriceZone::DISCOUNT && !r.optimal);

    r = RangePosition::evaluate(1.5, 2.0, 1.0, cfg);
    assert(r.zone == PriceZone::EQUILIBRIUM && !r.optimal);

    r = RangePosition::evaluate(1.7, 2.0, 1.0, cfg);
    assert(r.zone == PriceZone::PREMIUM && r.optimal);

    r = RangePosition::evaluate(1.9, 2.0, 1.0, cfg);
    assert(r.zone == PriceZone::PREMIUM && !r.optimal);

    assert(!RangePosition::evaluate(1.5, 1.0, 1.0, cfg).valid);
    assert(!RangePosition::evaluate(1.5, 1.0, 2.0, cfg).valid);

    std::cout << "[TEST] range position PASSED\n";
}

void testTimeframeSnapshot() {
    DetectorConfig cfg;
    cfg.structure.confirm_window = 2;
    cfg.structure.displacement_multiplier = 0.0;
    TimeframeAnalyzer analyzer(Resolution::M15, cfg, 0.0001);

    for (int i = 0; i < 30; ++i) {
        const double b = 1.1000 + 0.0010 * std::sin(i * 0.7);
        analyzer.update(bar(i, b, b + 0.0008, b - 0.0008, b + 0.0003));
    }
    auto snap = analyzer.snapshot();
    assert(snap.bars == 30);
    assert(snap.timestamp == T0 + 29 * STEP);
    assert(snap.atr > 0.0);
    for (const auto& zone : snap.order_blocks) {
        assert(zone.isActive() && zone.kind == ZoneKind::ORDER_BLOCK);
    }
    for (const auto& level : snap.liquidity) {
        assert(level.status == ZoneStatus::FRESH);
    }

    bool threw = false;
    try {
        analyzer.update(bar(10, 1.1, 1.1, 1.1, 1.1));
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);
    assert(analyzer.barCount() == 30);

    std::cout << "[TEST] timeframe snapshot PASSED\n";
}
}

int main() {
    testTransitions();
    testOrderBlock();
    testBreakerBlocks();
    testGapLifecycle();
    testSweeps();
    testSessionLevels();
    testRangePosition();
    testTimeframeSnapshot();

    std::cout << "[TEST] ZoneDetectors PASSED\n";
    return 0;
}
