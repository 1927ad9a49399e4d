#include "risk/PositionSizer.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>

using namespace confluence;
using namespace confluence::risk;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

InstrumentMeta forex(double unit_value = 10.0) {
    InstrumentMeta meta;
    meta.symbol = "EURUSD";
    meta.instrument_class = InstrumentClass::FOREX;
    meta.unit_value = unit_value;
    meta.pip_size = 0.0001;
    meta.min_increment = 0.01;
    return meta;
}

RiskErrorKind kindOf(const std::function<void()>& call) {
    try {
        call();
    } catch (const RiskError& e) {
        return e.kind();
    }
    assert(false && "expected RiskError");
    return RiskErrorKind::UNRESOLVED_UNIT_VALUE;
}

void testReferenceSize() {
    PositionSizer sizer{RiskConfig{}};
    const auto order = sizer.size(10000.0, 1.2500, 1.2450, forex());
    assert(near(order.stop_distance_units, 50.0, 1e-6));
    assert(near(order.risk_amount, 100.0));
    assert(near(order.size, 0.20));
    assert(!order.anomaly);
    assert(!order.clamped);

    // short side, same distance
    assert(near(sizer.size(10000.0, 1.2450, 1.2500, forex()).size, 0.20));

    // conflict multiplier halves the risk
    assert(near(sizer.size(10000.0, 1.2500, 1.2450, forex(), 0.5).size, 0.10));

    std::cout << "[TEST] reference size PASSED\n";
}

void testUnitValueDoesNotEscapeBounds() {
    RiskConfig cfg;
    PositionSizer sizer{cfg};
    const double class_max = sizer.classMax(InstrumentClass::FOREX);

    const auto heavy = sizer.size(10000.0, 1.2500, 1.2450, forex(100.0));
    assert(near(heavy.size, 0.02));
    assert(!heavy.anomaly);

    const auto tiny = sizer.size(10000.0, 1.2500, 1.2450, forex(0.0001));
    assert(tiny.anomaly);
    assert(tiny.raw_size > cfg.sanity_multiple * cfg.global_max_size);
    assert(near(tiny.size, 0.01));

    for (const auto& order : {heavy, tiny}) {
        assert(order.size <= class_max);
        assert(order.size <= cfg.global_max_size);
    }

    // an anomaly is forced to one increment, and that increment obeys the caps too
    InstrumentMeta gold;
    gold.symbol = "XAUUSD";
    gold.instrument_class = InstrumentClass::METAL;
    gold.pip_size = 0.01;
    gold.min_increment = 1.0;
    gold.unit_value = 0.0001;
    bool refused = false;
    try {
        sizer.size(10000.0, 2000.0, 1999.0, gold);
    } catch (const RiskError& e) {
        refused = e.kind() == RiskErrorKind::BELOW_MIN_INCREMENT;
    }
    assert(refused);

    // same instrument with a sane unit value is refused the same way
    gold.unit_value = 1.0;
    assert(kindOf([&] { sizer.size(10000.0, 2000.0, 1999.0, gold); }) ==
           RiskErrorKind::BELOW_MIN_INCREMENT);

    gold.min_increment = 0.5;
    gold.unit_value = 0.0001;
    const auto capped = sizer.size(10000.0, 2000.0, 1999.0, gold);
    assert(capped.anomaly);
    assert(near(capped.size, 0.5));
    assert(capped.size <= sizer.classMax(InstrumentClass::METAL));

    std::cout << "[TEST] unit value bounds PASSED\n";
}

void testClamps() {
    RiskConfig cfg;
    cfg.class_max_size[InstrumentClass::INDEX] = 5.0;
    PositionSizer sizer{cfg};

    InstrumentMeta gold = forex();
    gold.symbol = "XAUUSD";
    gold.instrument_class = InstrumentClass::METAL;
    // raw 2.0 against a metal cap of 0.5
    auto order = sizer.size(10000.0, 1.2500, 1.2495, gold);
    assert(near(order.raw_size, 2.0, 1e-6));
    assert(order.clamped);
    assert(near(order.size, 0.5));

    InstrumentMeta index = forex();
    index.symbol = "US500";
    index.instrument_class = InstrumentClass::INDEX;
    // raw 4.0: class cap 5.0 lets it through, global cap 2.0 does not
    order = sizer.size(10000.0, 1.25000, 1.24975, index);
    assert(near(order.raw_size, 4.0, 1e-6));
    assert(order.clamped);
    assert(near(order.size, cfg.global_max_size));

    // rounding is always down to the increment
    InstrumentMeta coarse = forex();
    coarse.min_increment = 0.1;
    assert(near(sizer.size(10000.0, 1.2500, 1.2450, coarse, 0.99).size, 0.1));

    std::cout << "[TEST] class and global clamps PASSED\n";
}

void testRiskErrors() {
    PositionSizer sizer{RiskConfig{}};

    assert(kindOf([&] { sizer.size(10000.0, 1.25, 1.245, forex(0.0)); }) ==
           RiskErrorKind::UNRESOLVED_UNIT_VALUE);

    InstrumentMeta no_pip = forex();
    no_pip.pip_size = 0.0;
    assert(kindOf([&] { sizer.size(10000.0, 1.25, 1.245, no_pip); }) ==
           RiskErrorKind::UNRESOLVED_UNIT_VALUE);

    assert(kindOf([&] { sizer.size(10000.0, 1.25, 1.25, forex()); }) ==
           RiskErrorKind::NON_POSITIVE_STOP_DISTANCE);

    assert(kindOf([&] { sizer.size(0.0, 1.25, 1.245, forex()); }) ==
           RiskErrorKind::NON_POSITIVE_BALANCE);
    assert(kindOf([&] { sizer.size(-50.0, 1.25, 1.245, forex()); }) ==
           RiskErrorKind::NON_POSITIVE_BALANCE);

    InstrumentMeta no_step = forex();
    no_step.min_increment = 0.0;
    assert(kindOf([&] { sizer.size(10000.0, 1.25, 1.245, no_step); }) ==
           RiskErrorKind::UNRESOLVED_MIN_INCREMENT);
    no_step.min_increment = -0.01;
    assert(kindOf([&] { sizer.size(10000.0, 1.25, 1.245, no_step); }) ==
           RiskErrorKind::UNRESOLVED_MIN_INCREMENT);

    // 2000-unit stop: raw 0.005, under one increment
    assert(kindOf([&] { sizer.size(10000.0, 1.25, 1.05, forex()); }) ==
           RiskErrorKind::BELOW_MIN_INCREMENT);

    std::cout << "[TEST] risk errors PASSED\n";
}
}

int main() {
    testReferenceSize();
    testUnitValueDoesNotEscapeBounds();
    testClamps();
    testRiskErrors();

    std::cout << "[TEST] PositionSizer PASSED\n";
    return 0;
}
