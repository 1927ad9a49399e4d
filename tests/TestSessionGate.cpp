#include "strategy/SessionGate.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace confluence;
using namespace confluence::strategy;

namespace {
const TimestampMs MIDNIGHT = 1700006400000LL; // 2023-11-15 00:00 UTC

TimestampMs at(int hours, int minutes) {
    return MIDNIGHT + (hours * 60 + minutes) * MS_PER_MINUTE;
}

bool throwsRuntime(const std::string& text) {
    try {
        parseMinuteOfDay(text);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void testMinuteParsing() {
    assert(parseMinuteOfDay("00:00") == 0);
    assert(parseMinuteOfDay("07:30") == 450);
    assert(parseMinuteOfDay("24:00") == 1440);
    assert(throwsRuntime("7:30"));
    assert(throwsRuntime("07:60"));
    assert(throwsRuntime("24:01"));
    assert(throwsRuntime("ab:cd"));

    assert(SessionGate::minuteOfDay(at(13, 45)) == 825);
    assert(SessionGate::minuteOfDay(MIDNIGHT - MS_PER_MINUTE) == 1439);

    std::cout << "[TEST] session minute parsing PASSED\n";
}

void testDefaultWindows() {
    SessionConfig cfg;
    cfg.enabled = true;
    const SessionGate gate(cfg);

    assert(!gate.isOpen(at(0, 0)));
    assert(!gate.isOpen(at(6, 45)));
    assert(gate.isOpen(at(7, 0)));
    assert(gate.sessionAt(at(7, 0)) == std::string("london"));
    // overlap reports the first window listed
    assert(gate.sessionAt(at(13, 0)) == std::string("london"));
    assert(gate.sessionAt(at(16, 0)) == std::string("new_york"));
    assert(gate.isOpen(at(20, 45)));
    assert(!gate.isOpen(at(21, 0)));
    assert(!gate.sessionAt(at(22, 0)));

    // disabled admits every bar
    const SessionGate open_gate{SessionConfig{}};
    assert(open_gate.isOpen(at(3, 0)));

    std::cout << "[TEST] default session windows PASSED\n";
}

void testWindowWrapsMidnight() {
    SessionConfig cfg;
    cfg.enabled = true;
    cfg.windows = {{"asia_late", 22 * 60, 2 * 60}};
    const SessionGate gate(cfg);

    assert(gate.isOpen(at(23, 0)));
    assert(gate.isOpen(at(0, 30)));
    assert(gate.isOpen(at(1, 59)));
    assert(!gate.isOpen(at(2, 0)));
    assert(!gate.isOpen(at(12, 0)));

    std::cout << "[TEST] window wraps midnight PASSED\n";
}
}

int main() {
    testMinuteParsing();
    testDefaultWindows();
    testWindowWrapsMidnight();

    std::cout << "[TEST] SessionGate PASSED\n";
    return 0;
}
