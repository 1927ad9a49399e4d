#pragma once

#include <string>
#include <vector>

namespace confluence {

// Unix epoch milliseconds (UTC)
using TimestampMs = long long;

constexpr TimestampMs MS_PER_MINUTE = 60LL * 1000LL;
constexpr TimestampMs MS_PER_DAY = 24LL * 60LL * MS_PER_MINUTE;

enum class Direction { LONG, SHORT };

enum class Resolution { M1, M5, M15, M30, H1, H4, D1 };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    double body() const { return close >= open ? close - open : open - close; }
    double range() const { return high - low; }
    bool isBullish() const { return close > open; }
    bool isBearish() const { return close < open; }
};

inline int directionSign(Direction d) {
    return d == Direction::LONG ? 1 : -1;
}

inline Direction opposite(Direction d) {
    return d == Direction::LONG ? Direction::SHORT : Direction::LONG;
}

inline const char* directionToString(Direction d) {
    return d == Direction::LONG ? "LONG" : "SHORT";
}

inline long long dayKey(TimestampMs ts) {
    // floor division keeps pre-epoch timestamps on the right day
    return ts >= 0 ? ts / MS_PER_DAY : -((-ts + MS_PER_DAY - 1) / MS_PER_DAY);
}

int resolutionMinutes(Resolution res);
TimestampMs resolutionMs(Resolution res);
std::string resolutionToString(Resolution res);

// Accepts "M15", "15m", "H4", "4h", "D1", "1d" (case-insensitive).
// Throws std::runtime_error on anything else.
Resolution parseResolution(const std::string& text);

} // namespace confluence
