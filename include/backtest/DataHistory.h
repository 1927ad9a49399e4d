#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace confluence {
namespace backtest {

// Candle files are returned in file order; ordering is validated by the CandleStore.
class DataHistory {
public:
    // Dispatches on the extension (.json, anything else is CSV)
    static std::vector<Candle> load(const std::string& file_path);

    // Expected format: time,open,high,low,close,volume. time is an epoch in
    // seconds or milliseconds, or a UTC "YYYY-MM-DD HH:MM:SS" datetime.
    // Unparseable rows are logged and skipped.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects with timestamp/open/high/low/close/volume (or t/o/h/l/c/v)
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Inclusive UTC dates "YYYY-MM-DD"; an empty bound is open.
    // Throws std::invalid_argument on a malformed date.
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);

    // Second-resolution epochs are scaled to milliseconds
    static TimestampMs toMsTimestamp(long long ts);

    static TimestampMs parseDate(const std::string& date);

    // "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" or the ISO "T" form, UTC
    static TimestampMs parseDateTime(const std::string& text);

    // Epoch digits or a datetime; partial parses throw std::invalid_argument
    static TimestampMs parseTimestampCell(const std::string& cell);
};

} // namespace backtest
} // namespace confluence
