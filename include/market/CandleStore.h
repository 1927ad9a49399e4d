#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "common/Types.h"

namespace confluence {
namespace market {

// Append-only bar store keyed by (instrument, resolution).
// Timestamps inside a series are strictly increasing.
class CandleStore {
public:
    // Throws OutOfOrderDataError on a non-increasing timestamp; the series is left unchanged.
    void append(const std::string& instrument, Resolution resolution, const Candle& candle);

    // Validates the whole batch before storing any of it.
    void appendAll(const std::string& instrument, Resolution resolution,
                   const std::vector<Candle>& candles);

    bool has(const std::string& instrument, Resolution resolution) const;

    // Throws std::out_of_range for an unknown series
    const std::vector<Candle>& series(const std::string& instrument, Resolution resolution) const;

    // Last `count` bars with timestamp <= end_ts, oldest first
    std::vector<Candle> window(const std::string& instrument, Resolution resolution,
                               TimestampMs end_ts, size_t count) const;

    std::vector<std::string> instruments() const;

    // Builds `target` from `source` for one instrument and stores it
    void resampleInto(const std::string& instrument, Resolution source, Resolution target);

    // Calendar-bucket aggregation: bucket start = floor(ts / target duration).
    // Throws std::invalid_argument unless target is coarser than source.
    static std::vector<Candle> resample(const std::vector<Candle>& source,
                                        Resolution source_resolution,
                                        Resolution target);

private:
    using Key = std::pair<std::string, Resolution>;

    static std::string seriesName(const std::string& instrument, Resolution resolution);

    std::map<Key, std::vector<Candle>> series_;
};

} // namespace market
} // namespace confluence
