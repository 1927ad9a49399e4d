#include "market/CandleStore.h"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "common/Errors.h"
#include "common/Logger.h"

namespace confluence {
namespace market {

namespace {
TimestampMs bucketStart(TimestampMs ts, TimestampMs duration) {
    TimestampMs q = ts / duration;
    if (ts % duration != 0 && ts < 0) {
        --q;
    }
    return q * duration;
}
}

void CandleStore::append(const std::string& instrument, Resolution resolution, const Candle& candle) {
    auto& bars = series_[Key(instrument, resolution)];
    if (!bars.empty() && candle.timestamp <= bars.back().timestamp) {
        throw OutOfOrderDataError(seriesName(instrument, resolution),
                                  bars.back().timestamp, candle.timestamp);
    }
    bars.push_back(candle);
}

void CandleStore::appendAll(const std::string& instrument, Resolution resolution,
                            const std::vector<Candle>& candles) {
    const Key key(instrument, resolution);
    auto it = series_.find(key);
    TimestampMs last = 0;
    bool has_last = false;
    if (it != series_.end() && !it->second.empty()) {
        last = it->second.back().timestamp;
        has_last = true;
    }

    for (const auto& candle : candles) {
        if (has_last && candle.timestamp <= last) {
            throw OutOfOrderDataError(seriesName(instrument, resolution), last, candle.timestamp);
        }
        last = candle.timestamp;
        has_last = true;
    }

    auto& bars = series_[key];
    bars.insert(bars.end(), candles.begin(), candles.end());
}

bool CandleStore::has(const std::string& instrument, Resolution resolution) const {
    auto it = series_.find(Key(instrument, resolution));
    return it != series_.end() && !it->second.empty();
}

const std::vector<Candle>& CandleStore::series(const std::string& instrument, Resolution resolution) const {
    auto it = series_.find(Key(instrument, resolution));
    if (it == series_.end()) {
        throw std::out_of_range("No series " + seriesName(instrument, resolution));
    }
    return it->second;
}

std::vector<Candle> CandleStore::window(const std::string& instrument, Resolution resolution,
                                        TimestampMs end_ts, size_t count) const {
    const auto& bars = series(instrument, resolution);
    auto end = std::upper_bound(bars.begin(), bars.end(), end_ts,
        [](TimestampMs ts, const Candle& c) { return ts < c.timestamp; });
    const auto available = static_cast<size_t>(std::distance(bars.begin(), end));
    const size_t take = std::min(count, available);
    return std::vector<Candle>(end - static_cast<std::ptrdiff_t>(take), end);
}

std::vector<std::string> CandleStore::instruments() const {
    std::set<std::string> names;
    for (const auto& entry : series_) {
        names.insert(entry.first.first);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

void CandleStore::resampleInto(const std::string& instrument, Resolution source, Resolution target) {
    auto resampled = resample(series(instrument, source), source, target);
    LOG_INFO("{}: resampled {} {} bars into {} {} bars",
             instrument, series(instrument, source).size(), resolutionToString(source),
             resampled.size(), resolutionToString(target));
    appendAll(instrument, target, resampled);
}

std::vector<Candle> CandleStore::resample(const std::vector<Candle>& source,
                                          Resolution source_resolution,
                                          Resolution target) {
    if (resolutionMinutes(target) <= resolutionMinutes(source_resolution)) {
        throw std::invalid_argument("Resample target " + resolutionToString(target) +
                                    " is not coarser than " + resolutionToString(source_resolution));
    }

    const TimestampMs duration = resolutionMs(target);
    std::vector<Candle> aggregated;
    aggregated.reserve(source.size() / static_cast<size_t>(
        resolutionMinutes(target) / resolutionMinutes(source_resolution)) + 1);

    for (const auto& bar : source) {
        const TimestampMs bucket = bucketStart(bar.timestamp, duration);
        if (aggregated.empty() || aggregated.back().timestamp != bucket) {
            aggregated.emplace_back(bar.open, bar.high, bar.low, bar.close, bar.volume, bucket);
            continue;
        }
        auto& out = aggregated.back();
        out.high = std::max(out.high, bar.high);
        out.low = std::min(out.low, bar.low);
        out.close = bar.close;
        out.volume += bar.volume;
    }

    return aggregated;
}

std::string CandleStore::seriesName(const std::string& instrument, Resolution resolution) {
    return instrument + "/" + resolutionToString(resolution);
}

} // namespace market
} // namespace confluence
