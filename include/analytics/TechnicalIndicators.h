#pragma once

#include <vector>
#include "common/Types.h"

namespace confluence {
namespace analytics {

class TechnicalIndicators {
public:
    // ATR (Average True Range), Wilder smoothing. 0 until period + 1 bars exist.
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    static double calculateSMA(const std::vector<double>& values, int period);

    // Sample standard deviation around `mean`
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);

    // Linear-interpolated percentile of an unsorted sample, pct in [0, 100]
    static double calculatePercentile(std::vector<double> values, double pct);
};

} // namespace analytics
} // namespace confluence
