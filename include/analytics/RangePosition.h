#pragma once

#include <string>

#include "analytics/DetectorConfig.h"

namespace confluence {
namespace analytics {

enum class PriceZone { DISCOUNT, EQUILIBRIUM, PREMIUM };

struct RangeReading {
    bool valid = false;
    double position = 0.5;      // 0 at swing low, 1 at swing high
    PriceZone zone = PriceZone::EQUILIBRIUM;
    bool optimal = false;       // inside the discount or premium optimal band
    double swing_high = 0.0;
    double swing_low = 0.0;
};

std::string priceZoneToString(PriceZone zone);

class RangePosition {
public:
    // Invalid reading when the range is empty or inverted
    static RangeReading evaluate(double price, double swing_high, double swing_low,
                                 const RangeConfig& config);
};

} // namespace analytics
} // namespace confluence
