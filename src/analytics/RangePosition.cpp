#include "analytics/RangePosition.h"

namespace confluence {
namespace analytics {

std::string priceZoneToString(PriceZone zone) {
    switch (zone) {
        case PriceZone::DISCOUNT: return "DISCOUNT";
        case PriceZone::EQUILIBRIUM: return "EQUILIBRIUM";
        case PriceZone::PREMIUM: return "PREMIUM";
    }
    return "EQUILIBRIUM";
}

RangeReading RangePosition::evaluate(double price, double swing_high, double swing_low,
                                     const RangeConfig& config) {
    RangeReading reading;
    reading.swing_high = swing_high;
    reading.swing_low = swing_low;
    if (!(swing_high > swing_low)) {
        return reading;
    }

    reading.valid = true;
    reading.position = (price - swing_low) / (swing_high - swing_low);

    if (reading.position < config.discount_threshold) {
        reading.zone = PriceZone::DISCOUNT;
        reading.optimal = reading.position >= config.optimal_low &&
                          reading.position <= config.optimal_high;
    } else if (reading.position > config.premium_threshold) {
        reading.zone = PriceZone::PREMIUM;
        reading.optimal = reading.position >= 1.0 - config.optimal_high &&
                          reading.position <= 1.0 - config.optimal_low;
    }
    return reading;
}

} // namespace analytics
} // namespace confluence
