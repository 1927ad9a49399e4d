#include "risk/PositionSizer.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "common/Errors.h"
#include "common/Logger.h"

namespace confluence {
namespace risk {

namespace {
constexpr double ROUNDING_EPSILON = 1e-9;
}

PositionSizer::PositionSizer(RiskConfig config)
    : config_(std::move(config)) {}

double PositionSizer::classMax(InstrumentClass cls) const {
    auto it = config_.class_max_size.find(cls);
    if (it == config_.class_max_size.end()) {
        return config_.global_max_size;
    }
    return it->second;
}

OrderSize PositionSizer::size(double balance, double entry, double stop,
                              const InstrumentMeta& meta, double multiplier) const {
    if (!meta.isResolved()) {
        std::ostringstream oss;
        oss << meta.symbol << ": unit value " << meta.unit_value << " / pip size " << meta.pip_size
            << " not resolved";
        throw RiskError(RiskErrorKind::UNRESOLVED_UNIT_VALUE, oss.str());
    }
    if (!std::isfinite(balance) || balance <= 0.0) {
        throw RiskError(RiskErrorKind::NON_POSITIVE_BALANCE,
                        meta.symbol + ": balance " + std::to_string(balance));
    }

    OrderSize out;
    out.stop_distance_units = meta.toPriceUnits(std::abs(entry - stop));
    if (!std::isfinite(out.stop_distance_units) || out.stop_distance_units <= 0.0) {
        throw RiskError(RiskErrorKind::NON_POSITIVE_STOP_DISTANCE,
                        meta.symbol + ": stop distance must be positive");
    }

    const double increment = meta.min_increment;
    if (!std::isfinite(increment) || increment <= 0.0) {
        throw RiskError(RiskErrorKind::UNRESOLVED_MIN_INCREMENT,
                        meta.symbol + ": min increment " + std::to_string(increment) + " not resolved");
    }
    const double cap = std::min(classMax(meta.instrument_class), config_.global_max_size);

    const double mult = std::isfinite(multiplier) ? std::clamp(multiplier, 0.0, 1.0) : 1.0;
    out.risk_amount = balance * config_.risk_fraction * mult;
    out.raw_size = out.risk_amount / (out.stop_distance_units * meta.unit_value);

    if (out.raw_size > config_.sanity_multiple * config_.global_max_size) {
        out.anomaly = true;
        LOG_ERROR("{}: anomalous raw size {:.4f} (stop {:.2f} units, unit value {}); forcing to {}",
                  meta.symbol, out.raw_size, out.stop_distance_units, meta.unit_value, increment);
        if (increment > cap + ROUNDING_EPSILON) {
            throw RiskError(RiskErrorKind::BELOW_MIN_INCREMENT,
                            meta.symbol + ": min increment " + std::to_string(increment) +
                            " exceeds size cap " + std::to_string(cap));
        }
        out.size = increment;
        return out;
    }

    double sized = out.raw_size;
    if (sized > cap) {
        sized = cap;
        out.clamped = true;
    }

    const double steps = std::floor(sized / increment + ROUNDING_EPSILON);
    out.size = steps * increment;
    if (out.size < increment) {
        throw RiskError(RiskErrorKind::BELOW_MIN_INCREMENT,
                        meta.symbol + ": size " + std::to_string(sized) + " below minimum increment");
    }
    return out;
}

} // namespace risk
} // namespace confluence
