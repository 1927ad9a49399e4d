#pragma once

#include "risk/InstrumentMeta.h"
#include "risk/RiskConfig.h"

namespace confluence {
namespace risk {

struct OrderSize {
    double size = 0.0;
    double raw_size = 0.0;              // before clamps and rounding
    double risk_amount = 0.0;           // balance x risk_fraction x multiplier
    double stop_distance_units = 0.0;   // |entry - stop| in price units
    bool anomaly = false;               // raw size failed the sanity bound
    bool clamped = false;               // a class or global max applied
};

class PositionSizer {
public:
    explicit PositionSizer(RiskConfig config);

    // raw = balance x risk_fraction x multiplier / (stop units x unit_value), then
    // class max, global max, min-increment rounding (down). An anomalous raw size is
    // forced to one increment, which must itself fit under both caps.
    // Throws RiskError instead of ever returning an unsafe size.
    OrderSize size(double balance, double entry, double stop,
                   const InstrumentMeta& meta, double multiplier = 1.0) const;

    double classMax(InstrumentClass cls) const;

    const RiskConfig& config() const { return config_; }

private:
    RiskConfig config_;
};

} // namespace risk
} // namespace confluence
