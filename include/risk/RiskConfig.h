#pragma once

#include <map>

#include "risk/InstrumentMeta.h"

namespace confluence {
namespace risk {

struct RiskConfig {
    double risk_fraction = 0.01;            // of balance per trade
    std::map<InstrumentClass, double> class_max_size = {
        {InstrumentClass::FOREX, 1.0},
        {InstrumentClass::METAL, 0.5},
        {InstrumentClass::INDEX, 2.0},
        {InstrumentClass::CRYPTO, 1.0}
    };
    double global_max_size = 2.0;           // applies regardless of any computed value
    double sanity_multiple = 10.0;          // raw > multiple x global max is an anomaly
    double daily_loss_limit = 0.05;         // of start-of-day balance
    int max_daily_trades = 5;               // 0 disables
};

// Thresholds in R (multiples of the initial stop distance)
struct ManagementConfig {
    bool trailing_enabled = true;
    double trailing_start_r = 2.0;
    double trailing_distance_r = 1.0;

    bool breakeven_enabled = true;
    double breakeven_trigger_r = 1.0;
    double breakeven_offset_pips = 2.0;

    bool partial_enabled = true;
    double partial_close_r = 1.5;
    double partial_fraction = 0.5;
};

} // namespace risk
} // namespace confluence
