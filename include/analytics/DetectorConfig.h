#pragma once

#include <cstddef>
#include <map>

#include "common/Types.h"

namespace confluence {
namespace analytics {

struct StructureConfig {
    int confirm_window = 3;                 // bars on each side of a swing
    double displacement_multiplier = 1.2;   // 0 disables the displacement filter
    int displacement_lookback = 10;
    size_t max_swings = 64;
};

struct OrderBlockConfig {
    // Follow-through body / base body. Stricter on fast resolutions.
    std::map<Resolution, double> impulse_ratio = {
        {Resolution::M1, 2.0}, {Resolution::M5, 1.8}, {Resolution::M15, 1.5},
        {Resolution::M30, 1.5}, {Resolution::H1, 1.3}, {Resolution::H4, 1.2},
        {Resolution::D1, 1.2}
    };
    double default_impulse_ratio = 1.5;
    double wick_allowance = 0.1;            // fraction of the base bar range
    size_t max_zones_per_side = 10;
    int max_age_bars = 50;
};

struct GapConfig {
    std::map<Resolution, double> min_gap_pips = {
        {Resolution::M1, 2.0}, {Resolution::M5, 3.0}, {Resolution::M15, 5.0},
        {Resolution::M30, 6.0}, {Resolution::H1, 8.0}, {Resolution::H4, 12.0},
        {Resolution::D1, 20.0}
    };
    double default_min_gap_pips = 5.0;
    size_t max_zones_per_side = 10;
    int max_age_bars = 100;
};

// Broken order blocks kept as zones of the opposite polarity
struct BreakerConfig {
    bool enabled = true;
    size_t max_zones_per_side = 10;
    int max_age_bars = 100;
};

struct SweepConfig {
    double equal_tolerance_atr = 0.1;       // equal highs/lows band, in ATR
    double penetration_atr = 0.05;          // wick must clear the level by this much
    bool track_session_levels = true;       // previous UTC day high/low
    size_t max_levels_per_side = 20;
    int recent_sweep_bars = 10;
};

struct RangeConfig {
    double discount_threshold = 0.45;
    double premium_threshold = 0.55;
    // discount optimal band; the premium band is its mirror
    double optimal_low = 0.214;
    double optimal_high = 0.382;
};

struct DetectorConfig {
    StructureConfig structure;
    OrderBlockConfig order_block;
    GapConfig gap;
    BreakerConfig breaker;
    SweepConfig sweep;
    RangeConfig range;
    int atr_period = 14;
    size_t window_bars = 200;
};

} // namespace analytics
} // namespace confluence
