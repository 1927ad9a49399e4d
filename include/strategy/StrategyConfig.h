#pragma once

namespace confluence {
namespace strategy {

// Relative weights; the scorer normalizes them so a full house scores exactly 100
struct ScorerWeights {
    double macro_trend = 25.0;
    double intermediate_structure = 20.0;
    double order_block = 20.0;
    double gap = 10.0;
    double sweep = 15.0;
    double range_position = 10.0;
};

struct ScorerConfig {
    ScorerWeights weights;
    double min_confidence = 60.0;

    // partial credits
    double neutral_trend_credit = 0.5;      // RANGING bias
    double range_zone_credit = 0.6;         // discount/premium outside the optimal band
    double breaker_credit = 0.8;            // breaker block standing in for an order block

    // size multipliers on conflicts
    double macro_conflict_multiplier = 0.5;
    double intermediate_conflict_multiplier = 0.8;

    // counter-macro setups need a sweep and a deep range position
    bool allow_counter_trend = true;
    double counter_trend_depth = 0.3;

    double stop_atr_buffer = 0.1;
    double min_reward_multiple = 2.0;
};

} // namespace strategy
} // namespace confluence
