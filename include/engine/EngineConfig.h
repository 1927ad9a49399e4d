#pragma once

#include <string>

#include "common/Types.h"
#include "risk/RiskConfig.h"

namespace confluence {
namespace engine {

// Replay engine settings
struct EngineConfig {
    double initial_balance = 10000.0;

    // analysis resolutions
    Resolution macro_resolution = Resolution::D1;
    Resolution intermediate_resolution = Resolution::H4;
    Resolution execution_resolution = Resolution::M15;

    // inclusive UTC dates "YYYY-MM-DD", empty for unbounded
    std::string start_date;
    std::string end_date;

    // execution bars before the scorer is consulted
    int warmup_bars = 50;

    risk::RiskConfig risk;
    risk::ManagementConfig management;

    // persistence (empty disables)
    std::string journal_path;
    std::string checkpoint_path;

    // Monte Carlo
    int monte_carlo_simulations = 1000;
    unsigned int monte_carlo_seed = 42;
    double ruin_drawdown = 0.5;     // fraction of peak equity
};

} // namespace engine
} // namespace confluence
