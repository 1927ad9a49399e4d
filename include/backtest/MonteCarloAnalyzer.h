#pragma once

#include <cstddef>
#include <map>
#include <vector>

namespace confluence {
namespace backtest {

struct MonteCarloConfig {
    int simulations = 1000;
    unsigned int seed = 42;
    double ruin_drawdown = 0.5;     // fraction of peak equity
};

struct MonteCarloResult {
    int simulations = 0;
    std::size_t trades = 0;
    std::map<int, double> final_equity_percentiles;     // 5/25/50/75/95
    std::map<int, double> max_drawdown_percentiles;     // fraction of peak
    double mean_final_equity = 0.0;
    double probability_of_profit = 0.0;
    double probability_of_ruin = 0.0;
    int longest_losing_streak = 0;                      // of the original order
};

// Reorders the realized trade P&L sequence with a seeded generator to
// estimate how much of the result depends on trade order.
class MonteCarloAnalyzer {
public:
    explicit MonteCarloAnalyzer(MonteCarloConfig config);

    MonteCarloResult analyze(const std::vector<double>& pnls, double initial_balance) const;

    static int longestLosingStreak(const std::vector<double>& pnls);

    // Peak-to-trough drop of the cumulative equity path, as a fraction of the peak
    static double maxDrawdownFraction(const std::vector<double>& pnls, double initial_balance);

private:
    MonteCarloConfig config_;
};

} // namespace backtest
} // namespace confluence
