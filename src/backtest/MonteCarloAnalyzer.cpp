#include "backtest/MonteCarloAnalyzer.h"

#include <algorithm>
#include <numeric>
#include <random>

#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

namespace confluence {
namespace backtest {

namespace {
const int PERCENTILES[] = {5, 25, 50, 75, 95};
}

MonteCarloAnalyzer::MonteCarloAnalyzer(MonteCarloConfig config)
    : config_(config) {}

int MonteCarloAnalyzer::longestLosingStreak(const std::vector<double>& pnls) {
    int longest = 0;
    int current = 0;
    for (double pnl : pnls) {
        if (pnl < 0.0) {
            longest = std::max(longest, ++current);
        } else {
            current = 0;
        }
    }
    return longest;
}

double MonteCarloAnalyzer::maxDrawdownFraction(const std::vector<double>& pnls, double initial_balance) {
    double equity = initial_balance;
    double peak = initial_balance;
    double worst = 0.0;
    for (double pnl : pnls) {
        equity += pnl;
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            worst = std::max(worst, (peak - equity) / peak);
        }
    }
    return worst;
}

MonteCarloResult MonteCarloAnalyzer::analyze(const std::vector<double>& pnls, double initial_balance) const {
    MonteCarloResult result;
    result.trades = pnls.size();
    result.longest_losing_streak = longestLosingStreak(pnls);
    if (pnls.empty() || config_.simulations <= 0) {
        LOG_WARN("Monte Carlo skipped: {} trades, {} simulations", pnls.size(), config_.simulations);
        return result;
    }

    std::mt19937 rng(config_.seed);
    std::vector<double> sequence = pnls;
    std::vector<double> finals;
    std::vector<double> drawdowns;
    finals.reserve(static_cast<size_t>(config_.simulations));
    drawdowns.reserve(static_cast<size_t>(config_.simulations));

    int profitable = 0;
    int ruined = 0;
    for (int i = 0; i < config_.simulations; ++i) {
        std::shuffle(sequence.begin(), sequence.end(), rng);
        const double final_equity = initial_balance + std::accumulate(sequence.begin(), sequence.end(), 0.0);
        const double drawdown = maxDrawdownFraction(sequence, initial_balance);
        finals.push_back(final_equity);
        drawdowns.push_back(drawdown);
        if (final_equity > initial_balance) ++profitable;
        if (drawdown >= config_.ruin_drawdown) ++ruined;
    }

    result.simulations = config_.simulations;
    for (int pct : PERCENTILES) {
        result.final_equity_percentiles[pct] = analytics::TechnicalIndicators::calculatePercentile(finals, pct);
        result.max_drawdown_percentiles[pct] = analytics::TechnicalIndicators::calculatePercentile(drawdowns, pct);
    }
    result.mean_final_equity = std::accumulate(finals.begin(), finals.end(), 0.0) / finals.size();
    result.probability_of_profit = static_cast<double>(profitable) / config_.simulations;
    result.probability_of_ruin = static_cast<double>(ruined) / config_.simulations;

    LOG_INFO("Monte Carlo ({} runs, seed {}): median final equity {:.2f}, P(profit) {:.1f}%, P(ruin) {:.1f}%",
             config_.simulations, config_.seed, result.final_equity_percentiles[50],
             result.probability_of_profit * 100.0, result.probability_of_ruin * 100.0);
    return result;
}

} // namespace backtest
} // namespace confluence
