#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/MonteCarloAnalyzer.h"
#include "core/state/CheckpointStoreJson.h"
#include "core/state/EventJournalJsonl.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace confluence;

namespace {

struct CliOptions {
    std::string config_path;
    bool json_mode = false;
    std::string checkpoint_path;
    bool resume = false;
    std::string until_date;
    int monte_carlo = -1;
    std::string log_level;
    double initial_balance = -1.0;
};

void printUsage() {
    std::cerr << "Usage: confluence --backtest <config.json> [options]\n"
              << "  --json                 print the summary as JSON on stdout\n"
              << "  --checkpoint <path>    save a checkpoint when the replay stops\n"
              << "  --resume               continue from the checkpoint\n"
              << "  --until <YYYY-MM-DD>   stop before the first bar of that UTC day\n"
              << "  --monte-carlo <N>      trade-order simulations (0 disables)\n"
              << "  --initial-balance <X>  override engine.initial_balance\n"
              << "  --log-level <level>    trace, debug, info, warn, error\n";
}

std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    if (argc < 3 || std::string(argv[1]) != "--backtest") {
        return std::nullopt;
    }
    CliOptions options;
    options.config_path = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--json") {
            options.json_mode = true;
        } else if (arg == "--resume") {
            options.resume = true;
        } else if (arg == "--checkpoint" && has_value) {
            options.checkpoint_path = argv[++i];
        } else if (arg == "--until" && has_value) {
            options.until_date = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            options.log_level = argv[++i];
        } else if (arg == "--monte-carlo" && has_value) {
            options.monte_carlo = std::stoi(argv[++i]);
        } else if (arg == "--initial-balance" && has_value) {
            options.initial_balance = std::stod(argv[++i]);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        }
    }
    return options;
}

nlohmann::json resultToJson(const backtest::BacktestEngine::Result& result,
                            const std::optional<backtest::MonteCarloResult>& monte_carlo) {
    nlohmann::json j;
    j["initial_balance"] = result.initial_balance;
    j["final_balance"] = result.final_balance;
    j["total_profit"] = result.total_profit;
    j["return_pct"] = result.return_pct;
    j["total_trades"] = result.total_trades;
    j["winning_trades"] = result.winning_trades;
    j["losing_trades"] = result.losing_trades;
    j["win_rate"] = result.win_rate;
    j["avg_win"] = result.avg_win;
    j["avg_loss"] = result.avg_loss;
    j["largest_win"] = result.largest_win;
    j["largest_loss"] = result.largest_loss;
    j["profit_factor"] = result.profit_factor;
    j["expectancy"] = result.expectancy;
    j["max_drawdown"] = result.max_drawdown;
    j["max_drawdown_pct"] = result.max_drawdown_pct;
    j["sharpe_ratio"] = result.sharpe_ratio;
    j["recovery_factor"] = result.recovery_factor;
    j["exit_reason_counts"] = result.exit_reason_counts;

    j["instruments"] = nlohmann::json::array();
    for (const auto& s : result.instruments) {
        j["instruments"].push_back({
            {"symbol", s.symbol},
            {"bars", s.bars},
            {"signals", s.signals},
            {"trades", s.trades},
            {"wins", s.wins},
            {"net_pnl", s.net_pnl},
            {"anomalies", s.anomalies},
            {"aborted", s.aborted},
            {"abort_reason", s.abort_reason},
            {"dropped_signals", s.dropped_signals}
        });
    }

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        j["trades"].push_back(risk::toJson(trade));
    }
    j["equity_curve"] = nlohmann::json::array();
    for (const auto& point : result.equity_curve) {
        j["equity_curve"].push_back({{"timestamp", point.timestamp}, {"balance", point.balance},
                                     {"equity", point.equity}});
    }

    if (monte_carlo) {
        nlohmann::json mc;
        mc["simulations"] = monte_carlo->simulations;
        mc["probability_of_profit"] = monte_carlo->probability_of_profit;
        mc["probability_of_ruin"] = monte_carlo->probability_of_ruin;
        mc["longest_losing_streak"] = monte_carlo->longest_losing_streak;
        mc["mean_final_equity"] = monte_carlo->mean_final_equity;
        for (const auto& entry : monte_carlo->final_equity_percentiles) {
            mc["final_equity_percentiles"]["p" + std::to_string(entry.first)] = entry.second;
        }
        for (const auto& entry : monte_carlo->max_drawdown_percentiles) {
            mc["max_drawdown_percentiles"]["p" + std::to_string(entry.first)] = entry.second;
        }
        j["monte_carlo"] = mc;
    }
    return j;
}

void printSummary(const backtest::BacktestEngine::Result& result,
                  const std::optional<backtest::MonteCarloResult>& monte_carlo) {
    std::cout << "\nBacktest result\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial balance:  " << result.initial_balance << "\n";
    std::cout << "Final balance:    " << result.final_balance << "\n";
    std::cout << "Total profit:     " << result.total_profit << " (" << result.return_pct << "%)\n";
    std::cout << "Max drawdown:     " << result.max_drawdown << " (" << result.max_drawdown_pct * 100.0 << "%)\n";
    std::cout << "Trades:           " << result.total_trades
              << " (won " << result.winning_trades << ", lost " << result.losing_trades << ")\n";
    std::cout << "Win rate:         " << result.win_rate * 100.0 << "%\n";
    std::cout << "Avg win / loss:   " << result.avg_win << " / " << result.avg_loss << "\n";
    std::cout << "Largest win/loss: " << result.largest_win << " / " << result.largest_loss << "\n";
    std::cout << std::setprecision(3);
    std::cout << "Profit factor:    " << result.profit_factor << "\n";
    std::cout << "Expectancy:       " << result.expectancy << " per trade\n";
    std::cout << "Sharpe (daily):   " << result.sharpe_ratio << "\n";
    std::cout << "Recovery factor:  " << result.recovery_factor << "\n";

    if (!result.exit_reason_counts.empty()) {
        std::cout << "Exits:\n";
        for (const auto& entry : result.exit_reason_counts) {
            std::cout << "  - " << entry.first << ": " << entry.second << "\n";
        }
    }
    std::cout << "Instruments:\n";
    for (const auto& s : result.instruments) {
        std::cout << "  - " << s.symbol << " | bars=" << s.bars << " | signals=" << s.signals
                  << " | trades=" << s.trades << " | pnl=" << std::setprecision(2) << s.net_pnl;
        if (s.anomalies > 0) {
            std::cout << " | anomalies=" << s.anomalies;
        }
        if (s.aborted) {
            std::cout << " | ABORTED: " << s.abort_reason;
        }
        std::cout << "\n";
        for (const auto& drop : s.dropped_signals) {
            std::cout << "      dropped " << drop.first << ": " << drop.second << "\n";
        }
    }

    if (monte_carlo && monte_carlo->simulations > 0) {
        std::cout << "Monte Carlo (" << monte_carlo->simulations << " runs):\n";
        for (const auto& entry : monte_carlo->final_equity_percentiles) {
            std::cout << "  final equity p" << entry.first << ": " << entry.second << "\n";
        }
        for (const auto& entry : monte_carlo->max_drawdown_percentiles) {
            std::cout << "  max drawdown p" << entry.first << ": " << entry.second * 100.0 << "%\n";
        }
        std::cout << "  P(profit): " << monte_carlo->probability_of_profit * 100.0 << "%"
                  << ", P(ruin): " << monte_carlo->probability_of_ruin * 100.0 << "%"
                  << ", longest losing streak: " << monte_carlo->longest_losing_streak << "\n";
    }
    std::cout << "---------------------------------------------\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<CliOptions> options;
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        return 2;
    }
    if (!options) {
        printUsage();
        return 2;
    }

    try {
        if (!std::filesystem::exists(options->config_path)) {
            std::cerr << "Config file not found: " << options->config_path << "\n";
            return 1;
        }
        AppConfig config = Config::load(options->config_path);
        if (options->initial_balance > 0.0) {
            config.engine.initial_balance = options->initial_balance;
        }
        if (!options->checkpoint_path.empty()) {
            config.engine.checkpoint_path = options->checkpoint_path;
        }
        if (options->monte_carlo >= 0) {
            config.engine.monte_carlo_simulations = options->monte_carlo;
        }

        Logger::getInstance().initialize(
            config.logging.dir, options->log_level.empty() ? config.logging.level : options->log_level);
        LOG_INFO("Starting backtest with config {}", options->config_path);

        std::shared_ptr<core::IEventJournal> journal;
        if (!config.engine.journal_path.empty()) {
            journal = std::make_shared<core::EventJournalJsonl>(config.engine.journal_path);
        }

        backtest::BacktestEngine engine(config, nullptr, journal);
        engine.loadData();

        std::unique_ptr<core::CheckpointStoreJson> checkpoints;
        if (!config.engine.checkpoint_path.empty()) {
            checkpoints = std::make_unique<core::CheckpointStoreJson>(config.engine.checkpoint_path);
        }
        if (options->resume) {
            if (!checkpoints) {
                std::cerr << "--resume needs --checkpoint or engine.checkpoint_path\n";
                return 2;
            }
            if (!engine.restoreCheckpoint(*checkpoints)) {
                LOG_WARN("Nothing resumed, replaying from the first bar");
            }
        }

        if (!options->until_date.empty()) {
            if (!checkpoints) {
                std::cerr << "--until needs --checkpoint or engine.checkpoint_path\n";
                return 2;
            }
            const TimestampMs until = backtest::DataHistory::parseDate(options->until_date);
            while (true) {
                const auto next = engine.nextTimestamp();
                if (!next || *next >= until) {
                    break;
                }
                engine.step();
            }
            if (!engine.saveCheckpoint(*checkpoints)) {
                return 1;
            }
            std::cout << "Checkpoint written to " << config.engine.checkpoint_path << "\n";
            return 0;
        }

        engine.run();
        if (checkpoints && !engine.saveCheckpoint(*checkpoints)) {
            std::cerr << "Checkpoint could not be written to " << config.engine.checkpoint_path << "\n";
        }

        const auto result = engine.getResult();
        std::optional<backtest::MonteCarloResult> monte_carlo;
        if (config.engine.monte_carlo_simulations > 0) {
            backtest::MonteCarloConfig mc_config;
            mc_config.simulations = config.engine.monte_carlo_simulations;
            mc_config.seed = config.engine.monte_carlo_seed;
            mc_config.ruin_drawdown = config.engine.ruin_drawdown;
            monte_carlo = backtest::MonteCarloAnalyzer(mc_config).analyze(result.position_pnls,
                                                                          result.initial_balance);
        }

        if (options->json_mode) {
            std::cout << resultToJson(result, monte_carlo).dump() << "\n";
        } else {
            printSummary(result, monte_carlo);
        }
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
