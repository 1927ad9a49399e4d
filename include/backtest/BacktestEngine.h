#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analytics/TimeframeAnalyzer.h"
#include "common/Config.h"
#include "common/Types.h"
#include "core/contracts/ICheckpointStore.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/ITradingPermission.h"
#include "market/CandleStore.h"
#include "risk/AccountState.h"
#include "risk/PositionManager.h"
#include "risk/PositionSizer.h"
#include "strategy/ConfluenceScorer.h"
#include "strategy/SessionGate.h"

namespace confluence {
namespace backtest {

enum class InstrumentPhase { IDLE, SIGNAL_PENDING, POSITION_OPEN, ABORTED };

std::string instrumentPhaseToString(InstrumentPhase phase);

struct EquityPoint {
    TimestampMs timestamp = 0;
    double balance = 0.0;
    double equity = 0.0;
};

// Deterministic multi-instrument replay. Execution bars of all instruments
// are processed in timestamp order (ties by symbol); coarser resolutions are
// fed only once their bar has fully closed.
class BacktestEngine {
public:
    struct Result {
        struct InstrumentSummary {
            std::string symbol;
            size_t bars = 0;
            int signals = 0;
            int trades = 0;
            int wins = 0;
            double net_pnl = 0.0;
            int anomalies = 0;
            bool aborted = false;
            std::string abort_reason;
            std::map<std::string, int> dropped_signals;    // by reason
        };

        double initial_balance = 0.0;
        double final_balance = 0.0;
        double total_profit = 0.0;
        double return_pct = 0.0;

        // per closed position (partial fills folded in)
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double largest_win = 0.0;
        double largest_loss = 0.0;
        double profit_factor = 0.0;
        double expectancy = 0.0;

        double max_drawdown = 0.0;
        double max_drawdown_pct = 0.0;
        double sharpe_ratio = 0.0;
        double recovery_factor = 0.0;

        std::map<std::string, int> exit_reason_counts;     // per fill
        std::vector<risk::TradeRecord> trades;             // every fill, in close order
        std::vector<double> position_pnls;                 // net P&L per closed position
        std::vector<EquityPoint> equity_curve;
        std::vector<InstrumentSummary> instruments;
    };

    explicit BacktestEngine(const AppConfig& config,
                            std::shared_ptr<core::ITradingPermission> permission = nullptr,
                            std::shared_ptr<core::IEventJournal> journal = nullptr);

    void addInstrument(const risk::InstrumentMeta& meta);

    // Appends bars for one resolution. Out-of-order data aborts that
    // instrument only and returns false.
    bool addSeries(const std::string& symbol, Resolution resolution, const std::vector<Candle>& candles);

    // Registers every configured instrument and loads its data files
    void loadData();

    // step() until the data is exhausted, then finish()
    void run();

    // Processes every execution bar sharing the next timestamp. False when nothing remains.
    bool step();

    std::optional<TimestampMs> nextTimestamp();

    // Force-closes open positions at the last processed close. Idempotent.
    void finish();

    // Scores the current bar. Never yields a second Signal for the same bar,
    // while a position is open, or on the bar a position closed.
    std::optional<strategy::Signal> pollSignal(const std::string& symbol);

    // Session window, then embargo check, then sizing through the account
    // state, then open. False when the signal was dropped.
    bool submitSignal(const strategy::Signal& signal);

    // When disabled, step() only advances bars and positions; entries come
    // from pollSignal()/submitSignal()
    void setAutoTrade(bool enabled) { auto_trade_ = enabled; }

    InstrumentPhase phase(const std::string& symbol) const;
    std::optional<risk::Position> openPosition(const std::string& symbol) const;
    std::optional<analytics::TimeframeSnapshot> snapshot(const std::string& symbol, Resolution resolution) const;
    const risk::AccountState& account() const { return account_; }

    Result getResult() const;

    bool saveCheckpoint(core::ICheckpointStore& store) const;

    // Call after loadData() and before the first step(). Analyzer state is
    // rebuilt by replaying bars up to each instrument's saved timestamp.
    bool restoreCheckpoint(core::ICheckpointStore& store);

private:
    struct InstrumentRun {
        risk::InstrumentMeta meta;
        InstrumentPhase phase = InstrumentPhase::IDLE;
        std::unique_ptr<analytics::TimeframeAnalyzer> macro;
        std::unique_ptr<analytics::TimeframeAnalyzer> intermediate;
        std::unique_ptr<analytics::TimeframeAnalyzer> execution;
        size_t exec_cursor = 0;         // next execution bar to process
        size_t macro_cursor = 0;
        size_t intermediate_cursor = 0;
        long long last_signal_bar = -1;
        long long last_close_bar = -1;
        std::optional<risk::Position> position;
        int position_count = 0;
        Result::InstrumentSummary summary;
    };

    void prepare();
    void prepareInstrument(InstrumentRun& run);
    void processBar(InstrumentRun& run, const Candle& bar);
    void advanceAnalyzers(InstrumentRun& run, const Candle& bar);
    void feedCoarser(InstrumentRun& run, analytics::TimeframeAnalyzer& analyzer, Resolution resolution,
                     size_t& cursor, TimestampMs closed_through);
    void applyFills(InstrumentRun& run, const std::vector<risk::TradeRecord>& fills, bool closed);
    void dropSignal(InstrumentRun& run, const strategy::Signal& signal, const std::string& reason);
    void abort(InstrumentRun& run, const std::string& reason);
    void recordEquity(TimestampMs ts);
    void journal(const core::JournalEvent& event);

    const std::vector<Candle>* series(const InstrumentRun& run, Resolution resolution) const;
    long long currentBar(const InstrumentRun& run) const;
    std::string positionId(const InstrumentRun& run) const;

    AppConfig config_;
    std::shared_ptr<core::ITradingPermission> permission_;
    std::shared_ptr<core::IEventJournal> journal_;

    market::CandleStore store_;
    strategy::ConfluenceScorer scorer_;
    strategy::SessionGate sessions_;
    risk::PositionSizer sizer_;
    risk::PositionManager manager_;
    risk::AccountState account_;

    std::map<std::string, InstrumentRun> instruments_;
    std::vector<risk::TradeRecord> trades_;
    std::vector<double> position_pnls_;
    std::vector<EquityPoint> equity_curve_;
    TimestampMs clock_ = 0;
    bool prepared_ = false;
    bool finished_ = false;
    bool auto_trade_ = true;
};

} // namespace backtest
} // namespace confluence
