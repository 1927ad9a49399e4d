#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/JournalRecords.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "strategy/NewsEmbargo.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace confluence {
namespace backtest {

namespace {
constexpr int CHECKPOINT_SCHEMA_VERSION = 1;
constexpr double TRADING_DAYS_PER_YEAR = 252.0;

const char* admissionStatusToString(risk::AdmissionStatus status) {
    switch (status) {
        case risk::AdmissionStatus::ADMITTED: return "ADMITTED";
        case risk::AdmissionStatus::DAILY_LOSS_SUSPENDED: return "DAILY_LOSS_SUSPENDED";
        case risk::AdmissionStatus::DAILY_TRADE_LIMIT: return "DAILY_TRADE_LIMIT";
    }
    return "UNKNOWN";
}

InstrumentPhase parsePhase(const std::string& value) {
    if (value == "POSITION_OPEN") return InstrumentPhase::POSITION_OPEN;
    if (value == "ABORTED") return InstrumentPhase::ABORTED;
    // a checkpoint is only written between steps, so SIGNAL_PENDING resumes as IDLE
    return InstrumentPhase::IDLE;
}

analytics::Bias parseBias(const std::string& value) {
    if (value == "BULLISH") return analytics::Bias::BULLISH;
    if (value == "BEARISH") return analytics::Bias::BEARISH;
    return analytics::Bias::RANGING;
}

nlohmann::json summaryToJson(const BacktestEngine::Result::InstrumentSummary& s) {
    nlohmann::json j;
    j["bars"] = s.bars;
    j["signals"] = s.signals;
    j["trades"] = s.trades;
    j["wins"] = s.wins;
    j["net_pnl"] = s.net_pnl;
    j["anomalies"] = s.anomalies;
    j["aborted"] = s.aborted;
    j["abort_reason"] = s.abort_reason;
    j["dropped_signals"] = s.dropped_signals;
    return j;
}

void summaryFromJson(const nlohmann::json& j, BacktestEngine::Result::InstrumentSummary& s) {
    s.bars = j.value("bars", static_cast<size_t>(0));
    s.signals = j.value("signals", 0);
    s.trades = j.value("trades", 0);
    s.wins = j.value("wins", 0);
    s.net_pnl = j.value("net_pnl", 0.0);
    s.anomalies = j.value("anomalies", 0);
    s.aborted = j.value("aborted", false);
    s.abort_reason = j.value("abort_reason", std::string());
    if (j.contains("dropped_signals")) {
        s.dropped_signals = j["dropped_signals"].get<std::map<std::string, int>>();
    }
}
}

std::string instrumentPhaseToString(InstrumentPhase phase) {
    switch (phase) {
        case InstrumentPhase::IDLE: return "IDLE";
        case InstrumentPhase::SIGNAL_PENDING: return "SIGNAL_PENDING";
        case InstrumentPhase::POSITION_OPEN: return "POSITION_OPEN";
        case InstrumentPhase::ABORTED: return "ABORTED";
    }
    return "IDLE";
}

BacktestEngine::BacktestEngine(const AppConfig& config,
                               std::shared_ptr<core::ITradingPermission> permission,
                               std::shared_ptr<core::IEventJournal> journal)
    : config_(config),
      permission_(std::move(permission)),
      journal_(std::move(journal)),
      scorer_(config.scorer),
      sessions_(config.sessions),
      sizer_(config.engine.risk),
      manager_(config.engine.management),
      account_(config.engine.initial_balance,
               config.engine.risk.daily_loss_limit,
               config.engine.risk.max_daily_trades) {
    if (!permission_ && config_.embargo.enabled && !config_.events.empty()) {
        permission_ = std::make_shared<strategy::ScheduledEmbargoCalendar>(config_.embargo, config_.events);
    }
}

void BacktestEngine::addInstrument(const risk::InstrumentMeta& meta) {
    auto it = instruments_.find(meta.symbol);
    if (it != instruments_.end()) {
        LOG_WARN("Instrument {} registered twice, metadata replaced", meta.symbol);
        it->second.meta = meta;
        return;
    }
    InstrumentRun run;
    run.meta = meta;
    run.summary.symbol = meta.symbol;
    instruments_.emplace(meta.symbol, std::move(run));
}

bool BacktestEngine::addSeries(const std::string& symbol, Resolution resolution,
                               const std::vector<Candle>& candles) {
    auto it = instruments_.find(symbol);
    if (it == instruments_.end()) {
        LOG_ERROR("Series for unknown instrument {} ignored", symbol);
        return false;
    }
    if (prepared_) {
        LOG_WARN("{} {} series added after replay started, ignored", symbol, resolutionToString(resolution));
        return false;
    }
    auto& run = it->second;
    if (run.phase == InstrumentPhase::ABORTED) {
        return false;
    }
    try {
        store_.appendAll(symbol, resolution, candles);
    } catch (const OutOfOrderDataError& e) {
        abort(run, e.what());
        return false;
    }
    return true;
}

void BacktestEngine::loadData() {
    const auto& ec = config_.engine;
    for (const auto& spec : config_.instruments) {
        addInstrument(spec.meta);
        for (const auto& entry : spec.data_files) {
            auto candles = DataHistory::load(entry.second);
            if (!ec.start_date.empty() || !ec.end_date.empty()) {
                candles = DataHistory::filterByDate(candles, ec.start_date, ec.end_date);
            }
            if (candles.empty()) {
                LOG_WARN("{} {}: no candles in {}", spec.meta.symbol, resolutionToString(entry.first), entry.second);
                continue;
            }
            addSeries(spec.meta.symbol, entry.first, candles);
        }
    }
}

void BacktestEngine::prepare() {
    if (prepared_) {
        return;
    }
    prepared_ = true;
    if (instruments_.empty()) {
        LOG_WARN("Backtest has no instruments");
    }
    for (auto& entry : instruments_) {
        auto& run = entry.second;
        if (run.phase == InstrumentPhase::ABORTED) {
            continue;
        }
        try {
            prepareInstrument(run);
        } catch (const std::invalid_argument& e) {
            abort(run, e.what());
        }
    }
}

void BacktestEngine::prepareInstrument(InstrumentRun& run) {
    const auto& ec = config_.engine;
    const auto& symbol = run.meta.symbol;
    if (!store_.has(symbol, ec.execution_resolution)) {
        abort(run, "no " + resolutionToString(ec.execution_resolution) + " execution data");
        return;
    }
    for (Resolution res : {ec.macro_resolution, ec.intermediate_resolution}) {
        if (!store_.has(symbol, res)) {
            LOG_INFO("{}: resampling {} from {}", symbol, resolutionToString(res),
                     resolutionToString(ec.execution_resolution));
            store_.resampleInto(symbol, ec.execution_resolution, res);
        }
    }

    run.macro = std::make_unique<analytics::TimeframeAnalyzer>(
        ec.macro_resolution, config_.detectors, run.meta.pip_size);
    run.intermediate = std::make_unique<analytics::TimeframeAnalyzer>(
        ec.intermediate_resolution, config_.detectors, run.meta.pip_size);
    run.execution = std::make_unique<analytics::TimeframeAnalyzer>(
        ec.execution_resolution, config_.detectors, run.meta.pip_size);

    LOG_INFO("{}: {} execution bars ({} / {} / {})", symbol,
             store_.series(symbol, ec.execution_resolution).size(),
             resolutionToString(ec.macro_resolution), resolutionToString(ec.intermediate_resolution),
             resolutionToString(ec.execution_resolution));
}

const std::vector<Candle>* BacktestEngine::series(const InstrumentRun& run, Resolution resolution) const {
    if (!store_.has(run.meta.symbol, resolution)) {
        return nullptr;
    }
    return &store_.series(run.meta.symbol, resolution);
}

long long BacktestEngine::currentBar(const InstrumentRun& run) const {
    return static_cast<long long>(run.exec_cursor) - 1;
}

std::string BacktestEngine::positionId(const InstrumentRun& run) const {
    return run.meta.symbol + "#" + std::to_string(run.position_count);
}

std::optional<TimestampMs> BacktestEngine::nextTimestamp() {
    prepare();
    std::optional<TimestampMs> next;
    for (const auto& entry : instruments_) {
        const auto& run = entry.second;
        if (run.phase == InstrumentPhase::ABORTED) {
            continue;
        }
        const auto* exec = series(run, config_.engine.execution_resolution);
        if (!exec || run.exec_cursor >= exec->size()) {
            continue;
        }
        const TimestampMs ts = (*exec)[run.exec_cursor].timestamp;
        if (!next || ts < *next) {
            next = ts;
        }
    }
    return next;
}

bool BacktestEngine::step() {
    if (finished_) {
        return false;
    }
    const auto next = nextTimestamp();
    if (!next) {
        return false;
    }
    clock_ = *next;

    // std::map iteration breaks timestamp ties by symbol
    for (auto& entry : instruments_) {
        auto& run = entry.second;
        if (run.phase == InstrumentPhase::ABORTED) {
            continue;
        }
        const auto* exec = series(run, config_.engine.execution_resolution);
        if (!exec || run.exec_cursor >= exec->size()) {
            continue;
        }
        const Candle& bar = (*exec)[run.exec_cursor];
        if (bar.timestamp != clock_) {
            continue;
        }
        try {
            processBar(run, bar);
        } catch (const OutOfOrderDataError& e) {
            abort(run, e.what());
        }
    }
    recordEquity(clock_);
    return true;
}

void BacktestEngine::run() {
    while (step()) {
    }
    finish();

    const auto result = getResult();
    LOG_INFO("Backtest finished: {} trades, final balance {:.2f}, return {:.2f}%, max drawdown {:.2f}%",
             result.total_trades, result.final_balance, result.return_pct, result.max_drawdown_pct * 100.0);
}

void BacktestEngine::processBar(InstrumentRun& run, const Candle& bar) {
    const auto bar_index = static_cast<long long>(run.exec_cursor);

    // exits first: the position was opened on an earlier bar's close
    if (run.position) {
        auto outcome = manager_.onBar(*run.position, bar, run.meta);
        applyFills(run, outcome.fills, outcome.closed);
        if (outcome.closed) {
            run.last_close_bar = bar_index;
        } else if (outcome.stop_moved) {
            LOG_DEBUG("{}: stop moved to {:.5f}", run.meta.symbol, run.position->stop);
        }
    }

    advanceAnalyzers(run, bar);
    ++run.exec_cursor;
    ++run.summary.bars;

    if (auto_trade_) {
        if (auto signal = pollSignal(run.meta.symbol)) {
            submitSignal(*signal);
        }
    }
}

void BacktestEngine::advanceAnalyzers(InstrumentRun& run, const Candle& bar) {
    const auto& ec = config_.engine;
    const TimestampMs closed_through = bar.timestamp + resolutionMs(ec.execution_resolution);
    feedCoarser(run, *run.macro, ec.macro_resolution, run.macro_cursor, closed_through);
    feedCoarser(run, *run.intermediate, ec.intermediate_resolution, run.intermediate_cursor, closed_through);
    run.execution->update(bar);
}

void BacktestEngine::feedCoarser(InstrumentRun& run, analytics::TimeframeAnalyzer& analyzer,
                                 Resolution resolution, size_t& cursor, TimestampMs closed_through) {
    const auto* bars = series(run, resolution);
    if (!bars) {
        return;
    }
    const TimestampMs duration = resolutionMs(resolution);
    while (cursor < bars->size() && (*bars)[cursor].timestamp + duration <= closed_through) {
        analyzer.update((*bars)[cursor]);
        ++cursor;
    }
}

void BacktestEngine::applyFills(InstrumentRun& run, const std::vector<risk::TradeRecord>& fills, bool closed) {
    if (!run.position) {
        return;
    }
    const std::string id = positionId(run);
    for (size_t i = 0; i < fills.size(); ++i) {
        const auto& fill = fills[i];
        const bool closing = closed && i + 1 == fills.size();

        account_.realize(fill.pnl, fill.close_time, closing);
        run.position->realized_pnl += fill.pnl;
        run.summary.net_pnl += fill.pnl;
        trades_.push_back(fill);

        Logger::getInstance().logTrade(fill.instrument, directionToString(fill.direction), fill.entry,
                                       fill.exit, fill.size, fill.pnl, risk::exitReasonToString(fill.exit_reason));
        journal(positionFillEvent(fill, id, closing));
    }

    if (closed) {
        const double net = run.position->realized_pnl;
        position_pnls_.push_back(net);
        ++run.summary.trades;
        if (net > 0.0) {
            ++run.summary.wins;
        }
        run.position.reset();
        run.phase = InstrumentPhase::IDLE;
    }
}

std::optional<strategy::Signal> BacktestEngine::pollSignal(const std::string& symbol) {
    auto it = instruments_.find(symbol);
    if (it == instruments_.end()) {
        return std::nullopt;
    }
    auto& run = it->second;
    if (run.phase != InstrumentPhase::IDLE || !run.execution || run.exec_cursor == 0) {
        return std::nullopt;
    }
    const long long bar = currentBar(run);
    if (run.last_signal_bar == bar || run.last_close_bar == bar) {
        return std::nullopt;
    }
    if (run.execution->barCount() < static_cast<size_t>(std::max(0, config_.engine.warmup_bars))) {
        return std::nullopt;
    }

    strategy::MarketContext context;
    context.instrument = symbol;
    context.spread = run.meta.spread;
    context.macro = run.macro->snapshot();
    context.intermediate = run.intermediate->snapshot();
    context.execution = run.execution->snapshot();

    auto signal = scorer_.evaluate(context);
    if (!signal) {
        return std::nullopt;
    }
    run.last_signal_bar = bar;
    ++run.summary.signals;
    journal(signalEmittedEvent(*signal));
    return signal;
}

bool BacktestEngine::submitSignal(const strategy::Signal& signal) {
    auto it = instruments_.find(signal.instrument);
    if (it == instruments_.end()) {
        LOG_WARN("Signal for unknown instrument {} ignored", signal.instrument);
        return false;
    }
    auto& run = it->second;
    if (run.phase != InstrumentPhase::IDLE) {
        LOG_WARN("{}: signal ignored in phase {}", signal.instrument, instrumentPhaseToString(run.phase));
        return false;
    }
    run.phase = InstrumentPhase::SIGNAL_PENDING;

    if (!sessions_.isOpen(signal.timestamp)) {
        dropSignal(run, signal, "OUTSIDE_SESSION");
        return false;
    }

    // the embargo oracle is consulted exactly once per signal
    if (permission_ && !permission_->isTradingPermitted(signal.instrument, signal.timestamp)) {
        dropSignal(run, signal, "NEWS_EMBARGO");
        return false;
    }

    risk::Admission admission;
    try {
        admission = account_.sizeAndCommit(signal.timestamp, [&](double balance) {
            return sizer_.size(balance, signal.entry, signal.stop, run.meta, signal.size_multiplier);
        });
    } catch (const RiskError& e) {
        LOG_WARN("{}: sizing refused, {}", signal.instrument, e.what());
        dropSignal(run, signal, riskErrorKindToString(e.kind()));
        return false;
    }
    if (!admission.admitted()) {
        dropSignal(run, signal, admissionStatusToString(admission.status));
        return false;
    }

    const auto& order = admission.order;
    if (order.anomaly) {
        ++run.summary.anomalies;
        LOG_ERROR("{}: anomalous raw size {:.4f}, opened at minimum increment {:.2f}",
                  signal.instrument, order.raw_size, order.size);
    }

    risk::Position position;
    position.instrument = signal.instrument;
    position.direction = signal.direction;
    position.entry = signal.entry;
    position.stop = signal.stop;
    position.target = signal.target;
    position.size = order.size;
    position.initial_size = order.size;
    position.initial_risk = std::abs(signal.entry - signal.stop);
    position.opened_at = signal.timestamp;
    position.confidence = signal.confidence;
    position.anomaly = order.anomaly;
    position.management.best_price = signal.entry;

    ++run.position_count;
    run.position = position;
    run.phase = InstrumentPhase::POSITION_OPEN;

    LOG_INFO("{} {} opened: size {:.2f} entry {:.5f} stop {:.5f} target {:.5f} (risk {:.2f})",
             signal.instrument, directionToString(signal.direction), position.size, position.entry,
             position.stop, position.target, order.risk_amount);
    journal(positionOpenedEvent(position, positionId(run)));
    return true;
}

void BacktestEngine::dropSignal(InstrumentRun& run, const strategy::Signal& signal, const std::string& reason) {
    ++run.summary.dropped_signals[reason];
    run.phase = InstrumentPhase::IDLE;
    LOG_INFO("{}: {} signal dropped ({})", signal.instrument, directionToString(signal.direction), reason);
    journal(signalDroppedEvent(signal, reason));
}

void BacktestEngine::abort(InstrumentRun& run, const std::string& reason) {
    if (run.phase == InstrumentPhase::ABORTED) {
        return;
    }
    if (run.position) {
        const auto* exec = series(run, config_.engine.execution_resolution);
        double price = run.position->entry;
        TimestampMs ts = clock_;
        if (exec && run.exec_cursor > 0 && run.exec_cursor <= exec->size()) {
            price = (*exec)[run.exec_cursor - 1].close;
            ts = (*exec)[run.exec_cursor - 1].timestamp;
        }
        const auto fill = manager_.close(*run.position, price, ts, risk::ExitReason::END_OF_DATA, run.meta);
        applyFills(run, {fill}, true);
    }
    run.phase = InstrumentPhase::ABORTED;
    run.summary.aborted = true;
    run.summary.abort_reason = reason;
    LOG_ERROR("{}: instrument aborted, {}", run.meta.symbol, reason);
    journal(instrumentAbortedEvent(run.meta.symbol, reason, clock_));
}

void BacktestEngine::finish() {
    if (finished_) {
        return;
    }
    prepare();
    finished_ = true;

    for (auto& entry : instruments_) {
        auto& run = entry.second;
        if (!run.position) {
            continue;
        }
        const auto* exec = series(run, config_.engine.execution_resolution);
        double price = run.position->entry;
        TimestampMs ts = clock_;
        if (exec && run.exec_cursor > 0) {
            price = (*exec)[run.exec_cursor - 1].close;
            ts = (*exec)[run.exec_cursor - 1].timestamp;
        }
        const auto fill = manager_.close(*run.position, price, ts, risk::ExitReason::END_OF_DATA, run.meta);
        applyFills(run, {fill}, true);
        run.last_close_bar = currentBar(run);
    }
    recordEquity(clock_);
}

void BacktestEngine::recordEquity(TimestampMs ts) {
    double unrealized = 0.0;
    for (const auto& entry : instruments_) {
        const auto& run = entry.second;
        if (!run.position || run.exec_cursor == 0) {
            continue;
        }
        const auto* exec = series(run, config_.engine.execution_resolution);
        if (!exec) {
            continue;
        }
        const double price = (*exec)[run.exec_cursor - 1].close;
        unrealized += risk::PositionManager::unrealized(*run.position, price, run.meta);
    }
    account_.markToMarket(unrealized);

    EquityPoint point;
    point.timestamp = ts;
    point.balance = account_.balance();
    point.equity = account_.equity();
    if (!equity_curve_.empty() && equity_curve_.back().timestamp == ts) {
        equity_curve_.back() = point;
    } else {
        equity_curve_.push_back(point);
    }
}

void BacktestEngine::journal(const core::JournalEvent& event) {
    if (!journal_) {
        return;
    }
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed for {} {}", event.instrument, event.entity_id);
    }
}

InstrumentPhase BacktestEngine::phase(const std::string& symbol) const {
    auto it = instruments_.find(symbol);
    if (it == instruments_.end()) {
        throw std::out_of_range("Unknown instrument: " + symbol);
    }
    return it->second.phase;
}

std::optional<risk::Position> BacktestEngine::openPosition(const std::string& symbol) const {
    auto it = instruments_.find(symbol);
    if (it == instruments_.end()) {
        return std::nullopt;
    }
    return it->second.position;
}

std::optional<analytics::TimeframeSnapshot> BacktestEngine::snapshot(const std::string& symbol,
                                                                     Resolution resolution) const {
    auto it = instruments_.find(symbol);
    if (it == instruments_.end()) {
        return std::nullopt;
    }
    const auto& run = it->second;
    for (const auto* analyzer : {run.macro.get(), run.intermediate.get(), run.execution.get()}) {
        if (analyzer && analyzer->resolution() == resolution) {
            return analyzer->snapshot();
        }
    }
    return std::nullopt;
}

BacktestEngine::Result BacktestEngine::getResult() const {
    Result result;
    result.initial_balance = config_.engine.initial_balance;
    result.final_balance = account_.balance();
    result.total_profit = result.final_balance - result.initial_balance;
    result.return_pct = result.initial_balance > 0.0
        ? (result.total_profit / result.initial_balance) * 100.0
        : 0.0;

    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    for (double pnl : position_pnls_) {
        if (pnl > 0.0) {
            ++result.winning_trades;
            gross_profit += pnl;
            result.largest_win = std::max(result.largest_win, pnl);
        } else if (pnl < 0.0) {
            ++result.losing_trades;
            gross_loss_abs += std::abs(pnl);
            result.largest_loss = std::min(result.largest_loss, pnl);
        }
    }
    result.total_trades = static_cast<int>(position_pnls_.size());
    result.win_rate = result.total_trades > 0
        ? static_cast<double>(result.winning_trades) / static_cast<double>(result.total_trades)
        : 0.0;
    result.avg_win = result.winning_trades > 0 ? gross_profit / result.winning_trades : 0.0;
    result.avg_loss = result.losing_trades > 0 ? gross_loss_abs / result.losing_trades : 0.0;
    result.profit_factor = gross_loss_abs > 1e-12 ? gross_profit / gross_loss_abs : 0.0;
    result.expectancy = result.total_trades > 0
        ? (gross_profit - gross_loss_abs) / static_cast<double>(result.total_trades)
        : 0.0;

    // drawdown on marked-to-market equity
    double peak = result.initial_balance;
    for (const auto& point : equity_curve_) {
        peak = std::max(peak, point.equity);
        const double drawdown = peak - point.equity;
        if (drawdown > result.max_drawdown) {
            result.max_drawdown = drawdown;
            result.max_drawdown_pct = peak > 0.0 ? drawdown / peak : 0.0;
        }
    }
    result.recovery_factor = result.max_drawdown > 1e-12 ? result.total_profit / result.max_drawdown : 0.0;

    // Sharpe on the last equity of each UTC day
    std::vector<double> daily_equity;
    long long day = 0;
    for (const auto& point : equity_curve_) {
        const long long key = dayKey(point.timestamp);
        if (daily_equity.empty() || key != day) {
            daily_equity.push_back(point.equity);
            day = key;
        } else {
            daily_equity.back() = point.equity;
        }
    }
    std::vector<double> daily_returns;
    double previous = result.initial_balance;
    for (double equity : daily_equity) {
        daily_returns.push_back(previous > 0.0 ? equity / previous - 1.0 : 0.0);
        previous = equity;
    }
    if (daily_returns.size() >= 2) {
        const double mean = analytics::TechnicalIndicators::calculateSMA(
            daily_returns, static_cast<int>(daily_returns.size()));
        const double stdev = analytics::TechnicalIndicators::calculateStandardDeviation(daily_returns, mean);
        result.sharpe_ratio = stdev > 1e-12 ? mean / stdev * std::sqrt(TRADING_DAYS_PER_YEAR) : 0.0;
    }

    for (const auto& trade : trades_) {
        ++result.exit_reason_counts[risk::exitReasonToString(trade.exit_reason)];
    }
    result.trades = trades_;
    result.position_pnls = position_pnls_;
    result.equity_curve = equity_curve_;
    for (const auto& entry : instruments_) {
        result.instruments.push_back(entry.second.summary);
    }
    return result;
}

bool BacktestEngine::saveCheckpoint(core::ICheckpointStore& store) const {
    core::EngineCheckpoint checkpoint;
    checkpoint.schema_version = CHECKPOINT_SCHEMA_VERSION;
    checkpoint.saved_at_ms = clock_;

    const auto snap = account_.snapshot();
    auto& account = checkpoint.account;
    account["balance"] = snap.balance;
    account["equity"] = snap.equity;
    account["open_positions"] = snap.open_positions;
    account["daily_loss"] = snap.daily_loss;
    account["day_start_balance"] = snap.day_start_balance;
    account["day"] = snap.day;
    account["trades_today"] = snap.trades_today;
    account["suspended"] = snap.suspended;
    account["position_pnls"] = position_pnls_;
    account["equity_curve"] = nlohmann::json::array();
    for (const auto& point : equity_curve_) {
        account["equity_curve"].push_back({{"t", point.timestamp}, {"b", point.balance}, {"e", point.equity}});
    }

    checkpoint.instruments = nlohmann::json::object();
    for (const auto& entry : instruments_) {
        const auto& run = entry.second;
        nlohmann::json j;
        j["phase"] = instrumentPhaseToString(run.phase);
        j["exec_cursor"] = run.exec_cursor;
        j["last_signal_bar"] = run.last_signal_bar;
        j["last_close_bar"] = run.last_close_bar;
        j["position_count"] = run.position_count;
        j["summary"] = summaryToJson(run.summary);
        j["position"] = run.position ? risk::toJson(*run.position) : nlohmann::json();

        const auto* exec = series(run, config_.engine.execution_resolution);
        j["last_ts"] = (exec && run.exec_cursor > 0) ? (*exec)[run.exec_cursor - 1].timestamp : 0LL;
        if (run.execution) {
            j["bias"] = {
                {"macro", analytics::biasToString(run.macro->structure().state().bias)},
                {"intermediate", analytics::biasToString(run.intermediate->structure().state().bias)},
                {"execution", analytics::biasToString(run.execution->structure().state().bias)}
            };
        }
        checkpoint.instruments[entry.first] = j;
    }

    checkpoint.trades = nlohmann::json::array();
    for (const auto& trade : trades_) {
        checkpoint.trades.push_back(risk::toJson(trade));
    }

    if (!store.save(checkpoint)) {
        LOG_ERROR("Checkpoint save failed at {}", clock_);
        return false;
    }
    LOG_INFO("Checkpoint saved at {} ({} trades)", clock_, trades_.size());
    return true;
}

bool BacktestEngine::restoreCheckpoint(core::ICheckpointStore& store) {
    prepare();
    for (const auto& entry : instruments_) {
        if (entry.second.exec_cursor > 0) {
            LOG_WARN("Checkpoint restore skipped: replay already started");
            return false;
        }
    }

    auto checkpoint = store.load();
    if (!checkpoint) {
        LOG_INFO("No checkpoint to resume from");
        return false;
    }
    if (checkpoint->schema_version != CHECKPOINT_SCHEMA_VERSION) {
        LOG_WARN("Checkpoint schema {} not supported", checkpoint->schema_version);
        return false;
    }

    // parsed in full before anything is applied
    struct SavedInstrument {
        InstrumentRun* run = nullptr;
        Result::InstrumentSummary summary;
        int position_count = 0;
        long long last_signal_bar = -1;
        long long last_close_bar = -1;
        InstrumentPhase phase = InstrumentPhase::IDLE;
        TimestampMs last_ts = 0;
        size_t exec_cursor = 0;
        std::map<std::string, analytics::Bias> bias;
        std::optional<risk::Position> position;
    };

    risk::AccountSnapshot snap;
    std::vector<double> pnls;
    std::vector<EquityPoint> curve;
    std::vector<risk::TradeRecord> trades;
    std::vector<SavedInstrument> saved;
    try {
        const auto& a = checkpoint->account;
        snap.balance = a.value("balance", config_.engine.initial_balance);
        snap.equity = a.value("equity", snap.balance);
        snap.open_positions = a.value("open_positions", 0);
        snap.daily_loss = a.value("daily_loss", 0.0);
        snap.day_start_balance = a.value("day_start_balance", snap.balance);
        snap.day = a.value("day", 0LL);
        snap.trades_today = a.value("trades_today", 0);
        snap.suspended = a.value("suspended", false);

        pnls = a.value("position_pnls", std::vector<double>());
        if (a.contains("equity_curve")) {
            for (const auto& p : a["equity_curve"]) {
                EquityPoint point;
                point.timestamp = p.value("t", 0LL);
                point.balance = p.value("b", 0.0);
                point.equity = p.value("e", 0.0);
                curve.push_back(point);
            }
        }
        for (const auto& t : checkpoint->trades) {
            trades.push_back(risk::tradeFromJson(t));
        }

        for (auto it = checkpoint->instruments.begin(); it != checkpoint->instruments.end(); ++it) {
            auto found = instruments_.find(it.key());
            if (found == instruments_.end()) {
                LOG_WARN("Checkpoint instrument {} is not configured, skipped", it.key());
                continue;
            }
            const auto& j = it.value();
            SavedInstrument item;
            item.run = &found->second;
            summaryFromJson(j.value("summary", nlohmann::json::object()), item.summary);
            item.position_count = j.value("position_count", 0);
            item.last_signal_bar = j.value("last_signal_bar", -1LL);
            item.last_close_bar = j.value("last_close_bar", -1LL);
            item.phase = parsePhase(j.value("phase", std::string("IDLE")));
            item.last_ts = j.value("last_ts", 0LL);
            item.exec_cursor = j.value("exec_cursor", static_cast<size_t>(0));
            if (j.contains("bias")) {
                for (const char* name : {"macro", "intermediate", "execution"}) {
                    item.bias[name] = parseBias(j["bias"].value(name, std::string("RANGING")));
                }
            }
            if (j.contains("position") && j["position"].is_object()) {
                item.position = risk::positionFromJson(j["position"]);
            }
            saved.push_back(std::move(item));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Corrupt checkpoint: ") + e.what());
    }

    account_.restore(snap);
    position_pnls_ = std::move(pnls);
    equity_curve_ = std::move(curve);
    trades_ = std::move(trades);

    for (auto& item : saved) {
        auto& run = *item.run;
        run.summary = item.summary;
        run.position_count = item.position_count;
        run.last_signal_bar = item.last_signal_bar;
        run.last_close_bar = item.last_close_bar;

        if (item.phase == InstrumentPhase::ABORTED) {
            run.phase = InstrumentPhase::ABORTED;
            continue;
        }
        if (run.phase == InstrumentPhase::ABORTED || !run.execution) {
            continue;
        }

        // warm replay: analyzers only, no positions, no signals
        const auto* exec = series(run, config_.engine.execution_resolution);
        try {
            while (exec && run.exec_cursor < exec->size() &&
                   (*exec)[run.exec_cursor].timestamp <= item.last_ts) {
                advanceAnalyzers(run, (*exec)[run.exec_cursor]);
                ++run.exec_cursor;
            }
        } catch (const OutOfOrderDataError& e) {
            abort(run, e.what());
            continue;
        }

        if (run.exec_cursor != item.exec_cursor) {
            LOG_WARN("{}: resumed at bar {} but checkpoint recorded {}",
                     run.meta.symbol, run.exec_cursor, item.exec_cursor);
        }
        const std::pair<const char*, const analytics::TimeframeAnalyzer*> checks[] = {
            {"macro", run.macro.get()},
            {"intermediate", run.intermediate.get()},
            {"execution", run.execution.get()},
        };
        for (const auto& check : checks) {
            auto expected = item.bias.find(check.first);
            if (expected == item.bias.end()) {
                continue;
            }
            const auto actual = check.second->structure().state().bias;
            if (expected->second != actual) {
                LOG_WARN("{}: {} bias after replay is {}, checkpoint had {}", run.meta.symbol,
                         check.first, analytics::biasToString(actual),
                         analytics::biasToString(expected->second));
            }
        }

        if (item.position) {
            run.position = std::move(item.position);
            run.phase = InstrumentPhase::POSITION_OPEN;
        } else {
            run.phase = InstrumentPhase::IDLE;
        }
    }
    clock_ = checkpoint->saved_at_ms;

    // fills journaled after the checkpoint was taken will be replayed and journaled again
    if (journal_) {
        try {
            const auto journaled = journaledFills(*journal_).size();
            if (journaled != trades_.size()) {
                LOG_WARN("Journal holds {} fills but checkpoint restored {}", journaled, trades_.size());
            }
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Journal fills unreadable: {}", e.what());
        }
    }

    LOG_INFO("Resumed from checkpoint at {} ({} trades, balance {:.2f})",
             clock_, trades_.size(), account_.balance());
    return true;
}

} // namespace backtest
} // namespace confluence
