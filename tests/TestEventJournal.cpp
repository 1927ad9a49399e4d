#include "backtest/JournalRecords.h"
#include "core/state/CheckpointStoreJson.h"
#include "core/state/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace confluence;

namespace {
strategy::Signal longSignal() {
    strategy::Signal signal;
    signal.instrument = "EURUSD";
    signal.direction = Direction::LONG;
    signal.entry = 1.1001;
    signal.stop = 1.0981;
    signal.target = 1.1041;
    signal.confidence = 72.5;
    signal.reasons = {"HTF_BULLISH", "OB_RETEST"};
    signal.timestamp = 1000;
    signal.trigger_zone_id = 7;
    return signal;
}

risk::TradeRecord fill(double pnl, risk::ExitReason reason, long long close_time) {
    risk::TradeRecord trade;
    trade.instrument = "EURUSD";
    trade.entry = 1.1001;
    trade.exit = 1.1021;
    trade.size = 0.1;
    trade.pnl = pnl;
    trade.open_time = 1000;
    trade.close_time = close_time;
    trade.exit_reason = reason;
    return trade;
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "confluence_test_journal";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto path = dir / "events.jsonl";

    const auto signal = longSignal();
    risk::Position position;
    position.instrument = "EURUSD";
    position.entry = signal.entry;
    position.stop = signal.stop;
    position.size = 0.2;
    position.initial_size = 0.2;
    position.opened_at = 2000;

    {
        core::EventJournalJsonl journal(path);
        if (!journal.append(backtest::signalEmittedEvent(signal)) ||
            !journal.append(backtest::positionOpenedEvent(position, "EURUSD#1"))) {
            std::cerr << "[TEST] append failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }
    }

    // rows this journal cannot decode are counted and never returned
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "{\"seq\": 3, \"type\": \"ORDER_ROUTED\"}\n";
        out << "not json\n";
    }

    // reopening continues the sequence past the last readable row
    core::EventJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2 || reopened.skippedRows() != 2) {
        std::cerr << "[TEST] reopen: lastSeq " << reopened.lastSeq() << ", skipped "
                  << reopened.skippedRows() << "\n";
        return 1;
    }

    core::JournalEvent gbp = backtest::instrumentAbortedEvent("GBPUSD", "bar out of order", 2500);
    if (!reopened.append(backtest::positionFillEvent(fill(10.0, risk::ExitReason::PARTIAL_TAKE_PROFIT, 3000), "EURUSD#1", false)) ||
        !reopened.append(gbp) ||
        !reopened.append(backtest::positionFillEvent(fill(15.0, risk::ExitReason::TAKE_PROFIT, 4000), "EURUSD#1", true)) ||
        !reopened.append(backtest::signalDroppedEvent(signal, "NEWS_EMBARGO"))) {
        std::cerr << "[TEST] append after reopen failed\n";
        return 1;
    }
    if (reopened.lastSeq() != 6) {
        std::cerr << "[TEST] lastSeq should be 6, got " << reopened.lastSeq() << "\n";
        return 1;
    }

    const auto all = reopened.readFrom(1);
    if (all.size() != 6 || all[2].seq != 3 || all[2].type != core::JournalEventType::POSITION_REDUCED) {
        std::cerr << "[TEST] readFrom(1) returned " << all.size() << " rows\n";
        return 1;
    }

    core::JournalFilter eurusd;
    eurusd.instrument = "EURUSD";
    if (reopened.readFrom(1, eurusd).size() != 5 || reopened.readFrom(5, eurusd).size() != 2) {
        std::cerr << "[TEST] instrument filter mismatch\n";
        return 1;
    }

    const auto fills = backtest::journaledFills(reopened, "EURUSD");
    if (fills.size() != 2 || fills[0].exit_reason != risk::ExitReason::PARTIAL_TAKE_PROFIT ||
        fills[1].pnl != 15.0 || fills[1].close_time != 4000) {
        std::cerr << "[TEST] journaled fills mismatch\n";
        return 1;
    }
    const auto closed = reopened.readFrom(1, backtest::fillFilter("EURUSD"));
    if (closed.back().type != core::JournalEventType::POSITION_CLOSED || closed.back().entity_id != "EURUSD#1") {
        std::cerr << "[TEST] closing fill not marked POSITION_CLOSED\n";
        return 1;
    }

    core::JournalFilter signals;
    signals.types = {core::JournalEventType::SIGNAL_EMITTED, core::JournalEventType::SIGNAL_DROPPED};
    const auto signal_rows = reopened.readFrom(1, signals);
    if (signal_rows.size() != 2) {
        std::cerr << "[TEST] signal filter returned " << signal_rows.size() << " rows\n";
        return 1;
    }
    const auto emitted = backtest::signalOf(signal_rows[0]);
    const auto dropped = backtest::signalOf(signal_rows[1]);
    if (emitted.trigger_zone_id != 7 || emitted.reasons.size() != 2 || emitted.entry != signal.entry ||
        dropped.timestamp != signal.timestamp || backtest::dropReasonOf(signal_rows[1]) != "NEWS_EMBARGO" ||
        signal_rows[0].entity_id != "EURUSD@1000") {
        std::cerr << "[TEST] signal payloads not preserved\n";
        return 1;
    }

    const auto opened = backtest::openedPositionOf(all[1]);
    if (opened.size != 0.2 || opened.opened_at != 2000 || all[1].ts_ms != 2000) {
        std::cerr << "[TEST] opened position not preserved\n";
        return 1;
    }
    if (backtest::abortReasonOf(all[3]) != "bar out of order" || all[3].instrument != "GBPUSD") {
        std::cerr << "[TEST] abort reason not preserved\n";
        return 1;
    }

    bool threw = false;
    try {
        backtest::fillOf(all[0]);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] reading a signal row as a fill should throw\n";
        return 1;
    }

    std::string error;
    if (core::EventJournalJsonl::decodeRow("{\"type\": \"SIGNAL_EMITTED\"}", &error) || error != "missing seq") {
        std::cerr << "[TEST] row without seq decoded: " << error << "\n";
        return 1;
    }
    const auto decoded = core::EventJournalJsonl::decodeRow(core::EventJournalJsonl::encodeRow(gbp));
    if (!decoded || decoded->type != core::JournalEventType::INSTRUMENT_ABORTED || decoded->ts_ms != 2500) {
        std::cerr << "[TEST] encoded row did not decode\n";
        return 1;
    }
    if (core::journalEventTypeFromString("ORDER_ROUTED")) {
        std::cerr << "[TEST] unknown event type accepted\n";
        return 1;
    }

    core::CheckpointStoreJson store(dir / "checkpoint.json");
    if (store.load()) {
        std::cerr << "[TEST] empty store should load nothing\n";
        return 1;
    }
    core::EngineCheckpoint checkpoint;
    checkpoint.saved_at_ms = 3000;
    checkpoint.account["balance"] = 10100.0;
    checkpoint.instruments["EURUSD"]["phase"] = "IDLE";
    checkpoint.trades = nlohmann::json::array();
    if (!store.save(checkpoint)) {
        std::cerr << "[TEST] checkpoint save failed\n";
        return 1;
    }
    const auto loaded = store.load();
    if (!loaded || loaded->saved_at_ms != 3000 ||
        loaded->instruments["EURUSD"].value("phase", std::string()) != "IDLE") {
        std::cerr << "[TEST] checkpoint did not round trip\n";
        return 1;
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
