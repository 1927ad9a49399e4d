#include "backtest/JournalRecords.h"

#include <initializer_list>
#include <stdexcept>

namespace confluence {
namespace backtest {

namespace {

std::string signalId(const strategy::Signal& signal) {
    return signal.instrument + "@" + std::to_string(signal.timestamp);
}

void expectType(const core::JournalEvent& event, std::initializer_list<core::JournalEventType> types) {
    for (const auto type : types) {
        if (event.type == type) {
            return;
        }
    }
    throw std::invalid_argument("Journal row " + std::to_string(event.seq) + " is " +
                                core::journalEventTypeToString(event.type));
}

core::JournalEvent makeEvent(core::JournalEventType type, const std::string& instrument,
                             const std::string& entity_id, TimestampMs ts, nlohmann::json payload) {
    core::JournalEvent event;
    event.ts_ms = ts;
    event.type = type;
    event.instrument = instrument;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    return event;
}

} // namespace

core::JournalEvent signalEmittedEvent(const strategy::Signal& signal) {
    return makeEvent(core::JournalEventType::SIGNAL_EMITTED, signal.instrument, signalId(signal),
                     signal.timestamp, strategy::toJson(signal));
}

core::JournalEvent signalDroppedEvent(const strategy::Signal& signal, const std::string& reason) {
    nlohmann::json payload;
    payload["reason"] = reason;
    payload["signal"] = strategy::toJson(signal);
    return makeEvent(core::JournalEventType::SIGNAL_DROPPED, signal.instrument, signalId(signal),
                     signal.timestamp, std::move(payload));
}

core::JournalEvent positionOpenedEvent(const risk::Position& position, const std::string& position_id) {
    return makeEvent(core::JournalEventType::POSITION_OPENED, position.instrument, position_id,
                     position.opened_at, risk::toJson(position));
}

core::JournalEvent positionFillEvent(const risk::TradeRecord& fill, const std::string& position_id, bool closing) {
    return makeEvent(closing ? core::JournalEventType::POSITION_CLOSED : core::JournalEventType::POSITION_REDUCED,
                     fill.instrument, position_id, fill.close_time, risk::toJson(fill));
}

core::JournalEvent instrumentAbortedEvent(const std::string& symbol, const std::string& reason, TimestampMs ts) {
    nlohmann::json payload;
    payload["reason"] = reason;
    return makeEvent(core::JournalEventType::INSTRUMENT_ABORTED, symbol, symbol, ts, std::move(payload));
}

strategy::Signal signalOf(const core::JournalEvent& event) {
    expectType(event, {core::JournalEventType::SIGNAL_EMITTED, core::JournalEventType::SIGNAL_DROPPED});
    if (event.type == core::JournalEventType::SIGNAL_DROPPED) {
        return strategy::signalFromJson(event.payload.value("signal", nlohmann::json::object()));
    }
    return strategy::signalFromJson(event.payload);
}

std::string dropReasonOf(const core::JournalEvent& event) {
    expectType(event, {core::JournalEventType::SIGNAL_DROPPED});
    return event.payload.value("reason", std::string());
}

risk::Position openedPositionOf(const core::JournalEvent& event) {
    expectType(event, {core::JournalEventType::POSITION_OPENED});
    return risk::positionFromJson(event.payload);
}

risk::TradeRecord fillOf(const core::JournalEvent& event) {
    expectType(event, {core::JournalEventType::POSITION_REDUCED, core::JournalEventType::POSITION_CLOSED});
    return risk::tradeFromJson(event.payload);
}

std::string abortReasonOf(const core::JournalEvent& event) {
    expectType(event, {core::JournalEventType::INSTRUMENT_ABORTED});
    return event.payload.value("reason", std::string());
}

core::JournalFilter fillFilter(const std::string& symbol) {
    core::JournalFilter filter;
    filter.instrument = symbol;
    filter.types = {core::JournalEventType::POSITION_REDUCED, core::JournalEventType::POSITION_CLOSED};
    return filter;
}

std::vector<risk::TradeRecord> journaledFills(core::IEventJournal& journal, const std::string& symbol) {
    std::vector<risk::TradeRecord> fills;
    for (const auto& event : journal.readFrom(1, fillFilter(symbol))) {
        fills.push_back(fillOf(event));
    }
    return fills;
}

} // namespace backtest
} // namespace confluence
