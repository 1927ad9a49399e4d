#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "risk/PositionManager.h"
#include "strategy/Signal.h"

namespace confluence {
namespace backtest {

// Typed journal rows written by the replay engine.
// Readers throw std::invalid_argument when handed a row of another type.

core::JournalEvent signalEmittedEvent(const strategy::Signal& signal);
core::JournalEvent signalDroppedEvent(const strategy::Signal& signal, const std::string& reason);
core::JournalEvent positionOpenedEvent(const risk::Position& position, const std::string& position_id);

// POSITION_CLOSED for the fill that ends the position, POSITION_REDUCED otherwise
core::JournalEvent positionFillEvent(const risk::TradeRecord& fill, const std::string& position_id, bool closing);

core::JournalEvent instrumentAbortedEvent(const std::string& symbol, const std::string& reason, TimestampMs ts);

strategy::Signal signalOf(const core::JournalEvent& event);
std::string dropReasonOf(const core::JournalEvent& event);
risk::Position openedPositionOf(const core::JournalEvent& event);
risk::TradeRecord fillOf(const core::JournalEvent& event);
std::string abortReasonOf(const core::JournalEvent& event);

core::JournalFilter fillFilter(const std::string& symbol = std::string());

// Every fill in the journal, optionally for one instrument, in journal order
std::vector<risk::TradeRecord> journaledFills(core::IEventJournal& journal, const std::string& symbol = std::string());

} // namespace backtest
} // namespace confluence
