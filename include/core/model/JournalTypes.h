#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace confluence {
namespace core {

enum class JournalEventType {
    SIGNAL_EMITTED,
    SIGNAL_DROPPED,
    POSITION_OPENED,
    POSITION_REDUCED,
    POSITION_CLOSED,
    INSTRUMENT_ABORTED
};

std::string journalEventTypeToString(JournalEventType type);
std::optional<JournalEventType> journalEventTypeFromString(const std::string& value);

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::SIGNAL_EMITTED;
    std::string instrument;
    std::string entity_id;          // "<symbol>@<ts>" for signals, "<symbol>#<n>" for positions
    nlohmann::json payload;
};

// Empty instrument or empty type list matches everything
struct JournalFilter {
    std::string instrument;
    std::vector<JournalEventType> types;

    bool matches(const JournalEvent& event) const {
        if (!instrument.empty() && event.instrument != instrument) {
            return false;
        }
        return types.empty() || std::find(types.begin(), types.end(), event.type) != types.end();
    }
};

} // namespace core
} // namespace confluence
