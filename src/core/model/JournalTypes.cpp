#include "core/model/JournalTypes.h"

namespace confluence {
namespace core {

std::string journalEventTypeToString(JournalEventType type) {
    switch (type) {
        case JournalEventType::SIGNAL_EMITTED: return "SIGNAL_EMITTED";
        case JournalEventType::SIGNAL_DROPPED: return "SIGNAL_DROPPED";
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_REDUCED: return "POSITION_REDUCED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::INSTRUMENT_ABORTED: return "INSTRUMENT_ABORTED";
    }
    return "UNKNOWN";
}

std::optional<JournalEventType> journalEventTypeFromString(const std::string& value) {
    static const JournalEventType all[] = {
        JournalEventType::SIGNAL_EMITTED,   JournalEventType::SIGNAL_DROPPED,
        JournalEventType::POSITION_OPENED,  JournalEventType::POSITION_REDUCED,
        JournalEventType::POSITION_CLOSED,  JournalEventType::INSTRUMENT_ABORTED,
    };
    for (const auto type : all) {
        if (journalEventTypeToString(type) == value) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace confluence
