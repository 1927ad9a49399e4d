#pragma once

#include <cstdint>
#include <vector>

#include "core/model/JournalTypes.h"

namespace confluence {
namespace core {

class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    // Assigns the next sequence number; false when the event could not be persisted
    virtual bool append(const JournalEvent& event) = 0;

    // Events with seq >= seq_inclusive that pass the filter, in sequence order
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive,
                                               const JournalFilter& filter = JournalFilter()) = 0;

    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace confluence
