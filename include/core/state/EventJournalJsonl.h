#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace confluence {
namespace core {

// Append-only JSON Lines journal of signals and position lifecycle events.
// One row per event: {"seq","ts_ms","type","instrument","entity_id","payload"}.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive,
                                       const JournalFilter& filter = JournalFilter()) override;
    std::uint64_t lastSeq() const override;

    // Rows that could not be decoded while scanning the existing file
    size_t skippedRows() const { return skipped_rows_; }

    static std::string encodeRow(const JournalEvent& event);

    // nullopt for rows that are not JSON, carry no seq, or name an unknown event type
    static std::optional<JournalEvent> decodeRow(const std::string& row, std::string* error = nullptr);

private:
    void scan(const std::function<void(JournalEvent&&)>& visit, size_t* skipped) const;

    std::filesystem::path file_path_;
    std::ofstream out_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    size_t skipped_rows_ = 0;
};

} // namespace core
} // namespace confluence
