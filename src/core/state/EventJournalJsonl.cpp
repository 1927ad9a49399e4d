#include "core/state/EventJournalJsonl.h"

#include "common/Logger.h"

namespace confluence {
namespace core {

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    scan([this](JournalEvent&& event) {
        if (event.seq > last_seq_) {
            last_seq_ = event.seq;
        }
    }, &skipped_rows_);
    if (skipped_rows_ > 0) {
        LOG_WARN("Journal {}: {} unreadable rows ignored", file_path_.string(), skipped_rows_);
    }
}

std::string EventJournalJsonl::encodeRow(const JournalEvent& event) {
    nlohmann::json row;
    row["seq"] = event.seq;
    row["ts_ms"] = event.ts_ms;
    row["type"] = journalEventTypeToString(event.type);
    row["instrument"] = event.instrument;
    row["entity_id"] = event.entity_id;
    row["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;
    return row.dump();
}

std::optional<JournalEvent> EventJournalJsonl::decodeRow(const std::string& row, std::string* error) {
    auto fail = [error](const std::string& why) -> std::optional<JournalEvent> {
        if (error) {
            *error = why;
        }
        return std::nullopt;
    };

    const auto parsed = nlohmann::json::parse(row, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return fail("not a JSON object");
    }
    if (!parsed.contains("seq") || !parsed["seq"].is_number_unsigned()) {
        return fail("missing seq");
    }
    const auto type = journalEventTypeFromString(parsed.value("type", std::string()));
    if (!type) {
        return fail("unknown event type '" + parsed.value("type", std::string()) + "'");
    }

    JournalEvent event;
    event.seq = parsed["seq"].get<std::uint64_t>();
    event.type = *type;
    try {
        event.ts_ms = parsed.value("ts_ms", 0LL);
        event.instrument = parsed.value("instrument", std::string());
        event.entity_id = parsed.value("entity_id", std::string());
    } catch (const nlohmann::json::type_error& e) {
        return fail(e.what());
    }
    event.payload = parsed.contains("payload") ? parsed["payload"] : nlohmann::json::object();
    return event;
}

void EventJournalJsonl::scan(const std::function<void(JournalEvent&&)>& visit, size_t* skipped) const {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    size_t line_no = 0;
    while (std::getline(in, row)) {
        ++line_no;
        if (row.empty()) {
            continue;
        }
        std::string error;
        auto event = decodeRow(row, &error);
        if (!event) {
            LOG_DEBUG("Journal {} line {}: {}", file_path_.string(), line_no, error);
            if (skipped) {
                ++*skipped;
            }
            continue;
        }
        visit(std::move(*event));
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!out_.is_open()) {
        if (file_path_.has_parent_path()) {
            std::filesystem::create_directories(file_path_.parent_path());
        }
        out_.open(file_path_, std::ios::binary | std::ios::app);
        if (!out_.is_open()) {
            LOG_ERROR("Journal open failed: {}", file_path_.string());
            return false;
        }
    }

    JournalEvent row = event;
    row.seq = last_seq_ + 1;
    out_ << encodeRow(row) << '\n';
    out_.flush();
    if (!out_) {
        LOG_ERROR("Journal write failed: {}", file_path_.string());
        out_.close();
        return false;
    }
    last_seq_ = row.seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive, const JournalFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> events;
    scan([&](JournalEvent&& event) {
        if (event.seq >= seq_inclusive && filter.matches(event)) {
            events.push_back(std::move(event));
        }
    }, nullptr);
    return events;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace confluence
