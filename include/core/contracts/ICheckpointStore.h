#pragma once

#include <optional>

#include <nlohmann/json.hpp>

namespace confluence {
namespace core {

// Resumable replay state. Detector state is not stored: it is rebuilt by
// replaying the candle series up to the checkpoint timestamp.
struct EngineCheckpoint {
    int schema_version = 1;
    long long saved_at_ms = 0;      // replay clock, not wall clock
    nlohmann::json account;
    nlohmann::json instruments;
    nlohmann::json trades;
};

class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    virtual std::optional<EngineCheckpoint> load() = 0;
    virtual bool save(const EngineCheckpoint& checkpoint) = 0;
};

} // namespace core
} // namespace confluence
