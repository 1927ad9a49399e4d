#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/ICheckpointStore.h"

namespace confluence {
namespace core {

class CheckpointStoreJson : public ICheckpointStore {
public:
    explicit CheckpointStoreJson(std::filesystem::path file_path);

    std::optional<EngineCheckpoint> load() override;
    bool save(const EngineCheckpoint& checkpoint) override;

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace confluence
