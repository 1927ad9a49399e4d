#include "core/state/CheckpointStoreJson.h"

#include <fstream>
#include <system_error>

#include "common/Logger.h"

namespace confluence {
namespace core {

CheckpointStoreJson::CheckpointStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<EngineCheckpoint> CheckpointStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Checkpoint {} unreadable: {}", file_path_.string(), e.what());
        return std::nullopt;
    }

    EngineCheckpoint checkpoint;
    checkpoint.schema_version = raw.value("schema_version", 1);
    checkpoint.saved_at_ms = raw.value("saved_at_ms", 0LL);
    checkpoint.account = raw.value("account", nlohmann::json::object());
    checkpoint.instruments = raw.value("instruments", nlohmann::json::array());
    checkpoint.trades = raw.value("trades", nlohmann::json::array());
    return checkpoint;
}

bool CheckpointStoreJson::save(const EngineCheckpoint& checkpoint) {
    nlohmann::json raw;
    raw["schema_version"] = checkpoint.schema_version;
    raw["saved_at_ms"] = checkpoint.saved_at_ms;
    raw["account"] = checkpoint.account;
    raw["instruments"] = checkpoint.instruments;
    raw["trades"] = checkpoint.trades;

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        LOG_ERROR("Checkpoint rename failed: {}", ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

} // namespace core
} // namespace confluence
