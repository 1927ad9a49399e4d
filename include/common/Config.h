#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/DetectorConfig.h"
#include "engine/EngineConfig.h"
#include "risk/InstrumentMeta.h"
#include "strategy/NewsEmbargo.h"
#include "strategy/SessionGate.h"
#include "strategy/StrategyConfig.h"

namespace confluence {

struct LoggingConfig {
    std::string level = "info";
    std::string dir = "logs";
};

struct InstrumentSpec {
    risk::InstrumentMeta meta;
    std::map<Resolution, std::string> data_files;   // CSV or JSON per resolution
};

struct AppConfig {
    LoggingConfig logging;
    engine::EngineConfig engine;
    analytics::DetectorConfig detectors;
    strategy::ScorerConfig scorer;
    strategy::EmbargoConfig embargo;
    strategy::SessionConfig sessions;
    std::vector<strategy::ScheduledEvent> events;
    std::vector<InstrumentSpec> instruments;
};

class Config {
public:
    // Missing file: warning and defaults. Unparseable JSON or an unknown
    // class, resolution or impact level throws std::runtime_error.
    // Relative data paths resolve against the config file's directory.
    static AppConfig load(const std::string& config_path);

    // Absent keys keep their defaults
    static AppConfig fromJson(const nlohmann::json& j);
};

} // namespace confluence
