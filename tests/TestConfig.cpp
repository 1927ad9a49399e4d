#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace confluence;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

void testDefaults() {
    const AppConfig config = Config::fromJson(nlohmann::json::object());
    assert(near(config.engine.initial_balance, 10000.0));
    assert(config.engine.execution_resolution == Resolution::M15);
    assert(config.engine.intermediate_resolution == Resolution::H4);
    assert(config.engine.macro_resolution == Resolution::D1);
    assert(near(config.engine.risk.risk_fraction, 0.01));
    assert(near(config.engine.risk.global_max_size, 2.0));
    assert(near(config.scorer.min_confidence, 60.0));
    assert(near(config.detectors.order_block.impulse_ratio.at(Resolution::M1), 2.0));
    assert(config.instruments.empty());
    assert(config.events.empty());
    assert(!config.sessions.enabled);
    assert(config.sessions.windows.size() == 2);
    assert(config.detectors.breaker.enabled);
    assert(near(config.scorer.breaker_credit, 0.8));

    std::cout << "[TEST] config defaults PASSED\n";
}

void testOverrides() {
    const auto j = nlohmann::json::parse(R"({
        "logging": {"level": "debug"},
        "engine": {
            "initial_balance": 25000,
            "execution_resolution": "5m",
            "warmup_bars": 20,
            "monte_carlo": {"simulations": 200, "seed": 7}
        },
        "risk": {"risk_fraction": 0.005, "class_max_size": {"metal": 0.25}},
        "management": {"partial_enabled": false},
        "detectors": {"order_block": {"impulse_ratio": {"M5": 2.5}}, "gap": {"min_gap_pips": {"M5": 4}},
                      "breaker": {"enabled": false, "max_age_bars": 40}},
        "scorer": {"min_confidence": 70, "weights": {"sweep": 30}, "breaker_credit": 0.5},
        "sessions": {"enabled": true, "windows": [{"name": "ny_open", "start": "12:30", "end": "15:00"}]},
        "embargo": {
            "minutes_before": 60,
            "events": [{"timestamp": 1700056800000, "impact": "high", "title": "CPI", "codes": ["USD"]}]
        },
        "instruments": [
            {"symbol": "XAUUSD", "class": "metal", "unit_value": 1.0, "pip_size": 0.01,
             "data": {"M5": "xau_m5.csv"}}
        ]
    })");
    const AppConfig config = Config::fromJson(j);

    assert(config.logging.level == "debug");
    assert(near(config.engine.initial_balance, 25000.0));
    assert(config.engine.execution_resolution == Resolution::M5);
    assert(config.engine.warmup_bars == 20);
    assert(config.engine.monte_carlo_simulations == 200);
    assert(config.engine.monte_carlo_seed == 7u);
    assert(near(config.engine.risk.risk_fraction, 0.005));
    assert(near(config.engine.risk.class_max_size.at(risk::InstrumentClass::METAL), 0.25));
    assert(near(config.engine.risk.class_max_size.at(risk::InstrumentClass::FOREX), 1.0));
    assert(!config.engine.management.partial_enabled);
    assert(config.engine.management.trailing_enabled);
    assert(near(config.detectors.order_block.impulse_ratio.at(Resolution::M5), 2.5));
    assert(near(config.detectors.order_block.impulse_ratio.at(Resolution::H4), 1.2));
    assert(near(config.detectors.gap.min_gap_pips.at(Resolution::M5), 4.0));
    assert(near(config.scorer.min_confidence, 70.0));
    assert(near(config.scorer.weights.sweep, 30.0));
    assert(near(config.scorer.weights.order_block, 20.0));
    assert(near(config.scorer.breaker_credit, 0.5));
    assert(!config.detectors.breaker.enabled);
    assert(config.detectors.breaker.max_age_bars == 40);
    assert(config.sessions.enabled);
    assert(config.sessions.windows.size() == 1);
    assert(config.sessions.windows[0].name == "ny_open");
    assert(config.sessions.windows[0].start_minute == 750);
    assert(config.sessions.windows[0].end_minute == 900);
    assert(near(config.embargo.minutes_before, 60.0));
    assert(config.events.size() == 1);
    assert(config.events[0].impact == strategy::ImpactLevel::HIGH);
    assert(config.instruments.size() == 1);
    assert(config.instruments[0].meta.instrument_class == risk::InstrumentClass::METAL);
    assert(config.instruments[0].data_files.at(Resolution::M5) == "xau_m5.csv");

    std::cout << "[TEST] config overrides PASSED\n";
}

void testInvalidValues() {
    auto throws = [](const char* text) {
        try {
            Config::fromJson(nlohmann::json::parse(text));
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    assert(throws(R"({"instruments": [{"symbol": "BTCUSD", "class": "bond"}]})"));
    assert(throws(R"({"instruments": [{"class": "forex"}]})"));
    assert(throws(R"({"engine": {"execution_resolution": "7m"}})"));
    assert(throws(R"({"embargo": {"events": [{"impact": "catastrophic"}]}})"));
    assert(throws(R"({"engine": {"initial_balance": "lots"}})"));
    assert(throws(R"({"instruments": [{"symbol": "EURUSD", "unit_value": 10, "pip_size": 0.0001,
                                        "min_increment": 0}]})"));
    assert(throws(R"({"instruments": [{"symbol": "XAUUSD", "class": "metal", "unit_value": 1,
                                        "pip_size": 0.01, "min_increment": 1.0}]})"));
    assert(throws(R"({"risk": {"global_max_size": 0.05},
                      "instruments": [{"symbol": "EURUSD", "unit_value": 10, "pip_size": 0.0001,
                                       "min_increment": 0.1}]})"));
    assert(!throws(R"({"instruments": [{"symbol": "XAUUSD", "class": "metal", "unit_value": 1,
                                         "pip_size": 0.01, "min_increment": 0.5}]})"));
    assert(throws(R"({"sessions": {"enabled": true, "windows": []}})"));
    assert(throws(R"({"sessions": {"windows": [{"name": "london", "start": "7am", "end": "16:00"}]}})"));
    assert(throws(R"({"sessions": {"windows": [{"name": "london", "start": "07:00"}]}})"));
    assert(!throws(R"({"sessions": {"enabled": false, "windows": []}})"));

    std::cout << "[TEST] invalid config values PASSED\n";
}

void testLoadFromFile() {
    const auto dir = std::filesystem::temp_directory_path() / "confluence_test_config";
    std::filesystem::create_directories(dir);

    const AppConfig missing = Config::load((dir / "absent.json").string());
    assert(missing.instruments.empty());
    assert(near(missing.engine.initial_balance, 10000.0));

    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({"instruments": [{"symbol": "EURUSD", "unit_value": 10, "pip_size": 0.0001,
                  "data": {"M15": "data/eurusd_m15.csv"}}]})";
    }
    const AppConfig loaded = Config::load(path.string());
    assert(loaded.instruments.size() == 1);
    const std::filesystem::path data(loaded.instruments[0].data_files.at(Resolution::M15));
    assert(data.is_absolute());
    assert(data == (dir / "data" / "eurusd_m15.csv").lexically_normal());

    const auto broken = dir / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    bool threw = false;
    try {
        Config::load(broken.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    std::cout << "[TEST] config load from file PASSED\n";
}
}

int main() {
    testDefaults();
    testOverrides();
    testInvalidValues();
    testLoadFromFile();

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
