#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace confluence {

namespace {
void readResolutionTable(const nlohmann::json& j, std::map<Resolution, double>& table) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        table[parseResolution(it.key())] = it.value().get<double>();
    }
}

void readDetectors(const nlohmann::json& j, analytics::DetectorConfig& cfg) {
    cfg.atr_period = j.value("atr_period", cfg.atr_period);
    cfg.window_bars = j.value("window_bars", cfg.window_bars);

    if (j.contains("structure")) {
        const auto& s = j["structure"];
        cfg.structure.confirm_window = s.value("confirm_window", cfg.structure.confirm_window);
        cfg.structure.displacement_multiplier =
            s.value("displacement_multiplier", cfg.structure.displacement_multiplier);
        cfg.structure.displacement_lookback =
            s.value("displacement_lookback", cfg.structure.displacement_lookback);
        cfg.structure.max_swings = s.value("max_swings", cfg.structure.max_swings);
    }

    if (j.contains("order_block")) {
        const auto& s = j["order_block"];
        if (s.contains("impulse_ratio")) {
            readResolutionTable(s["impulse_ratio"], cfg.order_block.impulse_ratio);
        }
        cfg.order_block.default_impulse_ratio =
            s.value("default_impulse_ratio", cfg.order_block.default_impulse_ratio);
        cfg.order_block.wick_allowance = s.value("wick_allowance", cfg.order_block.wick_allowance);
        cfg.order_block.max_zones_per_side = s.value("max_zones_per_side", cfg.order_block.max_zones_per_side);
        cfg.order_block.max_age_bars = s.value("max_age_bars", cfg.order_block.max_age_bars);
    }

    if (j.contains("gap")) {
        const auto& s = j["gap"];
        if (s.contains("min_gap_pips")) {
            readResolutionTable(s["min_gap_pips"], cfg.gap.min_gap_pips);
        }
        cfg.gap.default_min_gap_pips = s.value("default_min_gap_pips", cfg.gap.default_min_gap_pips);
        cfg.gap.max_zones_per_side = s.value("max_zones_per_side", cfg.gap.max_zones_per_side);
        cfg.gap.max_age_bars = s.value("max_age_bars", cfg.gap.max_age_bars);
    }

    if (j.contains("breaker")) {
        const auto& s = j["breaker"];
        cfg.breaker.enabled = s.value("enabled", cfg.breaker.enabled);
        cfg.breaker.max_zones_per_side = s.value("max_zones_per_side", cfg.breaker.max_zones_per_side);
        cfg.breaker.max_age_bars = s.value("max_age_bars", cfg.breaker.max_age_bars);
    }

    if (j.contains("sweep")) {
        const auto& s = j["sweep"];
        cfg.sweep.equal_tolerance_atr = s.value("equal_tolerance_atr", cfg.sweep.equal_tolerance_atr);
        cfg.sweep.penetration_atr = s.value("penetration_atr", cfg.sweep.penetration_atr);
        cfg.sweep.track_session_levels = s.value("track_session_levels", cfg.sweep.track_session_levels);
        cfg.sweep.max_levels_per_side = s.value("max_levels_per_side", cfg.sweep.max_levels_per_side);
        cfg.sweep.recent_sweep_bars = s.value("recent_sweep_bars", cfg.sweep.recent_sweep_bars);
    }

    if (j.contains("range")) {
        const auto& s = j["range"];
        cfg.range.discount_threshold = s.value("discount_threshold", cfg.range.discount_threshold);
        cfg.range.premium_threshold = s.value("premium_threshold", cfg.range.premium_threshold);
        cfg.range.optimal_low = s.value("optimal_low", cfg.range.optimal_low);
        cfg.range.optimal_high = s.value("optimal_high", cfg.range.optimal_high);
    }
}

void readScorer(const nlohmann::json& s, strategy::ScorerConfig& cfg) {
    if (s.contains("weights")) {
        const auto& w = s["weights"];
        cfg.weights.macro_trend = w.value("macro_trend", cfg.weights.macro_trend);
        cfg.weights.intermediate_structure = w.value("intermediate_structure", cfg.weights.intermediate_structure);
        cfg.weights.order_block = w.value("order_block", cfg.weights.order_block);
        cfg.weights.gap = w.value("gap", cfg.weights.gap);
        cfg.weights.sweep = w.value("sweep", cfg.weights.sweep);
        cfg.weights.range_position = w.value("range_position", cfg.weights.range_position);
    }
    cfg.min_confidence = s.value("min_confidence", cfg.min_confidence);
    cfg.neutral_trend_credit = s.value("neutral_trend_credit", cfg.neutral_trend_credit);
    cfg.range_zone_credit = s.value("range_zone_credit", cfg.range_zone_credit);
    cfg.breaker_credit = s.value("breaker_credit", cfg.breaker_credit);
    cfg.macro_conflict_multiplier = s.value("macro_conflict_multiplier", cfg.macro_conflict_multiplier);
    cfg.intermediate_conflict_multiplier =
        s.value("intermediate_conflict_multiplier", cfg.intermediate_conflict_multiplier);
    cfg.allow_counter_trend = s.value("allow_counter_trend", cfg.allow_counter_trend);
    cfg.counter_trend_depth = s.value("counter_trend_depth", cfg.counter_trend_depth);
    cfg.stop_atr_buffer = s.value("stop_atr_buffer", cfg.stop_atr_buffer);
    cfg.min_reward_multiple = s.value("min_reward_multiple", cfg.min_reward_multiple);
}

void readRisk(const nlohmann::json& r, risk::RiskConfig& cfg) {
    cfg.risk_fraction = r.value("risk_fraction", cfg.risk_fraction);
    cfg.global_max_size = r.value("global_max_size", cfg.global_max_size);
    cfg.sanity_multiple = r.value("sanity_multiple", cfg.sanity_multiple);
    cfg.daily_loss_limit = r.value("daily_loss_limit", cfg.daily_loss_limit);
    cfg.max_daily_trades = r.value("max_daily_trades", cfg.max_daily_trades);
    if (r.contains("class_max_size")) {
        const auto& table = r["class_max_size"];
        for (auto it = table.begin(); it != table.end(); ++it) {
            cfg.class_max_size[risk::parseInstrumentClass(it.key())] = it.value().get<double>();
        }
    }
}

void readManagement(const nlohmann::json& m, risk::ManagementConfig& cfg) {
    cfg.trailing_enabled = m.value("trailing_enabled", cfg.trailing_enabled);
    cfg.trailing_start_r = m.value("trailing_start_r", cfg.trailing_start_r);
    cfg.trailing_distance_r = m.value("trailing_distance_r", cfg.trailing_distance_r);
    cfg.breakeven_enabled = m.value("breakeven_enabled", cfg.breakeven_enabled);
    cfg.breakeven_trigger_r = m.value("breakeven_trigger_r", cfg.breakeven_trigger_r);
    cfg.breakeven_offset_pips = m.value("breakeven_offset_pips", cfg.breakeven_offset_pips);
    cfg.partial_enabled = m.value("partial_enabled", cfg.partial_enabled);
    cfg.partial_close_r = m.value("partial_close_r", cfg.partial_close_r);
    cfg.partial_fraction = m.value("partial_fraction", cfg.partial_fraction);
}

void readEngine(const nlohmann::json& e, engine::EngineConfig& cfg) {
    cfg.initial_balance = e.value("initial_balance", cfg.initial_balance);
    if (e.contains("macro_resolution")) {
        cfg.macro_resolution = parseResolution(e["macro_resolution"].get<std::string>());
    }
    if (e.contains("intermediate_resolution")) {
        cfg.intermediate_resolution = parseResolution(e["intermediate_resolution"].get<std::string>());
    }
    if (e.contains("execution_resolution")) {
        cfg.execution_resolution = parseResolution(e["execution_resolution"].get<std::string>());
    }
    cfg.warmup_bars = e.value("warmup_bars", cfg.warmup_bars);
    cfg.start_date = e.value("start_date", cfg.start_date);
    cfg.end_date = e.value("end_date", cfg.end_date);
    cfg.journal_path = e.value("journal_path", cfg.journal_path);
    cfg.checkpoint_path = e.value("checkpoint_path", cfg.checkpoint_path);

    if (e.contains("monte_carlo")) {
        const auto& mc = e["monte_carlo"];
        cfg.monte_carlo_simulations = mc.value("simulations", cfg.monte_carlo_simulations);
        cfg.monte_carlo_seed = mc.value("seed", cfg.monte_carlo_seed);
        cfg.ruin_drawdown = mc.value("ruin_drawdown", cfg.ruin_drawdown);
    }
}

void readEmbargo(const nlohmann::json& n, strategy::EmbargoConfig& cfg,
                 std::vector<strategy::ScheduledEvent>& events) {
    cfg.enabled = n.value("enabled", cfg.enabled);
    cfg.minutes_before = n.value("minutes_before", cfg.minutes_before);
    cfg.minutes_after = n.value("minutes_after", cfg.minutes_after);
    cfg.block_high = n.value("block_high", cfg.block_high);
    cfg.block_medium = n.value("block_medium", cfg.block_medium);

    if (n.contains("events")) {
        for (const auto& item : n["events"]) {
            strategy::ScheduledEvent event;
            event.timestamp = item.value("timestamp", 0LL);
            event.impact = strategy::parseImpactLevel(item.value("impact", std::string("none")));
            event.title = item.value("title", std::string());
            if (item.contains("codes")) {
                event.codes = item["codes"].get<std::vector<std::string>>();
            }
            events.push_back(std::move(event));
        }
    }
}

// A "windows" key replaces the default windows
void readSessions(const nlohmann::json& n, strategy::SessionConfig& cfg) {
    cfg.enabled = n.value("enabled", cfg.enabled);
    if (n.contains("windows")) {
        cfg.windows.clear();
        for (const auto& item : n["windows"]) {
            strategy::SessionWindow window;
            window.name = item.value("name", std::string());
            window.start_minute = strategy::parseMinuteOfDay(item.at("start").get<std::string>());
            window.end_minute = strategy::parseMinuteOfDay(item.at("end").get<std::string>());
            cfg.windows.push_back(std::move(window));
        }
    }
    if (cfg.enabled && cfg.windows.empty()) {
        throw std::runtime_error("Session gate enabled without any window");
    }
}

InstrumentSpec readInstrument(const nlohmann::json& item) {
    InstrumentSpec spec;
    spec.meta.symbol = item.value("symbol", std::string());
    if (spec.meta.symbol.empty()) {
        throw std::runtime_error("Instrument entry without a symbol");
    }
    spec.meta.instrument_class = risk::parseInstrumentClass(item.value("class", std::string("forex")));
    spec.meta.unit_value = item.value("unit_value", 0.0);
    spec.meta.pip_size = item.value("pip_size", 0.0);
    spec.meta.min_increment = item.value("min_increment", spec.meta.min_increment);
    spec.meta.spread = item.value("spread", 0.0);
    if (!(spec.meta.min_increment > 0.0) || !std::isfinite(spec.meta.min_increment)) {
        throw std::runtime_error("Instrument " + spec.meta.symbol + ": min_increment must be positive");
    }

    if (!spec.meta.isResolved()) {
        LOG_WARN("Instrument {} has no usable unit_value/pip_size; its signals will be dropped",
                 spec.meta.symbol);
    }

    if (item.contains("data")) {
        const auto& data = item["data"];
        for (auto it = data.begin(); it != data.end(); ++it) {
            spec.data_files[parseResolution(it.key())] = it.value().get<std::string>();
        }
    }
    return spec;
}
}

AppConfig Config::fromJson(const nlohmann::json& j) {
    AppConfig config;
    try {
        if (j.contains("logging")) {
            config.logging.level = j["logging"].value("level", config.logging.level);
            config.logging.dir = j["logging"].value("dir", config.logging.dir);
        }
        if (j.contains("engine")) readEngine(j["engine"], config.engine);
        if (j.contains("risk")) readRisk(j["risk"], config.engine.risk);
        if (j.contains("management")) readManagement(j["management"], config.engine.management);
        if (j.contains("detectors")) readDetectors(j["detectors"], config.detectors);
        if (j.contains("scorer")) readScorer(j["scorer"], config.scorer);
        if (j.contains("embargo")) readEmbargo(j["embargo"], config.embargo, config.events);
        if (j.contains("sessions")) readSessions(j["sessions"], config.sessions);
        if (j.contains("instruments")) {
            for (const auto& item : j["instruments"]) {
                config.instruments.push_back(readInstrument(item));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    // one increment must fit under the instrument's caps
    const auto& risk_cfg = config.engine.risk;
    for (const auto& instrument : config.instruments) {
        const auto it = risk_cfg.class_max_size.find(instrument.meta.instrument_class);
        const double class_max = it != risk_cfg.class_max_size.end() ? it->second : risk_cfg.global_max_size;
        if (instrument.meta.min_increment > std::min(class_max, risk_cfg.global_max_size)) {
            throw std::runtime_error("Instrument " + instrument.meta.symbol + ": min_increment " +
                                     std::to_string(instrument.meta.min_increment) +
                                     " exceeds the size cap of its class");
        }
    }
    return config;
}

AppConfig Config::load(const std::string& path) {
    std::filesystem::path config_path = std::filesystem::path(path).is_absolute()
        ? std::filesystem::path(path)
        : utils::PathUtils::resolveRelativePath(path);

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}, using defaults", config_path.string());
        return AppConfig{};
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + config_path.string() + ": " + e.what());
    }

    AppConfig config = fromJson(j);

    const auto base_dir = config_path.parent_path();
    for (auto& instrument : config.instruments) {
        for (auto& entry : instrument.data_files) {
            std::filesystem::path data_path(entry.second);
            if (data_path.is_relative()) {
                entry.second = (base_dir / data_path).lexically_normal().string();
            }
        }
    }

    LOG_INFO("Config loaded from {}: {} instrument(s), {} scheduled event(s)",
             config_path.string(), config.instruments.size(), config.events.size());
    return config;
}

} // namespace confluence
