#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace phoenix {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

bool readEnvDouble(const char* name, double& out) {
    const std::string raw = readEnvVar(name);
    if (raw.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        const double parsed = std::stod(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument(raw);
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        LOG_WARN("Invalid {} value '{}'. Ignored.", name, raw);
        return false;
    }
}

void overlay(engine::EngineConfig& cfg, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    if (j.contains("instrument")) {
        const auto& t = j["instrument"];
        cfg.instrument.symbol = t.value("symbol", cfg.instrument.symbol);
        cfg.instrument.pip_size = t.value("pip_size", cfg.instrument.pip_size);
    }

    if (j.contains("safety")) {
        const auto& s = j["safety"];
        auto& law = cfg.safety;
        law.max_sl_pips = s.value("max_sl_pips", law.max_sl_pips);
        law.winner_rr_threshold = s.value("winner_rr_threshold", law.winner_rr_threshold);
        law.breakeven_buffer_pips = s.value("breakeven_buffer_pips", law.breakeven_buffer_pips);
        law.zombie_threshold_bars = s.value("zombie_threshold_bars", law.zombie_threshold_bars);
        law.zombie_step_pips = s.value("zombie_step_pips", law.zombie_step_pips);
        law.trailing_distance_pips = s.value("trailing_distance_pips", law.trailing_distance_pips);
        law.min_reward_risk = s.value("min_reward_risk", law.min_reward_risk);
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        auto& risk = cfg.risk;
        risk.initial_equity = r.value("initial_equity", risk.initial_equity);
        risk.skip_floor = r.value("skip_floor", risk.skip_floor);
        risk.max_concurrent_positions = r.value("max_concurrent_positions", risk.max_concurrent_positions);
        risk.daily_loss_limit_pct = r.value("daily_loss_limit_pct", risk.daily_loss_limit_pct);
        risk.max_risk_per_trade_pct = r.value("max_risk_per_trade_pct", risk.max_risk_per_trade_pct);
        risk.min_trade_size = r.value("min_trade_size", risk.min_trade_size);

        if (r.contains("ladder")) {
            risk.ladder.clear();
            for (const auto& tier : r["ladder"]) {
                engine::RiskTier t;
                t.drawdown_threshold = tier.value("drawdown", 0.0);
                t.multiplier = tier.value("multiplier", 1.0);
                risk.ladder.push_back(t);
            }
        }

        if (r.contains("regime_multipliers")) {
            for (const auto& [key, value] : r["regime_multipliers"].items()) {
                const auto regime = analytics::regimeFromString(key);
                if (!regime) {
                    throw ConfigError("unknown regime label: " + key);
                }
                risk.regime_multipliers[*regime] = value.get<double>();
            }
        }
    }

    if (j.contains("costs")) {
        const auto& c = j["costs"];
        auto& costs = cfg.costs;
        costs.fee_per_unit = c.value("fee_per_unit", costs.fee_per_unit);
        costs.fee_per_fill = c.value("fee_per_fill", costs.fee_per_fill);
        costs.slippage_pips = c.value("slippage_pips", costs.slippage_pips);
        costs.slippage_range_factor = c.value("slippage_range_factor", costs.slippage_range_factor);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        cfg.log_level = l.value("level", cfg.log_level);
        cfg.log_dir = l.value("dir", cfg.log_dir);
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolve(path);

    LOG_INFO("Config path: {}", config_path.string());

    engine::EngineConfig cfg;
    std::vector<PackDefinition> packs;

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}. Using defaults.", config_path.string());
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("cannot open config file: " + config_path.string());
        }

        nlohmann::json j;
        try {
            file >> j;
            cfg = parseEngineConfig(j);
            packs = parsePacks(j);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("config parse error: ") + e.what());
        }
    }

    applyEnvironment(cfg);
    cfg.validate();

    engine_config_ = cfg;
    packs_ = std::move(packs);

    LOG_INFO("Config loaded: symbol={}, max_sl_pips={}, winner_rr={}, zombie={}/{}, packs={}",
             engine_config_.instrument.symbol,
             engine_config_.safety.max_sl_pips,
             engine_config_.safety.winner_rr_threshold,
             engine_config_.safety.zombie_threshold_bars,
             engine_config_.safety.zombie_step_pips,
             packs_.size());
}

engine::EngineConfig Config::parseEngineConfig(const nlohmann::json& j) {
    engine::EngineConfig cfg;
    overlay(cfg, j);
    return cfg;
}

engine::EngineConfig Config::applyOverrides(const engine::EngineConfig& base,
                                            const nlohmann::json& overrides) {
    engine::EngineConfig cfg = base;
    if (overrides.is_null()) {
        return cfg;
    }
    try {
        overlay(cfg, overrides);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("override parse error: ") + e.what());
    }
    return cfg;
}

std::vector<PackDefinition> Config::parsePacks(const nlohmann::json& j) {
    std::vector<PackDefinition> packs;
    if (!j.contains("packs")) {
        return packs;
    }

    int index = 0;
    for (const auto& p : j["packs"]) {
        PackDefinition def;
        def.name = p.value("name", "pack_" + std::to_string(index));
        def.overrides = p.value("overrides", nlohmann::json::object());
        packs.push_back(std::move(def));
        ++index;
    }
    return packs;
}

void Config::applyEnvironment(engine::EngineConfig& cfg) {
    const std::string level = readEnvVar("PHOENIX_LOG_LEVEL");
    if (!level.empty()) {
        cfg.log_level = level;
    }

    double value = 0.0;
    if (readEnvDouble("PHOENIX_MAX_SL_PIPS", value)) {
        cfg.safety.max_sl_pips = value;
    }
    if (readEnvDouble("PHOENIX_INITIAL_EQUITY", value)) {
        cfg.risk.initial_equity = value;
    }
}

} // namespace phoenix
