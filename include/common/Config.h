#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace phoenix {

// Named parameter combination run through the simulator in a batch
struct PackDefinition {
    std::string name;
    nlohmann::json overrides = nlohmann::json::object();
};

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; malformed or invalid content throws ConfigError
    void load(const std::string& config_path);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    void setEngineConfig(const engine::EngineConfig& cfg) { engine_config_ = cfg; }
    std::vector<PackDefinition> getPacks() const { return packs_; }
    std::string getLogLevel() const { return engine_config_.log_level; }

    // Defaults overlaid with every key present in `j`
    static engine::EngineConfig parseEngineConfig(const nlohmann::json& j);

    // Copy of `base` with the keys present in `overrides` replaced
    static engine::EngineConfig applyOverrides(const engine::EngineConfig& base,
                                               const nlohmann::json& overrides);

    static std::vector<PackDefinition> parsePacks(const nlohmann::json& j);

    // PHOENIX_* environment variables win over file values
    static void applyEnvironment(engine::EngineConfig& cfg);

private:
    Config() = default;

    engine::EngineConfig engine_config_;
    std::vector<PackDefinition> packs_;
};

} // namespace phoenix
