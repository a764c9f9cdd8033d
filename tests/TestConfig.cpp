#include "common/Config.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace phoenix;
using phoenix::analytics::MarketRegime;

namespace {
bool near(double a, double b, double eps = 1e-12) {
    return std::abs(a - b) <= eps;
}

template <typename Fn>
bool throwsConfigError(Fn fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    unsetenv("PHOENIX_LOG_LEVEL");
    unsetenv("PHOENIX_MAX_SL_PIPS");
    unsetenv("PHOENIX_INITIAL_EQUITY");

    // Defaults survive an empty document
    {
        auto cfg = Config::parseEngineConfig(nlohmann::json::object());
        assert(cfg.instrument.symbol == "EUR_USD");
        assert(near(cfg.pipSize(), 0.0001));
        assert(near(cfg.safety.max_sl_pips, 50.0));
        assert(cfg.safety.zombie_threshold_bars == 40);
        assert(cfg.risk.ladder.size() == 4);
        assert(near(cfg.risk.max_risk_per_trade_pct, 0.02));
        assert(cfg.risk.min_trade_size == 0.0);
        assert(near(cfg.risk.regime_multipliers[MarketRegime::RANGING], 0.8));
        cfg.validate();
    }

    // Every section is read
    {
        auto j = nlohmann::json::parse(R"({
            "instrument": { "symbol": "USD_JPY" },
            "safety": { "max_sl_pips": 15, "winner_rr_threshold": 2.0, "zombie_threshold_bars": 20,
                        "zombie_step_pips": 3, "trailing_distance_pips": 8, "min_reward_risk": 1.5 },
            "risk": { "initial_equity": 50000, "skip_floor": 0.3, "max_concurrent_positions": 2,
                      "daily_loss_limit_pct": 0.02, "max_risk_per_trade_pct": 0.01, "min_trade_size": 1000,
                      "ladder": [ { "drawdown": 0.0, "multiplier": 1.0 },
                                  { "drawdown": 0.08, "multiplier": 0.4 } ],
                      "regime_multipliers": { "volatile": 0.3, "SIDEWAYS": 0.9 } },
            "costs": { "fee_per_unit": 0.00002, "slippage_pips": 0.5 },
            "logging": { "level": "debug", "dir": "/tmp/phoenix_logs" }
        })");
        auto cfg = Config::parseEngineConfig(j);
        assert(near(cfg.pipSize(), 0.01));
        assert(near(cfg.safety.max_sl_pips, 15.0));
        assert(cfg.safety.zombie_threshold_bars == 20);
        assert(near(cfg.safety.trailing_distance_pips, 8.0));
        assert(near(cfg.risk.initial_equity, 50000.0));
        assert(cfg.risk.max_concurrent_positions == 2);
        assert(near(cfg.risk.max_risk_per_trade_pct, 0.01));
        assert(near(cfg.risk.min_trade_size, 1000.0));
        assert(cfg.risk.ladder.size() == 2);
        assert(near(cfg.risk.ladder[1].multiplier, 0.4));
        assert(near(cfg.risk.regime_multipliers[MarketRegime::HIGH_VOLATILITY], 0.3));
        assert(near(cfg.risk.regime_multipliers[MarketRegime::RANGING], 0.9));
        assert(near(cfg.risk.regime_multipliers[MarketRegime::TRENDING_UP], 1.0));
        assert(near(cfg.costs.slippage_pips, 0.5));
        assert(cfg.log_level == "debug");
        assert(cfg.log_dir == "/tmp/phoenix_logs");
        cfg.validate();

        cfg.instrument.pip_size = 0.5;
        assert(near(cfg.pipSize(), 0.5));
    }

    // Malformed content is a ConfigError
    {
        assert(throwsConfigError([] {
            Config::parseEngineConfig(nlohmann::json::parse(R"({"risk": {"regime_multipliers": {"CRASH": 0.1}}})"));
        }));
        assert(throwsConfigError([] {
            Config::applyOverrides(engine::EngineConfig(),
                                   nlohmann::json::parse(R"({"risk": {"min_trade_size": "small"}})"));
        }));
        assert(throwsConfigError([] {
            Config::parseEngineConfig(nlohmann::json::array());
        }));
        assert(throwsConfigError([] {
            Config::applyOverrides(engine::EngineConfig(),
                                   nlohmann::json::parse(R"({"safety": {"max_sl_pips": "wide"}})"));
        }));

        engine::EngineConfig rising;
        rising.risk.ladder = {{0.0, 0.5}, {0.1, 0.9}};
        assert(throwsConfigError([&] { rising.validate(); }));

        engine::EngineConfig unordered;
        unordered.risk.ladder = {{0.1, 0.5}, {0.1, 0.4}};
        assert(throwsConfigError([&] { unordered.validate(); }));

        engine::EngineConfig beyond;
        beyond.risk.ladder = {{0.0, 1.0}, {1.0, 0.1}};
        assert(throwsConfigError([&] { beyond.validate(); }));

        engine::EngineConfig reckless;
        reckless.risk.max_risk_per_trade_pct = 1.5;
        assert(throwsConfigError([&] { reckless.validate(); }));

        engine::EngineConfig negative_floor;
        negative_floor.risk.min_trade_size = -1.0;
        assert(throwsConfigError([&] { negative_floor.validate(); }));

        engine::EngineConfig no_zombie;
        no_zombie.safety.zombie_threshold_bars = 0;
        assert(throwsConfigError([&] { no_zombie.validate(); }));
    }

    // Packs and overrides
    {
        auto j = nlohmann::json::parse(R"({
            "packs": [ { "name": "tight", "overrides": { "safety": { "max_sl_pips": 15 } } },
                       { "overrides": { "risk": { "skip_floor": 0.5 } } } ]
        })");
        auto packs = Config::parsePacks(j);
        assert(packs.size() == 2);
        assert(packs[0].name == "tight");
        assert(packs[1].name == "pack_1");

        engine::EngineConfig base;
        base.safety.winner_rr_threshold = 3.0;
        auto tight = Config::applyOverrides(base, packs[0].overrides);
        assert(near(tight.safety.max_sl_pips, 15.0));
        assert(near(tight.safety.winner_rr_threshold, 3.0));
        assert(near(base.safety.max_sl_pips, 50.0));

        auto floor = Config::applyOverrides(base, packs[1].overrides);
        assert(near(floor.risk.skip_floor, 0.5));

        assert(Config::parsePacks(nlohmann::json::object()).empty());
    }

    // Environment wins over file values; garbage is ignored
    {
        setenv("PHOENIX_MAX_SL_PIPS", " 25 ", 1);
        setenv("PHOENIX_INITIAL_EQUITY", "12abc", 1);
        setenv("PHOENIX_LOG_LEVEL", "warn", 1);

        engine::EngineConfig cfg;
        Config::applyEnvironment(cfg);
        assert(near(cfg.safety.max_sl_pips, 25.0));
        assert(near(cfg.risk.initial_equity, 100000.0));
        assert(cfg.log_level == "warn");

        unsetenv("PHOENIX_MAX_SL_PIPS");
        unsetenv("PHOENIX_INITIAL_EQUITY");
        unsetenv("PHOENIX_LOG_LEVEL");
    }

    // Singleton load from disk
    {
        const auto path = std::filesystem::temp_directory_path() / "phoenix_config_test.json";
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({ "safety": { "max_sl_pips": 20 },
                        "packs": [ { "name": "baseline", "overrides": {} } ] })";
        }

        Config& config = Config::getInstance();
        config.load(path.string());
        assert(near(config.getEngineConfig().safety.max_sl_pips, 20.0));
        assert(config.getPacks().size() == 1);
        assert(config.getLogLevel() == "info");

        {
            std::ofstream out(path, std::ios::trunc);
            out << "{ \"safety\": ";
        }
        assert(throwsConfigError([&] { config.load(path.string()); }));
        // Failed load keeps the previous values
        assert(near(config.getEngineConfig().safety.max_sl_pips, 20.0));

        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({ "risk": { "initial_equity": -5 } })";
        }
        assert(throwsConfigError([&] { config.load(path.string()); }));
        std::filesystem::remove(path);

        config.load((std::filesystem::temp_directory_path() / "phoenix_missing_config.json").string());
        assert(near(config.getEngineConfig().safety.max_sl_pips, 50.0));
        assert(config.getPacks().empty());
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
