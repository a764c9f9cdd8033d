#pragma once

#include <map>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"

namespace phoenix {
namespace engine {

struct InstrumentConfig {
    std::string symbol = "EUR_USD";
    double pip_size = 0.0;          // 0 = derive from symbol
};

// Thresholds of the three safety laws; immutable for a run
struct SafetyLawConfig {
    double max_sl_pips = 50.0;              // Tourniquet ceiling
    double winner_rr_threshold = 2.5;       // Winner trigger (reward / original risk)
    double breakeven_buffer_pips = 1.0;     // Winner lock offset beyond entry
    int zombie_threshold_bars = 40;         // Zombie staleness period
    double zombie_step_pips = 5.0;          // Zombie tightening per period
    double trailing_distance_pips = 0.0;    // 0 = no trailing after first TP
    double min_reward_risk = 0.0;           // 0 = no floor
};

struct RiskTier {
    double drawdown_threshold = 0.0;
    double multiplier = 1.0;
};

struct RiskConfig {
    double initial_equity = 100000.0;
    std::vector<RiskTier> ladder;
    std::map<analytics::MarketRegime, double> regime_multipliers;
    double skip_floor = 0.2;
    int max_concurrent_positions = 5;
    double daily_loss_limit_pct = 0.05;
    double max_risk_per_trade_pct = 0.02;   // stop distance x size vs equity; 0 = uncapped
    double min_trade_size = 0.0;            // smaller scaled sizes are skipped

    RiskConfig()
        : ladder{{0.0, 1.0}, {0.05, 0.75}, {0.10, 0.5}, {0.20, 0.25}}
        , regime_multipliers{
              {analytics::MarketRegime::UNKNOWN, 1.0},
              {analytics::MarketRegime::TRENDING_UP, 1.0},
              {analytics::MarketRegime::TRENDING_DOWN, 1.0},
              {analytics::MarketRegime::RANGING, 0.8},
              {analytics::MarketRegime::HIGH_VOLATILITY, 0.5}}
    {}
};

struct CostConfig {
    double fee_per_unit = 0.0;              // round-trip commission per unit
    double fee_per_fill = 0.0;              // flat ticket charge per exit fill
    double slippage_pips = 0.0;             // fixed slippage per unit
    double slippage_range_factor = 0.0;     // share of bar range lost per unit
};

struct EngineConfig {
    InstrumentConfig instrument;
    SafetyLawConfig safety;
    RiskConfig risk;
    CostConfig costs;
    std::string log_level = "info";
    std::string log_dir = "logs";

    // Throws ConfigError when the config cannot drive a run
    void validate() const;

    double pipSize() const;
};

} // namespace engine
} // namespace phoenix
