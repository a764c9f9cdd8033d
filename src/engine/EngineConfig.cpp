#include "engine/EngineConfig.h"
#include "common/Errors.h"
#include "common/PipMath.h"

#include <cmath>
#include <string>

namespace phoenix {
namespace engine {

double EngineConfig::pipSize() const {
    if (instrument.pip_size > 0.0) {
        return instrument.pip_size;
    }
    return common::pipSizeForSymbol(instrument.symbol);
}

void EngineConfig::validate() const {
    if (instrument.pip_size < 0.0) {
        throw ConfigError("instrument.pip_size must be >= 0");
    }
    if (!(safety.max_sl_pips > 0.0)) {
        throw ConfigError("safety.max_sl_pips must be > 0");
    }
    if (!(safety.winner_rr_threshold > 0.0)) {
        throw ConfigError("safety.winner_rr_threshold must be > 0");
    }
    if (safety.breakeven_buffer_pips < 0.0) {
        throw ConfigError("safety.breakeven_buffer_pips must be >= 0");
    }
    if (safety.zombie_threshold_bars <= 0) {
        throw ConfigError("safety.zombie_threshold_bars must be > 0");
    }
    if (safety.zombie_step_pips < 0.0 || safety.trailing_distance_pips < 0.0 ||
        safety.min_reward_risk < 0.0) {
        throw ConfigError("safety distances must be >= 0");
    }

    if (!(risk.initial_equity > 0.0)) {
        throw ConfigError("risk.initial_equity must be > 0");
    }
    if (risk.skip_floor < 0.0 || risk.skip_floor > 1.0) {
        throw ConfigError("risk.skip_floor must be within [0, 1]");
    }
    if (risk.max_concurrent_positions <= 0) {
        throw ConfigError("risk.max_concurrent_positions must be > 0");
    }
    if (risk.daily_loss_limit_pct < 0.0) {
        throw ConfigError("risk.daily_loss_limit_pct must be >= 0");
    }
    if (risk.max_risk_per_trade_pct < 0.0 || risk.max_risk_per_trade_pct > 1.0) {
        throw ConfigError("risk.max_risk_per_trade_pct must be within [0, 1]");
    }
    if (risk.min_trade_size < 0.0) {
        throw ConfigError("risk.min_trade_size must be >= 0");
    }

    // Ladder: thresholds strictly increasing within [0, 1), multipliers non-increasing
    for (size_t i = 0; i < risk.ladder.size(); ++i) {
        const auto& tier = risk.ladder[i];
        if (tier.drawdown_threshold < 0.0 || tier.drawdown_threshold >= 1.0) {
            throw ConfigError("risk.ladder threshold out of [0, 1): " +
                              std::to_string(tier.drawdown_threshold));
        }
        if (tier.multiplier < 0.0 || !std::isfinite(tier.multiplier)) {
            throw ConfigError("risk.ladder multiplier must be >= 0");
        }
        if (i > 0) {
            const auto& prev = risk.ladder[i - 1];
            if (tier.drawdown_threshold <= prev.drawdown_threshold) {
                throw ConfigError("risk.ladder thresholds must be strictly increasing");
            }
            if (tier.multiplier > prev.multiplier) {
                throw ConfigError("risk.ladder multipliers must not increase with drawdown");
            }
        }
    }

    for (const auto& [regime, multiplier] : risk.regime_multipliers) {
        if (multiplier < 0.0 || !std::isfinite(multiplier)) {
            throw ConfigError(std::string("regime multiplier must be >= 0 for ") +
                              analytics::regimeToString(regime));
        }
    }

    if (costs.fee_per_unit < 0.0 || costs.fee_per_fill < 0.0 ||
        costs.slippage_pips < 0.0 || costs.slippage_range_factor < 0.0) {
        throw ConfigError("cost parameters must be >= 0");
    }
}

} // namespace engine
} // namespace phoenix
