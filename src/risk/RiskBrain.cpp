#include "risk/RiskBrain.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace phoenix {
namespace risk {

namespace {
constexpr double FULL_SIZE_TOLERANCE = 1e-9;

std::string describe(double ladder, double regime, double combined) {
    std::ostringstream oss;
    oss << "ladder=" << ladder << " regime=" << regime << " combined=" << combined;
    return oss.str();
}
}

const char* triageDecisionToString(TriageDecision decision) {
    switch (decision) {
        case TriageDecision::ALLOW_FULL: return "ALLOW_FULL";
        case TriageDecision::ALLOW_REDUCED: return "ALLOW_REDUCED";
        case TriageDecision::SKIP: return "SKIP";
    }
    return "SKIP";
}

RiskBrain::RiskBrain(const engine::RiskConfig& config, double pip_size)
    : config_(config)
    , pip_size_(pip_size) {
    if (!(pip_size_ > 0.0)) {
        throw ConfigError("risk pip size must be > 0");
    }
    std::sort(config_.ladder.begin(), config_.ladder.end(),
              [](const engine::RiskTier& a, const engine::RiskTier& b) {
                  return a.drawdown_threshold < b.drawdown_threshold;
              });
    for (size_t i = 1; i < config_.ladder.size(); ++i) {
        if (config_.ladder[i].multiplier > config_.ladder[i - 1].multiplier) {
            throw ConfigError("risk ladder multipliers must not increase with drawdown");
        }
    }
    if (config_.skip_floor < 0.0) {
        throw ConfigError("risk skip floor must be >= 0");
    }
}

double RiskBrain::ladderMultiplier(double drawdown) const {
    double multiplier = 1.0;
    for (const auto& tier : config_.ladder) {
        if (tier.drawdown_threshold <= drawdown) {
            multiplier = tier.multiplier;
        } else {
            break;
        }
    }
    return multiplier;
}

double RiskBrain::regimeMultiplier(analytics::MarketRegime regime) const {
    auto it = config_.regime_multipliers.find(regime);
    if (it == config_.regime_multipliers.end()) {
        return 1.0;
    }
    return it->second;
}

TriageResult RiskBrain::triage(const AccountState& account,
                               analytics::MarketRegime regime,
                               const Engagement& engagement,
                               int open_positions) const {
    TriageResult result;
    result.drawdown = account.drawdown();

    // Portfolio gate before sizing
    if (open_positions >= config_.max_concurrent_positions) {
        result.decision = TriageDecision::SKIP;
        result.combined_multiplier = 0.0;
        result.reason = "max concurrent positions (" +
                        std::to_string(config_.max_concurrent_positions) + ") reached";
        return result;
    }
    if (config_.daily_loss_limit_pct > 0.0 &&
        account.dailyLoss() >= config_.daily_loss_limit_pct) {
        result.decision = TriageDecision::SKIP;
        result.combined_multiplier = 0.0;
        result.reason = "daily loss limit hit";
        return result;
    }

    result.ladder_multiplier = ladderMultiplier(result.drawdown);
    result.regime_multiplier = regimeMultiplier(regime);
    result.combined_multiplier = result.ladder_multiplier * result.regime_multiplier;

    const std::string detail = describe(result.ladder_multiplier,
                                        result.regime_multiplier,
                                        result.combined_multiplier);

    if (result.combined_multiplier < config_.skip_floor) {
        result.decision = TriageDecision::SKIP;
        result.reason = "multiplier below floor: " + detail;
        return result;
    }

    result.scaled_size = engagement.requested_size * result.combined_multiplier;
    if (!(result.scaled_size > 0.0)) {
        result.decision = TriageDecision::SKIP;
        result.scaled_size = 0.0;
        result.reason = "scaled size is zero: " + detail;
        return result;
    }

    const bool full = std::abs(result.combined_multiplier - 1.0) <= FULL_SIZE_TOLERANCE;
    if (full) {
        result.scaled_size = engagement.requested_size;
    }

    // Loss at the stop may not exceed the per-trade share of equity
    bool capped = false;
    if (config_.max_risk_per_trade_pct > 0.0) {
        const double budget = config_.max_risk_per_trade_pct * std::max(0.0, account.equity);
        const double stop_price = engagement.stop_distance_pips * pip_size_;
        if (stop_price > 0.0 && result.scaled_size * stop_price > budget) {
            result.scaled_size = budget / stop_price;
            capped = true;
        }
    }

    if (!(result.scaled_size > 0.0) || result.scaled_size < config_.min_trade_size) {
        std::ostringstream oss;
        oss << "size below minimum " << config_.min_trade_size << " after risk cap: " << detail;
        result.decision = TriageDecision::SKIP;
        result.scaled_size = 0.0;
        result.reason = oss.str();
        return result;
    }

    result.decision = (full && !capped) ? TriageDecision::ALLOW_FULL : TriageDecision::ALLOW_REDUCED;
    result.reason = capped ? detail + " risk_capped" : detail;
    return result;
}

} // namespace risk
} // namespace phoenix
