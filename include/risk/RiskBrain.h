#pragma once

#include <string>

#include "analytics/RegimeDetector.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "risk/AccountLedger.h"

namespace phoenix {
namespace risk {

enum class TriageDecision {
    ALLOW_FULL,
    ALLOW_REDUCED,
    SKIP
};

const char* triageDecisionToString(TriageDecision decision);

struct TriageResult {
    TriageDecision decision = TriageDecision::SKIP;
    double drawdown = 0.0;
    double ladder_multiplier = 1.0;
    double regime_multiplier = 1.0;
    double combined_multiplier = 1.0;
    double scaled_size = 0.0;
    std::string reason;
};

// Converts account drawdown and market regime into a sizing decision.
// Never mutates the account; callers pass the latest committed snapshot.
class RiskBrain {
public:
    // Throws ConfigError on a malformed ladder, floor or pip size.
    // pip_size converts stop distances to price for the per-trade risk cap.
    explicit RiskBrain(const engine::RiskConfig& config, double pip_size = 0.0001);

    // Multiplier of the tier with the greatest threshold <= drawdown, 1.0 below the first tier
    double ladderMultiplier(double drawdown) const;

    // 1.0 for labels missing from the table
    double regimeMultiplier(analytics::MarketRegime regime) const;

    TriageResult triage(const AccountState& account,
                        analytics::MarketRegime regime,
                        const Engagement& engagement,
                        int open_positions) const;

    const engine::RiskConfig& config() const { return config_; }

private:
    engine::RiskConfig config_;
    double pip_size_;
};

} // namespace risk
} // namespace phoenix
