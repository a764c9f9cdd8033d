#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/Position.h"

namespace phoenix {
namespace safety {

enum class LawAction {
    NO_OP,
    REJECT,         // engagement never opens
    FORCE_CLOSE,    // open position closes at market
    MUTATE          // stop moves to new_stop_price
};

enum class SafetyLaw {
    NONE,
    TOURNIQUET,
    WINNER,
    ZOMBIE
};

const char* lawActionToString(LawAction action);
const char* safetyLawToString(SafetyLaw law);

struct LawDecision {
    LawAction action = LawAction::NO_OP;
    SafetyLaw law = SafetyLaw::NONE;
    double new_stop_price = 0.0;
    bool lock_breakeven = false;        // Winner sets the lock flag
    int zombie_period = 0;              // staleness period the Zombie acted on
    std::string reason;

    bool fired() const { return action != LawAction::NO_OP; }
};

struct EngagementCheck {
    bool valid = true;
    std::string reason;
};

// Stateless apart from its thresholds; every method is a pure function of
// the snapshot handed in.
class SafetyLawEvaluator {
public:
    SafetyLawEvaluator(const engine::SafetyLawConfig& config, double pip_size);

    // Shape checks that classify an engagement as invalid before any law runs
    EngagementCheck validateEngagement(const Engagement& engagement) const;

    // REJECT when the proposed stop distance reaches MAX_SL_PIPS
    LawDecision tourniquet(const Engagement& engagement) const;

    // FORCE_CLOSE when a stop distance on an open position reaches MAX_SL_PIPS
    LawDecision tourniquet(double stop_distance_pips) const;
    LawDecision tourniquet(const engine::Position& position) const;

    LawDecision winner(const engine::Position& position, double market_price) const;
    LawDecision zombie(const engine::Position& position) const;

    // Tourniquet > Winner > Zombie. A FORCE_CLOSE ends the list; a Winner
    // mutation is visible to the Zombie evaluation that follows it.
    std::vector<LawDecision> evaluateOpenPosition(const engine::Position& position,
                                                  double market_price) const;

    // Stop level the Winner lock moves to: entry + buffer in the trade's favour
    double breakevenPrice(const engine::Position& position) const;

    // Reward/risk of an open position: max(unrealized, locked) / original risk
    double rewardRisk(const engine::Position& position, double market_price) const;

    double adverseStopDistancePips(const engine::Position& position) const;

    const engine::SafetyLawConfig& config() const { return config_; }
    double pipSize() const { return pip_size_; }

private:
    engine::SafetyLawConfig config_;
    double pip_size_;
};

// True when `candidate` is at least as protective as `current` for `direction`
bool isStopTighterOrEqual(Direction direction, double candidate, double current);

} // namespace safety
} // namespace phoenix
