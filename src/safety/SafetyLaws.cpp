#include "safety/SafetyLaws.h"
#include "common/PipMath.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace phoenix {
namespace safety {

namespace {
constexpr double PIP_EPSILON = 1e-9;
constexpr double FRACTION_EPSILON = 1e-9;
constexpr double PRICE_EPSILON = 1e-12;

std::string formatPips(double pips) {
    std::ostringstream oss;
    oss << pips;
    return oss.str();
}
}

const char* lawActionToString(LawAction action) {
    switch (action) {
        case LawAction::NO_OP: return "NO_OP";
        case LawAction::REJECT: return "REJECT";
        case LawAction::FORCE_CLOSE: return "FORCE_CLOSE";
        case LawAction::MUTATE: return "MUTATE";
    }
    return "NO_OP";
}

const char* safetyLawToString(SafetyLaw law) {
    switch (law) {
        case SafetyLaw::NONE: return "";
        case SafetyLaw::TOURNIQUET: return "TOURNIQUET";
        case SafetyLaw::WINNER: return "WINNER";
        case SafetyLaw::ZOMBIE: return "ZOMBIE";
    }
    return "";
}

bool isStopTighterOrEqual(Direction direction, double candidate, double current) {
    return directionSign(direction) * (candidate - current) >= -PRICE_EPSILON;
}

SafetyLawEvaluator::SafetyLawEvaluator(const engine::SafetyLawConfig& config, double pip_size)
    : config_(config)
    , pip_size_(pip_size) {}

EngagementCheck SafetyLawEvaluator::validateEngagement(const Engagement& engagement) const {
    EngagementCheck check;
    auto invalid = [&check](const std::string& reason) {
        check.valid = false;
        check.reason = reason;
        return check;
    };

    if (!std::isfinite(engagement.requested_size) || engagement.requested_size <= 0.0) {
        return invalid("non-positive size");
    }
    if (!std::isfinite(engagement.entry_price) || engagement.entry_price <= 0.0) {
        return invalid("non-positive entry price");
    }
    if (!std::isfinite(engagement.stop_distance_pips) || engagement.stop_distance_pips <= 0.0) {
        return invalid("zero risk distance");
    }
    if (engagement.take_profits.empty()) {
        return invalid("no take-profit level");
    }

    double fraction_sum = 0.0;
    double furthest_tp_pips = 0.0;
    for (const auto& tp : engagement.take_profits) {
        if (!(tp.distance_pips > 0.0)) {
            return invalid("take-profit distance must be positive");
        }
        if (!(tp.fraction > 0.0)) {
            return invalid("take-profit fraction must be positive");
        }
        fraction_sum += tp.fraction;
        furthest_tp_pips = std::max(furthest_tp_pips, tp.distance_pips);
    }
    if (fraction_sum > 1.0 + FRACTION_EPSILON) {
        return invalid("take-profit fractions sum above 1");
    }

    if (config_.min_reward_risk > 0.0) {
        const double rr = furthest_tp_pips / engagement.stop_distance_pips;
        if (rr + PIP_EPSILON < config_.min_reward_risk) {
            return invalid("reward/risk " + formatPips(rr) + " below floor " +
                           formatPips(config_.min_reward_risk));
        }
    }

    return check;
}

LawDecision SafetyLawEvaluator::tourniquet(const Engagement& engagement) const {
    LawDecision decision;
    if (engagement.stop_distance_pips + PIP_EPSILON >= config_.max_sl_pips) {
        decision.action = LawAction::REJECT;
        decision.law = SafetyLaw::TOURNIQUET;
        decision.reason = "stop " + formatPips(engagement.stop_distance_pips) +
                          " pips >= max " + formatPips(config_.max_sl_pips);
    }
    return decision;
}

LawDecision SafetyLawEvaluator::tourniquet(double stop_distance_pips) const {
    LawDecision decision;
    if (stop_distance_pips + PIP_EPSILON >= config_.max_sl_pips) {
        decision.action = LawAction::FORCE_CLOSE;
        decision.law = SafetyLaw::TOURNIQUET;
        decision.reason = "stop " + formatPips(stop_distance_pips) +
                          " pips >= max " + formatPips(config_.max_sl_pips);
    }
    return decision;
}

LawDecision SafetyLawEvaluator::tourniquet(const engine::Position& position) const {
    return tourniquet(adverseStopDistancePips(position));
}

double SafetyLawEvaluator::adverseStopDistancePips(const engine::Position& position) const {
    const double adverse = directionSign(position.direction) *
                           (position.entry_price - position.stop_price);
    if (adverse <= 0.0) {
        return 0.0;
    }
    return common::pipDistance(position.entry_price, position.stop_price, pip_size_);
}

double SafetyLawEvaluator::breakevenPrice(const engine::Position& position) const {
    return position.entry_price + directionSign(position.direction) *
           common::pipsToPrice(config_.breakeven_buffer_pips, pip_size_);
}

double SafetyLawEvaluator::rewardRisk(const engine::Position& position, double market_price) const {
    const double risk = common::pipsToPrice(position.initial_risk_pips, pip_size_);
    if (risk <= 0.0) {
        return 0.0;
    }
    const double sign = directionSign(position.direction);
    const double unrealized = sign * (market_price - position.entry_price);
    const double locked = sign * (position.stop_price - position.entry_price);
    return std::max(unrealized, locked) / risk;
}

LawDecision SafetyLawEvaluator::winner(const engine::Position& position, double market_price) const {
    LawDecision decision;
    if (position.breakeven_locked) {
        return decision;
    }

    const double rr = rewardRisk(position, market_price);
    if (rr + PIP_EPSILON < config_.winner_rr_threshold) {
        return decision;
    }

    const double target = breakevenPrice(position);
    decision.action = LawAction::MUTATE;
    decision.law = SafetyLaw::WINNER;
    decision.lock_breakeven = true;
    // A stop already past the breakeven level stays where it is
    decision.new_stop_price = isStopTighterOrEqual(position.direction, target, position.stop_price)
        ? target
        : position.stop_price;
    decision.reason = "reward/risk " + formatPips(rr) + " >= " +
                      formatPips(config_.winner_rr_threshold);
    return decision;
}

LawDecision SafetyLawEvaluator::zombie(const engine::Position& position) const {
    LawDecision decision;
    const int period = config_.zombie_threshold_bars;
    if (period <= 0 || position.filled_take_profits > 0) {
        return decision;
    }
    if (position.bars_held < period || position.bars_held % period != 0) {
        return decision;
    }

    const int crossing = position.bars_held / period;
    if (crossing <= position.zombie_tightenings) {
        return decision;
    }

    const double sign = directionSign(position.direction);
    const double cap = breakevenPrice(position);
    double candidate = position.stop_price + sign * common::pipsToPrice(config_.zombie_step_pips, pip_size_);
    if (sign * (candidate - cap) > 0.0) {
        candidate = cap;
    }
    if (!(sign * (candidate - position.stop_price) > 0.0)) {
        return decision;
    }

    decision.action = LawAction::MUTATE;
    decision.law = SafetyLaw::ZOMBIE;
    decision.new_stop_price = candidate;
    decision.zombie_period = crossing;
    decision.reason = "held " + std::to_string(position.bars_held) + " bars without a fill";
    return decision;
}

std::vector<LawDecision> SafetyLawEvaluator::evaluateOpenPosition(const engine::Position& position,
                                                                  double market_price) const {
    std::vector<LawDecision> decisions;

    auto cut = tourniquet(position);
    if (cut.fired()) {
        decisions.push_back(cut);
        return decisions;
    }

    engine::Position view = position;
    auto lock = winner(view, market_price);
    if (lock.fired()) {
        view.stop_price = lock.new_stop_price;
        view.breakeven_locked = true;
        decisions.push_back(lock);
    }

    auto stale = zombie(view);
    if (stale.fired()) {
        decisions.push_back(stale);
    }
    return decisions;
}

} // namespace safety
} // namespace phoenix
