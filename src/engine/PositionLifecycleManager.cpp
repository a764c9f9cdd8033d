#include "engine/PositionLifecycleManager.h"
#include "common/Logger.h"
#include "common/PipMath.h"
#include "core/execution/PositionLifecycleStateMachine.h"

#include <algorithm>
#include <cmath>

namespace phoenix {
namespace engine {

namespace {
constexpr double SIZE_EPSILON = 1e-9;

using core::execution::PositionEvent;
using core::execution::PositionLifecycleStateMachine;

bool stopTouched(const Position& pos, const Bar& bar) {
    if (pos.direction == Direction::LONG) {
        return bar.low <= pos.stop_price;
    }
    return bar.high >= pos.stop_price;
}

bool levelTouched(Direction direction, double level, const Bar& bar) {
    if (direction == Direction::LONG) {
        return bar.high >= level;
    }
    return bar.low <= level;
}
}

PositionLifecycleManager::PositionLifecycleManager(const EngineConfig& config,
                                                   risk::AccountLedger& ledger,
                                                   IExecutionSink* sink)
    : config_(config)
    , symbol_(config.instrument.symbol)
    , pip_size_(config.pipSize())
    , ledger_(ledger)
    , sink_(sink)
    , evaluator_(config.safety, config.pipSize())
    , risk_brain_(config.risk, config.pipSize())
    , cost_model_(config.costs, config.pipSize()) {}

void PositionLifecycleManager::onBar(const Bar& bar) {
    ledger_.observeTime(bar.timestamp);

    for (auto& pos : positions_) {
        if (!pos.isActive()) {
            continue;
        }
        pos.bars_held++;

        // Stop before take-profit when one bar crosses both
        if (checkStop(pos, bar)) {
            continue;
        }
        if (checkTakeProfits(pos, bar)) {
            continue;
        }
        if (applySafetyLaws(pos, bar)) {
            continue;
        }
        updateTrailingStop(pos, bar);
        markToMarket(pos, bar.close);
    }

    sweepClosed();
}

SubmitResult PositionLifecycleManager::submit(const Engagement& engagement,
                                              const Bar& bar,
                                              analytics::MarketRegime regime) {
    SubmitResult result;
    Engagement eng = engagement;
    if (eng.symbol.empty()) {
        eng.symbol = symbol_;
    }

    auto decline = [&](SubmitOutcome outcome, LifecycleEventType type,
                       const std::string& law, const std::string& reason) {
        result.outcome = outcome;
        result.reason = reason;

        LifecycleEvent event;
        event.type = type;
        event.ts = bar.timestamp;
        event.symbol = eng.symbol;
        event.law = law;
        event.reason = reason;
        event.price = eng.entry_price;
        event.size = eng.requested_size;
        emit(std::move(event));
        return result;
    };

    if (eng.symbol != symbol_) {
        return decline(SubmitOutcome::INVALID, LifecycleEventType::ENGAGEMENT_INVALID, "",
                       "symbol " + eng.symbol + " is not routed to " + symbol_);
    }

    const auto check = evaluator_.validateEngagement(eng);
    if (!check.valid) {
        return decline(SubmitOutcome::INVALID, LifecycleEventType::ENGAGEMENT_INVALID, "", check.reason);
    }

    const auto account = ledger_.snapshot();
    result.triage = risk_brain_.triage(account, regime, eng, account.open_positions);
    if (result.triage.decision == risk::TriageDecision::SKIP) {
        return decline(SubmitOutcome::SKIPPED, LifecycleEventType::ENGAGEMENT_SKIPPED, "",
                       result.triage.reason);
    }

    const auto cut = evaluator_.tourniquet(eng);
    if (cut.fired()) {
        return decline(SubmitOutcome::REJECTED, LifecycleEventType::ENGAGEMENT_REJECTED,
                       safety::safetyLawToString(cut.law), cut.reason);
    }

    // Another instrument on the account may have taken the last slot since the snapshot
    if (!ledger_.reservePosition(config_.risk.max_concurrent_positions)) {
        result.triage.decision = risk::TriageDecision::SKIP;
        return decline(SubmitOutcome::SKIPPED, LifecycleEventType::ENGAGEMENT_SKIPPED, "",
                       "max concurrent positions (" +
                       std::to_string(config_.risk.max_concurrent_positions) + ") reached");
    }

    const double sign = directionSign(eng.direction);

    Position pos;
    pos.id = symbol_ + "-" + std::to_string(next_position_seq_++);
    pos.symbol = symbol_;
    pos.strategy_name = eng.strategy_name;
    pos.tag = eng.tag;
    pos.direction = eng.direction;
    pos.entry_price = eng.entry_price;
    pos.stop_price = eng.entry_price - sign * common::pipsToPrice(eng.stop_distance_pips, pip_size_);
    pos.initial_stop_price = pos.stop_price;
    pos.initial_risk_pips = eng.stop_distance_pips;
    pos.initial_size = result.triage.scaled_size;
    pos.remaining_size = pos.initial_size;
    pos.pending_take_profits = eng.take_profits;
    std::stable_sort(pos.pending_take_profits.begin(), pos.pending_take_profits.end(),
                     [](const TakeProfitLevel& a, const TakeProfitLevel& b) {
                         return a.distance_pips < b.distance_pips;
                     });
    pos.best_close = eng.entry_price;
    pos.size_multiplier = result.triage.combined_multiplier;
    pos.regime = regime;
    pos.opened_at = bar.timestamp;
    pos.state = PositionLifecycleStateMachine::transition(pos.state, PositionEvent::ACCEPT);
    markToMarket(pos, bar.close);

    result.outcome = SubmitOutcome::OPENED;
    result.position_id = pos.id;
    result.reason = risk::triageDecisionToString(result.triage.decision);

    LOG_INFO("{} opened {} {} @ {:.5f} size={:.4f} stop={:.5f} ({})",
             pos.id, directionToString(pos.direction), pos.symbol, pos.entry_price,
             pos.initial_size, pos.stop_price, result.triage.reason);

    positions_.push_back(pos);

    LifecycleEvent event;
    event.type = LifecycleEventType::POSITION_OPENED;
    event.ts = bar.timestamp;
    event.symbol = symbol_;
    event.position_id = pos.id;
    event.reason = result.reason;
    event.price = pos.entry_price;
    event.size = pos.initial_size;
    emit(std::move(event));

    if (sink_) {
        sink_->onPositionOpened(positions_.back(), bar.timestamp);
    }
    return result;
}

bool PositionLifecycleManager::amendStop(const StopAmendment& amendment, const Bar& bar) {
    Position* pos = find(amendment.position_id);
    if (!pos || !pos->isActive()) {
        return false;
    }

    auto refuse = [&](const std::string& reason) {
        LifecycleEvent event;
        event.type = LifecycleEventType::AMENDMENT_REFUSED;
        event.ts = bar.timestamp;
        event.symbol = symbol_;
        event.position_id = pos->id;
        event.law = "STRATEGY";
        event.reason = reason;
        event.price = pos->stop_price;
        emit(std::move(event));
        return false;
    };

    if (!(amendment.new_stop_distance_pips > 0.0)) {
        return refuse("non-positive stop distance");
    }

    // Tourniquet overrides strategy intent even on a locked position
    const auto cut = evaluator_.tourniquet(amendment.new_stop_distance_pips);
    if (cut.fired()) {
        LOG_WARN("{} tourniquet on amendment: {}", pos->id, cut.reason);
        close(*pos, bar.close, bar.range(), bar.timestamp, CloseReason::SAFETY_LAW,
              safety::safetyLawToString(cut.law));
        sweepClosed();
        return true;
    }

    const double new_stop = pos->entry_price - directionSign(pos->direction) *
                            common::pipsToPrice(amendment.new_stop_distance_pips, pip_size_);
    const bool locked = pos->breakeven_locked || pos->trailing_active || pos->zombie_tightenings > 0;
    if (locked && !safety::isStopTighterOrEqual(pos->direction, new_stop, pos->stop_price)) {
        return refuse("stop is locked against loosening");
    }

    moveStop(*pos, new_stop, bar.timestamp, "STRATEGY", "amendment");
    return true;
}

bool PositionLifecycleManager::forceClose(const std::string& position_id,
                                          double price,
                                          double bar_range,
                                          Timestamp ts,
                                          CloseReason reason,
                                          const std::string& law) {
    Position* pos = find(position_id);
    if (!pos || !pos->isActive()) {
        return false;
    }
    close(*pos, price, bar_range, ts, reason, law);
    sweepClosed();
    return true;
}

void PositionLifecycleManager::closeAll(const Bar& bar, CloseReason reason) {
    for (auto& pos : positions_) {
        if (pos.isActive()) {
            close(pos, bar.close, bar.range(), bar.timestamp, reason, "");
        }
    }
    sweepClosed();
}

const Position* PositionLifecycleManager::findPosition(const std::string& position_id) const {
    for (const auto& pos : positions_) {
        if (pos.id == position_id) {
            return &pos;
        }
    }
    return nullptr;
}

Position* PositionLifecycleManager::find(const std::string& position_id) {
    for (auto& pos : positions_) {
        if (pos.id == position_id) {
            return &pos;
        }
    }
    return nullptr;
}

double PositionLifecycleManager::unrealizedPnl() const {
    double total = 0.0;
    for (const auto& pos : positions_) {
        total += pos.unrealized_pnl;
    }
    return total;
}

bool PositionLifecycleManager::checkStop(Position& pos, const Bar& bar) {
    if (!stopTouched(pos, bar)) {
        return false;
    }
    close(pos, pos.stop_price, bar.range(), bar.timestamp, CloseReason::STOP_LOSS, "");
    return true;
}

bool PositionLifecycleManager::checkTakeProfits(Position& pos, const Bar& bar) {
    const double sign = directionSign(pos.direction);

    while (!pos.pending_take_profits.empty()) {
        const TakeProfitLevel tp = pos.pending_take_profits.front();
        const double level = pos.entry_price + sign * common::pipsToPrice(tp.distance_pips, pip_size_);
        if (!levelTouched(pos.direction, level, bar)) {
            break;
        }

        pos.pending_take_profits.erase(pos.pending_take_profits.begin());
        const double size = std::min(pos.remaining_size, tp.fraction * pos.initial_size);
        if (pos.remaining_size - size <= SIZE_EPSILON) {
            pos.filled_take_profits++;
            close(pos, level, bar.range(), bar.timestamp, CloseReason::TAKE_PROFIT, "");
            return true;
        }

        fill(pos, level, size, bar.range(), bar.timestamp);
        pos.filled_take_profits++;
        pos.state = PositionLifecycleStateMachine::transition(pos.state, PositionEvent::TAKE_PROFIT_FILL);

        LOG_INFO("{} take-profit {} filled @ {:.5f} size={:.4f} remaining={:.4f}",
                 pos.id, pos.filled_take_profits, level, size, pos.remaining_size);

        LifecycleEvent event;
        event.type = LifecycleEventType::TAKE_PROFIT_FILLED;
        event.ts = bar.timestamp;
        event.symbol = symbol_;
        event.position_id = pos.id;
        event.price = level;
        event.size = size;
        event.pnl = sign * (level - pos.entry_price) * size;
        emit(std::move(event));

        if (sink_) {
            sink_->onPositionReduced(pos, level, size, bar.timestamp);
        }
    }
    return false;
}

bool PositionLifecycleManager::applySafetyLaws(Position& pos, const Bar& bar) {
    const auto decisions = evaluator_.evaluateOpenPosition(pos, bar.close);
    for (const auto& decision : decisions) {
        const std::string law = safety::safetyLawToString(decision.law);
        switch (decision.action) {
            case safety::LawAction::FORCE_CLOSE:
                LOG_WARN("{} {} force-close: {}", pos.id, law, decision.reason);
                close(pos, bar.close, bar.range(), bar.timestamp, CloseReason::SAFETY_LAW, law);
                return true;
            case safety::LawAction::MUTATE:
                if (decision.lock_breakeven) {
                    pos.breakeven_locked = true;
                }
                if (decision.zombie_period > 0) {
                    pos.zombie_tightenings = decision.zombie_period;
                }
                moveStop(pos, decision.new_stop_price, bar.timestamp, law, decision.reason);
                break;
            case safety::LawAction::REJECT:
            case safety::LawAction::NO_OP:
                break;
        }
    }
    return false;
}

void PositionLifecycleManager::updateTrailingStop(Position& pos, const Bar& bar) {
    const double sign = directionSign(pos.direction);
    if (sign * (bar.close - pos.best_close) > 0.0) {
        pos.best_close = bar.close;
    }

    const double distance = config_.safety.trailing_distance_pips;
    if (distance <= 0.0 || pos.filled_take_profits == 0) {
        return;
    }

    const double candidate = pos.best_close - sign * common::pipsToPrice(distance, pip_size_);
    if (sign * (candidate - pos.stop_price) > 0.0) {
        pos.trailing_active = true;
        moveStop(pos, candidate, bar.timestamp, "TRAILING", "best close " + std::to_string(pos.best_close));
    }
}

void PositionLifecycleManager::fill(Position& pos, double price, double size,
                                    double bar_range, Timestamp ts) {
    const double gross = directionSign(pos.direction) * (price - pos.entry_price) * size;
    const auto cost = cost_model_.costFor(size, bar_range);

    pos.gross_pnl += gross;
    pos.fees += cost.fee;
    pos.slippage += cost.slippage;
    pos.exit_notional += price * size;
    pos.remaining_size -= size;
    if (pos.remaining_size < SIZE_EPSILON) {
        pos.remaining_size = 0.0;
    }

    ledger_.applyRealized(gross - cost.total(), ts);
}

void PositionLifecycleManager::close(Position& pos, double price, double bar_range, Timestamp ts,
                                     CloseReason reason, const std::string& law) {
    const double last_size = pos.remaining_size;
    fill(pos, price, last_size, bar_range, ts);
    pos.remaining_size = 0.0;
    pos.unrealized_pnl = 0.0;
    pos.state = PositionLifecycleStateMachine::transition(pos.state, PositionEvent::CLOSE);
    ledger_.releasePosition();

    ClosedTrade trade;
    trade.position_id = pos.id;
    trade.symbol = pos.symbol;
    trade.strategy_name = pos.strategy_name;
    trade.tag = pos.tag;
    trade.direction = pos.direction;
    trade.entry_price = pos.entry_price;
    trade.size = pos.initial_size;
    trade.exit_price = (pos.initial_size > 0.0) ? pos.exit_notional / pos.initial_size : price;
    trade.gross_pnl = pos.gross_pnl;
    trade.fees = pos.fees;
    trade.slippage = pos.slippage;
    trade.realized_pnl = pos.gross_pnl - pos.fees - pos.slippage;
    trade.reason = reason;
    trade.law = law;
    trade.bars_held = pos.bars_held;
    trade.opened_at = pos.opened_at;
    trade.closed_at = ts;
    closed_trades_.push_back(trade);

    LOG_INFO("{} closed {} @ {:.5f} pnl={:.2f} bars={}{}{}",
             pos.id, closeReasonToString(reason), trade.exit_price, trade.realized_pnl,
             trade.bars_held, law.empty() ? "" : " law=", law);
    Logger::getInstance().logTrade(trade.symbol, directionToString(trade.direction),
                                   trade.entry_price, trade.exit_price, trade.size,
                                   trade.realized_pnl, closeReasonToString(reason));

    LifecycleEvent event;
    event.type = LifecycleEventType::POSITION_CLOSED;
    event.ts = ts;
    event.symbol = symbol_;
    event.position_id = pos.id;
    event.law = law;
    event.reason = closeReasonToString(reason);
    event.price = trade.exit_price;
    event.size = trade.size;
    event.pnl = trade.realized_pnl;
    emit(std::move(event));

    if (sink_) {
        sink_->onPositionClosed(trade, price, last_size);
    }
}

void PositionLifecycleManager::moveStop(Position& pos, double new_stop, Timestamp ts,
                                        const std::string& law, const std::string& reason) {
    const double previous = pos.stop_price;
    pos.stop_price = new_stop;

    LOG_INFO("{} stop {:.5f} -> {:.5f} ({}: {})", pos.id, previous, new_stop, law, reason);

    LifecycleEvent event;
    event.type = LifecycleEventType::STOP_MOVED;
    event.ts = ts;
    event.symbol = symbol_;
    event.position_id = pos.id;
    event.law = law;
    event.reason = reason;
    event.price = new_stop;
    event.size = pos.remaining_size;
    emit(std::move(event));

    if (sink_) {
        sink_->onStopMoved(pos, ts);
    }
}

void PositionLifecycleManager::markToMarket(Position& pos, double price) {
    pos.unrealized_pnl = directionSign(pos.direction) * (price - pos.entry_price) * pos.remaining_size;
}

void PositionLifecycleManager::sweepClosed() {
    positions_.erase(std::remove_if(positions_.begin(), positions_.end(),
                                    [](const Position& pos) { return !pos.isActive(); }),
                     positions_.end());
}

void PositionLifecycleManager::emit(LifecycleEvent event) {
    if (event.type == LifecycleEventType::ENGAGEMENT_INVALID ||
        event.type == LifecycleEventType::ENGAGEMENT_SKIPPED ||
        event.type == LifecycleEventType::ENGAGEMENT_REJECTED ||
        event.type == LifecycleEventType::AMENDMENT_REFUSED) {
        LOG_INFO("{} {}{}{}: {}", event.symbol, lifecycleEventTypeToString(event.type),
                 event.law.empty() ? "" : " by ", event.law, event.reason);
    }
    events_.push_back(event);
    if (listener_) {
        listener_(events_.back());
    }
}

} // namespace engine
} // namespace phoenix
