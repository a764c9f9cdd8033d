#include "backtest/SimulationDriver.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "engine/PositionLifecycleManager.h"

#include <algorithm>

namespace phoenix {
namespace backtest {

SimulationDriver::SimulationDriver(const engine::EngineConfig& config)
    : config_(config) {
    config_.validate();
}

SimulationDriver::Result SimulationDriver::run(IBarFeed& feed, strategy::IStrategy& strategy) {
    Result result;

    risk::AccountLedger ledger(config_.risk.initial_equity);
    engine::PositionLifecycleManager manager(config_, ledger);
    if (journal_) {
        manager.setEventListener([this](const engine::LifecycleEvent& event) {
            if (!journal_->append(engine::toJournalEvent(event))) {
                LOG_WARN("Journal append failed for {}", event.position_id);
            }
        });
    }

    FeedValidator validator;
    std::vector<Bar> history;
    Bar last_bar;
    bool have_bar = false;

    LOG_INFO("Simulation start: {} strategy={} equity={:.2f}",
             config_.instrument.symbol, strategy.getInfo().name, config_.risk.initial_equity);

    while (true) {
        Bar bar;
        const FeedStatus status = feed.next(bar);
        if (status == FeedStatus::END_OF_STREAM) {
            break;
        }
        if (status == FeedStatus::STALL) {
            continue;
        }

        try {
            validator.validate(bar);
        } catch (const FeedIntegrityError& e) {
            LOG_ERROR("Feed integrity failure, aborting run: {}", e.what());
            throw;
        }

        manager.onBar(bar);

        history.push_back(bar);
        if (history.size() > history_limit_) {
            history.erase(history.begin());
        }

        auto output = strategy.onBar(bar, history, manager.openPositions());
        const auto regime = output.regime
            ? *output.regime
            : regime_detector_.analyzeRegime(history).regime;

        for (const auto& amendment : output.stop_amendments) {
            manager.amendStop(amendment, bar);
        }
        for (const auto& engagement : output.engagements) {
            manager.submit(engagement, bar, regime);
        }

        const auto account = ledger.snapshot();
        EquityPoint point;
        point.timestamp = bar.timestamp;
        point.equity = account.equity;
        point.unrealized_pnl = manager.unrealizedPnl();
        point.drawdown = account.drawdown();
        result.equity_curve.push_back(point);

        last_bar = bar;
        have_bar = true;
    }

    if (have_bar) {
        manager.closeAll(last_bar, engine::CloseReason::END_OF_DATA);
        const auto account = ledger.snapshot();
        auto& tail = result.equity_curve.back();
        tail.equity = account.equity;
        tail.unrealized_pnl = 0.0;
        tail.drawdown = account.drawdown();
    }

    result.trades = manager.closedTrades();
    result.events = manager.events();
    result.final_account = ledger.snapshot();
    result.summary = summarize(result.trades, result.equity_curve, result.events);

    LOG_INFO("Simulation done: bars={} trades={} equity={:.2f} max_dd={:.2f}%",
             result.summary.bars_processed, result.summary.total_trades,
             result.final_account.equity, result.summary.max_drawdown * 100.0);
    return result;
}

SimulationDriver::Summary SimulationDriver::summarize(
    const std::vector<engine::ClosedTrade>& trades,
    const std::vector<EquityPoint>& curve,
    const std::vector<engine::LifecycleEvent>& events) {
    Summary summary;
    summary.total_trades = static_cast<int>(trades.size());
    summary.bars_processed = static_cast<int>(curve.size());

    double bars_held = 0.0;
    for (const auto& trade : trades) {
        summary.total_profit += trade.realized_pnl;
        summary.total_fees += trade.fees;
        summary.total_slippage += trade.slippage;
        bars_held += trade.bars_held;
        if (trade.realized_pnl > 0.0) {
            summary.winning_trades++;
            summary.gross_profit += trade.realized_pnl;
        } else if (trade.realized_pnl < 0.0) {
            summary.losing_trades++;
            summary.gross_loss += -trade.realized_pnl;
        }
        summary.exit_reason_counts[engine::closeReasonToString(trade.reason)]++;
    }

    if (summary.total_trades > 0) {
        summary.win_rate = static_cast<double>(summary.winning_trades) / summary.total_trades;
        summary.expectancy = summary.total_profit / summary.total_trades;
        summary.avg_bars_held = bars_held / summary.total_trades;
    }
    summary.profit_factor = (summary.gross_loss > 1e-12) ? (summary.gross_profit / summary.gross_loss) : 0.0;

    for (const auto& point : curve) {
        summary.max_drawdown = std::max(summary.max_drawdown, point.drawdown);
    }

    for (const auto& event : events) {
        switch (event.type) {
            case engine::LifecycleEventType::POSITION_OPENED:
                summary.engagements_opened++;
                break;
            case engine::LifecycleEventType::ENGAGEMENT_SKIPPED:
                summary.engagements_skipped++;
                break;
            case engine::LifecycleEventType::ENGAGEMENT_REJECTED:
                summary.engagements_rejected++;
                break;
            case engine::LifecycleEventType::ENGAGEMENT_INVALID:
                summary.engagements_invalid++;
                break;
            default:
                break;
        }

        const bool law_event = event.type == engine::LifecycleEventType::ENGAGEMENT_REJECTED ||
                               event.type == engine::LifecycleEventType::STOP_MOVED ||
                               event.type == engine::LifecycleEventType::POSITION_CLOSED;
        if (law_event && (event.law == "TOURNIQUET" || event.law == "WINNER" || event.law == "ZOMBIE")) {
            summary.law_firing_counts[event.law]++;
        }
    }
    return summary;
}

} // namespace backtest
} // namespace phoenix
