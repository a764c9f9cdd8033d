#pragma once

#include <map>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "backtest/BarFeed.h"
#include "backtest/FeedValidator.h"
#include "core/contracts/IEventJournal.h"
#include "engine/EngineConfig.h"
#include "engine/LifecycleEvent.h"
#include "engine/Position.h"
#include "risk/AccountLedger.h"
#include "strategy/IStrategy.h"

namespace phoenix {
namespace backtest {

// One deterministic run: bars in, ledger and equity curve out
class SimulationDriver {
public:
    struct EquityPoint {
        Timestamp timestamp = 0;
        double equity = 0.0;            // realized
        double unrealized_pnl = 0.0;
        double drawdown = 0.0;
    };

    struct Summary {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double total_profit = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double profit_factor = 0.0;
        double expectancy = 0.0;
        double total_fees = 0.0;
        double total_slippage = 0.0;
        double max_drawdown = 0.0;
        double avg_bars_held = 0.0;
        int bars_processed = 0;
        int engagements_opened = 0;
        int engagements_skipped = 0;
        int engagements_rejected = 0;
        int engagements_invalid = 0;
        std::map<std::string, int> exit_reason_counts;
        std::map<std::string, int> law_firing_counts;
    };

    struct Result {
        std::vector<engine::ClosedTrade> trades;
        std::vector<EquityPoint> equity_curve;
        risk::AccountState final_account;
        std::vector<engine::LifecycleEvent> events;
        Summary summary;
    };

    explicit SimulationDriver(const engine::EngineConfig& config);

    // Throws FeedIntegrityError when the feed breaks ordering or shape
    Result run(IBarFeed& feed, strategy::IStrategy& strategy);

    // Lifecycle events are appended as they happen when set
    void setJournal(core::IEventJournal* journal) { journal_ = journal; }

    void setHistoryLimit(size_t bars) { history_limit_ = bars; }

    static Summary summarize(const std::vector<engine::ClosedTrade>& trades,
                             const std::vector<EquityPoint>& curve,
                             const std::vector<engine::LifecycleEvent>& events);

private:
    engine::EngineConfig config_;
    analytics::RegimeDetector regime_detector_;
    core::IEventJournal* journal_ = nullptr;
    size_t history_limit_ = 500;
};

} // namespace backtest
} // namespace phoenix
