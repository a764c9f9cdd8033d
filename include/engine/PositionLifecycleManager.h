#pragma once

#include <functional>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/IExecutionSink.h"
#include "engine/LifecycleEvent.h"
#include "engine/Position.h"
#include "execution/CostModel.h"
#include "risk/AccountLedger.h"
#include "risk/RiskBrain.h"
#include "safety/SafetyLaws.h"

namespace phoenix {
namespace engine {

enum class SubmitOutcome {
    OPENED,
    INVALID,
    SKIPPED,
    REJECTED
};

struct SubmitResult {
    SubmitOutcome outcome = SubmitOutcome::INVALID;
    std::string position_id;
    risk::TriageResult triage;
    std::string reason;
};

// Bar-by-bar owner of every open position of one instrument. The same
// instance type drives backtests and live routing; only the bar source
// and the execution sink differ.
class PositionLifecycleManager {
public:
    using EventListener = std::function<void(const LifecycleEvent&)>;

    PositionLifecycleManager(const EngineConfig& config,
                             risk::AccountLedger& ledger,
                             IExecutionSink* sink = nullptr);

    // Advance every open position by one bar: stop, take-profits, safety
    // laws, trailing stop, in that order.
    void onBar(const Bar& bar);

    // Validation -> triage -> Tourniquet -> open at the engagement's entry
    SubmitResult submit(const Engagement& engagement,
                        const Bar& bar,
                        analytics::MarketRegime regime);

    // Strategy stop change. Returns false when the position is unknown or
    // the amendment was refused.
    bool amendStop(const StopAmendment& amendment, const Bar& bar);

    bool forceClose(const std::string& position_id,
                    double price,
                    double bar_range,
                    Timestamp ts,
                    CloseReason reason,
                    const std::string& law = "");

    // Close everything at the bar close (end of data, shutdown)
    void closeAll(const Bar& bar, CloseReason reason);

    const std::vector<Position>& openPositions() const { return positions_; }
    const Position* findPosition(const std::string& position_id) const;
    const std::vector<ClosedTrade>& closedTrades() const { return closed_trades_; }
    const std::vector<LifecycleEvent>& events() const { return events_; }

    double unrealizedPnl() const;
    const std::string& symbol() const { return symbol_; }
    const safety::SafetyLawEvaluator& evaluator() const { return evaluator_; }
    const risk::RiskBrain& riskBrain() const { return risk_brain_; }

    void setEventListener(EventListener listener) { listener_ = std::move(listener); }

private:
    Position* find(const std::string& position_id);

    // Returns true when the position closed during the bar
    bool checkStop(Position& pos, const Bar& bar);
    bool checkTakeProfits(Position& pos, const Bar& bar);
    bool applySafetyLaws(Position& pos, const Bar& bar);
    void updateTrailingStop(Position& pos, const Bar& bar);

    void fill(Position& pos, double price, double size, double bar_range, Timestamp ts);
    void close(Position& pos, double price, double bar_range, Timestamp ts,
               CloseReason reason, const std::string& law);
    void moveStop(Position& pos, double new_stop, Timestamp ts,
                  const std::string& law, const std::string& reason);
    void markToMarket(Position& pos, double price);
    void sweepClosed();

    void emit(LifecycleEvent event);

    EngineConfig config_;
    std::string symbol_;
    double pip_size_;
    risk::AccountLedger& ledger_;
    IExecutionSink* sink_;
    safety::SafetyLawEvaluator evaluator_;
    risk::RiskBrain risk_brain_;
    execution::CostModel cost_model_;

    std::vector<Position> positions_;
    std::vector<ClosedTrade> closed_trades_;
    std::vector<LifecycleEvent> events_;
    EventListener listener_;
    long long next_position_seq_ = 1;
};

} // namespace engine
} // namespace phoenix
