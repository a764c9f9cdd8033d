#pragma once

#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "common/Types.h"

namespace phoenix {
namespace engine {

enum class PositionState {
    PENDING,    // engagement received, not yet evaluated
    OPEN,       // accepted, full size
    PARTIAL,    // one or more take-profits filled
    CLOSED      // terminal, size 0
};

enum class CloseReason {
    STOP_LOSS,
    TAKE_PROFIT,
    SAFETY_LAW,
    END_OF_DATA,
    BROKER_REJECT
};

const char* positionStateToString(PositionState state);
const char* closeReasonToString(CloseReason reason);

// Live trade owned by one PositionLifecycleManager
struct Position {
    std::string id;
    std::string symbol;
    std::string strategy_name;
    std::string tag;
    Direction direction = Direction::LONG;
    PositionState state = PositionState::PENDING;

    double entry_price = 0.0;
    double stop_price = 0.0;
    double initial_stop_price = 0.0;
    double initial_risk_pips = 0.0;     // stop distance at open, denominator of RR

    double initial_size = 0.0;
    double remaining_size = 0.0;

    std::vector<TakeProfitLevel> pending_take_profits;   // nearest first
    int filled_take_profits = 0;

    bool trailing_active = false;
    bool breakeven_locked = false;
    int zombie_tightenings = 0;         // last staleness period already acted on
    int bars_held = 0;
    double best_close = 0.0;

    double unrealized_pnl = 0.0;
    double gross_pnl = 0.0;             // realized so far over partial fills
    double fees = 0.0;
    double slippage = 0.0;
    double exit_notional = 0.0;         // sum(fill price * fill size)

    double size_multiplier = 1.0;
    analytics::MarketRegime regime = analytics::MarketRegime::UNKNOWN;
    Timestamp opened_at = 0;

    bool isActive() const {
        return state == PositionState::OPEN || state == PositionState::PARTIAL;
    }
};

// Immutable record of a finished position
struct ClosedTrade {
    std::string position_id;
    std::string symbol;
    std::string strategy_name;
    std::string tag;
    Direction direction = Direction::LONG;
    double entry_price = 0.0;
    double exit_price = 0.0;            // size-weighted over all exit fills
    double size = 0.0;
    double gross_pnl = 0.0;
    double fees = 0.0;
    double slippage = 0.0;
    double realized_pnl = 0.0;          // gross - fees - slippage
    CloseReason reason = CloseReason::STOP_LOSS;
    std::string law;                    // triggering law for SAFETY_LAW closes
    int bars_held = 0;
    Timestamp opened_at = 0;
    Timestamp closed_at = 0;
};

} // namespace engine
} // namespace phoenix
