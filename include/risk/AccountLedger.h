#pragma once

#include <mutex>

#include "common/Types.h"

namespace phoenix {
namespace risk {

struct AccountState {
    double equity = 0.0;
    double peak_equity = 0.0;           // high-water mark, never decreases
    double day_start_equity = 0.0;
    long long trading_day = -1;         // epoch day of day_start_equity
    int realized_fills = 0;
    double realized_pnl = 0.0;
    int open_positions = 0;             // across every instrument on the account

    // (peak - equity) / peak clamped into [0, 1); 0 when peak is unset
    double drawdown() const;

    // Share of the day's starting equity lost so far, 0 when flat or up
    double dailyLoss() const;
};

// Single writer around AccountState. Readers get consistent copies; the
// mutations are a realized PnL increment and the open-position count.
class AccountLedger {
public:
    explicit AccountLedger(double initial_equity);

    AccountState snapshot() const;

    void applyRealized(double pnl, Timestamp ts);

    // Claims a position slot when fewer than max_positions are open
    bool reservePosition(int max_positions);
    void releasePosition();

    // Rolls the daily loss window when `ts` falls on a new day
    void observeTime(Timestamp ts);

private:
    void rollDayLocked(Timestamp ts);

    mutable std::mutex mutex_;
    AccountState state_;
};

} // namespace risk
} // namespace phoenix
