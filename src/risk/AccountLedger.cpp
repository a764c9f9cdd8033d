#include "risk/AccountLedger.h"

#include <algorithm>
#include <cmath>

namespace phoenix {
namespace risk {

namespace {
constexpr long long MS_PER_DAY = 86400000LL;

long long epochDay(Timestamp ts) {
    long long day = ts / MS_PER_DAY;
    if (ts < 0 && ts % MS_PER_DAY != 0) {
        --day;
    }
    return day;
}
}

double AccountState::drawdown() const {
    if (!(peak_equity > 0.0) || !std::isfinite(peak_equity)) {
        return 0.0;
    }
    const double dd = (peak_equity - equity) / peak_equity;
    if (!(dd > 0.0)) {
        return 0.0;
    }
    return std::min(dd, std::nextafter(1.0, 0.0));
}

double AccountState::dailyLoss() const {
    if (!(day_start_equity > 0.0)) {
        return 0.0;
    }
    return std::max(0.0, (day_start_equity - equity) / day_start_equity);
}

AccountLedger::AccountLedger(double initial_equity) {
    state_.equity = initial_equity;
    state_.peak_equity = std::max(0.0, initial_equity);
    state_.day_start_equity = initial_equity;
}

AccountState AccountLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void AccountLedger::applyRealized(double pnl, Timestamp ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    rollDayLocked(ts);
    state_.equity += pnl;
    state_.realized_pnl += pnl;
    state_.realized_fills++;
    if (state_.equity > state_.peak_equity) {
        state_.peak_equity = state_.equity;
    }
}

bool AccountLedger::reservePosition(int max_positions) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.open_positions >= max_positions) {
        return false;
    }
    state_.open_positions++;
    return true;
}

void AccountLedger::releasePosition() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.open_positions > 0) {
        state_.open_positions--;
    }
}

void AccountLedger::observeTime(Timestamp ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    rollDayLocked(ts);
}

void AccountLedger::rollDayLocked(Timestamp ts) {
    const long long day = epochDay(ts);
    if (day > state_.trading_day) {
        state_.trading_day = day;
        state_.day_start_equity = state_.equity;
    }
}

} // namespace risk
} // namespace phoenix
