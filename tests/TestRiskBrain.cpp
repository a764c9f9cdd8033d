#include "common/Errors.h"
#include "risk/AccountLedger.h"
#include "risk/RiskBrain.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

using namespace phoenix;
using phoenix::analytics::MarketRegime;
using phoenix::risk::AccountLedger;
using phoenix::risk::AccountState;
using phoenix::risk::RiskBrain;
using phoenix::risk::TriageDecision;

namespace {
constexpr Timestamp DAY_MS = 86400000LL;

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

Engagement engagement(double size) {
    Engagement e;
    e.symbol = "EUR_USD";
    e.entry_price = 1.1;
    e.stop_distance_pips = 10.0;
    e.requested_size = size;
    e.take_profits.push_back({30.0, 1.0});
    return e;
}
}

int main() {
    engine::RiskConfig cfg;   // ladder 0:1.0, 5%:0.75, 10%:0.5, 20%:0.25

    // Zero peak is zero drawdown, and the first lookup never throws
    {
        AccountState empty;
        assert(empty.drawdown() == 0.0);

        RiskBrain brain(cfg);
        assert(brain.ladderMultiplier(0.0) == 1.0);

        // No equity means no risk budget
        auto t = brain.triage(empty, MarketRegime::UNKNOWN, engagement(1000.0), 0);
        assert(t.decision == TriageDecision::SKIP);
        assert(t.scaled_size == 0.0);

        empty.equity = 100000.0;
        t = brain.triage(empty, MarketRegime::UNKNOWN, engagement(1000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_FULL);
        assert(near(t.scaled_size, 1000.0));
    }

    // Greatest threshold not exceeding drawdown
    {
        RiskBrain brain(cfg);
        assert(brain.ladderMultiplier(0.04) == 1.0);
        assert(brain.ladderMultiplier(0.05) == 0.75);
        assert(brain.ladderMultiplier(0.0999) == 0.75);
        assert(brain.ladderMultiplier(0.12) == 0.5);
        assert(brain.ladderMultiplier(0.25) == 0.25);

        engine::RiskConfig sparse = cfg;
        sparse.ladder = {{0.10, 0.5}};
        RiskBrain sparse_brain(sparse);
        assert(sparse_brain.ladderMultiplier(0.05) == 1.0);
        assert(sparse_brain.ladderMultiplier(0.10) == 0.5);
    }

    // Ladder must not grow with drawdown
    {
        engine::RiskConfig bad = cfg;
        bad.ladder = {{0.0, 0.5}, {0.1, 0.9}};
        bool threw = false;
        try {
            RiskBrain brain(bad);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    // Drawdown crossing 10% mid-run changes the next engagement's size
    {
        engine::RiskConfig no_breaker = cfg;
        no_breaker.daily_loss_limit_pct = 0.0;
        RiskBrain brain(no_breaker);
        AccountLedger ledger(100000.0);

        ledger.applyRealized(-4000.0, 1000);
        auto account = ledger.snapshot();
        assert(near(account.drawdown(), 0.04));
        auto t = brain.triage(account, MarketRegime::UNKNOWN, engagement(10000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_FULL);
        assert(near(t.scaled_size, 10000.0));

        ledger.applyRealized(-8000.0, 2000);
        account = ledger.snapshot();
        assert(near(account.drawdown(), 0.12));
        t = brain.triage(account, MarketRegime::UNKNOWN, engagement(10000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_REDUCED);
        assert(near(t.ladder_multiplier, 0.5));
        assert(near(t.scaled_size, 5000.0));
    }

    // Regime multiplier composes with the ladder; below the floor is a skip
    {
        RiskBrain brain(cfg);
        AccountState fresh;
        fresh.equity = fresh.peak_equity = fresh.day_start_equity = 100000.0;

        auto t = brain.triage(fresh, MarketRegime::RANGING, engagement(10000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_REDUCED);
        assert(near(t.scaled_size, 8000.0));

        AccountState deep = fresh;
        deep.equity = 75000.0;
        deep.day_start_equity = 75000.0;
        t = brain.triage(deep, MarketRegime::HIGH_VOLATILITY, engagement(10000.0), 0);
        assert(near(t.combined_multiplier, 0.125));
        assert(t.decision == TriageDecision::SKIP);
        assert(t.scaled_size == 0.0);
    }

    // Portfolio gate: concurrency cap and daily loss breaker
    {
        RiskBrain brain(cfg);
        AccountLedger ledger(100000.0);
        auto t = brain.triage(ledger.snapshot(), MarketRegime::UNKNOWN, engagement(1000.0), 5);
        assert(t.decision == TriageDecision::SKIP);

        ledger.applyRealized(-6000.0, 1000);
        t = brain.triage(ledger.snapshot(), MarketRegime::UNKNOWN, engagement(1000.0), 0);
        assert(t.decision == TriageDecision::SKIP);
        assert(t.reason == "daily loss limit hit");

        // Next day the breaker resets; the 6% drawdown still shrinks size
        ledger.observeTime(DAY_MS + 1000);
        t = brain.triage(ledger.snapshot(), MarketRegime::UNKNOWN, engagement(1000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_REDUCED);
        assert(near(t.scaled_size, 750.0));
    }

    // Loss at the stop is capped at 2% of equity; the pip size sets the stop in price
    {
        RiskBrain brain(cfg);
        AccountState fresh;
        fresh.equity = fresh.peak_equity = fresh.day_start_equity = 100000.0;

        // 10 pips = 0.001; 2000 / 0.001 = 2,000,000
        auto t = brain.triage(fresh, MarketRegime::UNKNOWN, engagement(5000000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_REDUCED);
        assert(near(t.scaled_size, 2000000.0, 1e-6));
        assert(t.reason.find("risk_capped") != std::string::npos);

        t = brain.triage(fresh, MarketRegime::UNKNOWN, engagement(2000000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_FULL);
        assert(near(t.scaled_size, 2000000.0));

        RiskBrain yen(cfg, 0.01);
        t = yen.triage(fresh, MarketRegime::UNKNOWN, engagement(100000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_REDUCED);
        assert(near(t.scaled_size, 20000.0, 1e-6));

        engine::RiskConfig uncapped = cfg;
        uncapped.max_risk_per_trade_pct = 0.0;
        RiskBrain loose(uncapped);
        t = loose.triage(fresh, MarketRegime::UNKNOWN, engagement(5000000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_FULL);
        assert(near(t.scaled_size, 5000000.0));

        bool threw = false;
        try {
            RiskBrain broken(cfg, 0.0);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    // Sizes below the minimum after scaling are skipped
    {
        engine::RiskConfig floored = cfg;
        floored.min_trade_size = 1000.0;
        RiskBrain brain(floored);
        AccountState fresh;
        fresh.equity = fresh.peak_equity = fresh.day_start_equity = 100000.0;

        auto t = brain.triage(fresh, MarketRegime::UNKNOWN, engagement(1000.0), 0);
        assert(t.decision == TriageDecision::ALLOW_FULL);

        // RANGING 0.8 shrinks 1000 to 800
        t = brain.triage(fresh, MarketRegime::RANGING, engagement(1000.0), 0);
        assert(t.decision == TriageDecision::SKIP);
        assert(t.scaled_size == 0.0);
        assert(t.reason.find("below minimum") != std::string::npos);

        // A wide stop caps a large request below the floor: 2000 / (5000 pips * 0.0001) = 4000
        Engagement wide = engagement(1000000.0);
        wide.stop_distance_pips = 5000.0;
        t = brain.triage(fresh, MarketRegime::UNKNOWN, wide, 0);
        assert(t.decision == TriageDecision::ALLOW_REDUCED);
        assert(near(t.scaled_size, 4000.0, 1e-6));

        floored.min_trade_size = 5000.0;
        RiskBrain strict(floored);
        t = strict.triage(fresh, MarketRegime::UNKNOWN, wide, 0);
        assert(t.decision == TriageDecision::SKIP);
    }

    // Peak equity never decreases; drawdown stays in [0, 1)
    {
        AccountLedger ledger(1000.0);
        double peak = 1000.0;
        const std::vector<double> pnls = {500.0, -200.0, 1000.0, -3000.0, 250.0, -5000.0};
        Timestamp ts = 0;
        for (double pnl : pnls) {
            ledger.applyRealized(pnl, ts += 1000);
            auto s = ledger.snapshot();
            assert(s.peak_equity >= peak);
            peak = s.peak_equity;
            assert(s.drawdown() >= 0.0 && s.drawdown() < 1.0);
        }
        assert(near(peak, 2300.0));
        assert(ledger.snapshot().equity < 0.0);
    }

    // Concurrent writers never lose an update
    {
        AccountLedger ledger(100000.0);
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&ledger]() {
                for (int i = 0; i < 1000; ++i) {
                    ledger.applyRealized(1.0, 1000);
                }
            });
        }
        for (auto& w : writers) {
            w.join();
        }
        auto s = ledger.snapshot();
        assert(near(s.equity, 104000.0));
        assert(near(s.peak_equity, 104000.0));
        assert(s.realized_fills == 4000);
    }

    std::cout << "[TEST] RiskBrain PASSED\n";
    return 0;
}
