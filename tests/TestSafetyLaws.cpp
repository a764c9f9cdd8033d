#include "safety/SafetyLaws.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace phoenix;
using phoenix::safety::LawAction;
using phoenix::safety::SafetyLaw;
using phoenix::safety::SafetyLawEvaluator;

namespace {
constexpr double PIP = 0.0001;

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

engine::SafetyLawConfig lawConfig() {
    engine::SafetyLawConfig cfg;
    cfg.max_sl_pips = 15.0;
    cfg.winner_rr_threshold = 2.5;
    cfg.breakeven_buffer_pips = 1.0;
    cfg.zombie_threshold_bars = 40;
    cfg.zombie_step_pips = 5.0;
    return cfg;
}

Engagement engagement(Direction dir, double entry, double stop_pips) {
    Engagement e;
    e.symbol = "EUR_USD";
    e.direction = dir;
    e.entry_price = entry;
    e.stop_distance_pips = stop_pips;
    e.requested_size = 10000.0;
    e.take_profits.push_back({30.0, 1.0});
    return e;
}

engine::Position position(Direction dir, double entry, double stop_pips) {
    engine::Position p;
    p.id = "EUR_USD-1";
    p.symbol = "EUR_USD";
    p.direction = dir;
    p.entry_price = entry;
    p.stop_price = entry - directionSign(dir) * stop_pips * PIP;
    p.initial_stop_price = p.stop_price;
    p.initial_risk_pips = stop_pips;
    p.initial_size = 10000.0;
    p.remaining_size = 10000.0;
    p.state = engine::PositionState::OPEN;
    return p;
}
}

int main() {
    const SafetyLawEvaluator laws(lawConfig(), PIP);

    // Invalid engagements are classified before any law
    {
        auto e = engagement(Direction::LONG, 1.1, 10.0);
        assert(laws.validateEngagement(e).valid);

        auto zero_size = e;
        zero_size.requested_size = 0.0;
        assert(!laws.validateEngagement(zero_size).valid);

        auto zero_risk = e;
        zero_risk.stop_distance_pips = 0.0;
        auto check = laws.validateEngagement(zero_risk);
        assert(!check.valid);
        assert(check.reason == "zero risk distance");

        auto overfilled = e;
        overfilled.take_profits = {{10.0, 0.6}, {20.0, 0.5}};
        assert(!laws.validateEngagement(overfilled).valid);

        auto exact = e;
        exact.take_profits = {{10.0, 0.5}, {20.0, 0.3}, {30.0, 0.2}};
        assert(laws.validateEngagement(exact).valid);
    }

    // Reward/risk floor is optional
    {
        auto cfg = lawConfig();
        cfg.min_reward_risk = 3.0;
        const SafetyLawEvaluator strict(cfg, PIP);
        auto e = engagement(Direction::LONG, 1.1, 10.0);
        e.take_profits = {{20.0, 1.0}};
        assert(!strict.validateEngagement(e).valid);
        e.take_profits = {{30.0, 1.0}};
        assert(strict.validateEngagement(e).valid);
    }

    // Tourniquet: 20 pips against MAX_SL_PIPS=15 never opens
    {
        auto d = laws.tourniquet(engagement(Direction::LONG, 100.0, 20.0));
        assert(d.action == LawAction::REJECT);
        assert(d.law == SafetyLaw::TOURNIQUET);

        assert(laws.tourniquet(engagement(Direction::LONG, 100.0, 15.0)).action == LawAction::REJECT);
        assert(!laws.tourniquet(engagement(Direction::LONG, 100.0, 14.9)).fired());
    }

    // Tourniquet on an open position whose stop was widened
    {
        auto p = position(Direction::SHORT, 1.1, 10.0);
        assert(!laws.tourniquet(p).fired());
        p.stop_price = 1.1 + 16.0 * PIP;
        auto d = laws.tourniquet(p);
        assert(d.action == LawAction::FORCE_CLOSE);

        // A stop on the profit side has no adverse distance
        p.stop_price = 1.1 - 2.0 * PIP;
        assert(near(laws.adverseStopDistancePips(p), 0.0));
    }

    // Winner: RR 3.0 >= 2.5 locks entry + buffer
    {
        auto p = position(Direction::LONG, 1.1, 10.0);
        assert(!laws.winner(p, 1.1020).fired());

        auto d = laws.winner(p, 1.1030);
        assert(d.action == LawAction::MUTATE);
        assert(d.law == SafetyLaw::WINNER);
        assert(d.lock_breakeven);
        assert(near(d.new_stop_price, 1.1001));

        // Idempotent once locked
        p.stop_price = d.new_stop_price;
        p.breakeven_locked = true;
        assert(!laws.winner(p, 1.1040).fired());
    }

    {
        auto p = position(Direction::SHORT, 1.1, 10.0);
        auto d = laws.winner(p, 1.0970);
        assert(d.action == LawAction::MUTATE);
        assert(near(d.new_stop_price, 1.0999));
    }

    // Winner never loosens a stop already past breakeven
    {
        auto p = position(Direction::LONG, 1.1, 10.0);
        p.stop_price = 1.1015;
        auto d = laws.winner(p, 1.1030);
        assert(d.action == LawAction::MUTATE);
        assert(near(d.new_stop_price, 1.1015));
    }

    // Zombie: once per threshold multiple, step toward entry
    {
        auto p = position(Direction::LONG, 1.1, 10.0);
        p.bars_held = 39;
        assert(!laws.zombie(p).fired());

        p.bars_held = 40;
        auto d = laws.zombie(p);
        assert(d.action == LawAction::MUTATE);
        assert(d.law == SafetyLaw::ZOMBIE);
        assert(d.zombie_period == 1);
        assert(near(d.new_stop_price, 1.0995));

        p.stop_price = d.new_stop_price;
        p.zombie_tightenings = d.zombie_period;
        for (int bars = 41; bars < 80; ++bars) {
            p.bars_held = bars;
            assert(!laws.zombie(p).fired());
        }

        p.bars_held = 80;
        d = laws.zombie(p);
        assert(d.fired());
        assert(near(d.new_stop_price, 1.1000));
    }

    // Zombie stops at the Winner level and ignores trades with a fill
    {
        auto p = position(Direction::LONG, 1.1, 10.0);
        p.stop_price = 1.0999;
        p.bars_held = 80;
        p.zombie_tightenings = 1;
        auto d = laws.zombie(p);
        assert(near(d.new_stop_price, 1.1001));

        p.stop_price = laws.breakevenPrice(p);
        assert(!laws.zombie(p).fired());

        auto filled = position(Direction::LONG, 1.1, 10.0);
        filled.bars_held = 40;
        filled.filled_take_profits = 1;
        assert(!laws.zombie(filled).fired());
    }

    // Precedence: Tourniquet ends evaluation, Winner feeds Zombie
    {
        auto p = position(Direction::LONG, 1.1, 20.0);
        p.bars_held = 40;
        auto decisions = laws.evaluateOpenPosition(p, 1.1100);
        assert(decisions.size() == 1);
        assert(decisions[0].action == LawAction::FORCE_CLOSE);

        auto q = position(Direction::LONG, 1.1, 10.0);
        q.bars_held = 40;
        decisions = laws.evaluateOpenPosition(q, 1.1030);
        assert(decisions.size() == 1);
        assert(decisions[0].law == SafetyLaw::WINNER);

        q.bars_held = 40;
        decisions = laws.evaluateOpenPosition(q, 1.1000);
        assert(decisions.size() == 1);
        assert(decisions[0].law == SafetyLaw::ZOMBIE);
    }

    std::cout << "[TEST] SafetyLaws PASSED\n";
    return 0;
}
