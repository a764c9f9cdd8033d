#include "analytics/RegimeDetector.h"

#include <cassert>
#include <iostream>

using namespace phoenix;
using phoenix::analytics::MarketRegime;
using phoenix::analytics::RegimeDetector;
using phoenix::analytics::RegimeThresholds;

namespace {
constexpr Timestamp T0 = 1700000000000LL;
constexpr Timestamp STEP = 60000;

// Bars whose close moves by `slope` each step, spread `half_range` around it
std::vector<Bar> series(size_t count, double start, double slope, double half_range) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < count; ++i) {
        const double c = start + slope * static_cast<double>(i);
        bars.emplace_back(c, c + half_range, c - half_range, c, 100.0,
                          T0 + static_cast<Timestamp>(i) * STEP);
    }
    return bars;
}

std::vector<Bar> chop(size_t count) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < count; ++i) {
        const double c = (i % 2 == 0) ? 100.0 : 100.05;
        bars.emplace_back(c, c + 0.1, c - 0.1, c, 100.0, T0 + static_cast<Timestamp>(i) * STEP);
    }
    return bars;
}
}

int main() {
    RegimeDetector detector;

    {
        auto a = detector.analyzeRegime(series(49, 100.0, 0.5, 0.1));
        assert(a.regime == MarketRegime::UNKNOWN);
        assert(a.adx == 0.0);
    }

    {
        auto a = detector.analyzeRegime(series(60, 100.0, 0.5, 0.1));
        assert(a.regime == MarketRegime::TRENDING_UP);
        assert(a.adx > 25.0);
        assert(a.trend_score > 0.0);
    }

    {
        auto a = detector.analyzeRegime(series(60, 200.0, -0.5, 0.1));
        assert(a.regime == MarketRegime::TRENDING_DOWN);
        assert(a.trend_score < 0.0);
    }

    {
        auto a = detector.analyzeRegime(chop(60));
        assert(a.regime == MarketRegime::RANGING);
        assert(a.adx < 25.0);
    }

    // Wide bars: ATR near 10% of price outranks the trend
    {
        auto a = detector.analyzeRegime(series(60, 100.0, 0.5, 5.0));
        assert(a.regime == MarketRegime::HIGH_VOLATILITY);
        assert(a.atr_pct > 2.0);
        assert(a.trend_score == 0.0);
    }

    {
        RegimeThresholds short_history;
        short_history.min_bars = 30;
        short_history.slow_ema = 25;
        RegimeDetector quick(short_history);
        assert(quick.analyzeRegime(series(30, 100.0, 0.5, 0.1)).regime == MarketRegime::TRENDING_UP);
        assert(detector.analyzeRegime(series(30, 100.0, 0.5, 0.1)).regime == MarketRegime::UNKNOWN);
    }

    {
        RegimeThresholds t;
        assert(RegimeDetector::classify(t, 40.0, 2.5, true) == MarketRegime::HIGH_VOLATILITY);
        assert(RegimeDetector::classify(t, 25.0, 1.0, false) == MarketRegime::TRENDING_DOWN);
        assert(RegimeDetector::classify(t, 24.9, 1.0, true) == MarketRegime::RANGING);
        assert(RegimeDetector::classify(t, 30.0, 2.0, true) == MarketRegime::TRENDING_UP);
    }

    {
        assert(analytics::regimeFromString("bull") == MarketRegime::TRENDING_UP);
        assert(analytics::regimeFromString("Ranging") == MarketRegime::RANGING);
        assert(analytics::regimeFromString("VOLATILE") == MarketRegime::HIGH_VOLATILITY);
        assert(!analytics::regimeFromString("crab"));
        assert(std::string(analytics::regimeToString(MarketRegime::TRENDING_DOWN)) == "TRENDING_DOWN");
    }

    std::cout << "[TEST] RegimeDetector PASSED\n";
    return 0;
}
