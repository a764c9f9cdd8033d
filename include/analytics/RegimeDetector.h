#pragma once

#include "common/Types.h"
#include <optional>
#include <vector>
#include <string>

namespace phoenix {
namespace analytics {

enum class MarketRegime {
    UNKNOWN,
    TRENDING_UP,
    TRENDING_DOWN,
    RANGING,
    HIGH_VOLATILITY
};

const char* regimeToString(MarketRegime regime);

// Accepts the enum names case-insensitively plus BULL/BEAR/SIDEWAYS/VOLATILE
std::optional<MarketRegime> regimeFromString(const std::string& value);

struct RegimeThresholds {
    size_t min_bars = 50;
    int indicator_period = 14;
    int fast_ema = 20;
    int slow_ema = 50;
    double adx_trend = 25.0;          // ADX at or above this is a trend
    double atr_pct_ceiling = 2.0;     // ATR as % of price; above is HIGH_VOLATILITY
};

struct RegimeAnalysis {
    MarketRegime regime = MarketRegime::UNKNOWN;
    double adx = 0.0;
    double atr_pct = 0.0;
    double trend_score = 0.0;   // signed ADX/100, positive when fast EMA leads
};

// Fallback regime source for bars the strategy did not label
class RegimeDetector {
public:
    RegimeDetector() = default;
    explicit RegimeDetector(const RegimeThresholds& thresholds)
        : thresholds_(thresholds) {}

    // UNKNOWN until min_bars of history exist
    RegimeAnalysis analyzeRegime(const std::vector<Bar>& bars) const;

    // Volatility outranks trend; trend needs ADX at the threshold
    static MarketRegime classify(const RegimeThresholds& thresholds, double adx,
                                 double atr_pct, bool fast_above_slow);

private:
    RegimeThresholds thresholds_;
};

} // namespace analytics
} // namespace phoenix
