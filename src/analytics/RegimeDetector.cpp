#include "analytics/RegimeDetector.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace phoenix {
namespace analytics {

namespace {
const std::pair<const char*, MarketRegime> REGIME_NAMES[] = {
    {"UNKNOWN", MarketRegime::UNKNOWN},
    {"TRENDING_UP", MarketRegime::TRENDING_UP},
    {"TRENDING_DOWN", MarketRegime::TRENDING_DOWN},
    {"RANGING", MarketRegime::RANGING},
    {"HIGH_VOLATILITY", MarketRegime::HIGH_VOLATILITY},
    {"BULL", MarketRegime::TRENDING_UP},
    {"BEAR", MarketRegime::TRENDING_DOWN},
    {"SIDEWAYS", MarketRegime::RANGING},
    {"VOLATILE", MarketRegime::HIGH_VOLATILITY},
};
}

const char* regimeToString(MarketRegime regime) {
    for (const auto& entry : REGIME_NAMES) {
        if (entry.second == regime) {
            return entry.first;
        }
    }
    return "UNKNOWN";
}

std::optional<MarketRegime> regimeFromString(const std::string& value) {
    std::string upper(value.size(), '\0');
    std::transform(value.begin(), value.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const auto& entry : REGIME_NAMES) {
        if (upper == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

MarketRegime RegimeDetector::classify(const RegimeThresholds& thresholds, double adx,
                                      double atr_pct, bool fast_above_slow) {
    if (atr_pct > thresholds.atr_pct_ceiling) {
        return MarketRegime::HIGH_VOLATILITY;
    }
    if (adx < thresholds.adx_trend) {
        return MarketRegime::RANGING;
    }
    return fast_above_slow ? MarketRegime::TRENDING_UP : MarketRegime::TRENDING_DOWN;
}

RegimeAnalysis RegimeDetector::analyzeRegime(const std::vector<Bar>& bars) const {
    RegimeAnalysis result;
    if (bars.size() < thresholds_.min_bars || bars.back().close <= 0.0) {
        return result;
    }

    const int period = thresholds_.indicator_period;
    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const bool fast_above_slow = TechnicalIndicators::calculateEMA(closes, thresholds_.fast_ema) >
                                 TechnicalIndicators::calculateEMA(closes, thresholds_.slow_ema);

    result.adx = TechnicalIndicators::calculateADX(bars, period);
    result.atr_pct = TechnicalIndicators::calculateATR(bars, period) / bars.back().close * 100.0;
    result.regime = classify(thresholds_, result.adx, result.atr_pct, fast_above_slow);
    if (result.regime != MarketRegime::HIGH_VOLATILITY) {
        result.trend_score = (fast_above_slow ? 1.0 : -1.0) * result.adx / 100.0;
    }
    return result;
}

} // namespace analytics
} // namespace phoenix
