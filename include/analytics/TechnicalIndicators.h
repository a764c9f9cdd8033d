#pragma once

#include <vector>
#include "common/Types.h"

namespace phoenix {
namespace analytics {

// Indicator set used by the regime labeler
class TechnicalIndicators {
public:
    // ATR (Average True Range), Wilder smoothing; 0 until period + 1 bars exist
    static double calculateATR(const std::vector<Bar>& bars, int period = 14);

    // ADX (Average Directional Index); >= 25 reads as trending
    static double calculateADX(const std::vector<Bar>& bars, int period = 14);

    static double calculateEMA(const std::vector<double>& prices, int period);

    // Mean of the latest `period` values
    static double calculateSMA(const std::vector<double>& prices, int period);

    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);
};

} // namespace analytics
} // namespace phoenix
