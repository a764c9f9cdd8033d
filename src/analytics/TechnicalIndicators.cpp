#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace phoenix {
namespace analytics {

double TechnicalIndicators::calculateATR(const std::vector<Bar>& bars, int period) {
    if (period <= 0 || bars.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(bars.size());

    // First TR needs a previous close, so it starts at index 1
    for (size_t i = 1; i < bars.size(); ++i) {
        const auto& current = bars[i];
        const auto& prev = bars[i - 1];

        const double tr1 = current.high - current.low;
        const double tr2 = std::abs(current.high - prev.close);
        const double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    // Wilder smoothing to the latest bar
    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr;
}

double TechnicalIndicators::calculateADX(const std::vector<Bar>& bars, int period) {
    if (period <= 0 || bars.size() < static_cast<size_t>(period * 2)) return 0.0;

    std::vector<double> tr_vec, dm_plus_vec, dm_minus_vec;
    tr_vec.reserve(bars.size());
    dm_plus_vec.reserve(bars.size());
    dm_minus_vec.reserve(bars.size());

    for (size_t i = 1; i < bars.size(); ++i) {
        const double current_high = bars[i].high;
        const double current_low = bars[i].low;
        const double prev_high = bars[i - 1].high;
        const double prev_low = bars[i - 1].low;
        const double prev_close = bars[i - 1].close;

        const double tr1 = current_high - current_low;
        const double tr2 = std::abs(current_high - prev_close);
        const double tr3 = std::abs(current_low - prev_close);
        tr_vec.push_back(std::max({tr1, tr2, tr3}));

        const double up_move = current_high - prev_high;
        const double down_move = prev_low - current_low;

        dm_plus_vec.push_back((up_move > down_move && up_move > 0) ? up_move : 0.0);
        dm_minus_vec.push_back((down_move > up_move && down_move > 0) ? down_move : 0.0);
    }

    // Wilder: first value is the plain sum, then prev - prev/p + x
    auto smooth = [](const std::vector<double>& vec, int p) {
        std::vector<double> smoothed;
        if (vec.size() < static_cast<size_t>(p)) return smoothed;

        double sum = 0.0;
        for (int i = 0; i < p; ++i) sum += vec[i];
        smoothed.push_back(sum);

        double prev = sum;
        for (size_t i = p; i < vec.size(); ++i) {
            const double current = prev - (prev / p) + vec[i];
            smoothed.push_back(current);
            prev = current;
        }
        return smoothed;
    };

    const auto tr_smooth = smooth(tr_vec, period);
    const auto dm_plus_smooth = smooth(dm_plus_vec, period);
    const auto dm_minus_smooth = smooth(dm_minus_vec, period);

    const size_t len = std::min({tr_smooth.size(), dm_plus_smooth.size(), dm_minus_smooth.size()});
    if (len == 0) return 0.0;

    std::vector<double> dx_vec;
    dx_vec.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        const double tr = tr_smooth[i];
        if (tr == 0) {
            dx_vec.push_back(0.0);
            continue;
        }

        const double di_plus = (dm_plus_smooth[i] / tr) * 100.0;
        const double di_minus = (dm_minus_smooth[i] / tr) * 100.0;

        const double sum_di = di_plus + di_minus;
        if (sum_di == 0) dx_vec.push_back(0.0);
        else dx_vec.push_back((std::abs(di_plus - di_minus) / sum_di) * 100.0);
    }

    if (dx_vec.size() < static_cast<size_t>(period)) return 0.0;

    // ADX = SMA of the latest DX values
    return calculateSMA(dx_vec, period);
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return prices.back();

    const double multiplier = 2.0 / (period + 1.0);

    // Seed with the SMA of the first period values
    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += prices[i];
    }
    ema /= period;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }
    return sum / period;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());

    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }

    return prices;
}

} // namespace analytics
} // namespace phoenix
