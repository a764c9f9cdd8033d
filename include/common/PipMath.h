#pragma once
// ===================================================================
// Pip conversion helpers
//
// FX convention: JPY-quoted pairs move in 0.01 units, everything else
// in 0.0001. Instruments with another tick grid set pip_size explicitly
// in the instrument config.
// ===================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace phoenix {
namespace common {

constexpr double DEFAULT_PIP_SIZE = 0.0001;
constexpr double JPY_PIP_SIZE = 0.01;

inline double pipSizeForSymbol(const std::string& symbol) {
    std::string upper = symbol;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper.find("JPY") != std::string::npos) {
        return JPY_PIP_SIZE;
    }
    return DEFAULT_PIP_SIZE;
}

inline double pipsToPrice(double pips, double pip_size) {
    return pips * pip_size;
}

inline double priceToPips(double price_distance, double pip_size) {
    if (pip_size <= 0.0) return 0.0;
    return price_distance / pip_size;
}

// Absolute pip distance between two prices with a small tolerance so
// 15.0000000001 pips computed from floats still compares as 15
inline double pipDistance(double a, double b, double pip_size) {
    const double pips = priceToPips(std::abs(a - b), pip_size);
    return std::round(pips * 1e6) / 1e6;
}

} // namespace common
} // namespace phoenix
