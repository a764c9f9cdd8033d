#pragma once

#include "engine/EngineConfig.h"

namespace phoenix {
namespace execution {

struct FillCost {
    double fee = 0.0;
    double slippage = 0.0;

    double total() const { return fee + slippage; }
};

// Deterministic fee/slippage for exit fills
class CostModel {
public:
    CostModel(const engine::CostConfig& config, double pip_size);

    double fee(double size) const;

    // bar_range is the high-low of the bar the fill happened on
    double slippage(double size, double bar_range) const;

    FillCost costFor(double size, double bar_range) const;

private:
    engine::CostConfig config_;
    double pip_size_;
};

} // namespace execution
} // namespace phoenix
