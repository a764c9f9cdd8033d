#include "execution/CostModel.h"
#include "common/PipMath.h"

#include <algorithm>

namespace phoenix {
namespace execution {

CostModel::CostModel(const engine::CostConfig& config, double pip_size)
    : config_(config)
    , pip_size_(pip_size) {}

double CostModel::fee(double size) const {
    if (size <= 0.0) {
        return 0.0;
    }
    return config_.fee_per_unit * size + config_.fee_per_fill;
}

double CostModel::slippage(double size, double bar_range) const {
    if (size <= 0.0) {
        return 0.0;
    }
    const double per_unit = common::pipsToPrice(config_.slippage_pips, pip_size_) +
                            config_.slippage_range_factor * std::max(0.0, bar_range);
    return size * per_unit;
}

FillCost CostModel::costFor(double size, double bar_range) const {
    FillCost cost;
    cost.fee = fee(size);
    cost.slippage = slippage(size, bar_range);
    return cost;
}

} // namespace execution
} // namespace phoenix
