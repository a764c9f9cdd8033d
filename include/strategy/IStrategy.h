#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "common/Types.h"
#include "engine/Position.h"

namespace phoenix {
namespace strategy {

struct StrategyInfo {
    std::string name;
    std::string description;
};

// Advisory output for one bar. Every engagement still passes triage and
// the safety laws before anything opens.
struct StrategyOutput {
    std::vector<Engagement> engagements;
    std::vector<StopAmendment> stop_amendments;
    std::optional<analytics::MarketRegime> regime;   // overrides the detector when set
};

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // `history` ends with `bar`
    virtual StrategyOutput onBar(const Bar& bar,
                                 const std::vector<Bar>& history,
                                 const std::vector<engine::Position>& open_positions) = 0;
};

} // namespace strategy
} // namespace phoenix
