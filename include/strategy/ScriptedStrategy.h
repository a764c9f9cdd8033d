#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "strategy/IStrategy.h"

namespace phoenix {
namespace strategy {

// Replays a recorded engagement sequence keyed by bar timestamp.
//
// {
//   "name": "replay",
//   "steps": [
//     { "timestamp": 1700000000000, "regime": "RANGING",
//       "engagements": [ { "direction": "LONG", "entry_price": 1.1,
//                          "stop_pips": 10, "size": 10000, "tag": "a",
//                          "take_profits": [ { "pips": 20, "fraction": 0.5 } ] } ],
//       "amendments": [ { "tag": "a", "stop_pips": 30 } ] } ] }
//
// entry_price defaults to the bar close. Amendments address a position by
// "position_id" or by the engagement "tag".
class ScriptedStrategy : public IStrategy {
public:
    struct ScriptedAmendment {
        std::string position_id;
        std::string tag;
        double stop_distance_pips = 0.0;
    };

    struct Step {
        std::vector<Engagement> engagements;
        std::vector<ScriptedAmendment> amendments;
        std::optional<analytics::MarketRegime> regime;
        std::vector<bool> entry_from_close;   // per engagement
    };

    ScriptedStrategy() = default;

    // Throws std::runtime_error on a malformed script
    static ScriptedStrategy fromJson(const nlohmann::json& j);
    static ScriptedStrategy loadFromFile(const std::string& path);

    void addStep(Timestamp ts, Step step);

    StrategyInfo getInfo() const override;

    StrategyOutput onBar(const Bar& bar,
                         const std::vector<Bar>& history,
                         const std::vector<engine::Position>& open_positions) override;

    size_t stepCount() const { return steps_.size(); }

private:
    std::string name_ = "scripted";
    std::map<Timestamp, Step> steps_;
};

} // namespace strategy
} // namespace phoenix
