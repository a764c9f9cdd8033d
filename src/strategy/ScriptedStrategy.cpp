#include "strategy/ScriptedStrategy.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace phoenix {
namespace strategy {

namespace {
Direction parseDirection(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (value == "LONG" || value == "BUY") return Direction::LONG;
    if (value == "SHORT" || value == "SELL") return Direction::SHORT;
    throw std::runtime_error("engagement script: unknown direction " + value);
}

Engagement parseEngagement(const nlohmann::json& e, const std::string& strategy_name, bool& from_close) {
    Engagement eng;
    eng.symbol = e.value("symbol", std::string());
    eng.direction = parseDirection(e.value("direction", std::string("LONG")));
    eng.entry_price = e.value("entry_price", 0.0);
    from_close = !e.contains("entry_price");
    eng.stop_distance_pips = e.value("stop_pips", 0.0);
    eng.requested_size = e.value("size", 0.0);
    eng.strategy_name = e.value("strategy", strategy_name);
    eng.tag = e.value("tag", std::string());

    if (e.contains("take_profits")) {
        for (const auto& tp : e["take_profits"]) {
            TakeProfitLevel level;
            level.distance_pips = tp.value("pips", 0.0);
            level.fraction = tp.value("fraction", 0.0);
            eng.take_profits.push_back(level);
        }
    }
    return eng;
}
}

ScriptedStrategy ScriptedStrategy::fromJson(const nlohmann::json& j) {
    ScriptedStrategy strategy;
    try {
        strategy.name_ = j.value("name", std::string("scripted"));

        if (!j.contains("steps")) {
            return strategy;
        }
        for (const auto& s : j["steps"]) {
            if (!s.contains("timestamp")) {
                throw std::runtime_error("engagement script: step without timestamp");
            }
            const Timestamp ts = backtest::DataHistory::toMsTimestamp(s["timestamp"].get<Timestamp>());

            Step step;
            if (s.contains("regime")) {
                const std::string label = s["regime"].get<std::string>();
                step.regime = analytics::regimeFromString(label);
                if (!step.regime) {
                    throw std::runtime_error("engagement script: unknown regime " + label);
                }
            }
            if (s.contains("engagements")) {
                for (const auto& e : s["engagements"]) {
                    bool from_close = false;
                    step.engagements.push_back(parseEngagement(e, strategy.name_, from_close));
                    step.entry_from_close.push_back(from_close);
                }
            }
            if (s.contains("amendments")) {
                for (const auto& a : s["amendments"]) {
                    ScriptedAmendment amendment;
                    amendment.position_id = a.value("position_id", std::string());
                    amendment.tag = a.value("tag", std::string());
                    amendment.stop_distance_pips = a.value("stop_pips", 0.0);
                    step.amendments.push_back(amendment);
                }
            }
            strategy.addStep(ts, std::move(step));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("engagement script parse error: ") + e.what());
    }
    return strategy;
}

ScriptedStrategy ScriptedStrategy::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open engagement script: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("engagement script parse error: " + std::string(e.what()));
    }

    auto strategy = fromJson(j);
    LOG_INFO("Loaded engagement script '{}' with {} steps from {}",
             strategy.name_, strategy.steps_.size(), path);
    return strategy;
}

void ScriptedStrategy::addStep(Timestamp ts, Step step) {
    step.entry_from_close.resize(step.engagements.size(), false);
    auto& slot = steps_[ts];
    for (size_t i = 0; i < step.engagements.size(); ++i) {
        slot.engagements.push_back(step.engagements[i]);
        slot.entry_from_close.push_back(step.entry_from_close[i]);
    }
    for (auto& amendment : step.amendments) {
        slot.amendments.push_back(amendment);
    }
    if (step.regime) {
        slot.regime = step.regime;
    }
}

StrategyInfo ScriptedStrategy::getInfo() const {
    StrategyInfo info;
    info.name = name_;
    info.description = "replays a recorded engagement sequence";
    return info;
}

StrategyOutput ScriptedStrategy::onBar(const Bar& bar,
                                       const std::vector<Bar>& history,
                                       const std::vector<engine::Position>& open_positions) {
    (void)history;
    StrategyOutput output;

    auto it = steps_.find(bar.timestamp);
    if (it == steps_.end()) {
        return output;
    }
    const Step& step = it->second;
    output.regime = step.regime;

    for (size_t i = 0; i < step.engagements.size(); ++i) {
        Engagement eng = step.engagements[i];
        if (step.entry_from_close[i]) {
            eng.entry_price = bar.close;
        }
        output.engagements.push_back(eng);
    }

    for (const auto& scripted : step.amendments) {
        StopAmendment amendment;
        amendment.new_stop_distance_pips = scripted.stop_distance_pips;
        amendment.position_id = scripted.position_id;
        if (amendment.position_id.empty() && !scripted.tag.empty()) {
            for (const auto& pos : open_positions) {
                if (pos.tag == scripted.tag) {
                    amendment.position_id = pos.id;
                    break;
                }
            }
        }
        if (amendment.position_id.empty()) {
            LOG_WARN("{}: amendment for tag '{}' has no open position", name_, scripted.tag);
            continue;
        }
        output.stop_amendments.push_back(amendment);
    }
    return output;
}

} // namespace strategy
} // namespace phoenix
