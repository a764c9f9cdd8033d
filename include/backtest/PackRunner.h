#pragma once

#include <string>
#include <vector>

#include "backtest/SimulationDriver.h"
#include "common/Config.h"
#include "engine/EngineConfig.h"
#include "strategy/ScriptedStrategy.h"

namespace phoenix {
namespace backtest {

struct PackResult {
    std::string name;
    engine::EngineConfig config;
    SimulationDriver::Result result;
    bool ok = false;
    std::string error;
};

// Runs independent parameter packs over the same bars and engagement
// script on up to max_parallel worker threads. Each pack owns its account
// and positions; nothing is shared.
class PackRunner {
public:
    PackRunner(const engine::EngineConfig& base, size_t max_parallel);

    // Results come back in pack order. A pack that fails records its error
    // and does not stop the others.
    std::vector<PackResult> run(const std::vector<PackDefinition>& packs,
                                const std::vector<Bar>& bars,
                                const strategy::ScriptedStrategy& script) const;

private:
    PackResult runOne(const PackDefinition& pack,
                      const std::vector<Bar>& bars,
                      const strategy::ScriptedStrategy& script) const;

    engine::EngineConfig base_;
    size_t max_parallel_;
};

} // namespace backtest
} // namespace phoenix
