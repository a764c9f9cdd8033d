#include "backtest/PackRunner.h"
#include "common/Logger.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>

namespace phoenix {
namespace backtest {

PackRunner::PackRunner(const engine::EngineConfig& base, size_t max_parallel)
    : base_(base)
    , max_parallel_(std::max<size_t>(1, max_parallel)) {}

std::vector<PackResult> PackRunner::run(const std::vector<PackDefinition>& packs,
                                        const std::vector<Bar>& bars,
                                        const strategy::ScriptedStrategy& script) const {
    std::vector<PackResult> results(packs.size());
    std::atomic<size_t> next_pack{0};

    auto worker = [&]() {
        while (true) {
            const size_t index = next_pack.fetch_add(1);
            if (index >= packs.size()) {
                return;
            }
            results[index] = runOne(packs[index], bars, script);
        }
    };

    const size_t thread_count = std::min(max_parallel_, packs.size());
    std::vector<std::unique_ptr<std::thread>> workers;
    for (size_t i = 0; i < thread_count; ++i) {
        workers.push_back(std::make_unique<std::thread>(worker));
    }
    for (auto& t : workers) {
        t->join();
    }
    return results;
}

PackResult PackRunner::runOne(const PackDefinition& pack,
                              const std::vector<Bar>& bars,
                              const strategy::ScriptedStrategy& script) const {
    PackResult out;
    out.name = pack.name;
    try {
        out.config = Config::applyOverrides(base_, pack.overrides);
        out.config.validate();

        VectorBarFeed feed(bars);
        strategy::ScriptedStrategy strategy = script;
        SimulationDriver driver(out.config);
        out.result = driver.run(feed, strategy);
        out.ok = true;
    } catch (const std::exception& e) {
        out.ok = false;
        out.error = e.what();
        LOG_ERROR("Pack '{}' failed: {}", pack.name, e.what());
    }
    return out;
}

} // namespace backtest
} // namespace phoenix
