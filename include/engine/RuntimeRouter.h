#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "backtest/BarFeed.h"
#include "core/contracts/IBrokerAdapter.h"
#include "core/contracts/IEventJournal.h"
#include "engine/EngineConfig.h"
#include "engine/LifecycleEvent.h"
#include "engine/Position.h"
#include "risk/AccountLedger.h"
#include "strategy/IStrategy.h"

namespace phoenix {
namespace engine {

struct InstrumentRoute {
    EngineConfig config;                            // instrument.symbol selects the route
    std::shared_ptr<backtest::IBarFeed> feed;
    std::shared_ptr<strategy::IStrategy> strategy;
};

// Live analogue of the simulation driver. One worker thread per
// instrument, each with its own lifecycle manager, all sharing one
// account ledger and one broker adapter.
class RuntimeRouter {
public:
    RuntimeRouter(std::shared_ptr<risk::AccountLedger> ledger,
                  std::shared_ptr<core::IBrokerAdapter> broker);
    ~RuntimeRouter();

    RuntimeRouter(const RuntimeRouter&) = delete;
    RuntimeRouter& operator=(const RuntimeRouter&) = delete;

    // Only before start()
    void addInstrument(InstrumentRoute route);

    void start();

    // Signals every worker; each force-closes its open positions before
    // its thread exits. Blocks until all workers are joined.
    void stop();

    // Blocks until every feed reached end of stream
    void wait();

    bool isRunning() const { return running_; }

    // Workers that have not yet flattened and published their results
    int activeWorkers() const { return active_workers_; }

    void setJournal(core::IEventJournal* journal) { journal_ = journal; }

    // Complete once the workers have been joined
    std::vector<ClosedTrade> closedTrades() const;
    std::vector<LifecycleEvent> events() const;
    std::vector<std::string> errors() const;

private:
    void runInstrument(const InstrumentRoute& route);
    std::vector<core::ExecutionUpdate> collectUpdates(const std::string& symbol);
    void joinWorkers();

    std::shared_ptr<risk::AccountLedger> ledger_;
    std::shared_ptr<core::IBrokerAdapter> broker_;
    core::IEventJournal* journal_ = nullptr;

    std::vector<InstrumentRoute> routes_;
    std::vector<std::unique_ptr<std::thread>> workers_;
    std::atomic<bool> running_{false};
    std::atomic<int> active_workers_{0};

    std::mutex broker_mutex_;
    std::map<std::string, std::vector<core::ExecutionUpdate>> pending_updates_;

    mutable std::mutex results_mutex_;
    std::vector<ClosedTrade> closed_trades_;
    std::vector<LifecycleEvent> events_;
    std::vector<std::string> errors_;
};

} // namespace engine
} // namespace phoenix
