#include "engine/RuntimeRouter.h"
#include "analytics/RegimeDetector.h"
#include "backtest/FeedValidator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/execution/ExecutionReport.h"
#include "engine/PositionLifecycleManager.h"
#include "execution/BrokerExecutionSink.h"

#include <stdexcept>

namespace phoenix {
namespace engine {

namespace {
constexpr size_t HISTORY_LIMIT = 500;
}

RuntimeRouter::RuntimeRouter(std::shared_ptr<risk::AccountLedger> ledger,
                             std::shared_ptr<core::IBrokerAdapter> broker)
    : ledger_(std::move(ledger))
    , broker_(std::move(broker)) {
    if (!ledger_ || !broker_) {
        throw std::invalid_argument("RuntimeRouter needs a ledger and a broker adapter");
    }
}

RuntimeRouter::~RuntimeRouter() {
    stop();
}

void RuntimeRouter::addInstrument(InstrumentRoute route) {
    if (running_) {
        throw std::logic_error("instruments must be added before start()");
    }
    if (!route.feed || !route.strategy) {
        throw std::invalid_argument("route for " + route.config.instrument.symbol +
                                    " needs a feed and a strategy");
    }
    route.config.validate();
    for (const auto& existing : routes_) {
        if (existing.config.instrument.symbol == route.config.instrument.symbol) {
            throw std::invalid_argument("duplicate route for " + route.config.instrument.symbol);
        }
    }
    routes_.push_back(std::move(route));
}

void RuntimeRouter::start() {
    if (running_) {
        LOG_WARN("Router already running");
        return;
    }
    joinWorkers();

    running_ = true;
    LOG_INFO("Router starting {} instrument worker(s)", routes_.size());
    for (const auto& route : routes_) {
        ++active_workers_;
        workers_.push_back(std::make_unique<std::thread>(&RuntimeRouter::runInstrument, this, route));
    }
}

void RuntimeRouter::stop() {
    if (!running_ && workers_.empty()) {
        return;
    }
    LOG_INFO("Router stopping");
    running_ = false;
    joinWorkers();
}

void RuntimeRouter::wait() {
    joinWorkers();
    running_ = false;
}

void RuntimeRouter::joinWorkers() {
    for (auto& worker : workers_) {
        if (worker && worker->joinable()) {
            worker->join();
        }
    }
    workers_.clear();
}

std::vector<ClosedTrade> RuntimeRouter::closedTrades() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return closed_trades_;
}

std::vector<LifecycleEvent> RuntimeRouter::events() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return events_;
}

std::vector<std::string> RuntimeRouter::errors() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return errors_;
}

std::vector<core::ExecutionUpdate> RuntimeRouter::collectUpdates(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(broker_mutex_);
    broker_->poll();
    for (auto& update : broker_->drainUpdates()) {
        pending_updates_[update.symbol].push_back(std::move(update));
    }

    std::vector<core::ExecutionUpdate> out;
    auto it = pending_updates_.find(symbol);
    if (it != pending_updates_.end()) {
        out.swap(it->second);
    }
    return out;
}

void RuntimeRouter::runInstrument(const InstrumentRoute& route) {
    const std::string symbol = route.config.instrument.symbol;

    execution::BrokerExecutionSink sink(*broker_, symbol);
    PositionLifecycleManager manager(route.config, *ledger_, &sink);
    if (journal_) {
        manager.setEventListener([this](const LifecycleEvent& event) {
            if (!journal_->append(toJournalEvent(event))) {
                LOG_WARN("Journal append failed for {}", event.position_id);
            }
        });
    }

    analytics::RegimeDetector regime_detector;
    backtest::FeedValidator validator;
    std::vector<Bar> history;
    Bar last_bar;
    bool have_bar = false;

    auto handleBroker = [&]() {
        for (const auto& id : sink.drainFailedEntries()) {
            if (const Position* pos = manager.findPosition(id)) {
                manager.forceClose(id, pos->entry_price, 0.0, last_bar.timestamp,
                                   CloseReason::BROKER_REJECT);
            }
        }
        for (const auto& update : collectUpdates(symbol)) {
            LOG_DEBUG("[{}] broker {}", symbol, core::execution::toJson(update).dump());
            if (journal_ && !journal_->append(core::execution::toJournalEvent(update))) {
                LOG_WARN("Journal append failed for order {}", update.order_id);
            }
            if (update.status != OrderStatus::REJECTED) {
                continue;
            }
            if (update.intent == core::ExecutionIntent::ENTRY) {
                if (const Position* pos = manager.findPosition(update.position_id)) {
                    LOG_WARN("{} entry rejected by broker, force-closing", update.position_id);
                    manager.forceClose(update.position_id, pos->entry_price, 0.0,
                                       last_bar.timestamp, CloseReason::BROKER_REJECT);
                }
            } else {
                LOG_WARN("{} broker rejected {} order {}", update.position_id,
                         core::execution::toString(update.intent), update.order_id);
            }
        }
    };

    LOG_INFO("[{}] worker started", symbol);

    try {
        while (running_) {
            Bar bar;
            const auto status = route.feed->next(bar);
            if (status == backtest::FeedStatus::END_OF_STREAM) {
                LOG_INFO("[{}] feed ended", symbol);
                break;
            }

            if (status == backtest::FeedStatus::BAR) {
                validator.validate(bar);
                manager.onBar(bar);

                history.push_back(bar);
                if (history.size() > HISTORY_LIMIT) {
                    history.erase(history.begin());
                }

                auto output = route.strategy->onBar(bar, history, manager.openPositions());
                const auto regime = output.regime
                    ? *output.regime
                    : regime_detector.analyzeRegime(history).regime;

                for (const auto& amendment : output.stop_amendments) {
                    manager.amendStop(amendment, bar);
                }
                for (const auto& engagement : output.engagements) {
                    manager.submit(engagement, bar, regime);
                }

                last_bar = bar;
                have_bar = true;
            }

            handleBroker();
        }
    } catch (const FeedIntegrityError& e) {
        LOG_ERROR("[{}] feed integrity failure: {}", symbol, e.what());
        std::lock_guard<std::mutex> lock(results_mutex_);
        errors_.push_back(symbol + ": " + e.what());
    }

    // No open position outlives the worker
    if (have_bar && !manager.openPositions().empty()) {
        LOG_INFO("[{}] closing {} open position(s)", symbol, manager.openPositions().size());
        manager.closeAll(last_bar, CloseReason::END_OF_DATA);
    }
    handleBroker();

    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        closed_trades_.insert(closed_trades_.end(),
                              manager.closedTrades().begin(), manager.closedTrades().end());
        events_.insert(events_.end(), manager.events().begin(), manager.events().end());
    }
    LOG_INFO("[{}] worker stopped: {} trades", symbol, manager.closedTrades().size());
    --active_workers_;
}

} // namespace engine
} // namespace phoenix
