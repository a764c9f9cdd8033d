#include "backtest/BarFeed.h"
#include "backtest/DataHistory.h"
#include "backtest/PackRunner.h"
#include "backtest/SimulationDriver.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/RuntimeRouter.h"
#include "execution/PaperBrokerAdapter.h"
#include "strategy/ScriptedStrategy.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace phoenix;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_stop_requested = 1;
    }
}

struct CliOptions {
    std::string mode;               // "backtest" or "paper"
    std::string bars_path;
    std::string script_path;
    std::string config_path = "config/phoenix.json";
    std::string journal_path;
    bool json = false;
    bool packs = false;
    int threads = 0;
};

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  phoenix --backtest <bars.csv|bars.json> --engagements <script.json>\n"
        << "          [--config <file>] [--json] [--packs] [--threads N] [--journal <file.jsonl>]\n"
        << "  phoenix --paper <bars.csv|bars.json> --engagements <script.json>\n"
        << "          [--config <file>] [--max-order-size X] [--journal <file.jsonl>]\n";
}

nlohmann::json tradeToJson(const engine::ClosedTrade& t) {
    return {
        {"position_id", t.position_id},
        {"symbol", t.symbol},
        {"direction", directionToString(t.direction)},
        {"entry_price", t.entry_price},
        {"exit_price", t.exit_price},
        {"size", t.size},
        {"gross_pnl", t.gross_pnl},
        {"fees", t.fees},
        {"slippage", t.slippage},
        {"realized_pnl", t.realized_pnl},
        {"reason", engine::closeReasonToString(t.reason)},
        {"law", t.law},
        {"bars_held", t.bars_held},
        {"opened_at", t.opened_at},
        {"closed_at", t.closed_at}
    };
}

nlohmann::json resultToJson(const backtest::SimulationDriver::Result& result) {
    const auto& s = result.summary;
    nlohmann::json j;
    j["final_equity"] = result.final_account.equity;
    j["peak_equity"] = result.final_account.peak_equity;
    j["total_profit"] = s.total_profit;
    j["max_drawdown"] = s.max_drawdown;
    j["total_trades"] = s.total_trades;
    j["winning_trades"] = s.winning_trades;
    j["losing_trades"] = s.losing_trades;
    j["win_rate"] = s.win_rate;
    j["profit_factor"] = s.profit_factor;
    j["expectancy"] = s.expectancy;
    j["total_fees"] = s.total_fees;
    j["total_slippage"] = s.total_slippage;
    j["avg_bars_held"] = s.avg_bars_held;
    j["bars_processed"] = s.bars_processed;
    j["engagements_opened"] = s.engagements_opened;
    j["engagements_skipped"] = s.engagements_skipped;
    j["engagements_rejected"] = s.engagements_rejected;
    j["engagements_invalid"] = s.engagements_invalid;
    j["exit_reason_counts"] = s.exit_reason_counts;
    j["law_firing_counts"] = s.law_firing_counts;
    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        j["trades"].push_back(tradeToJson(t));
    }
    j["equity_curve"] = nlohmann::json::array();
    for (const auto& p : result.equity_curve) {
        j["equity_curve"].push_back({
            {"ts", p.timestamp}, {"equity", p.equity},
            {"unrealized_pnl", p.unrealized_pnl}, {"drawdown", p.drawdown}
        });
    }
    return j;
}

void printSummary(const std::string& title, const backtest::SimulationDriver::Result& result) {
    const auto& s = result.summary;
    std::cout << "\n" << title << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Final equity:   " << result.final_account.equity << "\n";
    std::cout << "Peak equity:    " << result.final_account.peak_equity << "\n";
    std::cout << "Total profit:   " << s.total_profit << "\n";
    std::cout << "Max drawdown:   " << (s.max_drawdown * 100.0) << "%\n";
    std::cout << "Trades:         " << s.total_trades
              << " (win " << s.winning_trades << " / loss " << s.losing_trades << ")\n";
    std::cout << "Win rate:       " << (s.win_rate * 100.0) << "%\n";
    std::cout << "Profit factor:  " << std::setprecision(3) << s.profit_factor << "\n";
    std::cout << "Expectancy:     " << std::setprecision(2) << s.expectancy << " /trade\n";
    std::cout << "Fees/slippage:  " << s.total_fees << " / " << s.total_slippage << "\n";
    std::cout << "Engagements:    opened " << s.engagements_opened
              << ", skipped " << s.engagements_skipped
              << ", rejected " << s.engagements_rejected
              << ", invalid " << s.engagements_invalid << "\n";
    if (!s.exit_reason_counts.empty()) {
        std::cout << "Exit reasons:\n";
        for (const auto& [reason, count] : s.exit_reason_counts) {
            std::cout << "  - " << reason << ": " << count << "\n";
        }
    }
    if (!s.law_firing_counts.empty()) {
        std::cout << "Safety laws:\n";
        for (const auto& [law, count] : s.law_firing_counts) {
            std::cout << "  - " << law << ": " << count << "\n";
        }
    }
    std::cout << "---------------------------------------------\n";
}

std::unique_ptr<core::EventJournalJsonl> openJournal(const std::string& path) {
    auto journal = std::make_unique<core::EventJournalJsonl>(path);
    if (journal->lastSeq() > 0) {
        LOG_INFO("Journal {} resumes after seq {}", path, journal->lastSeq());
    }
    if (journal->malformedRows() > 0) {
        LOG_WARN("Journal {} has {} unreadable rows", path, journal->malformedRows());
    }
    return journal;
}

int runBacktest(const CliOptions& options) {
    auto& config = Config::getInstance();
    const auto bars = backtest::DataHistory::load(options.bars_path);
    const auto script = strategy::ScriptedStrategy::loadFromFile(options.script_path);

    if (options.packs) {
        auto packs = config.getPacks();
        if (packs.empty()) {
            packs.push_back(PackDefinition{"base", nlohmann::json::object()});
        }
        const size_t threads = options.threads > 0
            ? static_cast<size_t>(options.threads)
            : std::max(1u, std::thread::hardware_concurrency());

        backtest::PackRunner runner(config.getEngineConfig(), threads);
        const auto results = runner.run(packs, bars, script);

        int failures = 0;
        nlohmann::json out = nlohmann::json::array();
        for (const auto& pack : results) {
            if (!pack.ok) {
                ++failures;
            }
            if (options.json) {
                nlohmann::json j = pack.ok ? resultToJson(pack.result) : nlohmann::json::object();
                j["pack"] = pack.name;
                j["ok"] = pack.ok;
                if (!pack.ok) {
                    j["error"] = pack.error;
                }
                out.push_back(j);
            } else if (pack.ok) {
                printSummary("Pack: " + pack.name, pack.result);
            } else {
                std::cout << "\nPack: " << pack.name << " FAILED: " << pack.error << "\n";
            }
        }
        if (options.json) {
            std::cout << out.dump() << "\n";
        }
        return failures == 0 ? 0 : 1;
    }

    std::unique_ptr<core::EventJournalJsonl> journal;
    backtest::SimulationDriver driver(config.getEngineConfig());
    if (!options.journal_path.empty()) {
        journal = openJournal(options.journal_path);
        driver.setJournal(journal.get());
    }

    backtest::VectorBarFeed feed(bars);
    strategy::ScriptedStrategy strategy = script;
    const auto result = driver.run(feed, strategy);

    if (options.json) {
        std::cout << resultToJson(result).dump() << "\n";
    } else {
        printSummary("Backtest result", result);
    }
    return 0;
}

int runPaper(const CliOptions& options, double max_order_size) {
    auto& config = Config::getInstance();
    const auto cfg = config.getEngineConfig();

    const auto bars = backtest::DataHistory::load(options.bars_path);
    auto strategy = std::make_shared<strategy::ScriptedStrategy>(
        strategy::ScriptedStrategy::loadFromFile(options.script_path));

    auto ledger = std::make_shared<risk::AccountLedger>(cfg.risk.initial_equity);
    auto broker = std::make_shared<execution::PaperBrokerAdapter>(max_order_size);
    auto feed = std::make_shared<backtest::LiveBarFeed>();

    std::unique_ptr<core::EventJournalJsonl> journal;
    engine::RuntimeRouter router(ledger, broker);
    if (!options.journal_path.empty()) {
        journal = openJournal(options.journal_path);
        router.setJournal(journal.get());
    }

    engine::InstrumentRoute route;
    route.config = cfg;
    route.feed = feed;
    route.strategy = strategy;
    router.addInstrument(route);

    std::signal(SIGINT, signalHandler);
    router.start();

    // Replay the file as if it were arriving live. SIGINT only raises
    // g_stop_requested; the session is wound down from this thread.
    for (const auto& bar : bars) {
        if (g_stop_requested) {
            break;
        }
        feed->push(bar);
    }
    feed->close();
    while (router.activeWorkers() > 0 && !g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (g_stop_requested) {
        LOG_INFO("Interrupt received, flattening open positions");
        router.stop();
    } else {
        router.wait();
    }

    const auto trades = router.closedTrades();
    const auto account = ledger->snapshot();
    const auto errors = router.errors();

    std::cout << "\nPaper session\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Orders sent:    " << broker->submittedCount() << "\n";
    std::cout << "Closed trades:  " << trades.size() << "\n";
    std::cout << "Final equity:   " << account.equity << "\n";
    std::cout << "Drawdown:       " << (account.drawdown() * 100.0) << "%\n";
    for (const auto& e : errors) {
        std::cout << "Error:          " << e << "\n";
    }
    std::cout << "---------------------------------------------\n";

    return errors.empty() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions options;
        double max_order_size = 0.0;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto nextValue = [&](const char* flag) -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(std::string("missing value for ") + flag);
                }
                return argv[++i];
            };

            if (arg == "--backtest") {
                options.mode = "backtest";
                options.bars_path = nextValue("--backtest");
            } else if (arg == "--paper") {
                options.mode = "paper";
                options.bars_path = nextValue("--paper");
            } else if (arg == "--engagements") {
                options.script_path = nextValue("--engagements");
            } else if (arg == "--config") {
                options.config_path = nextValue("--config");
            } else if (arg == "--journal") {
                options.journal_path = nextValue("--journal");
            } else if (arg == "--json") {
                options.json = true;
            } else if (arg == "--packs") {
                options.packs = true;
            } else if (arg == "--threads") {
                const std::string value = nextValue("--threads");
                try {
                    options.threads = std::stoi(value);
                } catch (const std::exception&) {
                    std::cerr << "Ignored invalid --threads value: " << value << "\n";
                }
            } else if (arg == "--max-order-size") {
                const std::string value = nextValue("--max-order-size");
                try {
                    max_order_size = std::stod(value);
                } catch (const std::exception&) {
                    std::cerr << "Ignored invalid --max-order-size value: " << value << "\n";
                }
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                printUsage();
                return 2;
            }
        }

        if (options.mode.empty() || options.script_path.empty()) {
            printUsage();
            return 2;
        }
        if (!std::filesystem::exists(options.bars_path)) {
            std::cerr << "Bar file not found: " << options.bars_path << "\n";
            return 2;
        }

        Config::getInstance().load(options.config_path);
        const auto cfg = Config::getInstance().getEngineConfig();

        // --json keeps stdout machine-readable
        Logger::getInstance().initialize(cfg.log_dir, options.json ? "warn" : cfg.log_level);
        LOG_INFO("Phoenix {} mode: bars={} script={} config={}",
                 options.mode, options.bars_path, options.script_path, options.config_path);

        if (options.mode == "paper") {
            return runPaper(options, max_order_size);
        }
        return runBacktest(options);

    } catch (const FeedIntegrityError& e) {
        LOG_ERROR("Feed integrity error: {}", e.what());
        std::cerr << "Feed integrity error: " << e.what() << "\n";
        return 3;
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
