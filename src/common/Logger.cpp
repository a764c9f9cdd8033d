#include "common/Logger.h"
#include "common/PathUtils.h"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace phoenix {

namespace {
constexpr size_t MAIN_LOG_MAX_BYTES = 10 * 1024 * 1024;
constexpr size_t MAIN_LOG_FILES = 3;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (main_logger_) {
        return;
    }

    const auto dir = utils::PathUtils::resolve(log_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create log directory " + dir.string() + ": " + ec.message());
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (dir / "phoenix.log").string(), MAIN_LOG_MAX_BYTES, MAIN_LOG_FILES));

        auto main_logger = std::make_shared<spdlog::logger>("phoenix", sinks.begin(), sinks.end());
        main_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
        main_logger->set_level(spdlog::level::from_str(level));
        main_logger->flush_on(spdlog::level::warn);

        auto trade_logger = spdlog::daily_logger_mt("phoenix_trades", (dir / "trades.log").string());
        trade_logger->set_pattern("%v");

        main_logger_ = std::move(main_logger);
        trade_logger_ = std::move(trade_logger);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("log init failed: ") + ex.what());
    }

    main_logger_->info("Logging to {} at level {}", dir.string(), level);
}

void Logger::logTrade(const std::string& symbol, const std::string& direction,
                      double entry_price, double exit_price, double size,
                      double pnl, const std::string& reason) {
    if (!trade_logger_) {
        return;
    }
    trade_logger_->info("{},{},{:.5f},{:.5f},{:.4f},{:.2f},{}",
                        symbol, direction, entry_price, exit_price, size, pnl, reason);
}

} // namespace phoenix
