#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>

namespace phoenix {

// Process-wide logging. Console plus a rotating phoenix.log; closed trades
// also go to a daily trades.log as CSV. Calls made before initialize() are
// dropped, which keeps library code and tests quiet.
class Logger {
public:
    static Logger& getInstance();

    // Relative log_dir resolves like any other path (see PathUtils::resolve)
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void write(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->log(level, fmt, std::forward<Args>(args)...);
        }
    }

    // symbol,direction,entry,exit,size,pnl,reason
    void logTrade(const std::string& symbol, const std::string& direction,
                  double entry_price, double exit_price, double size,
                  double pnl, const std::string& reason);

private:
    Logger() = default;

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
};

#define LOG_DEBUG(...) phoenix::Logger::getInstance().write(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) phoenix::Logger::getInstance().write(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) phoenix::Logger::getInstance().write(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) phoenix::Logger::getInstance().write(spdlog::level::err, __VA_ARGS__)

} // namespace phoenix
