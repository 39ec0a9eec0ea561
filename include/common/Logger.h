#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace stratlab {

class Logger {
public:
    static Logger& getInstance();

    // Until initialize() runs every call below is a no-op.
    // console_to_stderr keeps stdout free for machine-readable output.
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info",
                    bool console_to_stderr = false);

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV line per closed trade: ticker,entry_date,entry_price,exit_date,exit_price,pnl_pct
    void logTrade(const std::string& ticker,
                  const std::string& entry_date, double entry_price,
                  const std::string& exit_date, double exit_price,
                  double pnl_pct);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) stratlab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) stratlab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) stratlab::Logger::getInstance().error(__VA_ARGS__)

} // namespace stratlab
