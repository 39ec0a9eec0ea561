#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace stratlab {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level, bool console_to_stderr) {
    if (initialized_) return;

    const std::filesystem::path logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    std::filesystem::create_directories(logs_path);

    try {
        spdlog::sink_ptr console_sink;
        if (console_to_stderr) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/stratlab.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::rotating_logger_mt(
            "trade", logs_path.string() + "/trades.log", 1024 * 1024 * 5, 3
        );
        trade_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        main_logger_.reset();
        trade_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logTrade(const std::string& ticker,
                      const std::string& entry_date, double entry_price,
                      const std::string& exit_date, double exit_price,
                      double pnl_pct) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << ticker << "," << entry_date << ","
            << std::fixed << std::setprecision(4) << entry_price << ","
            << exit_date << ","
            << std::fixed << std::setprecision(4) << exit_price << ","
            << std::fixed << std::setprecision(2) << pnl_pct;
        trade_logger_->info(oss.str());
    }
}

} // namespace stratlab
