#include "cli/CommandLine.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "backtest/BacktestEngine.h"
#include "data/DataHistory.h"
#include "spec/StrategySpec.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace stratlab {
namespace cli {

namespace {
void printUsage() {
    std::cout << "Usage: stratlab --spec <spec.json> --prices <prices.csv|prices.json>\n"
              << "                [--config <config.json>] [--log-dir <dir>] [--json] [--series]\n";
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw SpecificationError("Cannot open strategy file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void printReport(const backtest::BacktestEngine::Result& result) {
    std::cout << "\nBacktest result: " << result.spec.ticker << " "
              << result.spec.start_date.toIsoString() << " -> " << result.spec.end_date.toIsoString() << "\n";
    std::cout << "---------------------------------------------\n";

    if (!result.errors.empty()) {
        std::cout << "Errors:\n";
        for (const auto& e : result.errors) {
            std::cout << "  - " << e << "\n";
        }
    }
    if (!result.warnings.empty()) {
        std::cout << "Warnings:\n";
        for (const auto& w : result.warnings) {
            std::cout << "  - " << w << "\n";
        }
    }

    if (result.simulated) {
        std::cout << "Metrics:\n";
        for (const auto& kv : result.metrics) {
            std::cout << "  " << std::left << std::setw(20) << kv.first;
            if (kv.first == "num_trades") {
                std::cout << static_cast<long long>(kv.second) << "\n";
            } else if (kv.first == "sharpe") {
                std::cout << std::fixed << std::setprecision(3) << kv.second << "\n";
            } else {
                std::cout << std::fixed << std::setprecision(2) << (kv.second * 100.0) << "%\n";
            }
        }
        std::cout << "\nTrades:\n" << backtest::formatTradeLedger(result.trades);
    }
    std::cout << "---------------------------------------------\n";
}
}

int run(int argc, char* argv[]) {
    std::string spec_path;
    std::string prices_path;
    std::string config_path = "config/config.json";
    std::string log_dir;
    bool json_mode = false;
    bool include_series = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--spec" && i + 1 < argc) {
            spec_path = argv[++i];
        } else if (arg == "--prices" && i + 1 < argc) {
            prices_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            log_dir = argv[++i];
        } else if (arg == "--json") {
            json_mode = true;
        } else if (arg == "--series") {
            include_series = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            printUsage();
            return 2;
        }
    }

    if (spec_path.empty() || prices_path.empty()) {
        printUsage();
        return 2;
    }

    auto& config = Config::getInstance();
    config.load(config_path, json_mode ? std::cerr : std::cout);
    if (!log_dir.empty()) {
        config.setLogDir(log_dir);
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel(), json_mode);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    spec::StrategySpec strategy;
    try {
        strategy = spec::parseStrategySpecText(readFile(spec_path), config.getDefaultMetrics());
    } catch (const SpecificationError& e) {
        LOG_ERROR("Specification error: {}", e.what());
        if (json_mode) {
            nlohmann::json j;
            j["ok"] = false;
            j["errors"] = std::vector<std::string>{e.what()};
            std::cout << j.dump(2) << "\n";
        } else {
            std::cerr << "Specification error: " << e.what() << "\n";
        }
        return 1;
    }

    if (!std::filesystem::exists(prices_path)) {
        LOG_ERROR("Price file not found: {}", prices_path);
        std::cerr << "Price file not found: " << prices_path << "\n";
        return 1;
    }
    const std::string ext = toLowerCopy(std::filesystem::path(prices_path).extension().string());
    const auto bars = (ext == ".json") ? data::DataHistory::loadJSON(prices_path)
                                       : data::DataHistory::loadDailyCSV(prices_path);

    LOG_INFO("Starting backtest: spec={}, prices={}", spec_path, prices_path);
    backtest::BacktestEngine engine(config.getEngineConfig());
    const auto result = engine.run(strategy, bars);

    if (json_mode) {
        std::cout << backtest::resultToJson(result, include_series).dump(2) << "\n";
    } else {
        printReport(result);
    }
    return result.ok ? 0 : 1;
}

} // namespace cli
} // namespace stratlab
