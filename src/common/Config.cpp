#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace stratlab {

namespace {
std::string normalizeMetricName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), not_space));
    name.erase(std::find_if(name.rbegin(), name.rend(), not_space).base(), name.end());
    return name;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    engine_config_ = engine::EngineConfig();
}

void Config::load(const std::string& path, std::ostream& notices) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    if (!std::filesystem::exists(config_path)) {
        notices << "Config file not found: " << config_path.string() << ", using defaults" << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "Config file could not be opened: " << config_path.string() << std::endl;
        return;
    }

    try {
        nlohmann::json j;
        file >> j;
        loadFromJson(j);
        notices << "Config loaded: " << config_path.string() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    if (j.contains("features")) {
        const auto& f = j["features"];
        auto& features = engine_config_.features;
        features.trading_days_per_year = f.value("trading_days_per_year", features.trading_days_per_year);
    }

    if (j.contains("validation")) {
        const auto& v = j["validation"];
        auto& validation = engine_config_.validation;
        validation.min_ma_window_warn = v.value("min_ma_window_warn", validation.min_ma_window_warn);
        validation.max_ma_window_warn = v.value("max_ma_window_warn", validation.max_ma_window_warn);
        validation.max_vol_window_years = v.value("max_vol_window_years", validation.max_vol_window_years);
        validation.history_padding_days = v.value("history_padding_days", validation.history_padding_days);
    }

    if (j.contains("metrics")) {
        const auto& m = j["metrics"];
        auto& metrics = engine_config_.metrics;
        metrics.trading_days_per_year = m.value("trading_days_per_year", metrics.trading_days_per_year);
        if (m.contains("default_metrics")) {
            metrics.default_metrics = m["default_metrics"].get<std::vector<std::string>>();
            for (auto& name : metrics.default_metrics) {
                name = normalizeMetricName(name);
            }
        }
    }
}

} // namespace stratlab
