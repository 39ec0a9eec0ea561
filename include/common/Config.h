#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace stratlab {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; malformed JSON is reported and defaults are kept.
    // Status notices go to `notices`, errors always to stderr.
    void load(const std::string& config_path, std::ostream& notices = std::cout);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    void setLogDir(const std::string& v) { log_dir_ = v; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::FeatureConfig getFeatureConfig() const { return engine_config_.features; }
    engine::ValidationConfig getValidationConfig() const { return engine_config_.validation; }
    engine::MetricsConfig getMetricsConfig() const { return engine_config_.metrics; }
    std::vector<std::string> getDefaultMetrics() const { return engine_config_.metrics.default_metrics; }

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    engine::EngineConfig engine_config_;
};

} // namespace stratlab
