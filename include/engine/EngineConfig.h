#pragma once

#include <string>
#include <vector>

namespace stratlab {
namespace engine {

// Indicator construction
struct FeatureConfig {
    int trading_days_per_year = 252;   // annualization factor for realized vol
};

// Structural/data validation thresholds
struct ValidationConfig {
    int min_ma_window_warn = 5;        // MA windows below this warn (unstable)
    int max_ma_window_warn = 200;      // MA windows above this warn (sluggish)
    int max_vol_window_years = 5;      // vol windows above years * 252 warn
    int history_padding_days = 10;     // extra bars required beyond the longest window
};

struct MetricsConfig {
    int trading_days_per_year = 252;
    std::vector<std::string> default_metrics{"cagr", "max_drawdown", "sharpe"};
};

struct EngineConfig {
    FeatureConfig features;
    ValidationConfig validation;
    MetricsConfig metrics;
};

} // namespace engine
} // namespace stratlab
