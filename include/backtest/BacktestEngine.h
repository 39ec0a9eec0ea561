#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtest/PositionSimulator.h"
#include "backtest/TradeReconstructor.h"
#include "common/Types.h"
#include "data/FeatureTable.h"
#include "engine/EngineConfig.h"
#include "spec/StrategySpec.h"
#include "validation/SpecValidator.h"

namespace stratlab {
namespace backtest {

// Runs one strategy over one price history:
// validate spec -> slice bars -> build features -> validate with data ->
// simulate -> metrics -> reconstruct trades.
// Structural errors and missing data stop before simulation; warnings accumulate.
class BacktestEngine {
public:
    BacktestEngine();
    explicit BacktestEngine(engine::EngineConfig config);

    struct Result {
        bool ok = false;
        bool simulated = false;
        spec::StrategySpec spec;
        validation::ValidationResult structural;
        validation::ValidationResult data_checks;
        data::FeatureTable table;
        SimulationResult simulation;
        std::map<std::string, double> metrics;
        std::vector<Trade> trades;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // Bars may cover more than the strategy's date range; they are sliced to [start, end)
    Result run(const spec::StrategySpec& spec, const std::vector<DailyBar>& bars) const;

private:
    engine::EngineConfig config_;
};

nlohmann::json resultToJson(const BacktestEngine::Result& result, bool include_series = false);

} // namespace backtest
} // namespace stratlab
