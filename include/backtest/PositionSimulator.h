#pragma once

#include <vector>
#include <nlohmann/json.hpp>

#include "data/FeatureTable.h"
#include "spec/StrategySpec.h"

namespace stratlab {
namespace backtest {

enum class PositionState { FLAT, LONG };

// Aligned with the feature table rows
struct SimulationResult {
    std::vector<int> position;            // 0 = flat, 1 = long at the day's close
    std::vector<double> strategy_return;  // position[t-1] * return[t]
    std::vector<double> equity_curve;     // cumulative product of 1 + strategy_return
};

class PositionSimulator {
public:
    // Single forward pass of the FLAT/LONG state machine. Pure: no I/O and
    // no state outside the call.
    static SimulationResult simulate(const spec::StrategySpec& spec, const data::FeatureTable& table);

    // Close-to-close execution: a position taken at day t's close earns day t+1's return
    static void computeReturns(const std::vector<int>& position, const std::vector<double>& daily_returns,
                               SimulationResult& result);
};

nlohmann::json simulationToJson(const SimulationResult& result, const data::FeatureTable& table);

} // namespace backtest
} // namespace stratlab
