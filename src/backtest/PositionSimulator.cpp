#include "backtest/PositionSimulator.h"
#include "engine/SignalComposer.h"

namespace stratlab {
namespace backtest {

SimulationResult PositionSimulator::simulate(const spec::StrategySpec& spec, const data::FeatureTable& table) {
    SimulationResult result;
    const size_t n = table.size();
    result.position.assign(n, 0);

    PositionState state = PositionState::FLAT;
    for (size_t i = 0; i < n; ++i) {
        if (state == PositionState::FLAT) {
            if (engine::evaluateEntry(spec, i, table)) {
                state = PositionState::LONG;
            }
        } else if (engine::firstTriggeredExit(spec.exit_rules, i, table)) {
            state = PositionState::FLAT;
        }
        result.position[i] = (state == PositionState::LONG) ? 1 : 0;
    }

    computeReturns(result.position, table.returns(), result);
    return result;
}

void PositionSimulator::computeReturns(const std::vector<int>& position, const std::vector<double>& daily_returns,
                                       SimulationResult& result) {
    const size_t n = position.size();
    result.strategy_return.assign(n, 0.0);
    result.equity_curve.assign(n, 1.0);

    double equity = 1.0;
    for (size_t i = 0; i < n; ++i) {
        const double held = (i == 0) ? 0.0 : static_cast<double>(position[i - 1]);
        result.strategy_return[i] = held * daily_returns[i];
        equity *= (1.0 + result.strategy_return[i]);
        result.equity_curve[i] = equity;
    }
}

nlohmann::json simulationToJson(const SimulationResult& result, const data::FeatureTable& table) {
    nlohmann::json rows = nlohmann::json::array();
    for (size_t i = 0; i < result.position.size() && i < table.size(); ++i) {
        rows.push_back({
            {"date", table.date(i).toIsoString()},
            {"close", table.close(i)},
            {"return", table.dailyReturn(i)},
            {"position", result.position[i]},
            {"strategy_return", result.strategy_return[i]},
            {"equity_curve", result.equity_curve[i]}
        });
    }
    return rows;
}

} // namespace backtest
} // namespace stratlab
