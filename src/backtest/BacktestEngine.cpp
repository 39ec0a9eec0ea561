#include "backtest/BacktestEngine.h"
#include "analytics/PerformanceMetrics.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "data/DataHistory.h"
#include "data/FeatureBuilder.h"

#include <algorithm>

namespace stratlab {
namespace backtest {

namespace {
void appendUnique(std::vector<std::string>& out, const std::vector<std::string>& items) {
    for (const auto& item : items) {
        if (std::find(out.begin(), out.end(), item) == out.end()) {
            out.push_back(item);
        }
    }
}
}

BacktestEngine::BacktestEngine()
    : config_() {}

BacktestEngine::BacktestEngine(engine::EngineConfig config)
    : config_(std::move(config)) {}

BacktestEngine::Result BacktestEngine::run(const spec::StrategySpec& spec, const std::vector<DailyBar>& bars) const {
    Result result;
    result.spec = spec;

    LOG_INFO("Validating strategy for {} ({} -> {}), {} entry / {} exit rules{}",
             spec.ticker, spec.start_date.toIsoString(), spec.end_date.toIsoString(),
             spec.entry_rules.size(), spec.exit_rules.size(),
             spec.entry_sequential ? ", sequential entry" : "");

    result.structural = validation::validateSpec(spec, config_.validation);
    appendUnique(result.errors, result.structural.errors);
    appendUnique(result.warnings, result.structural.warnings);
    if (!result.structural.ok) {
        LOG_ERROR("Validation found {} errors", result.structural.errors.size());
        for (const auto& e : result.structural.errors) {
            LOG_ERROR("  {}", e);
        }
        return result;
    }

    const auto sliced = data::DataHistory::filterByDate(bars, spec.start_date, spec.end_date);
    try {
        result.table = data::FeatureBuilder::build(sliced, spec, config_.features);
    } catch (const DataUnavailableError& e) {
        LOG_ERROR("Data unavailable: {}", e.what());
        result.errors.push_back(e.what());
        return result;
    }
    LOG_INFO("Feature table ready: {} rows, {} indicator columns",
             result.table.size(), result.table.columnNames().size());

    result.data_checks = validation::validateWithData(spec, result.table, config_.validation);
    appendUnique(result.errors, result.data_checks.errors);
    appendUnique(result.warnings, result.data_checks.warnings);
    for (const auto& w : result.data_checks.warnings) {
        LOG_WARN("Pre-backtest QA: {}", w);
    }
    if (!result.data_checks.ok) {
        return result;
    }

    result.simulation = PositionSimulator::simulate(spec, result.table);
    result.simulated = true;

    try {
        result.trades = TradeReconstructor::reconstruct(spec, result.table);
    } catch (const std::exception& e) {
        // Ledger is informational; the simulation result stands without it
        LOG_ERROR("Trade extraction failed: {}", e.what());
        result.warnings.push_back(std::string("Trade extraction failed: ") + e.what());
        result.trades.clear();
    }

    std::vector<std::string> unknown_metrics;
    result.metrics = analytics::PerformanceMetrics::compute(
        result.simulation, result.trades, spec.metrics, unknown_metrics,
        config_.metrics.trading_days_per_year);
    for (const auto& name : unknown_metrics) {
        result.warnings.push_back("Unknown metric '" + name + "' ignored.");
    }

    for (const auto& t : result.trades) {
        Logger::getInstance().logTrade(spec.ticker, t.entry_date.toIsoString(), t.entry_price,
                                       t.exit_date ? t.exit_date->toIsoString() : std::string(),
                                       t.exit_price.value_or(0.0), t.pnl_pct.value_or(0.0));
    }

    LOG_INFO("Backtest completed: {} trades, CAGR {:.2f}%, MDD {:.2f}%, Sharpe {:.2f}",
             result.trades.size(), result.metrics["cagr"] * 100.0,
             result.metrics["max_drawdown"] * 100.0, result.metrics["sharpe"]);
    if (!result.warnings.empty()) {
        LOG_INFO("Completed with {} warnings", result.warnings.size());
    }

    result.ok = result.errors.empty();
    return result;
}

nlohmann::json resultToJson(const BacktestEngine::Result& result, bool include_series) {
    nlohmann::json j;
    j["ok"] = result.ok;
    j["spec"] = spec::toJson(result.spec);
    j["errors"] = result.errors;
    j["warnings"] = result.warnings;
    j["metrics"] = result.metrics;
    j["trades"] = tradesToJson(result.trades);
    if (include_series && result.simulated) {
        j["series"] = simulationToJson(result.simulation, result.table);
    }
    return j;
}

} // namespace backtest
} // namespace stratlab
