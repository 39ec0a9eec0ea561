#include "data/FeatureBuilder.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

namespace stratlab {
namespace data {

namespace {
template <typename Fn>
void forEachRule(const spec::StrategySpec& spec, Fn&& fn) {
    for (const auto& rule : spec.entry_rules) fn(rule);
    for (const auto& rule : spec.exit_rules) fn(rule);
}
}

std::set<int> FeatureBuilder::requiredMaWindows(const spec::StrategySpec& spec) {
    std::set<int> windows;
    forEachRule(spec, [&](const spec::Rule& rule) {
        if (const auto* c = rule.asCrossover()) {
            windows.insert(c->fast_ma);
            windows.insert(c->slow_ma);
        }
    });
    return windows;
}

std::set<int> FeatureBuilder::requiredVolWindows(const spec::StrategySpec& spec) {
    std::set<int> windows;
    forEachRule(spec, [&](const spec::Rule& rule) {
        if (const auto* v = rule.asVolFilter()) {
            windows.insert(v->window);
        }
    });
    return windows;
}

FeatureTable FeatureBuilder::build(const std::vector<DailyBar>& bars,
                                   const spec::StrategySpec& spec,
                                   const engine::FeatureConfig& config) {
    if (bars.empty()) {
        throw DataUnavailableError("No price data returned for " + spec.ticker + ".");
    }

    std::vector<Date> dates;
    std::vector<double> closes;
    dates.reserve(bars.size());
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        dates.push_back(bar.date);
        closes.push_back(bar.close);
    }
    auto returns = analytics::TechnicalIndicators::calculatePctChange(closes);

    FeatureTable table(std::move(dates), closes, returns);

    for (int w : requiredMaWindows(spec)) {
        if (w <= 0) {
            continue;  // rejected by structural validation; leave the column absent
        }
        table.setColumn(FeatureTable::maColumn(w),
                        analytics::TechnicalIndicators::rollingMean(closes, w, 1));
    }

    for (int w : requiredVolWindows(spec)) {
        if (w <= 0) {
            continue;
        }
        auto rv = analytics::TechnicalIndicators::realizedVolatility(returns, w, config.trading_days_per_year);
        auto median = analytics::TechnicalIndicators::rollingMedian(rv, FeatureTable::kVolMedianWindow, 1);
        table.setColumn(FeatureTable::rvColumn(w), std::move(rv));
        table.setColumn(FeatureTable::rvMedianColumn(w), std::move(median));
    }

    return table;
}

} // namespace data
} // namespace stratlab
