#include "validation/SpecValidator.h"
#include "TestHelpers.h"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace stratlab;
using namespace stratlab::spec;
using stratlab::data::FeatureTable;
using stratlab::testing::contains;
using stratlab::testing::makeTable;

namespace {
StrategySpec validSpec() {
    StrategySpec spec;
    spec.ticker = "SPY";
    spec.start_date = Date(2015, 1, 1);
    spec.end_date = Date(2020, 1, 1);
    spec.entry_rules = {Rule::crossover(10, 50, CrossDirection::ABOVE)};
    spec.exit_rules = {Rule::crossover(10, 50, CrossDirection::BELOW)};
    spec.metrics = {"cagr", "max_drawdown", "sharpe"};
    return spec;
}

bool anyContains(const std::vector<std::string>& items, const std::string& needle) {
    return std::any_of(items.begin(), items.end(),
                       [&](const std::string& s) { return contains(s, needle); });
}

FeatureTable crossTable(size_t n, double fast_value) {
    auto table = makeTable(std::vector<double>(n, 100.0));
    table.setColumn(FeatureTable::maColumn(10), std::vector<double>(n, fast_value));
    table.setColumn(FeatureTable::maColumn(50), std::vector<double>(n, 100.0));
    return table;
}
}

int main() {
    // Clean spec passes
    {
        const auto result = validation::validateSpec(validSpec());
        assert(result.ok);
        assert(result.errors.empty());
        assert(result.warnings.empty());
    }

    // Contradictory entry rules: exactly one error
    {
        auto spec = validSpec();
        spec.entry_rules = {Rule::crossover(10, 50, CrossDirection::ABOVE),
                            Rule::crossover(10, 50, CrossDirection::BELOW)};
        const auto result = validation::validateSpec(spec);
        assert(!result.ok);
        assert(result.errors.size() == 1);
        assert(contains(result.errors[0], "both above and below"));

        spec.entry_rules = {Rule::volFilter(20, VolRelation::BELOW),
                            Rule::volFilter(20, VolRelation::ABOVE)};
        const auto vol = validation::validateSpec(spec);
        assert(vol.errors.size() == 1);
        assert(contains(vol.errors[0], "volatility"));

        // Different windows are not a contradiction
        spec.entry_rules = {Rule::volFilter(20, VolRelation::BELOW),
                            Rule::volFilter(60, VolRelation::ABOVE)};
        assert(validation::validateSpec(spec).ok);
    }

    // Structural errors
    {
        auto spec = validSpec();
        spec.start_date = Date(2020, 1, 1);
        spec.end_date = Date(2020, 1, 1);
        spec.exit_rules.clear();
        spec.entry_rules = {Rule::crossover(20, 20, CrossDirection::ABOVE)};
        const auto result = validation::validateSpec(spec);
        assert(!result.ok);
        assert(anyContains(result.errors, "Start date must be before end date."));
        assert(anyContains(result.errors, "At least one exit rule is required."));
        assert(anyContains(result.errors, "must differ"));

        auto mods = validSpec();
        mods.entry_rules = {Rule::volFilter(1, VolRelation::BELOW, 3, 2)};
        const auto bad = validation::validateSpec(mods);
        assert(anyContains(bad.errors, "Volatility window must be greater than 1."));
        assert(anyContains(bad.errors, "cannot combine lookahead_days and duration_days"));
    }

    // Warnings do not block
    {
        auto spec = validSpec();
        spec.metrics.clear();
        spec.entry_rules = {Rule::crossover(3, 250, CrossDirection::ABOVE)};
        spec.exit_rules = {Rule::crossover(3, 250, CrossDirection::BELOW)};
        const auto result = validation::validateSpec(spec);
        assert(result.ok);
        assert(anyContains(result.warnings, "No metrics specified"));
        assert(anyContains(result.warnings, "Very small moving average windows"));
        assert(anyContains(result.warnings, "Very large moving average windows"));
        // Entry and exit share windows; each warning is reported once
        assert(std::count_if(result.warnings.begin(), result.warnings.end(), [](const std::string& w) {
            return contains(w, "Very small");
        }) == 1);
    }

    // History length
    {
        auto spec = validSpec();
        assert(validation::requiredHistoryLength(spec) == 60);
        spec.exit_rules = {Rule::volFilter(20, VolRelation::ABOVE)};
        assert(validation::requiredHistoryLength(spec) == 20 + 252);

        auto far = validSpec();
        far.entry_rules = {Rule::volFilter(20, VolRelation::BELOW, 2147483647)};
        assert(validation::requiredHistoryLength(far) == 2147483647);

        const auto table = crossTable(100, 105.0);
        const auto result = validation::validateWithData(spec, table);
        assert(anyContains(result.warnings, "up to 272 days"));
        assert(anyContains(result.warnings, "only 100 data points"));
    }

    // Empty table is an error
    {
        const auto result = validation::validateWithData(validSpec(), FeatureTable());
        assert(!result.ok);
        assert(result.errors.size() == 1);
        assert(result.errors[0] == "No price data is available for the requested period.");
    }

    // Entry never satisfied: warning only
    {
        const auto table = crossTable(80, 95.0);
        const auto result = validation::validateWithData(validSpec(), table);
        assert(result.ok);
        assert(result.errors.empty());
        assert(anyContains(result.warnings, "unlikely to generate any entries"));
    }

    // Entry possible but exit never fires
    {
        const auto table = crossTable(80, 105.0);
        const auto result = validation::validateWithData(validSpec(), table);
        assert(result.ok);
        assert(anyContains(result.warnings, "exit conditions never trigger"));
    }

    // Missing indicator columns are reported, not fatal
    {
        auto spec = validSpec();
        spec.exit_rules = {Rule::volFilter(20, VolRelation::ABOVE)};
        const auto table = crossTable(300, 105.0);
        const auto missing = validation::missingIndicatorColumns(spec, table);
        assert(missing.size() == 2);
        assert(missing[0] == FeatureTable::rvColumn(20));
        assert(missing[1] == FeatureTable::rvMedianColumn(20));

        const auto result = validation::validateWithData(spec, table);
        assert(result.ok);
        assert(anyContains(result.warnings, "rv_20"));
    }

    std::cout << "[TEST] SpecValidator PASSED\n";
    return 0;
}
