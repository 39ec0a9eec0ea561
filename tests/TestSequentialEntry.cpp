#include "backtest/PositionSimulator.h"
#include "backtest/TradeReconstructor.h"
#include "engine/SignalComposer.h"
#include "TestHelpers.h"

#include <cassert>
#include <iostream>

using namespace stratlab;
using namespace stratlab::spec;
using stratlab::data::FeatureTable;
using stratlab::testing::contains;
using stratlab::testing::makeTable;

namespace {
// Crossover holds from day 5, RV below median from day 7
FeatureTable sequenceTable() {
    const size_t n = 12;
    auto table = makeTable(std::vector<double>(n, 100.0));
    std::vector<double> fast(n), slow(n, 100.0), rv(n), med(n, 0.20);
    for (size_t i = 0; i < n; ++i) {
        fast[i] = (i >= 5) ? 104.0 : 96.0;
        rv[i] = (i >= 7) ? 0.10 : 0.30;
    }
    table.setColumn(FeatureTable::maColumn(10), fast);
    table.setColumn(FeatureTable::maColumn(50), slow);
    table.setColumn(FeatureTable::rvColumn(20), rv);
    table.setColumn(FeatureTable::rvMedianColumn(20), med);
    return table;
}

bool sameTrade(const backtest::Trade& a, const backtest::Trade& b) {
    return a.entry_index == b.entry_index && a.entry_date == b.entry_date &&
           a.entry_price == b.entry_price && a.entry_reasons == b.entry_reasons &&
           a.entry_reason == b.entry_reason && a.exit_index == b.exit_index &&
           a.exit_date == b.exit_date && a.exit_price == b.exit_price &&
           a.exit_reason == b.exit_reason && a.pnl_pct == b.pnl_pct &&
           a.closed_at_end == b.closed_at_end;
}

StrategySpec sequenceSpec() {
    StrategySpec spec;
    spec.ticker = "SPY";
    spec.start_date = Date(2020, 1, 1);
    spec.end_date = Date(2021, 1, 1);
    spec.entry_sequential = true;
    spec.entry_rules = {
        Rule::crossover(10, 50, CrossDirection::ABOVE),
        Rule::volFilter(20, VolRelation::BELOW, 3)
    };
    return spec;
}
}

int main() {
    const auto table = sequenceTable();
    const auto spec = sequenceSpec();

    // The anchor must satisfy the first rule itself
    assert(!engine::evaluateSequential(spec.entry_rules, 4, table));
    assert(engine::evaluateSequential(spec.entry_rules, 5, table));

    // The lagging rule fires two days after the anchor
    assert(*engine::findSequentialTrigger(spec.entry_rules[1], 5, table) == 7);
    assert(*engine::findSequentialTrigger(spec.entry_rules[0], 5, table, true) == 5);
    // The first rule never looks ahead, even when it declares lookahead
    const auto lagging_first = Rule::volFilter(20, VolRelation::BELOW, 3);
    assert(!engine::findSequentialTrigger(lagging_first, 5, table, true));

    // A lagging rule without lookahead must hold on the anchor itself
    const std::vector<Rule> strict = {
        Rule::crossover(10, 50, CrossDirection::ABOVE),
        Rule::volFilter(20, VolRelation::BELOW)
    };
    assert(!engine::evaluateSequential(strict, 5, table));
    assert(engine::evaluateSequential(strict, 7, table));

    // Entry is attributed to the anchor day
    const auto sim = backtest::PositionSimulator::simulate(spec, table);
    for (size_t i = 0; i < 5; ++i) {
        assert(sim.position[i] == 0);
    }
    assert(sim.position[5] == 1);

    const auto trades = backtest::TradeReconstructor::reconstruct(spec, table);
    assert(trades.size() == 1);
    const auto& trade = trades[0];
    assert(trade.entry_index == 5);
    assert(trade.entry_date == Date(2020, 1, 6));
    assert(trade.entry_reasons.size() == 2);

    // Crossover reason uses anchor-day values
    assert(trade.entry_reasons[0] == "Entry: 10-day MA (104.00) crossed above 50-day MA (100.00)");
    // Vol reason uses the values from the day it fired
    assert(contains(trade.entry_reasons[1], "20-day RV (10.00%) below 1Y median (20.00%)"));
    assert(contains(trade.entry_reasons[1], "fired on 2020-01-08, +2d"));
    assert(contains(trade.entry_reason, " | "));

    // No exit rules: held to the end with the synthetic close
    assert(trade.closed_at_end);
    assert(*trade.exit_reason == backtest::kStillOpenReason);
    assert(*trade.exit_index == table.size() - 1);

    // Repeated runs give identical trades and leave the rules untouched
    {
        auto with_exit = spec;
        with_exit.exit_rules = {Rule::volFilter(20, VolRelation::ABOVE, std::nullopt, 2)};
        const auto rules_before = with_exit.entry_rules;

        const auto first = backtest::TradeReconstructor::reconstruct(with_exit, table);
        const auto second = backtest::TradeReconstructor::reconstruct(with_exit, table);
        assert(!first.empty());
        assert(first.size() == second.size());
        for (size_t i = 0; i < first.size(); ++i) {
            assert(sameTrade(first[i], second[i]));
        }
        assert(backtest::tradesToJson(first).dump() == backtest::tradesToJson(second).dump());
        assert(backtest::formatTradeLedger(first) == backtest::formatTradeLedger(second));

        assert(with_exit.entry_rules == rules_before);
        assert(*with_exit.entry_rules[1].lookaheadDays() == 3);
        assert(!with_exit.entry_rules[1].durationDays());

        // Interleaving with the simulator does not change either result
        const auto sim_a = backtest::PositionSimulator::simulate(with_exit, table);
        const auto third = backtest::TradeReconstructor::reconstruct(with_exit, table);
        const auto sim_b = backtest::PositionSimulator::simulate(with_exit, table);
        assert(sim_a.position == sim_b.position);
        assert(backtest::tradesToJson(third).dump() == backtest::tradesToJson(first).dump());
    }

    // Empty rule list never enters
    assert(!engine::evaluateSequential({}, 5, table));

    std::cout << "[TEST] SequentialEntry PASSED\n";
    return 0;
}
