#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "data/DataHistory.h"
#include "data/FeatureBuilder.h"
#include "TestHelpers.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace stratlab;
using namespace stratlab::spec;
using stratlab::analytics::TechnicalIndicators;
using stratlab::data::DataHistory;
using stratlab::data::FeatureBuilder;
using stratlab::data::FeatureTable;
using stratlab::testing::makeBars;
using stratlab::testing::near;

namespace {
StrategySpec mixedSpec() {
    StrategySpec spec;
    spec.ticker = "SPY";
    spec.start_date = Date(2020, 1, 1);
    spec.end_date = Date(2021, 1, 1);
    spec.entry_rules = {Rule::crossover(2, 3, CrossDirection::ABOVE), Rule::volFilter(3, VolRelation::BELOW)};
    spec.exit_rules = {Rule::crossover(2, 3, CrossDirection::BELOW)};
    return spec;
}

std::string writeTempFile(const std::string& name, const std::string& contents) {
    const std::string path = "stratlab_test_" + name;
    std::ofstream out(path);
    out << contents;
    return path;
}
}

int main() {
    // Indicator primitives
    {
        const auto pct = TechnicalIndicators::calculatePctChange({100.0, 110.0, 99.0});
        assert(pct[0] == 0.0);
        assert(near(pct[1], 0.10));
        assert(near(pct[2], -0.10));

        const auto mean = TechnicalIndicators::rollingMean({1.0, 2.0, 3.0, 4.0}, 2);
        assert(near(mean[0], 1.0));  // partial window
        assert(near(mean[1], 1.5));
        assert(near(mean[3], 3.5));

        const auto sd = TechnicalIndicators::rollingStdDev({1.0, 2.0, 3.0}, 3);
        assert(std::isnan(sd[0]));  // single observation
        assert(near(sd[1], std::sqrt(0.5)));
        assert(near(sd[2], 1.0));

        const auto med = TechnicalIndicators::rollingMedian({testing::kNaN, 3.0, 1.0, 2.0}, 3);
        assert(std::isnan(med[0]));
        assert(near(med[2], 2.0));  // NaN is ignored
        assert(near(med[3], 2.0));
    }

    // Builder produces every referenced column, aligned with the bars
    {
        const auto bars = makeBars({100, 102, 101, 104, 103, 107});
        const auto spec = mixedSpec();
        assert(FeatureBuilder::requiredMaWindows(spec) == std::set<int>({2, 3}));
        assert(FeatureBuilder::requiredVolWindows(spec) == std::set<int>({3}));

        const auto table = FeatureBuilder::build(bars, spec);
        assert(table.size() == bars.size());
        assert(table.hasColumn("ma_2"));
        assert(table.hasColumn("ma_3"));
        assert(table.hasColumn("rv_3"));
        assert(table.hasColumn("rv_3_med_252"));
        assert(!table.hasColumn("ma_50"));
        assert(table.column("ma_50") == nullptr);

        assert(near((*table.column("ma_2"))[1], 101.0));
        assert(near((*table.column("ma_3"))[2], 101.0));
        assert(near(table.dailyReturn(1), 0.02));

        const auto& rv = *table.column("rv_3");
        assert(std::isnan(rv[0]));
        assert(!std::isnan(rv[2]));
        assert(rv[2] > 0.0);

        // Median column name carries the window it was computed over
        assert(FeatureTable::rvMedianColumn(3) == "rv_3_med_" + std::to_string(FeatureTable::kVolMedianWindow));
        const auto expected_median = TechnicalIndicators::rollingMedian(rv, FeatureTable::kVolMedianWindow);
        const auto& median = *table.column(FeatureTable::rvMedianColumn(3));
        for (size_t i = 1; i < median.size(); ++i) {
            assert(near(median[i], expected_median[i]));
        }
    }

    // Empty input
    {
        bool threw = false;
        try {
            FeatureBuilder::build({}, mixedSpec());
        } catch (const DataUnavailableError&) {
            threw = true;
        }
        assert(threw);
    }

    // Column length must match the table
    {
        auto table = testing::makeTable({1.0, 2.0});
        bool threw = false;
        try {
            table.setColumn("ma_5", {1.0});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // CSV loading: header by name, unsorted rows, duplicates and junk rows
    {
        const auto path = writeTempFile("prices.csv",
            "\xEF\xBB\xBF" "Date,Open,High,Low,Close,Volume\n"
            "2020-01-03,10,11,9,10.5,100\n"
            "2020-01-02,9,10,8,9.5,100\n"
            "\"2020-01-06\",11,12,10,\"11.5\",100\n"
            "not-a-date,1,1,1,1,1\n"
            "2020-01-03,10,11,9,10.75,100\n");
        const auto bars = DataHistory::loadDailyCSV(path);
        std::remove(path.c_str());

        assert(bars.size() == 3);
        assert(bars[0].date == Date(2020, 1, 2));
        assert(bars[1].date == Date(2020, 1, 3));
        assert(near(bars[1].close, 10.75));  // last duplicate wins
        assert(near(bars[2].close, 11.5));
        assert(near(bars[0].open, 9.0));
    }

    // Missing close column or missing file yields nothing
    {
        const auto path = writeTempFile("bad.csv", "date,open\n2020-01-02,1\n");
        assert(DataHistory::loadDailyCSV(path).empty());
        std::remove(path.c_str());
        assert(DataHistory::loadDailyCSV("stratlab_test_missing.csv").empty());
    }

    // JSON loading, optional fields default to close
    {
        const auto path = writeTempFile("prices.json",
            R"([{"date": "2020-01-03", "close": 5.0}, {"date": "2020-01-02 00:00:00", "close": 4.0, "open": 3.5}])");
        const auto bars = DataHistory::loadJSON(path);
        std::remove(path.c_str());
        assert(bars.size() == 2);
        assert(bars[0].date == Date(2020, 1, 2));
        assert(near(bars[0].open, 3.5));
        assert(near(bars[1].high, 5.0));
    }

    // A bad bar in a JSON file is skipped, the rest of the file still loads
    {
        const auto path = writeTempFile("mixed.json",
            R"([{"date": "2020-01-02", "close": 4.0},
                {"date": "2020-01-03", "close": "n/a"},
                {"date": "2020-01-06", "close": null},
                {"date": 20200107, "close": 6.0},
                {"date": "2020-01-08", "close": 7.0, "volume": "lots"},
                {"date": "2020-01-09", "close": 8.0}])");
        const auto bars = DataHistory::loadJSON(path);
        std::remove(path.c_str());
        assert(bars.size() == 2);
        assert(bars[0].date == Date(2020, 1, 2));
        assert(bars[1].date == Date(2020, 1, 9));
        assert(near(bars[1].close, 8.0));
    }

    // Date slicing keeps [start, end)
    {
        const auto bars = makeBars({1, 2, 3, 4, 5}, Date(2020, 1, 1));
        const auto sliced = DataHistory::filterByDate(bars, Date(2020, 1, 2), Date(2020, 1, 4));
        assert(sliced.size() == 2);
        assert(sliced.front().date == Date(2020, 1, 2));
        assert(sliced.back().date == Date(2020, 1, 3));
    }

    std::cout << "[TEST] FeatureBuilder PASSED\n";
    return 0;
}
