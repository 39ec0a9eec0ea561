#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "data/FeatureTable.h"
#include "spec/StrategySpec.h"

namespace stratlab {
namespace backtest {

struct Trade {
    size_t entry_index = 0;
    Date entry_date;
    double entry_price = 0.0;
    std::vector<std::string> entry_reasons;  // one line per entry rule
    std::string entry_reason;                // entry_reasons joined with " | "

    std::optional<size_t> exit_index;
    std::optional<Date> exit_date;
    std::optional<double> exit_price;
    std::optional<std::string> exit_reason;
    std::optional<double> pnl_pct;           // (exit / entry - 1) * 100
    bool closed_at_end = false;              // synthetic close on the last bar
};

extern const char* const kStillOpenReason;

class TradeReconstructor {
public:
    // Replays the FLAT/LONG state machine independently of PositionSimulator
    // with the same composition rules, attaching the rule(s) that fired.
    static std::vector<Trade> reconstruct(const spec::StrategySpec& spec, const data::FeatureTable& table);

    // "Entry: 10-day MA (101.20) crossed above 50-day MA (99.80)"
    static std::string formatReason(const spec::Rule& rule, size_t day, const data::FeatureTable& table,
                                    bool is_entry);
};

nlohmann::json tradesToJson(const std::vector<Trade>& trades);

// Fixed-width text table: Entry Date | Entry Price | Exit Date | Exit Price | P&L % | reasons
std::string formatTradeLedger(const std::vector<Trade>& trades);

} // namespace backtest
} // namespace stratlab
