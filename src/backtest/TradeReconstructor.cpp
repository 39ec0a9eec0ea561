#include "backtest/TradeReconstructor.h"
#include "engine/RuleEvaluator.h"
#include "engine/SignalComposer.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace stratlab {
namespace backtest {

const char* const kStillOpenReason = "End of backtest period (still holding)";

namespace {
std::string formatNumber(double value) {
    if (std::isnan(value)) return "n/a";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string formatPercent(double value) {
    if (std::isnan(value)) return "n/a";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (value * 100.0) << "%";
    return oss.str();
}

std::string joinReasons(const std::vector<std::string>& reasons, const std::string& fallback) {
    if (reasons.empty()) {
        return fallback;
    }
    std::string out;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) out += " | ";
        out += reasons[i];
    }
    return out;
}

std::vector<std::string> sequentialEntryReasons(const spec::StrategySpec& spec, size_t anchor,
                                                const data::FeatureTable& table) {
    std::vector<std::string> reasons;
    for (size_t r = 0; r < spec.entry_rules.size(); ++r) {
        const auto& rule = spec.entry_rules[r];
        const auto fired = engine::findSequentialTrigger(rule, anchor, table, r == 0);
        const size_t day = fired ? *fired : anchor;
        std::string reason = TradeReconstructor::formatReason(rule, day, table, true);
        if (day != anchor) {
            reason += " (fired on " + table.date(day).toIsoString() + ", +" +
                      std::to_string(day - anchor) + "d)";
        }
        reasons.push_back(std::move(reason));
    }
    return reasons;
}

void closeTrade(Trade& trade, size_t day, const data::FeatureTable& table, std::string reason) {
    trade.exit_index = day;
    trade.exit_date = table.date(day);
    trade.exit_price = table.close(day);
    trade.exit_reason = std::move(reason);
    trade.pnl_pct = (table.close(day) / trade.entry_price - 1.0) * 100.0;
}
}

std::string TradeReconstructor::formatReason(const spec::Rule& rule, size_t day, const data::FeatureTable& table,
                                             bool is_entry) {
    const std::string action = is_entry ? "Entry" : "Exit";
    const auto reading = engine::readCondition(rule, day, table);
    if (!reading) {
        return action + ": " + spec::describeRule(rule) + " satisfied";
    }

    std::ostringstream oss;
    if (const auto* c = rule.asCrossover()) {
        oss << action << ": " << c->fast_ma << "-day MA (" << formatNumber(reading->lhs) << ") crossed "
            << spec::toString(c->direction) << " " << c->slow_ma << "-day MA ("
            << formatNumber(reading->rhs) << ")";
    } else if (const auto* v = rule.asVolFilter()) {
        oss << action << ": " << v->window << "-day RV (" << formatPercent(reading->lhs) << ") "
            << spec::toString(v->relation) << " 1Y median (" << formatPercent(reading->rhs) << ")";
    }
    return oss.str();
}

std::vector<Trade> TradeReconstructor::reconstruct(const spec::StrategySpec& spec, const data::FeatureTable& table) {
    std::vector<Trade> trades;
    std::optional<Trade> open_trade;

    for (size_t i = 0; i < table.size(); ++i) {
        if (!open_trade) {
            if (!engine::evaluateEntry(spec, i, table)) {
                continue;
            }
            Trade trade;
            trade.entry_index = i;
            trade.entry_date = table.date(i);
            trade.entry_price = table.close(i);
            if (spec.entry_sequential) {
                trade.entry_reasons = sequentialEntryReasons(spec, i, table);
            } else {
                for (const auto& rule : spec.entry_rules) {
                    trade.entry_reasons.push_back(formatReason(rule, i, table, true));
                }
            }
            trade.entry_reason = joinReasons(trade.entry_reasons, "All entry rules satisfied");
            open_trade = std::move(trade);
            continue;
        }

        const auto exit_rule = engine::firstTriggeredExit(spec.exit_rules, i, table);
        if (exit_rule) {
            closeTrade(*open_trade, i, table, formatReason(spec.exit_rules[*exit_rule], i, table, false));
            trades.push_back(std::move(*open_trade));
            open_trade.reset();
        }
    }

    if (open_trade) {
        closeTrade(*open_trade, table.size() - 1, table, kStillOpenReason);
        open_trade->closed_at_end = true;
        trades.push_back(std::move(*open_trade));
    }

    return trades;
}

nlohmann::json tradesToJson(const std::vector<Trade>& trades) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& t : trades) {
        nlohmann::json j;
        j["entry_date"] = t.entry_date.toIsoString();
        j["entry_price"] = t.entry_price;
        j["entry_reason"] = t.entry_reason;
        j["entry_reasons"] = t.entry_reasons;
        j["exit_date"] = t.exit_date ? nlohmann::json(t.exit_date->toIsoString()) : nlohmann::json();
        j["exit_price"] = t.exit_price ? nlohmann::json(*t.exit_price) : nlohmann::json();
        j["exit_reason"] = t.exit_reason ? nlohmann::json(*t.exit_reason) : nlohmann::json();
        j["pnl_pct"] = t.pnl_pct ? nlohmann::json(*t.pnl_pct) : nlohmann::json();
        j["closed_at_end"] = t.closed_at_end;
        out.push_back(std::move(j));
    }
    return out;
}

std::string formatTradeLedger(const std::vector<Trade>& trades) {
    std::ostringstream oss;
    oss << std::left
        << std::setw(12) << "Entry Date" << std::setw(14) << "Entry Price"
        << std::setw(12) << "Exit Date" << std::setw(14) << "Exit Price"
        << std::setw(10) << "P&L %" << "Reasons\n";

    if (trades.empty()) {
        oss << "(no trades)\n";
        return oss.str();
    }

    for (const auto& t : trades) {
        std::ostringstream pnl;
        if (t.pnl_pct) {
            pnl << std::showpos << std::fixed << std::setprecision(2) << *t.pnl_pct << "%";
        } else {
            pnl << "N/A";
        }
        oss << std::setw(12) << t.entry_date.toIsoString()
            << std::setw(14) << ("$" + formatNumber(t.entry_price))
            << std::setw(12) << (t.exit_date ? t.exit_date->toIsoString() : std::string("Open"))
            << std::setw(14) << (t.exit_price ? "$" + formatNumber(*t.exit_price) : std::string("N/A"))
            << std::setw(10) << pnl.str()
            << t.entry_reason << "\n";
        oss << std::setw(72) << "" << "-> " << t.exit_reason.value_or("N/A") << "\n";
    }
    return oss.str();
}

} // namespace backtest
} // namespace stratlab
