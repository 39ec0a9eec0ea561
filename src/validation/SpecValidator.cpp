#include "validation/SpecValidator.h"
#include "engine/SignalComposer.h"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <utility>

namespace stratlab {
namespace validation {

namespace {
// Stable de-duplication keeping the first occurrence
std::vector<std::string> dedupe(const std::vector<std::string>& items) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& item : items) {
        if (seen.insert(item).second) {
            out.push_back(item);
        }
    }
    return out;
}

ValidationResult finish(std::vector<std::string> errors, std::vector<std::string> warnings) {
    ValidationResult result;
    result.errors = dedupe(errors);
    result.warnings = dedupe(warnings);
    result.ok = result.errors.empty();
    return result;
}

int saturatingAdd(int a, int b) {
    const long long sum = static_cast<long long>(a) + b;
    return static_cast<int>(std::min<long long>(sum, std::numeric_limits<int>::max()));
}

void checkModifiers(const spec::Rule& rule, std::vector<std::string>& errors) {
    if (rule.lookaheadDays() && rule.durationDays()) {
        errors.push_back("A rule cannot combine lookahead_days and duration_days.");
    }
    if (rule.durationDays() && *rule.durationDays() <= 0) {
        errors.push_back("duration_days must be a positive number of days.");
    }
    if (rule.lookaheadDays() && *rule.lookaheadDays() < 0) {
        errors.push_back("lookahead_days cannot be negative.");
    }
}
}

ValidationResult validateSpec(const spec::StrategySpec& spec, const engine::ValidationConfig& config) {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    if (spec.start_date >= spec.end_date) {
        errors.push_back("Start date must be before end date.");
    }
    if (spec.entry_rules.empty()) {
        errors.push_back("At least one entry rule is required.");
    }
    if (spec.exit_rules.empty()) {
        errors.push_back("At least one exit rule is required.");
    }
    if (spec.metrics.empty()) {
        warnings.push_back("No metrics specified; default metrics will be used.");
    }
    if (spec.entry_sequential && spec.entry_rules.size() < 2) {
        warnings.push_back("Sequential entry has no effect with a single entry rule.");
    }

    // Directions/relations required by entry rules per comparison key
    std::map<std::pair<int, int>, std::set<spec::CrossDirection>> crossover_entry;
    std::map<std::pair<int, std::string>, std::set<spec::VolRelation>> vol_entry;

    auto inspect = [&](const spec::Rule& rule, bool is_entry) {
        checkModifiers(rule, errors);

        if (const auto* c = rule.asCrossover()) {
            if (c->fast_ma <= 0 || c->slow_ma <= 0) {
                errors.push_back("Moving average windows must be positive integers.");
            }
            if (c->fast_ma == c->slow_ma) {
                errors.push_back("Fast and slow moving averages must differ.");
            }
            if (c->fast_ma < config.min_ma_window_warn || c->slow_ma < config.min_ma_window_warn) {
                warnings.push_back("Very small moving average windows (under " +
                                   std::to_string(config.min_ma_window_warn) +
                                   " days) may be unstable or overly reactive.");
            }
            if (c->fast_ma > config.max_ma_window_warn || c->slow_ma > config.max_ma_window_warn) {
                warnings.push_back("Very large moving average windows (over " +
                                   std::to_string(config.max_ma_window_warn) +
                                   " days) may make the strategy slow and unresponsive.");
            }
            if (is_entry) {
                crossover_entry[{c->fast_ma, c->slow_ma}].insert(c->direction);
            }
        } else if (const auto* v = rule.asVolFilter()) {
            if (v->window <= 1) {
                errors.push_back("Volatility window must be greater than 1.");
            }
            if (v->window > data::FeatureTable::kVolMedianWindow * config.max_vol_window_years) {
                warnings.push_back("Very large volatility windows may dilute signal responsiveness.");
            }
            if (is_entry) {
                vol_entry[{v->window, v->threshold}].insert(v->relation);
            }
        }
    };

    for (const auto& rule : spec.entry_rules) inspect(rule, true);
    for (const auto& rule : spec.exit_rules) inspect(rule, false);

    for (const auto& kv : crossover_entry) {
        if (kv.second.size() > 1) {
            errors.push_back("Entry rules require the same moving averages to be both above and below each other, which is impossible.");
        }
    }
    for (const auto& kv : vol_entry) {
        if (kv.second.size() > 1) {
            errors.push_back("Entry rules require volatility to be both above and below the same threshold, which is impossible.");
        }
    }

    return finish(std::move(errors), std::move(warnings));
}

int requiredHistoryLength(const spec::StrategySpec& spec, const engine::ValidationConfig& config) {
    int max_ma = 0;
    int max_vol = 0;
    int max_lookahead = 0;
    int max_duration = 0;

    auto scan = [&](const spec::Rule& rule) {
        if (const auto* c = rule.asCrossover()) {
            max_ma = std::max({max_ma, c->fast_ma, c->slow_ma});
        } else if (const auto* v = rule.asVolFilter()) {
            max_vol = std::max(max_vol, v->window);
        }
        if (rule.lookaheadDays()) {
            max_lookahead = std::max(max_lookahead, *rule.lookaheadDays());
        }
        if (rule.durationDays()) {
            max_duration = std::max(max_duration, *rule.durationDays());
        }
    };
    for (const auto& rule : spec.entry_rules) scan(rule);
    for (const auto& rule : spec.exit_rules) scan(rule);

    const int pad = config.history_padding_days;
    int required = 0;
    if (max_ma > 0) required = std::max(required, saturatingAdd(max_ma, pad));
    if (max_vol > 0) required = std::max(required, saturatingAdd(max_vol, data::FeatureTable::kVolMedianWindow));
    if (max_lookahead > 0) required = std::max(required, saturatingAdd(max_lookahead, pad));
    if (max_duration > 0) required = std::max(required, saturatingAdd(max_duration, pad));
    return required;
}

std::vector<std::string> missingIndicatorColumns(const spec::StrategySpec& spec, const data::FeatureTable& table) {
    std::vector<std::string> missing;
    auto need = [&](const std::string& name) {
        if (!table.hasColumn(name) &&
            std::find(missing.begin(), missing.end(), name) == missing.end()) {
            missing.push_back(name);
        }
    };
    auto scan = [&](const spec::Rule& rule) {
        if (const auto* c = rule.asCrossover()) {
            need(data::FeatureTable::maColumn(c->fast_ma));
            need(data::FeatureTable::maColumn(c->slow_ma));
        } else if (const auto* v = rule.asVolFilter()) {
            need(data::FeatureTable::rvColumn(v->window));
            need(data::FeatureTable::rvMedianColumn(v->window));
        }
    };
    for (const auto& rule : spec.entry_rules) scan(rule);
    for (const auto& rule : spec.exit_rules) scan(rule);
    return missing;
}

ValidationResult validateWithData(const spec::StrategySpec& spec,
                                  const data::FeatureTable& table,
                                  const engine::ValidationConfig& config) {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    if (table.empty()) {
        errors.push_back("No price data is available for the requested period.");
        return finish(std::move(errors), std::move(warnings));
    }

    const size_t n = table.size();
    const int required = requiredHistoryLength(spec, config);
    if (required > 0 && n < static_cast<size_t>(required)) {
        warnings.push_back("Strategy uses long lookback windows (up to " + std::to_string(required) +
                           " days) but only " + std::to_string(n) +
                           " data points are available. Early signal values may be unreliable.");
    }

    const auto missing = missingIndicatorColumns(spec, table);
    if (!missing.empty()) {
        std::string names;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) names += ", ";
            names += missing[i];
        }
        warnings.push_back("Indicator columns missing from the data (" + names +
                           "); rules using them will never trigger.");
    }

    bool any_entry = false;
    bool any_exit = false;
    for (size_t i = 0; i < n && !(any_entry && any_exit); ++i) {
        if (!any_entry && engine::evaluateEntry(spec, i, table)) {
            any_entry = true;
        }
        if (!any_exit && engine::firstTriggeredExit(spec.exit_rules, i, table)) {
            any_exit = true;
        }
    }

    if (!any_entry) {
        warnings.push_back("Given the historical data and rules, this strategy is unlikely to generate any entries. It may produce zero trades.");
    }
    if (any_entry && !any_exit) {
        warnings.push_back("Entry conditions can occur, but exit conditions never trigger on this data. Positions may never close once opened.");
    }

    return finish(std::move(errors), std::move(warnings));
}

} // namespace validation
} // namespace stratlab
