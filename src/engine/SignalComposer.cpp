#include "engine/SignalComposer.h"
#include "engine/RuleEvaluator.h"

namespace stratlab {
namespace engine {

bool evaluateAllRules(const std::vector<spec::Rule>& rules, size_t day, const data::FeatureTable& table) {
    for (const auto& rule : rules) {
        if (!evaluateRule(rule, day, table)) {
            return false;
        }
    }
    return true;
}

bool evaluateEntry(const spec::StrategySpec& spec, size_t day, const data::FeatureTable& table) {
    if (spec.entry_sequential) {
        return evaluateSequential(spec.entry_rules, day, table);
    }
    return evaluateAllRules(spec.entry_rules, day, table);
}

std::optional<size_t> firstTriggeredExit(const std::vector<spec::Rule>& rules, size_t day,
                                         const data::FeatureTable& table) {
    for (size_t i = 0; i < rules.size(); ++i) {
        if (evaluateRule(rules[i], day, table)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> findSequentialTrigger(const spec::Rule& rule, size_t anchor,
                                            const data::FeatureTable& table, bool is_first) {
    if (is_first || !rule.lookaheadDays()) {
        if (evaluateInstant(rule, anchor, table)) {
            return anchor;
        }
        return std::nullopt;
    }

    const int lookahead = *rule.lookaheadDays();
    for (int offset = 0; offset <= lookahead; ++offset) {
        const size_t check = anchor + static_cast<size_t>(offset);
        if (check >= table.size()) {
            break;
        }
        if (evaluateInstant(rule, check, table)) {
            return check;
        }
    }
    return std::nullopt;
}

bool evaluateSequential(const std::vector<spec::Rule>& rules, size_t anchor, const data::FeatureTable& table) {
    if (rules.empty()) {
        return false;
    }
    for (size_t i = 0; i < rules.size(); ++i) {
        if (!findSequentialTrigger(rules[i], anchor, table, i == 0)) {
            return false;
        }
    }
    return true;
}

} // namespace engine
} // namespace stratlab
