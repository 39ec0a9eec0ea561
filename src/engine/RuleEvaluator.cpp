#include "engine/RuleEvaluator.h"

#include <cmath>

namespace stratlab {
namespace engine {

namespace {
// Instantaneous comparison on already-read values; NaN never passes
bool conditionHolds(const spec::Rule& rule, const ConditionReading& r) {
    if (std::isnan(r.lhs) || std::isnan(r.rhs)) {
        return false;
    }
    if (const auto* c = rule.asCrossover()) {
        return c->direction == spec::CrossDirection::ABOVE ? (r.lhs > r.rhs) : (r.lhs < r.rhs);
    }
    const auto* v = rule.asVolFilter();
    return v->relation == spec::VolRelation::BELOW ? (r.lhs < r.rhs) : (r.lhs > r.rhs);
}

bool hasMissingValue(const ConditionReading& r) {
    return std::isnan(r.lhs) || std::isnan(r.rhs);
}

int windowFor(const std::optional<int>& modifier) {
    return modifier ? *modifier : 1;
}
}

EvalMode declaredMode(const spec::Rule& rule) {
    if (rule.durationDays()) {
        return EvalMode::DURATION;
    }
    if (rule.lookaheadDays()) {
        return EvalMode::LOOKAHEAD;
    }
    return EvalMode::INSTANTANEOUS;
}

std::optional<ConditionReading> readCondition(const spec::Rule& rule, size_t day,
                                              const data::FeatureTable& table) {
    const std::vector<double>* lhs = nullptr;
    const std::vector<double>* rhs = nullptr;

    if (const auto* c = rule.asCrossover()) {
        lhs = table.column(data::FeatureTable::maColumn(c->fast_ma));
        rhs = table.column(data::FeatureTable::maColumn(c->slow_ma));
    } else if (const auto* v = rule.asVolFilter()) {
        lhs = table.column(data::FeatureTable::rvColumn(v->window));
        rhs = table.column(data::FeatureTable::rvMedianColumn(v->window));
    }

    if (lhs == nullptr || rhs == nullptr || day >= table.size()) {
        return std::nullopt;
    }
    ConditionReading reading;
    reading.lhs = (*lhs)[day];
    reading.rhs = (*rhs)[day];
    return reading;
}

bool evaluateInstant(const spec::Rule& rule, size_t day, const data::FeatureTable& table) {
    const auto reading = readCondition(rule, day, table);
    return reading && conditionHolds(rule, *reading);
}

bool evaluateDuration(const spec::Rule& rule, size_t day, const data::FeatureTable& table, int days) {
    const size_t span = static_cast<size_t>(days < 1 ? 1 : days);
    if (day >= table.size() || day + 1 < span) {
        return false;  // window runs off the start of history
    }
    for (size_t offset = 0; offset < span; ++offset) {
        const auto reading = readCondition(rule, day - offset, table);
        if (!reading || hasMissingValue(*reading) || !conditionHolds(rule, *reading)) {
            return false;
        }
    }
    return true;
}

bool evaluateLookahead(const spec::Rule& rule, size_t day, const data::FeatureTable& table, int days) {
    const size_t span = static_cast<size_t>(days < 0 ? 0 : days);
    for (size_t offset = 0; offset <= span; ++offset) {
        const size_t check = day + offset;
        if (check >= table.size()) {
            break;  // later offsets are past the end as well
        }
        const auto reading = readCondition(rule, check, table);
        if (!reading) {
            return false;  // column absent on every day
        }
        if (hasMissingValue(*reading)) {
            continue;
        }
        if (conditionHolds(rule, *reading)) {
            return true;
        }
    }
    return false;
}

bool evaluateInMode(const spec::Rule& rule, size_t day, const data::FeatureTable& table, EvalMode mode) {
    switch (mode) {
        case EvalMode::INSTANTANEOUS:
            return evaluateInstant(rule, day, table);
        case EvalMode::DURATION:
            return evaluateDuration(rule, day, table, windowFor(rule.durationDays()));
        case EvalMode::LOOKAHEAD:
            return evaluateLookahead(rule, day, table, rule.lookaheadDays() ? *rule.lookaheadDays() : 0);
    }
    return false;
}

bool evaluateRule(const spec::Rule& rule, size_t day, const data::FeatureTable& table) {
    return evaluateInMode(rule, day, table, declaredMode(rule));
}

} // namespace engine
} // namespace stratlab
