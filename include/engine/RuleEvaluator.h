#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "data/FeatureTable.h"
#include "spec/StrategySpec.h"

namespace stratlab {
namespace engine {

enum class EvalMode {
    INSTANTANEOUS,  // exact day only
    DURATION,       // every day of the trailing window; fails closed
    LOOKAHEAD       // any day of [day, day + N]; fails open on missing data
};

// The two values a rule compares on one day (fast/slow MA, or RV/median)
struct ConditionReading {
    double lhs = 0.0;
    double rhs = 0.0;
};

// Mode implied by the rule's own modifiers. Duration wins if both are set.
EvalMode declaredMode(const spec::Rule& rule);

// nullopt when the table lacks one of the rule's columns. The values
// themselves may be NaN.
std::optional<ConditionReading> readCondition(const spec::Rule& rule, size_t day,
                                              const data::FeatureTable& table);

bool evaluateInstant(const spec::Rule& rule, size_t day, const data::FeatureTable& table);
bool evaluateDuration(const spec::Rule& rule, size_t day, const data::FeatureTable& table, int days);
bool evaluateLookahead(const spec::Rule& rule, size_t day, const data::FeatureTable& table, int days);

// Evaluate in an explicit mode. The window length comes from the rule's
// matching modifier; without one the check covers only the exact day.
bool evaluateInMode(const spec::Rule& rule, size_t day, const data::FeatureTable& table, EvalMode mode);

// Evaluate in the rule's declared mode
bool evaluateRule(const spec::Rule& rule, size_t day, const data::FeatureTable& table);

} // namespace engine
} // namespace stratlab
