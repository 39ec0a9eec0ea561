#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "data/FeatureTable.h"
#include "spec/StrategySpec.h"

namespace stratlab {
namespace engine {

// Entry/exit composition shared by the position simulator, the trade
// reconstructor and the data validator.

// AND across all entry rules in their declared modes, or the sequential
// evaluation when spec.entry_sequential is set.
bool evaluateEntry(const spec::StrategySpec& spec, size_t day, const data::FeatureTable& table);

// Standard (non-sequential) AND, short-circuits on the first failing rule
bool evaluateAllRules(const std::vector<spec::Rule>& rules, size_t day, const data::FeatureTable& table);

// Index of the first exit rule (declared order) that holds on `day`.
// Later rules are not evaluated once one fires.
std::optional<size_t> firstTriggeredExit(const std::vector<spec::Rule>& rules, size_t day,
                                         const data::FeatureTable& table);

// "First A, then B within N days": rules[0] must hold instantaneously on
// `anchor`; each later rule must hold instantaneously on `anchor` or, when it
// declares lookahead_days = L, on some day of [anchor, anchor + L]. The entry
// is attributed to `anchor` even if a lagging rule fires later.
bool evaluateSequential(const std::vector<spec::Rule>& rules, size_t anchor, const data::FeatureTable& table);

// Day on which `rule` satisfies its sequential window relative to `anchor`,
// or nullopt. The first rule of a sequence is always checked on the anchor only.
std::optional<size_t> findSequentialTrigger(const spec::Rule& rule, size_t anchor,
                                            const data::FeatureTable& table, bool is_first = false);

} // namespace engine
} // namespace stratlab
