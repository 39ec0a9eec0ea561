#pragma once

#include <string>
#include <vector>

#include "data/FeatureTable.h"
#include "engine/EngineConfig.h"
#include "spec/StrategySpec.h"

namespace stratlab {
namespace validation {

struct ValidationResult {
    bool ok = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// Spec-only checks: contradictions and out-of-range parameters.
ValidationResult validateSpec(const spec::StrategySpec& spec,
                              const engine::ValidationConfig& config = engine::ValidationConfig());

// Spec + data checks: history length, indicator columns, and a dry run of the
// entry/exit composition over the whole table. Never throws.
ValidationResult validateWithData(const spec::StrategySpec& spec,
                                  const data::FeatureTable& table,
                                  const engine::ValidationConfig& config = engine::ValidationConfig());

// Minimum bar count implied by the longest window/lookahead/duration in use (0 if none)
int requiredHistoryLength(const spec::StrategySpec& spec,
                          const engine::ValidationConfig& config = engine::ValidationConfig());

// Indicator columns referenced by the strategy's rules but absent from the table
std::vector<std::string> missingIndicatorColumns(const spec::StrategySpec& spec, const data::FeatureTable& table);

} // namespace validation
} // namespace stratlab
