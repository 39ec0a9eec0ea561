#pragma once

#include <set>
#include <vector>

#include "common/Types.h"
#include "data/FeatureTable.h"
#include "engine/EngineConfig.h"
#include "spec/StrategySpec.h"

namespace stratlab {
namespace data {

class FeatureBuilder {
public:
    // Builds return, MA, realized-vol and vol-median columns for every window
    // referenced by the strategy's rules. Throws DataUnavailableError on empty input.
    static FeatureTable build(const std::vector<DailyBar>& bars,
                              const spec::StrategySpec& spec,
                              const engine::FeatureConfig& config = engine::FeatureConfig());

    static std::set<int> requiredMaWindows(const spec::StrategySpec& spec);
    static std::set<int> requiredVolWindows(const spec::StrategySpec& spec);
};

} // namespace data
} // namespace stratlab
