#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace stratlab {
namespace spec {

enum class RuleKind { CROSSOVER, VOL_FILTER };

// "above" = fast MA > slow MA
enum class CrossDirection { ABOVE, BELOW };

// Realized vol compared against its trailing one-year median
enum class VolRelation { BELOW, ABOVE };

struct CrossoverRule {
    int fast_ma = 0;
    int slow_ma = 0;
    CrossDirection direction = CrossDirection::ABOVE;
};

struct VolFilterRule {
    int window = 0;
    std::string threshold = "median_1y";
    VolRelation relation = VolRelation::BELOW;
};

using RuleCondition = std::variant<CrossoverRule, VolFilterRule>;

// Immutable once constructed. Evaluators never toggle the temporal modifiers,
// they take the evaluation mode as an explicit argument instead.
class Rule {
public:
    Rule(RuleCondition condition,
         std::optional<int> lookahead_days = std::nullopt,
         std::optional<int> duration_days = std::nullopt)
        : condition_(std::move(condition)),
          lookahead_days_(lookahead_days),
          duration_days_(duration_days) {}

    static Rule crossover(int fast_ma, int slow_ma, CrossDirection direction,
                          std::optional<int> lookahead_days = std::nullopt,
                          std::optional<int> duration_days = std::nullopt);
    static Rule volFilter(int window, VolRelation relation,
                          std::optional<int> lookahead_days = std::nullopt,
                          std::optional<int> duration_days = std::nullopt);

    RuleKind kind() const {
        return std::holds_alternative<CrossoverRule>(condition_) ? RuleKind::CROSSOVER : RuleKind::VOL_FILTER;
    }
    const RuleCondition& condition() const { return condition_; }
    const CrossoverRule* asCrossover() const { return std::get_if<CrossoverRule>(&condition_); }
    const VolFilterRule* asVolFilter() const { return std::get_if<VolFilterRule>(&condition_); }

    const std::optional<int>& lookaheadDays() const { return lookahead_days_; }
    const std::optional<int>& durationDays() const { return duration_days_; }

    bool operator==(const Rule& other) const;
    bool operator!=(const Rule& other) const { return !(*this == other); }

private:
    RuleCondition condition_;
    std::optional<int> lookahead_days_;
    std::optional<int> duration_days_;
};

struct StrategySpec {
    std::string ticker;
    Date start_date;
    Date end_date;
    std::vector<Rule> entry_rules;
    std::vector<Rule> exit_rules;
    std::vector<std::string> metrics;
    bool entry_sequential = false;
};

// Interchange format shared with the translation service and the UI.
// Throws SpecificationError on malformed input.
StrategySpec parseStrategySpec(const nlohmann::json& data,
                               const std::vector<std::string>& default_metrics = {"cagr", "max_drawdown", "sharpe"});
StrategySpec parseStrategySpecText(const std::string& text,
                                   const std::vector<std::string>& default_metrics = {"cagr", "max_drawdown", "sharpe"});
Rule parseRule(const nlohmann::json& rule_json);

nlohmann::json toJson(const Rule& rule);
nlohmann::json toJson(const StrategySpec& spec);

std::string toString(RuleKind kind);
std::string toString(CrossDirection direction);
std::string toString(VolRelation relation);

// e.g. "crossover(10/50 above, lookahead=3)"
std::string describeRule(const Rule& rule);

} // namespace spec
} // namespace stratlab
