#pragma once
#include "core/policy.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gup {

struct DecisionResult {
  Decision outcome = Decision::Allow;
  std::vector<std::string> triggered;       // sorted rule ids
  std::optional<std::string> decidingRule;  // empty when no rule matched
};

// Pure: no I/O, no mutation. Built-in `defaults:` rules take part in the same
// tie-break as configured rules (Deny > Warn > Allow, then smallest id).
DecisionResult decide(const InspectedFile& file, const EffectivePolicy& policy);

bool ruleMatches(const RulePredicate& when, const InspectedFile& file);

} // namespace gup
