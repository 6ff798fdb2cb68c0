#include "resolution_engine.hpp"

#include <algorithm>

#include "default_policy.hpp"
#include "rule_matcher.hpp"

namespace rule_advisor {

MatchResult resolve(const FactMap &facts, const RuleSet &rules,
                    const DiagnosticSink &sink) {
  MatchResult result;

  for (const auto &rule : rules) {
    if (rule_matches(facts, rule, sink)) {
      result.fired.push_back(rule);
    }
  }

  if (result.fired.empty()) {
    result.action = no_match_action();
    result.matched = false;
    return result;
  }

  // Source order is the tie-break for equal priorities
  std::stable_sort(result.fired.begin(), result.fired.end(),
                   [](const Rule &a, const Rule &b) {
                     return a.priority > b.priority;
                   });

  const Rule &winner = result.fired.front();
  if (winner.action && is_well_formed(*winner.action)) {
    result.action = *winner.action;
  } else {
    result.action = missing_action_guard();
  }
  result.matched = true;
  return result;
}

} // namespace rule_advisor
