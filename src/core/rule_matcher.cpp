#include "rule_matcher.hpp"

#include <algorithm>

namespace rule_advisor {

bool rule_matches(const FactMap &facts, const Rule &rule,
                  const DiagnosticSink &sink) {
  return std::all_of(rule.conditions.begin(), rule.conditions.end(),
                     [&](const Condition &c) {
                       return evaluate_condition(facts, c, sink);
                     });
}

} // namespace rule_advisor
