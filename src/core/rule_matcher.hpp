#pragma once

#include "condition_evaluator.hpp"
#include "rule_types.hpp"

namespace rule_advisor {

// True iff every condition of the rule holds (logical AND, short-circuits on
// the first false). A rule without conditions matches any facts.
bool rule_matches(const FactMap &facts, const Rule &rule,
                  const DiagnosticSink &sink = log_comparison_fault);

} // namespace rule_advisor
