#pragma once

#include <functional>
#include <string>

#include "rule_types.hpp"

namespace rule_advisor {

// Observability hook for comparisons that raised (incompatible operand
// kinds). Receives the offending condition, the fact value it was applied
// to and the comparator's error message.
using DiagnosticSink = std::function<void(
    const Condition &condition, const Value &fact, const std::string &error)>;

// Default sink: one "[ConditionEvaluator] ..." line on stderr
void log_comparison_fault(const Condition &condition, const Value &fact,
                          const std::string &error);

// Evaluate one condition against the facts.
// Fails safe: returns false (never throws) when the condition is malformed,
// the field is absent, the operator is unregistered, or the comparison
// raises. Only the last case is reported to the sink; an empty sink
// silences it.
bool evaluate_condition(const FactMap &facts, const Condition &condition,
                        const DiagnosticSink &sink = log_comparison_fault);

} // namespace rule_advisor
