#include "condition_evaluator.hpp"

#include <iostream>

namespace rule_advisor {

void log_comparison_fault(const Condition &condition, const Value &fact,
                          const std::string &error) {
  std::cerr << "[ConditionEvaluator] condition '" << describe(condition)
            << "' failed against fact value " << fact.to_string() << ": "
            << error << std::endl;
}

bool evaluate_condition(const FactMap &facts, const Condition &condition,
                        const DiagnosticSink &sink) {
  if (!condition.well_formed || !condition.op) {
    return false;
  }

  auto it = facts.find(condition.field);
  if (it == facts.end()) {
    // Fact not supplied, condition is false
    return false;
  }

  try {
    return comparator_for(*condition.op)(it->second, condition.value);
  } catch (const IncompatibleComparison &e) {
    if (sink) {
      sink(condition, it->second, e.what());
    }
    return false;
  }
}

} // namespace rule_advisor
