#pragma once

#include <string>

#include "config.hpp"
#include "core/rule_types.hpp"

namespace rule_advisor {

// Rule set the service evaluates against when a request brings none
struct ActiveRuleSetState {
  RuleSet rules;
  std::string source;     // File path or "built-in"
  bool fell_back = false; // Configured file was rejected at startup
  std::string error;
  bool log_comparison_faults = true;
  bool installed = false;
};

// Active rule set registry - process-wide, replaced wholesale
class ActiveRuleSet {
public:
  // Install the selection made at startup
  static void install(const RuleSetSelection &selection,
                      bool log_comparison_faults);

  // Copy of the current state (rules are small; callers never see a
  // half-replaced set)
  static ActiveRuleSetState snapshot();

  // Check if a rule set has been installed
  static bool is_installed();

  // Reset registry (for testing)
  static void reset();
};

} // namespace rule_advisor
