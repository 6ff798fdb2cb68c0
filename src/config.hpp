#pragma once

#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "core/rule_types.hpp"

namespace rule_advisor {

// What to do when the configured rules file cannot be loaded or validated
enum class InvalidRulesPolicy {
  UseDefault, // Log a warning and fall back to the built-in rule set
  Fail        // Treat as a fatal configuration error
};

// Complete advisor configuration
struct AdvisorConfig {
  std::string config_file_path; // Absolute path (for relative resolution)
  std::optional<std::string> rules_path; // Resolved against the config dir
  InvalidRulesPolicy on_invalid_rules = InvalidRulesPolicy::UseDefault;
  bool log_comparison_faults = true;
};

// Rule set chosen for a run, and where it came from
struct RuleSetSelection {
  RuleSet rules;
  std::string source; // File path, or "built-in"
  bool fell_back = false; // Configured file was rejected
  std::string error;      // Validation error when fell_back
};

// Load advisor configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
AdvisorConfig load_config(const std::string &path);

// Parse on_invalid policy from string
// Throws std::runtime_error if policy is invalid
InvalidRulesPolicy parse_invalid_rules_policy(const std::string &policy_str);

// Parse a rule set: either a sequence of rules or a map with a 'rules'
// sequence. Conditions with the wrong arity or an unknown operator are kept
// as malformed conditions (logged as warnings); structural problems throw
// std::runtime_error.
RuleSet parse_rule_set(const YAML::Node &root);
RuleSet load_rule_set(const std::string &path);
RuleSet load_rule_set_from_string(const std::string &text);

// Pick the rule set for this configuration, applying on_invalid_rules
RuleSetSelection select_rule_set(const AdvisorConfig &config);

// Parse applicant facts: a map of scalars, optionally under a 'facts' key
// Throws std::runtime_error on a non-map root or non-scalar value
FactMap parse_facts(const YAML::Node &root);
FactMap load_facts(const std::string &path);
FactMap load_facts_from_string(const std::string &text);

// Type a YAML scalar: quoted -> text, true/false -> boolean, integer literal
// -> integer, other numeric -> real, anything else -> text
Value parse_scalar(const YAML::Node &node);

} // namespace rule_advisor
