#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "operator_registry.hpp"
#include "value.hpp"

namespace rule_advisor {

// Named scalar inputs describing the applicant being evaluated
using FactMap = std::map<std::string, Value>;

// Atomic comparison "field op value". A condition read from an external
// source may be malformed (wrong arity or unregistered operator symbol);
// it is kept so that it can be reported, and always evaluates false.
struct Condition {
  std::string field;
  std::string symbol;         // operator as written by the rule author
  std::optional<Operator> op; // nullopt when symbol is not registered
  Value value;
  bool well_formed = true;    // false when the source was not a triple
};

// Build a condition, resolving the operator symbol against the registry
Condition make_condition(std::string field, std::string symbol, Value value);

// Placeholder for a source entry that was not a field/operator/value triple
Condition malformed_condition(std::string description);

// Decision payload attached to a rule
struct Action {
  std::string decision;
  std::string reason;
};

inline bool operator==(const Action &a, const Action &b) {
  return a.decision == b.decision && a.reason == b.reason;
}

inline bool operator!=(const Action &a, const Action &b) { return !(a == b); }

// An action is usable as a decision only when it names one
inline bool is_well_formed(const Action &action) {
  return !action.decision.empty();
}

// Prioritized conjunction of conditions. An empty condition list matches
// unconditionally (catch-all rule).
struct Rule {
  std::string name;
  int priority = 0;
  std::vector<Condition> conditions;
  std::optional<Action> action;
};

using RuleSet = std::vector<Rule>;

// Outcome of one resolution: the winning action plus every fired rule,
// highest priority first
struct MatchResult {
  Action action;
  std::vector<Rule> fired;
  bool matched = false; // false when the no-match fallback was returned
};

// Condition text for logs and reports ("cgpa >= 3.7")
std::string describe(const Condition &condition);

} // namespace rule_advisor
