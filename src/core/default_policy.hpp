#pragma once

#include "rule_types.hpp"

namespace rule_advisor {

// Fallback decisions. Downstream renderers branch on these literal strings,
// so they must not change.
constexpr const char *kNoMatchDecision = "MANUAL_REVIEW";
constexpr const char *kNoMatchReason = "No specific rule matched";
constexpr const char *kMissingActionDecision = "REVIEW";
constexpr const char *kMissingActionReason =
    "Matching rule has no defined action";

// Returned when no rule fired
Action no_match_action();

// Substituted when the winning rule has no well-formed action
Action missing_action_guard();

// Built-in scholarship rule set, used when no rules file is configured or
// the configured one fails validation. Returned by value; callers inject it
// into resolve() like any other rule set.
RuleSet default_rule_set();

} // namespace rule_advisor
