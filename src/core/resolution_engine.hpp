#pragma once

#include "condition_evaluator.hpp"
#include "rule_types.hpp"

namespace rule_advisor {

// Run the whole rule set against the facts and pick one decision.
//
// Every rule whose conditions all hold is collected, then stable-sorted by
// priority (highest first); rules of equal priority keep their order from
// `rules`. The first fired rule's action wins, with the missing-action guard
// substituted when that action is absent or has no decision. When nothing
// fires the no-match action is returned with an empty trace.
//
// Pure function of its arguments: holds no state between calls and may be
// called concurrently on independent inputs. Never throws for malformed
// conditions or actions.
MatchResult resolve(const FactMap &facts, const RuleSet &rules,
                    const DiagnosticSink &sink = log_comparison_fault);

} // namespace rule_advisor
