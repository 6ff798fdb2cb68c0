#pragma once

#include <string>

#include "core/rule_types.hpp"

namespace rule_advisor {

// Headline for a decision: the award/reject decisions get their own
// banner, anything else (REVIEW, MANUAL_REVIEW, NOT ELIGIBLE, ...) needs a
// human
std::string decision_banner(const std::string &decision);

// Plain-text report: facts, decision, reason and the fired-rule trace
std::string render_text_report(const FactMap &facts, const MatchResult &result);

// Same content as a YAML document
std::string render_yaml_report(const FactMap &facts, const MatchResult &result);

} // namespace rule_advisor
