#include "default_policy.hpp"

namespace rule_advisor {

Action no_match_action() { return Action{kNoMatchDecision, kNoMatchReason}; }

Action missing_action_guard() {
  return Action{kMissingActionDecision, kMissingActionReason};
}

RuleSet default_rule_set() {
  RuleSet rules;

  rules.push_back(Rule{
      "Top merit candidate",
      100,
      {make_condition("cgpa", ">=", Value(3.7)),
       make_condition("co_curricular_score", ">=", Value(80)),
       make_condition("family_income", "<=", Value(8000)),
       make_condition("disciplinary_actions", "==", Value(0))},
      Action{"AWARD FULL", "Excellent academic & co-curricular performance, "
                           "with acceptable need"}});

  rules.push_back(Rule{
      "Low CGPA not eligible",
      95,
      {make_condition("cgpa", "<", Value(2.5))},
      Action{"REJECT", "CGPA below minimum scholarship requirement"}});

  rules.push_back(
      Rule{"Serious disciplinary record",
           90,
           {make_condition("disciplinary_actions", ">=", Value(2))},
           Action{"REJECT", "Too many disciplinary records"}});

  rules.push_back(Rule{
      "Good candidate partial scholarship",
      80,
      {make_condition("cgpa", ">=", Value(3.3)),
       make_condition("co_curricular_score", ">=", Value(60)),
       make_condition("family_income", "<=", Value(12000)),
       make_condition("disciplinary_actions", "<=", Value(1))},
      Action{"AWARD PARTIAL",
             "Good academic & involvement record with moderate need"}});

  rules.push_back(
      Rule{"Need-based review",
           70,
           {make_condition("cgpa", ">=", Value(2.5)),
            make_condition("family_income", "<=", Value(4000))},
           Action{"REVIEW", "High need but borderline academic score"}});

  // Catch-all: no conditions, lowest priority
  rules.push_back(Rule{"Default non-qualifier",
                       1,
                       {},
                       Action{"NOT ELIGIBLE",
                              "Applicant did not meet the criteria for any "
                              "defined scholarship or review."}});

  return rules;
}

} // namespace rule_advisor
