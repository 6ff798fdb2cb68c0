#include "core/default_policy.hpp"
#include "core/resolution_engine.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace rule_advisor;

namespace {

std::vector<std::string> names(const MatchResult &result) {
  std::vector<std::string> out;
  for (const auto &rule : result.fired) {
    out.push_back(rule.name);
  }
  return out;
}

Rule always(const std::string &name, int priority, const std::string &decision) {
  return Rule{name, priority, {}, Action{decision, name + " fired"}};
}

} // namespace

TEST_CASE("Reference rule set scenarios", "[resolve]") {
  const RuleSet rules = default_rule_set();

  SECTION("top merit candidate wins with full award") {
    FactMap facts{{"cgpa", Value(3.8)},
                  {"co_curricular_score", Value(85)},
                  {"family_income", Value(5000)},
                  {"disciplinary_actions", Value(0)}};
    auto result = resolve(facts, rules);
    CHECK(result.matched);
    CHECK(result.action.decision == "AWARD FULL");
    REQUIRE_FALSE(result.fired.empty());
    CHECK(result.fired.front().name == "Top merit candidate");
    CHECK(result.fired.front().priority == 100);
    CHECK(names(result) ==
          std::vector<std::string>{"Top merit candidate",
                                   "Good candidate partial scholarship",
                                   "Default non-qualifier"});
  }

  SECTION("low CGPA rejects even when lower rules match") {
    FactMap facts{{"cgpa", Value(2.0)},
                  {"co_curricular_score", Value(85)},
                  {"family_income", Value(3000)},
                  {"disciplinary_actions", Value(3)}};
    auto result = resolve(facts, rules);
    CHECK(result.action.decision == "REJECT");
    CHECK(result.action.reason == "CGPA below minimum scholarship requirement");
    CHECK(names(result) ==
          std::vector<std::string>{"Low CGPA not eligible",
                                   "Serious disciplinary record",
                                   "Default non-qualifier"});
  }

  SECTION("only the catch-all matches") {
    FactMap facts{{"cgpa", Value(3.9)},
                  {"co_curricular_score", Value(0)},
                  {"family_income", Value(20000)},
                  {"disciplinary_actions", Value(0)}};
    auto result = resolve(facts, rules);
    CHECK(result.action.decision == "NOT ELIGIBLE");
    CHECK(names(result) == std::vector<std::string>{"Default non-qualifier"});
  }

  SECTION("need-based review") {
    FactMap facts{{"cgpa", Value(2.8)},
                  {"co_curricular_score", Value(40)},
                  {"family_income", Value(3500)},
                  {"disciplinary_actions", Value(1)}};
    auto result = resolve(facts, rules);
    CHECK(result.action.decision == "REVIEW");
    CHECK(result.fired.front().name == "Need-based review");
  }
}

TEST_CASE("No fired rule yields the manual review fallback", "[resolve]") {
  RuleSet rules{Rule{"needs income",
                     50,
                     {make_condition("family_income", "<=", Value(4000))},
                     Action{"REVIEW", "need"}}};

  for (const auto &facts :
       {FactMap{}, FactMap{{"family_income", Value(9000)}}}) {
    auto result = resolve(facts, rules);
    CHECK_FALSE(result.matched);
    CHECK(result.action.decision == "MANUAL_REVIEW");
    CHECK(result.action.reason == "No specific rule matched");
    CHECK(result.fired.empty());
  }

  auto empty = resolve(FactMap{{"cgpa", Value(3.0)}}, RuleSet{});
  CHECK(empty.action == no_match_action());
  CHECK(empty.fired.empty());
}

TEST_CASE("Fired rules are ordered by priority, ties keep input order",
          "[resolve]") {
  SECTION("tie block [B, A] is preserved") {
    RuleSet rules{always("low", 10, "LOW"), always("B", 80, "B"),
                  always("A", 80, "A"), always("top", 90, "TOP")};
    auto result = resolve(FactMap{}, rules);
    CHECK(names(result) == std::vector<std::string>{"top", "B", "A", "low"});
    CHECK(result.action.decision == "TOP");
  }

  SECTION("winning tie goes to the earlier rule") {
    RuleSet rules{always("B", 80, "B"), always("A", 80, "A")};
    CHECK(resolve(FactMap{}, rules).action.decision == "B");

    std::swap(rules[0], rules[1]);
    CHECK(resolve(FactMap{}, rules).action.decision == "A");
  }

  SECTION("negative priorities sort below zero") {
    RuleSet rules{always("neg", -5, "NEG"), always("zero", 0, "ZERO")};
    CHECK(names(resolve(FactMap{}, rules)) ==
          std::vector<std::string>{"zero", "neg"});
  }
}

TEST_CASE("Winner without a usable action gets the guard action",
          "[resolve]") {
  Rule no_action{"no action", 100, {}, std::nullopt};
  Rule empty_decision{"empty decision", 100, {}, Action{"", "orphan reason"}};
  Rule fallback = always("lower", 10, "AWARD PARTIAL");

  for (const auto &winner : {no_action, empty_decision}) {
    auto result = resolve(FactMap{}, RuleSet{winner, fallback});
    CHECK(result.matched);
    CHECK(result.action.decision == "REVIEW");
    CHECK(result.action.reason == "Matching rule has no defined action");
    REQUIRE(result.fired.size() == 2);
    CHECK(result.fired.front().name == winner.name);
  }

  SECTION("the guard follows priority, not input position") {
    auto result = resolve(FactMap{}, RuleSet{fallback, no_action});
    CHECK(result.action.decision == "REVIEW");
    auto reordered = resolve(
        FactMap{}, RuleSet{always("top", 200, "AWARD FULL"), no_action});
    CHECK(reordered.action.decision == "AWARD FULL");
  }
}

TEST_CASE("Resolution is deterministic and leaves its inputs alone",
          "[resolve]") {
  const RuleSet rules = default_rule_set();
  const FactMap facts{{"cgpa", Value(3.4)},
                      {"co_curricular_score", Value(70)},
                      {"family_income", Value(3900)},
                      {"disciplinary_actions", Value(1)}};

  auto first = resolve(facts, rules);
  for (int i = 0; i < 5; ++i) {
    auto again = resolve(facts, rules);
    CHECK(again.action == first.action);
    CHECK(names(again) == names(first));
    CHECK(again.matched == first.matched);
  }
  CHECK(first.action.decision == "AWARD PARTIAL");
  CHECK(rules.size() == default_rule_set().size());
  CHECK(rules.front().name == "Top merit candidate");
}

TEST_CASE("Incompatible facts fail conditions without aborting resolution",
          "[resolve]") {
  const FactMap facts{{"cgpa", Value("three point eight")},
                      {"co_curricular_score", Value(85)},
                      {"family_income", Value(5000)},
                      {"disciplinary_actions", Value(0)}};
  int reported = 0;
  DiagnosticSink sink = [&](const Condition &, const Value &,
                            const std::string &) { ++reported; };

  auto result = resolve(facts, default_rule_set(), sink);
  CHECK(result.action.decision == "NOT ELIGIBLE");
  // Four rules test cgpa first; each reports once and short-circuits
  CHECK(reported == 4);
}

TEST_CASE("Default policy constants", "[policy]") {
  CHECK(no_match_action() == Action{"MANUAL_REVIEW", "No specific rule matched"});
  CHECK(missing_action_guard() ==
        Action{"REVIEW", "Matching rule has no defined action"});

  const RuleSet rules = default_rule_set();
  REQUIRE(rules.size() == 6);
  CHECK(rules.back().conditions.empty());
  CHECK(rules.back().priority == 1);
  for (const auto &rule : rules) {
    REQUIRE(rule.action.has_value());
    CHECK(is_well_formed(*rule.action));
    for (const auto &cond : rule.conditions) {
      CHECK(cond.well_formed);
      CHECK(cond.op.has_value());
    }
  }
}
