#include "config.hpp"
#include "core/default_policy.hpp"
#include "core/resolution_engine.hpp"
#include "rules_yaml.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace rule_advisor;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed at scope exit
class TempDir {
public:
  TempDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            ("rule_advisor_test_" + std::to_string(stamp));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  std::string write(const std::string &name, const std::string &content) const {
    fs::path p = path_ / name;
    std::ofstream out(p);
    out << content;
    return p.string();
  }

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

const char *kMeritRules = R"yaml(
rules:
  - name: Merit
    priority: 100
    conditions:
      - [cgpa, ">=", 3.7]
      - [family_income, "<=", 8000]
    action:
      decision: AWARD FULL
      reason: Strong record
  - name: Catch all
    priority: 1
    conditions: []
    action:
      decision: NOT ELIGIBLE
      reason: Nothing else matched
)yaml";

} // namespace

TEST_CASE("Rule sets load from YAML", "[config][rules]") {
  SECTION("map root with a rules sequence") {
    RuleSet rules = load_rule_set_from_string(kMeritRules);
    REQUIRE(rules.size() == 2);
    CHECK(rules[0].name == "Merit");
    CHECK(rules[0].priority == 100);
    REQUIRE(rules[0].conditions.size() == 2);
    CHECK(rules[0].conditions[0].field == "cgpa");
    CHECK(rules[0].conditions[0].op == Operator::GreaterEqual);
    CHECK(rules[0].conditions[0].value == Value(3.7));
    CHECK(rules[0].conditions[1].value == Value(8000));
    REQUIRE(rules[0].action.has_value());
    CHECK(rules[0].action->decision == "AWARD FULL");
    CHECK(rules[1].conditions.empty());
  }

  SECTION("bare sequence root and field defaults") {
    RuleSet rules = load_rule_set_from_string(R"yaml(
- action: {decision: REVIEW, reason: anything}
)yaml");
    REQUIRE(rules.size() == 1);
    CHECK(rules[0].name == "(unnamed)");
    CHECK(rules[0].priority == 0);
    CHECK(rules[0].conditions.empty());
  }

  SECTION("scalar typing of condition literals") {
    RuleSet rules = load_rule_set_from_string(R"yaml(
- name: typed
  conditions:
    - [a, "==", 80]
    - [b, "==", 3.5]
    - [c, "==", "80"]
    - [d, "==", true]
    - [e, "==", FT]
    - [f, "==", -2]
)yaml");
    const auto &c = rules.at(0).conditions;
    REQUIRE(c.size() == 6);
    CHECK(c[0].value.kind() == Value::Kind::Integer);
    CHECK(c[1].value.kind() == Value::Kind::Real);
    CHECK(c[2].value == Value("80"));
    CHECK(c[3].value == Value(true));
    CHECK(c[4].value == Value("FT"));
    CHECK(c[5].value == Value(-2));
  }

  SECTION("malformed conditions are kept and never hold") {
    RuleSet rules = load_rule_set_from_string(R"yaml(
- name: odd
  priority: 50
  conditions:
    - [cgpa, ">="]
    - [cgpa, "=~", 3.0]
  action: {decision: AWARD FULL, reason: should not win}
- name: fallback
  priority: 1
  action: {decision: NOT ELIGIBLE, reason: catch all}
)yaml");
    REQUIRE(rules.size() == 2);
    CHECK_FALSE(rules[0].conditions[0].well_formed);
    CHECK(rules[0].conditions[1].well_formed);
    CHECK_FALSE(rules[0].conditions[1].op.has_value());

    auto result = resolve(FactMap{{"cgpa", Value(3.9)}}, rules);
    CHECK(result.action.decision == "NOT ELIGIBLE");
  }

  SECTION("odd condition shapes only disable their own condition") {
    RuleSet rules = load_rule_set_from_string(R"yaml(
- name: null literal
  priority: 60
  conditions:
    - [cgpa, "==", null]
  action: {decision: AWARD FULL, reason: should not win}
- name: list literal
  priority: 55
  conditions:
    - [cgpa, ">=", [3.0]]
  action: {decision: AWARD FULL, reason: should not win}
- name: bare field
  priority: 50
  conditions: [cgpa]
  action: {decision: AWARD FULL, reason: should not win}
- name: valid
  priority: 10
  conditions:
    - [cgpa, ">=", 3.0]
  action: {decision: AWARD PARTIAL, reason: kept alongside the others}
)yaml");
    REQUIRE(rules.size() == 4);
    CHECK_FALSE(rules[0].conditions.at(0).well_formed);
    CHECK_FALSE(rules[1].conditions.at(0).well_formed);
    CHECK_FALSE(rules[2].conditions.at(0).well_formed);
    CHECK(rules[3].conditions.at(0).well_formed);

    auto result = resolve(FactMap{{"cgpa", Value(3.9)}}, rules);
    CHECK(result.action.decision == "AWARD PARTIAL");
    REQUIRE(result.fired.size() == 1);
    CHECK(result.fired[0].name == "valid");
  }

  SECTION("missing action and missing decision load as guard cases") {
    RuleSet rules = load_rule_set_from_string(R"yaml(
- name: silent
  priority: 10
- name: half
  priority: 5
  action: {reason: no decision here}
)yaml");
    REQUIRE(rules.size() == 2);
    CHECK_FALSE(rules[0].action.has_value());
    REQUIRE(rules[1].action.has_value());
    CHECK_FALSE(is_well_formed(*rules[1].action));

    auto result = resolve(FactMap{}, rules);
    CHECK(result.action == missing_action_guard());
  }
}

TEST_CASE("Structurally invalid rule sets are rejected", "[config][rules]") {
  const char *invalid[] = {
      "rules: 5",
      "just a string",
      "- 42",
      "- name: x\n  priority: high",
      "- name: x\n  priority: 3.5",
      "- name: x\n  priority: \"100\"",
      "- name: x\n  priority: 99999999999",
      "- name: x\n  conditions: {cgpa: 3}",
      "- name: x\n  action: AWARD FULL",
      "- name: x\n  salience: 3",
      "rules: [",
  };

  for (const char *text : invalid) {
    INFO(text);
    CHECK_THROWS_AS(load_rule_set_from_string(text), std::runtime_error);
  }
}

TEST_CASE("Emitted rule sets load back unchanged", "[config][rules]") {
  const RuleSet original = default_rule_set();
  const RuleSet reloaded =
      load_rule_set_from_string(emit_rule_set_yaml(original));

  REQUIRE(reloaded.size() == original.size());
  for (std::size_t i = 0; i < original.size(); ++i) {
    INFO(original[i].name);
    CHECK(reloaded[i].name == original[i].name);
    CHECK(reloaded[i].priority == original[i].priority);
    REQUIRE(reloaded[i].conditions.size() == original[i].conditions.size());
    for (std::size_t j = 0; j < original[i].conditions.size(); ++j) {
      CHECK(reloaded[i].conditions[j].field == original[i].conditions[j].field);
      CHECK(reloaded[i].conditions[j].op == original[i].conditions[j].op);
      CHECK(reloaded[i].conditions[j].value == original[i].conditions[j].value);
    }
    REQUIRE(reloaded[i].action.has_value());
    CHECK(*reloaded[i].action == *original[i].action);
  }
}

TEST_CASE("Real literals keep full precision through YAML", "[config][rules]") {
  const Value threshold(0.1 + 0.2);
  RuleSet rules{Rule{"precise",
                     10,
                     {make_condition("cgpa", ">=", threshold)},
                     Action{"AWARD FULL", "exact threshold"}}};

  const RuleSet reloaded = load_rule_set_from_string(emit_rule_set_yaml(rules));
  REQUIRE(reloaded.size() == 1);
  REQUIRE(reloaded[0].conditions.size() == 1);
  CHECK(reloaded[0].conditions[0].value == threshold);

  // 0.3 sits just below the threshold and must still fail after reload
  CHECK(resolve(FactMap{{"cgpa", Value(0.3)}}, reloaded).action ==
        no_match_action());
  CHECK(resolve(FactMap{{"cgpa", threshold}}, reloaded).action.decision ==
        "AWARD FULL");
}

TEST_CASE("Facts load from YAML", "[config][facts]") {
  SECTION("plain map") {
    FactMap facts = load_facts_from_string(
        "cgpa: 3.8\nfamily_income: 5000\nenrolment: FT\nscholar: false\n");
    CHECK(facts.at("cgpa") == Value(3.8));
    CHECK(facts.at("family_income") == Value(5000));
    CHECK(facts.at("enrolment") == Value("FT"));
    CHECK(facts.at("scholar") == Value(false));
  }

  SECTION("map under a facts key") {
    FactMap facts = load_facts_from_string("facts:\n  cgpa: 2.0\n");
    REQUIRE(facts.size() == 1);
    CHECK(facts.at("cgpa") == Value(2.0));
  }

  SECTION("empty document") {
    CHECK(load_facts_from_string("").empty());
  }

  SECTION("invalid shapes") {
    CHECK_THROWS_AS(load_facts_from_string("- 1\n- 2\n"), std::runtime_error);
    CHECK_THROWS_AS(load_facts_from_string("cgpa: [3.8]\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(load_facts_from_string("cgpa: {value: 3}\n"),
                    std::runtime_error);
  }
}

TEST_CASE("Advisor config and rule set selection", "[config]") {
  TempDir dir;

  SECTION("relative rules file resolves against the config directory") {
    dir.write("rules.yaml", kMeritRules);
    std::string cfg = dir.write("advisor.yaml", R"yaml(
rules:
  file: rules.yaml
  on_invalid: fail
diagnostics:
  log_comparison_faults: false
)yaml");

    AdvisorConfig config = load_config(cfg);
    REQUIRE(config.rules_path.has_value());
    CHECK(fs::equivalent(*config.rules_path, dir.path() / "rules.yaml"));
    CHECK(config.on_invalid_rules == InvalidRulesPolicy::Fail);
    CHECK_FALSE(config.log_comparison_faults);

    RuleSetSelection selection = select_rule_set(config);
    CHECK_FALSE(selection.fell_back);
    CHECK(selection.rules.size() == 2);
    CHECK(selection.source == *config.rules_path);
  }

  SECTION("empty config uses defaults and the built-in rule set") {
    AdvisorConfig config = load_config(dir.write("advisor.yaml", ""));
    CHECK_FALSE(config.rules_path.has_value());
    CHECK(config.on_invalid_rules == InvalidRulesPolicy::UseDefault);
    CHECK(config.log_comparison_faults);

    RuleSetSelection selection = select_rule_set(config);
    CHECK(selection.source == "built-in");
    CHECK(selection.rules.size() == default_rule_set().size());
    CHECK_FALSE(selection.fell_back);
  }

  SECTION("invalid rules fall back to the built-in set") {
    AdvisorConfig config;
    config.rules_path = dir.write("broken.yaml", "rules: {not: a list}\n");

    RuleSetSelection selection = select_rule_set(config);
    CHECK(selection.fell_back);
    CHECK(selection.source == "built-in");
    CHECK(selection.rules.size() == default_rule_set().size());
    CHECK(selection.error.find("[RULES]") != std::string::npos);
  }

  SECTION("invalid rules are fatal under on_invalid: fail") {
    AdvisorConfig config;
    config.rules_path = dir.write("broken.yaml", "- name: x\n  priority: high\n");
    config.on_invalid_rules = InvalidRulesPolicy::Fail;
    CHECK_THROWS_AS(select_rule_set(config), std::runtime_error);
  }

  SECTION("missing rules file falls back too") {
    AdvisorConfig config;
    config.rules_path = (dir.path() / "absent.yaml").string();
    CHECK(select_rule_set(config).fell_back);
  }

  SECTION("config validation errors") {
    CHECK_THROWS_AS(load_config(dir.write("a.yaml", "engine: {}\n")),
                    std::runtime_error);
    CHECK_THROWS_AS(load_config(dir.write("b.yaml", "rules: {path: x}\n")),
                    std::runtime_error);
    CHECK_THROWS_AS(
        load_config(dir.write("c.yaml", "rules: {on_invalid: ignore}\n")),
        std::runtime_error);
    CHECK_THROWS_AS(load_config(dir.write(
                        "d.yaml", "diagnostics: {log_comparison_faults: 7}\n")),
                    std::runtime_error);
    CHECK_THROWS_AS(load_config((dir.path() / "missing.yaml").string()),
                    std::runtime_error);
  }
}
