#include "config.hpp"
#include "core/default_policy.hpp"
#include <filesystem>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>

namespace rule_advisor {

namespace fs = std::filesystem;

// Parse on_invalid policy from string
InvalidRulesPolicy parse_invalid_rules_policy(const std::string &policy_str) {
  if (policy_str == "use_default") {
    return InvalidRulesPolicy::UseDefault;
  } else if (policy_str == "fail") {
    return InvalidRulesPolicy::Fail;
  } else {
    throw std::runtime_error("Invalid rules.on_invalid: '" + policy_str +
                             "'. Valid values: use_default, fail");
  }
}

Value parse_scalar(const YAML::Node &node) {
  const std::string &scalar_val = node.Scalar();

  // Quoted scalars carry the non-specific "!" tag and are always text
  if (node.Tag() == "!") {
    return Value(scalar_val);
  }

  if (scalar_val == "true" || scalar_val == "false" || scalar_val == "True" ||
      scalar_val == "False" || scalar_val == "TRUE" || scalar_val == "FALSE") {
    return Value(node.as<bool>());
  }

  // Try int64 before double (no decimal point or exponent)
  if (scalar_val.find('.') == std::string::npos &&
      scalar_val.find('e') == std::string::npos &&
      scalar_val.find('E') == std::string::npos) {
    try {
      return Value(node.as<int64_t>());
    } catch (const YAML::BadConversion &) {
      // Not an integer literal; fall through to double
    }
  }

  try {
    return Value(node.as<double>());
  } catch (const YAML::BadConversion &) {
    return Value(scalar_val);
  }
}

static std::string rule_ref(std::size_t i) {
  return "rules[" + std::to_string(i) + "]";
}

static void warn_rules(const std::string &msg) {
  std::cerr << "[RULES] warning: " << msg << std::endl;
}

static Condition parse_condition(const YAML::Node &cond_node,
                                 const std::string &where) {
  if (!cond_node.IsSequence()) {
    warn_rules(where +
               ": condition must be a sequence [field, operator, value]; "
               "condition will never hold");
    return malformed_condition("condition is not a sequence");
  }

  if (cond_node.size() != 3) {
    warn_rules(where + ": expected [field, operator, value], got " +
               std::to_string(cond_node.size()) +
               " elements; condition will never hold");
    return malformed_condition(std::to_string(cond_node.size()) +
                               "-element condition");
  }

  for (std::size_t k = 0; k < cond_node.size(); ++k) {
    if (!cond_node[k].IsScalar()) {
      warn_rules(where + "[" + std::to_string(k) +
                 "]: condition elements must be scalars; condition will "
                 "never hold");
      return malformed_condition("non-scalar element " + std::to_string(k));
    }
  }

  Condition cond =
      make_condition(cond_node[0].as<std::string>(),
                     cond_node[1].as<std::string>(), parse_scalar(cond_node[2]));
  if (!cond.op) {
    warn_rules(where + ": unknown operator '" + cond.symbol +
               "'; condition will never hold");
  }
  return cond;
}

static Rule parse_rule(const YAML::Node &rule_node, std::size_t i) {
  if (!rule_node.IsMap()) {
    throw std::runtime_error("[RULES] Invalid " + rule_ref(i) +
                             ": entry must be a map");
  }

  static const std::set<std::string> kKnownKeys = {"name", "priority",
                                                   "conditions", "action"};
  for (const auto &kv : rule_node) {
    const std::string key = kv.first.as<std::string>();
    if (kKnownKeys.find(key) == kKnownKeys.end()) {
      throw std::runtime_error("[RULES] " + rule_ref(i) + ": unknown field '" +
                               key + "'");
    }
  }

  Rule rule;
  rule.name = "(unnamed)";

  if (rule_node["name"]) {
    if (!rule_node["name"].IsScalar()) {
      throw std::runtime_error("[RULES] " + rule_ref(i) +
                               ": 'name' must be a string");
    }
    rule.name = rule_node["name"].as<std::string>();
  }

  if (rule_node["priority"]) {
    const YAML::Node &prio = rule_node["priority"];
    if (!prio.IsScalar()) {
      throw std::runtime_error("[RULES] " + rule_ref(i) +
                               ": 'priority' must be an integer");
    }
    Value v = parse_scalar(prio);
    if (v.kind() != Value::Kind::Integer ||
        v.as_integer() < std::numeric_limits<int>::min() ||
        v.as_integer() > std::numeric_limits<int>::max()) {
      throw std::runtime_error("[RULES] " + rule_ref(i) +
                               ": 'priority' must be an integer");
    }
    rule.priority = static_cast<int>(v.as_integer());
  }

  if (rule_node["conditions"]) {
    const YAML::Node &conds = rule_node["conditions"];
    if (!conds.IsSequence()) {
      throw std::runtime_error("[RULES] " + rule_ref(i) +
                               ": 'conditions' must be a sequence");
    }
    for (std::size_t j = 0; j < conds.size(); ++j) {
      rule.conditions.push_back(parse_condition(
          conds[j], rule_ref(i) + ".conditions[" + std::to_string(j) + "]"));
    }
  }

  if (rule_node["action"]) {
    const YAML::Node &action_node = rule_node["action"];
    if (!action_node.IsMap()) {
      throw std::runtime_error("[RULES] " + rule_ref(i) +
                               ": 'action' must be a map");
    }
    Action action;
    if (action_node["decision"]) {
      action.decision = action_node["decision"].as<std::string>();
    }
    if (action_node["reason"]) {
      action.reason = action_node["reason"].as<std::string>();
    }
    if (!is_well_formed(action)) {
      warn_rules(rule_ref(i) + " ('" + rule.name +
                 "'): action has no decision");
    }
    rule.action = action;
  } else {
    warn_rules(rule_ref(i) + " ('" + rule.name + "'): no action defined");
  }

  return rule;
}

RuleSet parse_rule_set(const YAML::Node &root) {
  YAML::Node rules_node;
  if (root.IsSequence()) {
    rules_node = root;
  } else if (root.IsMap() && root["rules"]) {
    rules_node = root["rules"];
  } else {
    throw std::runtime_error(
        "[RULES] expected a sequence of rules or a map with a 'rules' "
        "sequence");
  }

  if (!rules_node.IsSequence()) {
    throw std::runtime_error("[RULES] 'rules' must be a sequence");
  }

  RuleSet rules;
  rules.reserve(rules_node.size());
  for (std::size_t i = 0; i < rules_node.size(); ++i) {
    try {
      rules.push_back(parse_rule(rules_node[i], i));
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("[RULES] Invalid " + rule_ref(i) + ": " +
                               e.what());
    }
  }
  return rules;
}

RuleSet load_rule_set(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load rules file '" + path +
                             "': " + e.what());
  }

  return parse_rule_set(yaml);
}

RuleSet load_rule_set_from_string(const std::string &text) {
  YAML::Node yaml;

  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[RULES] Failed to parse rules: " +
                             std::string(e.what()));
  }

  return parse_rule_set(yaml);
}

RuleSetSelection select_rule_set(const AdvisorConfig &config) {
  RuleSetSelection selection;

  if (!config.rules_path) {
    selection.rules = default_rule_set();
    selection.source = "built-in";
    return selection;
  }

  try {
    selection.rules = load_rule_set(*config.rules_path);
    selection.source = *config.rules_path;
  } catch (const std::exception &e) {
    if (config.on_invalid_rules == InvalidRulesPolicy::Fail) {
      throw;
    }
    std::cerr << "[RULES] warning: " << e.what()
              << "; using the built-in rule set" << std::endl;
    selection.rules = default_rule_set();
    selection.source = "built-in";
    selection.fell_back = true;
    selection.error = e.what();
  }

  return selection;
}

FactMap parse_facts(const YAML::Node &root) {
  FactMap facts;
  if (!root || root.IsNull()) {
    return facts;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("[FACTS] facts must be a map of field: value");
  }

  YAML::Node facts_node = root;
  if (root["facts"] && root["facts"].IsMap()) {
    facts_node = root["facts"];
  }

  for (const auto &kv : facts_node) {
    const std::string field = kv.first.as<std::string>();
    if (!kv.second.IsScalar()) {
      throw std::runtime_error("[FACTS] fact '" + field +
                               "' must be a scalar value");
    }
    facts[field] = parse_scalar(kv.second);
  }
  return facts;
}

FactMap load_facts(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load facts file '" + path +
                             "': " + e.what());
  }

  return parse_facts(yaml);
}

FactMap load_facts_from_string(const std::string &text) {
  YAML::Node yaml;

  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[FACTS] Failed to parse facts: " +
                             std::string(e.what()));
  }

  return parse_facts(yaml);
}

AdvisorConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  AdvisorConfig config;
  config.config_file_path = fs::absolute(path).string();

  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] config root must be a map");
  }

  for (const auto &kv : yaml) {
    std::string key = kv.first.as<std::string>();
    if (key != "rules" && key != "diagnostics") {
      throw std::runtime_error("[CONFIG] unknown section '" + key +
                               "' (prevents silently ignored config)");
    }
  }

  // Parse rules section
  if (yaml["rules"]) {
    const YAML::Node &rules = yaml["rules"];
    if (!rules.IsMap()) {
      throw std::runtime_error("[CONFIG] 'rules' section must be a map");
    }

    for (const auto &kv : rules) {
      std::string key = kv.first.as<std::string>();
      if (key != "file" && key != "on_invalid") {
        throw std::runtime_error("[CONFIG] unknown key 'rules." + key +
                                 "' (prevents silently ignored config)");
      }
    }

    if (rules["file"]) {
      fs::path rules_path = rules["file"].as<std::string>();
      if (rules_path.is_relative()) {
        rules_path = fs::path(config.config_file_path).parent_path() / rules_path;
      }
      config.rules_path = rules_path.lexically_normal().string();
    }

    if (rules["on_invalid"]) {
      try {
        config.on_invalid_rules =
            parse_invalid_rules_policy(rules["on_invalid"].as<std::string>());
      } catch (const std::exception &e) {
        throw std::runtime_error("[CONFIG] " + std::string(e.what()));
      }
    }
  }

  // Parse diagnostics section
  if (yaml["diagnostics"]) {
    const YAML::Node &diagnostics = yaml["diagnostics"];
    if (!diagnostics.IsMap()) {
      throw std::runtime_error("[CONFIG] 'diagnostics' section must be a map");
    }

    for (const auto &kv : diagnostics) {
      std::string key = kv.first.as<std::string>();
      if (key != "log_comparison_faults") {
        throw std::runtime_error("[CONFIG] unknown key 'diagnostics." + key +
                                 "' (prevents silently ignored config)");
      }
    }

    if (diagnostics["log_comparison_faults"]) {
      try {
        config.log_comparison_faults =
            diagnostics["log_comparison_faults"].as<bool>();
      } catch (const YAML::Exception &) {
        throw std::runtime_error(
            "[CONFIG] diagnostics.log_comparison_faults must be a boolean");
      }
    }
  }

  return config;
}

} // namespace rule_advisor
