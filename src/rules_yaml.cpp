#include "rules_yaml.hpp"

namespace rule_advisor {

void emit_value(YAML::Emitter &out, const Value &value) {
  if (value.kind() == Value::Kind::Text) {
    out << YAML::DoubleQuoted << value.as_text();
  } else {
    out << value.to_string();
  }
}

void emit_rule(YAML::Emitter &out, const Rule &rule) {
  out << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << rule.name;
  out << YAML::Key << "priority" << YAML::Value << rule.priority;

  out << YAML::Key << "conditions" << YAML::Value << YAML::BeginSeq;
  for (const auto &cond : rule.conditions) {
    out << YAML::Flow << YAML::BeginSeq;
    // A malformed condition has no triple to write back
    if (cond.well_formed) {
      out << cond.field << YAML::DoubleQuoted << cond.symbol;
      emit_value(out, cond.value);
    }
    out << YAML::EndSeq;
  }
  out << YAML::EndSeq;

  if (rule.action) {
    out << YAML::Key << "action" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "decision" << YAML::Value << rule.action->decision;
    out << YAML::Key << "reason" << YAML::Value << rule.action->reason;
    out << YAML::EndMap;
  }

  out << YAML::EndMap;
}

std::string emit_rule_set_yaml(const RuleSet &rules) {
  YAML::Emitter emitter;
  emitter << YAML::BeginMap;
  emitter << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
  for (const auto &rule : rules) {
    emit_rule(emitter, rule);
  }
  emitter << YAML::EndSeq;
  emitter << YAML::EndMap;
  return emitter.c_str();
}

} // namespace rule_advisor
