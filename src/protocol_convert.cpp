#include "protocol_convert.hpp"

namespace protocol_convert {

using rule_advisor::Value;
namespace v1 = rule_advisor::v1;

std::optional<Value> from_wire(const v1::Scalar &scalar) {
  switch (scalar.kind_case()) {
  case v1::Scalar::kIntValue:
    return Value(static_cast<int64_t>(scalar.int_value()));
  case v1::Scalar::kDoubleValue:
    return Value(scalar.double_value());
  case v1::Scalar::kStringValue:
    return Value(scalar.string_value());
  case v1::Scalar::kBoolValue:
    return Value(scalar.bool_value());
  case v1::Scalar::KIND_NOT_SET:
    break;
  }
  return std::nullopt;
}

void to_wire(const Value &value, v1::Scalar *out) {
  switch (value.kind()) {
  case Value::Kind::Integer:
    out->set_int_value(value.as_integer());
    break;
  case Value::Kind::Real:
    out->set_double_value(value.as_real());
    break;
  case Value::Kind::Text:
    out->set_string_value(value.as_text());
    break;
  case Value::Kind::Boolean:
    out->set_bool_value(value.as_boolean());
    break;
  }
}

rule_advisor::Condition from_wire(const v1::Condition &cond) {
  if (!cond.malformed().empty()) {
    return rule_advisor::malformed_condition(cond.malformed());
  }

  std::optional<Value> value;
  if (cond.has_value()) {
    value = from_wire(cond.value());
  }
  if (!value) {
    return rule_advisor::malformed_condition("condition on '" + cond.field() +
                                             "' has no value");
  }
  return rule_advisor::make_condition(cond.field(), cond.op(), *value);
}

rule_advisor::Rule from_wire(const v1::Rule &rule) {
  rule_advisor::Rule out;
  out.name = rule.name().empty() ? "(unnamed)" : rule.name();
  out.priority = rule.priority();
  out.conditions.reserve(static_cast<size_t>(rule.conditions_size()));
  for (const auto &cond : rule.conditions()) {
    out.conditions.push_back(from_wire(cond));
  }
  if (rule.has_action()) {
    out.action =
        rule_advisor::Action{rule.action().decision(), rule.action().reason()};
  }
  return out;
}

void to_wire(const rule_advisor::Rule &rule, v1::Rule *out) {
  out->set_name(rule.name);
  out->set_priority(rule.priority);
  for (const auto &cond : rule.conditions) {
    auto *c = out->add_conditions();
    if (!cond.well_formed) {
      c->set_malformed(cond.symbol);
      continue;
    }
    c->set_field(cond.field);
    c->set_op(cond.symbol);
    to_wire(cond.value, c->mutable_value());
  }
  if (rule.action) {
    out->mutable_action()->set_decision(rule.action->decision);
    out->mutable_action()->set_reason(rule.action->reason);
  }
}

} // namespace protocol_convert
