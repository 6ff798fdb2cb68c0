#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

#include "core/rule_types.hpp"

namespace rule_advisor {

// Emit a scalar so that parse_scalar() reads it back as the same kind:
// text is always double-quoted, reals always carry a decimal point
void emit_value(YAML::Emitter &out, const Value &value);

// Emit one rule as a map in the rules file schema
void emit_rule(YAML::Emitter &out, const Rule &rule);

// Render a rule set in the rules file schema ("rules:" sequence)
std::string emit_rule_set_yaml(const RuleSet &rules);

} // namespace rule_advisor
