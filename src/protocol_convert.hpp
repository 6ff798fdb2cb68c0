#pragma once

#include <optional>

#include "core/rule_types.hpp"
#include "rule_advisor.pb.h"

namespace protocol_convert {

// nullopt when the scalar carries no value
std::optional<rule_advisor::Value>
from_wire(const rule_advisor::v1::Scalar &scalar);

void to_wire(const rule_advisor::Value &value, rule_advisor::v1::Scalar *out);

// A condition without a value becomes a malformed condition, so it fails
// safe like any other malformed entry
rule_advisor::Condition from_wire(const rule_advisor::v1::Condition &cond);

rule_advisor::Rule from_wire(const rule_advisor::v1::Rule &rule);

void to_wire(const rule_advisor::Rule &rule, rule_advisor::v1::Rule *out);

} // namespace protocol_convert
