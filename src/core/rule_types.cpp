#include "rule_types.hpp"

#include <utility>

namespace rule_advisor {

Condition make_condition(std::string field, std::string symbol, Value value) {
  Condition c;
  c.op = find_operator(symbol);
  c.field = std::move(field);
  c.symbol = std::move(symbol);
  c.value = std::move(value);
  return c;
}

Condition malformed_condition(std::string description) {
  Condition c;
  c.symbol = std::move(description);
  c.well_formed = false;
  return c;
}

std::string describe(const Condition &condition) {
  if (!condition.well_formed) {
    return "<malformed: " + condition.symbol + ">";
  }
  return condition.field + " " + condition.symbol + " " +
         condition.value.to_string();
}

} // namespace rule_advisor
