#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "value.hpp"

namespace rule_advisor {

// Comparison operators usable in a rule condition
enum class Operator { Equal, NotEqual, Greater, GreaterEqual, Less, LessEqual };

// Raised by a comparator when the operand kinds have no defined ordering or
// equality (e.g. text vs number, or ordering two booleans)
class IncompatibleComparison : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Pure binary predicate: fact value on the left, condition literal on the right
using Comparator = bool (*)(const Value &lhs, const Value &rhs);

// Look up an operator by its symbol ("==", "!=", ">", ">=", "<", "<=").
// Unknown symbols yield nullopt; that is not an error at this level.
std::optional<Operator> find_operator(std::string_view symbol);

const char *operator_symbol(Operator op);

// Comparator bound to an operator. The table is fixed at compile time and
// never mutated, so lookups are safe from any thread.
Comparator comparator_for(Operator op);

// All registered symbols in registry order
std::vector<std::string> registered_symbols();

} // namespace rule_advisor
