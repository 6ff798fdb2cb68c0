#include "operator_registry.hpp"

#include <array>

namespace rule_advisor {

namespace {

[[noreturn]] void incompatible(const char *symbol, const Value &lhs,
                               const Value &rhs) {
  throw IncompatibleComparison(std::string("cannot compare ") +
                               kind_name(lhs.kind()) + " " + symbol + " " +
                               kind_name(rhs.kind()));
}

bool numeric_equal(const Value &lhs, const Value &rhs) {
  if (lhs.kind() == Value::Kind::Integer &&
      rhs.kind() == Value::Kind::Integer) {
    return lhs.as_integer() == rhs.as_integer();
  }
  return lhs.as_number() == rhs.as_number();
}

bool numeric_less(const Value &lhs, const Value &rhs) {
  if (lhs.kind() == Value::Kind::Integer &&
      rhs.kind() == Value::Kind::Integer) {
    return lhs.as_integer() < rhs.as_integer();
  }
  return lhs.as_number() < rhs.as_number();
}

bool values_equal(const char *symbol, const Value &lhs, const Value &rhs) {
  if (lhs.is_number() && rhs.is_number()) {
    return numeric_equal(lhs, rhs);
  }
  if (lhs.kind() != rhs.kind()) {
    incompatible(symbol, lhs, rhs);
  }
  if (lhs.kind() == Value::Kind::Text) {
    return lhs.as_text() == rhs.as_text();
  }
  return lhs.as_boolean() == rhs.as_boolean();
}

// Strict ordering; only numbers and text are ordered
bool values_less(const char *symbol, const Value &lhs, const Value &rhs) {
  if (lhs.is_number() && rhs.is_number()) {
    return numeric_less(lhs, rhs);
  }
  if (lhs.kind() == Value::Kind::Text && rhs.kind() == Value::Kind::Text) {
    return lhs.as_text() < rhs.as_text();
  }
  incompatible(symbol, lhs, rhs);
}

bool cmp_eq(const Value &lhs, const Value &rhs) {
  return values_equal("==", lhs, rhs);
}

bool cmp_ne(const Value &lhs, const Value &rhs) {
  return !values_equal("!=", lhs, rhs);
}

bool cmp_gt(const Value &lhs, const Value &rhs) {
  return values_less(">", rhs, lhs);
}

// >= and <= are spelled out rather than negating < so NaN compares false
bool cmp_ge(const Value &lhs, const Value &rhs) {
  return values_less(">=", rhs, lhs) || values_equal(">=", lhs, rhs);
}

bool cmp_lt(const Value &lhs, const Value &rhs) {
  return values_less("<", lhs, rhs);
}

bool cmp_le(const Value &lhs, const Value &rhs) {
  return values_less("<=", lhs, rhs) || values_equal("<=", lhs, rhs);
}

struct RegistryEntry {
  Operator op;
  const char *symbol;
  Comparator fn;
};

constexpr std::array<RegistryEntry, 6> kRegistry = {{
    {Operator::Equal, "==", &cmp_eq},
    {Operator::NotEqual, "!=", &cmp_ne},
    {Operator::Greater, ">", &cmp_gt},
    {Operator::GreaterEqual, ">=", &cmp_ge},
    {Operator::Less, "<", &cmp_lt},
    {Operator::LessEqual, "<=", &cmp_le},
}};

const RegistryEntry &entry_for(Operator op) {
  for (const auto &entry : kRegistry) {
    if (entry.op == op) {
      return entry;
    }
  }
  // Every enumerator has a table row
  throw std::logic_error("operator missing from registry");
}

} // namespace

std::optional<Operator> find_operator(std::string_view symbol) {
  for (const auto &entry : kRegistry) {
    if (symbol == entry.symbol) {
      return entry.op;
    }
  }
  return std::nullopt;
}

const char *operator_symbol(Operator op) { return entry_for(op).symbol; }

Comparator comparator_for(Operator op) { return entry_for(op).fn; }

std::vector<std::string> registered_symbols() {
  std::vector<std::string> out;
  out.reserve(kRegistry.size());
  for (const auto &entry : kRegistry) {
    out.emplace_back(entry.symbol);
  }
  return out;
}

} // namespace rule_advisor
