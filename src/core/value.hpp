#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace rule_advisor {

// Scalar carried by a fact or by the literal side of a condition.
// Integer and Real are both numbers and compare numerically with each other.
class Value {
public:
  enum class Kind { Integer, Real, Text, Boolean };

  Value() : data_(int64_t{0}) {}
  explicit Value(int v) : data_(static_cast<int64_t>(v)) {}
  explicit Value(int64_t v) : data_(v) {}
  explicit Value(double v) : data_(v) {}
  explicit Value(bool v) : data_(v) {}
  explicit Value(std::string v) : data_(std::move(v)) {}
  explicit Value(const char *v) : data_(std::string(v)) {}

  Kind kind() const;
  bool is_number() const {
    return kind() == Kind::Integer || kind() == Kind::Real;
  }

  // Accessors throw std::bad_variant_access on a kind mismatch
  int64_t as_integer() const { return std::get<int64_t>(data_); }
  double as_real() const { return std::get<double>(data_); }
  const std::string &as_text() const { return std::get<std::string>(data_); }
  bool as_boolean() const { return std::get<bool>(data_); }

  // Numeric view of Integer or Real; throws std::logic_error otherwise
  double as_number() const;

  // Human-readable rendering for logs and reports
  std::string to_string() const;

  // Structural equality (same kind, same payload). This is not the
  // semantics of the "==" condition operator.
  bool operator==(const Value &other) const { return data_ == other.data_; }
  bool operator!=(const Value &other) const { return !(*this == other); }

private:
  std::variant<int64_t, double, std::string, bool> data_;
};

const char *kind_name(Value::Kind kind);

} // namespace rule_advisor
