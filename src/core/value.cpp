#include "value.hpp"

#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace rule_advisor {

Value::Kind Value::kind() const {
  switch (data_.index()) {
  case 0:
    return Kind::Integer;
  case 1:
    return Kind::Real;
  case 2:
    return Kind::Text;
  default:
    return Kind::Boolean;
  }
}

double Value::as_number() const {
  if (kind() == Kind::Integer) {
    return static_cast<double>(as_integer());
  }
  if (kind() == Kind::Real) {
    return as_real();
  }
  throw std::logic_error(std::string("value of kind ") + kind_name(kind()) +
                         " is not a number");
}

std::string Value::to_string() const {
  switch (kind()) {
  case Kind::Integer:
    return std::to_string(as_integer());
  case Kind::Real: {
    // Fewest digits that read back as the same double, always with a decimal
    // point so the kind stays visible (3.0 rather than 3)
    std::string s;
    for (int precision = 15;
         precision <= std::numeric_limits<double>::max_digits10; ++precision) {
      std::ostringstream out;
      out << std::setprecision(precision) << as_real();
      s = out.str();
      if (std::strtod(s.c_str(), nullptr) == as_real()) {
        break;
      }
    }
    if (s.find_first_of(".eEn") == std::string::npos) {
      s += ".0";
    }
    return s;
  }
  case Kind::Text: {
    std::string s = "\"";
    for (char c : as_text()) {
      switch (c) {
      case '"':
        s += "\\\"";
        break;
      case '\\':
        s += "\\\\";
        break;
      case '\n':
        s += "\\n";
        break;
      default:
        s += c;
      }
    }
    s += '"';
    return s;
  }
  case Kind::Boolean:
    return as_boolean() ? "true" : "false";
  }
  return "";
}

const char *kind_name(Value::Kind kind) {
  switch (kind) {
  case Value::Kind::Integer:
    return "integer";
  case Value::Kind::Real:
    return "real";
  case Value::Kind::Text:
    return "text";
  case Value::Kind::Boolean:
    return "boolean";
  }
  return "unknown";
}

} // namespace rule_advisor
