#include "toolsmith/script/value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace toolsmith::script {

namespace {

const Value::Array &empty_array() {
  static const Value::Array empty;
  return empty;
}

std::string quote(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace

Value Value::boolean(const bool value) { return Value(Storage(std::in_place_type<bool>, value)); }

Value Value::integer(const std::int64_t value) {
  return Value(Storage(std::in_place_type<std::int64_t>, value));
}

Value Value::floating(const double value) {
  return Value(Storage(std::in_place_type<double>, value));
}

Value Value::string(std::string value) {
  return Value(Storage(std::in_place_type<std::string>, std::move(value)));
}

Value Value::array(Array values) {
  return Value(Storage(std::in_place_type<ArrayPtr>, std::make_shared<const Array>(std::move(values))));
}

Value::Kind Value::kind() const { return static_cast<Kind>(data_.index()); }

double Value::as_number() const {
  if (is_int()) {
    return static_cast<double>(as_int());
  }
  return as_float();
}

const Value::Array &Value::as_array() const {
  const auto &ptr = std::get<ArrayPtr>(data_);
  return ptr != nullptr ? *ptr : empty_array();
}

std::string_view Value::type_name() const {
  switch (kind()) {
  case Kind::Unit:
    return "nil";
  case Kind::Bool:
    return "boolean";
  case Kind::Int:
    return "integer";
  case Kind::Float:
    return "float";
  case Kind::String:
    return "string";
  case Kind::Array:
    return "table";
  }
  return "unknown";
}

std::string Value::to_display() const {
  if (is_string()) {
    return as_string();
  }
  return to_debug();
}

std::string Value::to_debug() const {
  switch (kind()) {
  case Kind::Unit:
    return "nil";
  case Kind::Bool:
    return as_bool() ? "true" : "false";
  case Kind::Int:
    return std::to_string(as_int());
  case Kind::Float:
    return format_float(as_float());
  case Kind::String:
    return quote(as_string());
  case Kind::Array: {
    std::string out = "[";
    const auto &items = as_array();
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += items[i].to_debug();
    }
    out += "]";
    return out;
  }
  }
  return "nil";
}

bool Value::operator==(const Value &other) const {
  if (is_number() && other.is_number()) {
    if (is_int() && other.is_int()) {
      return as_int() == other.as_int();
    }
    return as_number() == other.as_number();
  }
  if (kind() != other.kind()) {
    return false;
  }
  switch (kind()) {
  case Kind::Unit:
    return true;
  case Kind::Bool:
    return as_bool() == other.as_bool();
  case Kind::String:
    return as_string() == other.as_string();
  case Kind::Array:
    return as_array() == other.as_array();
  default:
    return false;
  }
}

std::string format_float(const double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }
  std::ostringstream out;
  out << std::setprecision(15) << value;
  std::string text = out.str();
  if (text.find_first_of(".e") == std::string::npos) {
    text += ".0";
  }
  return text;
}

} // namespace toolsmith::script
