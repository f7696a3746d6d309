#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolsmith::script {

/// Dynamically typed script value. Arrays are shared and immutable; mutation
/// produces a new array.
class Value {
public:
  using Array = std::vector<Value>;
  using ArrayPtr = std::shared_ptr<const Array>;

  enum class Kind { Unit, Bool, Int, Float, String, Array };

  Value() = default;

  static Value unit() { return Value(); }
  static Value boolean(bool value);
  static Value integer(std::int64_t value);
  static Value floating(double value);
  static Value string(std::string value);
  static Value array(Array values);

  [[nodiscard]] Kind kind() const;
  [[nodiscard]] bool is_unit() const { return kind() == Kind::Unit; }
  [[nodiscard]] bool is_bool() const { return kind() == Kind::Bool; }
  [[nodiscard]] bool is_int() const { return kind() == Kind::Int; }
  [[nodiscard]] bool is_float() const { return kind() == Kind::Float; }
  [[nodiscard]] bool is_number() const { return is_int() || is_float(); }
  [[nodiscard]] bool is_string() const { return kind() == Kind::String; }
  [[nodiscard]] bool is_array() const { return kind() == Kind::Array; }

  [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
  [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
  [[nodiscard]] double as_float() const { return std::get<double>(data_); }
  /// Int or float widened to double.
  [[nodiscard]] double as_number() const;
  [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(data_); }
  [[nodiscard]] const Array &as_array() const;

  /// Script-level type name: "nil", "boolean", "integer", "float", "string", "table".
  [[nodiscard]] std::string_view type_name() const;

  /// Caller-visible text: strings unquoted, everything else as in to_debug().
  [[nodiscard]] std::string to_display() const;
  /// Strings quoted and escaped, arrays as ["a", 1].
  [[nodiscard]] std::string to_debug() const;

  [[nodiscard]] bool operator==(const Value &other) const;
  [[nodiscard]] bool operator!=(const Value &other) const { return !(*this == other); }

private:
  using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, ArrayPtr>;

  explicit Value(Storage data) : data_(std::move(data)) {}

  Storage data_;
};

[[nodiscard]] std::string format_float(double value);

} // namespace toolsmith::script
