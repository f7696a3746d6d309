#pragma once

#include <string>
#include <unordered_map>

namespace toolsmith::common {

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Top-level members of a JSON object. String members are unescaped; nested objects,
/// arrays and scalars keep their raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;

/// Parse the top level of a JSON object. Returns an empty map when the text is not an object.
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// True when the text (ignoring surrounding whitespace) is a balanced JSON object.
[[nodiscard]] bool json_is_object(const std::string &text);

} // namespace toolsmith::common
