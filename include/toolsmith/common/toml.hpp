#pragma once

#include "toolsmith/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace toolsmith::common {

/// One `key = value` assignment; `raw` is the unparsed right-hand side.
struct TomlEntry {
  std::string raw;
  std::size_t line = 0;
};

/// Flat view of a TOML document: section keys are joined with '.' ("gateway.port").
/// Typed reads return the fallback when the key is absent and a ParseError when the
/// value has the wrong shape.
class TomlDocument {
public:
  void set(std::string key, TomlEntry entry);

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::size_t size() const { return entries_.size(); }

  [[nodiscard]] Result<std::string> string_or(const std::string &key,
                                              const std::string &fallback) const;
  [[nodiscard]] Result<bool> bool_or(const std::string &key, bool fallback) const;
  [[nodiscard]] Result<std::uint64_t> u64_or(const std::string &key,
                                             std::uint64_t fallback) const;

private:
  [[nodiscard]] const TomlEntry *find(const std::string &key) const;

  std::unordered_map<std::string, TomlEntry> entries_;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace toolsmith::common
