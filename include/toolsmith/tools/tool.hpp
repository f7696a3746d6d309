#pragma once

#include "toolsmith/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace toolsmith::tools {

enum class OriginKind { Local, Remote };

[[nodiscard]] std::string_view origin_to_string(OriginKind origin);
[[nodiscard]] std::optional<OriginKind> origin_from_string(std::string_view text);

struct ToolSource {
  std::string name;
  std::string source;
  OriginKind origin = OriginKind::Local;
};

inline constexpr std::string_view kToolFileExtension = ".lua";
inline constexpr std::size_t kMaxToolNameLength = 64;

/// Identifier syntax, length, and no collision with Lua keywords or sandbox globals.
/// Fails InvalidArgument.
[[nodiscard]] common::Status validate_tool_name(const std::string &name);

} // namespace toolsmith::tools
