#include "toolsmith/tools/tool.hpp"

#include "toolsmith/script/lua_state.hpp"

#include <cctype>

namespace toolsmith::tools {

std::string_view origin_to_string(const OriginKind origin) {
  return origin == OriginKind::Remote ? "remote" : "local";
}

std::optional<OriginKind> origin_from_string(const std::string_view text) {
  if (text == "local") {
    return OriginKind::Local;
  }
  if (text == "remote") {
    return OriginKind::Remote;
  }
  return std::nullopt;
}

common::Status validate_tool_name(const std::string &name) {
  if (name.empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "tool name is empty");
  }
  if (name.size() > kMaxToolNameLength) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "tool name exceeds " + std::to_string(kMaxToolNameLength) +
                                     " characters");
  }
  const auto first = static_cast<unsigned char>(name.front());
  if (!(std::isalpha(first) != 0 || name.front() == '_')) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "tool name must start with a letter or '_': " + name);
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "tool name may only contain letters, digits and '_': " + name);
    }
  }
  if (script::is_lua_keyword(name)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "tool name is a reserved keyword: " + name);
  }
  if (script::is_sandbox_global(name)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "tool name shadows a builtin global: " + name);
  }
  return common::Status::success();
}

} // namespace toolsmith::tools
