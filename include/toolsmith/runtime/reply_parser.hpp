#pragma once

#include "toolsmith/tools/tool.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolsmith::runtime {

struct ToolInvocation {
  std::string name;
  std::optional<std::string> argument;

  [[nodiscard]] std::vector<std::string> args() const;
};

/// First `[TOOL: name(arg)]` marker in `text`. The argument is trimmed and
/// unquoted; an empty argument means none. A marker without parentheses is a
/// zero-argument call.
[[nodiscard]] std::optional<ToolInvocation> parse_invocation(const std::string &text);

/// Fenced blocks tagged `tool` or `lua` that carry a `-- filename: <name>`
/// (or `// filename:`) line, in order of appearance. The source is the block body as written.
[[nodiscard]] std::vector<tools::ToolSource> extract_tool_definitions(const std::string &text);

} // namespace toolsmith::runtime
