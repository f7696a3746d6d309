#include "toolsmith/runtime/reply_parser.hpp"

#include "toolsmith/common/fs.hpp"

#include <array>
#include <sstream>

namespace toolsmith::runtime {

namespace {

constexpr std::string_view kMarker = "[TOOL:";
constexpr std::string_view kFence = "```";
constexpr std::array<std::string_view, 2> kFilenameTags = {{"-- filename:", "// filename:"}};

std::string unquote(std::string value) {
  if (value.size() >= 2) {
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' || first == '\'') && first == last) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

std::optional<std::string> filename_of(const std::string &body) {
  std::istringstream lines(body);
  std::string line;
  while (std::getline(lines, line)) {
    for (const auto tag : kFilenameTags) {
      const auto at = line.find(tag);
      if (at == std::string::npos) {
        continue;
      }
      std::string name = common::trim(line.substr(at + tag.size()));
      for (const std::string suffix : {".lua", ".tool"}) {
        if (common::ends_with(name, suffix)) {
          name.resize(name.size() - suffix.size());
          break;
        }
      }
      if (!name.empty()) {
        return name;
      }
    }
  }
  return std::nullopt;
}

} // namespace

std::vector<std::string> ToolInvocation::args() const {
  if (!argument.has_value()) {
    return {};
  }
  return {*argument};
}

std::optional<ToolInvocation> parse_invocation(const std::string &text) {
  const auto start = text.find(kMarker);
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const auto content_start = start + kMarker.size();
  const auto end = text.find(']', content_start);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  const std::string content = common::trim(text.substr(content_start, end - content_start));

  ToolInvocation invocation;
  const auto open = content.find('(');
  if (open == std::string::npos) {
    invocation.name = content;
  } else {
    invocation.name = common::trim(content.substr(0, open));
    const auto close = content.rfind(')');
    const std::size_t arg_end = (close == std::string::npos || close < open) ? content.size() : close;
    std::string argument = unquote(common::trim(content.substr(open + 1, arg_end - open - 1)));
    if (!argument.empty()) {
      invocation.argument = std::move(argument);
    }
  }
  if (invocation.name.empty()) {
    return std::nullopt;
  }
  return invocation;
}

std::vector<tools::ToolSource> extract_tool_definitions(const std::string &text) {
  std::vector<tools::ToolSource> out;
  std::size_t pos = 0;
  while (true) {
    const auto open = text.find(kFence, pos);
    if (open == std::string::npos) {
      break;
    }
    const auto line_end = text.find('\n', open);
    if (line_end == std::string::npos) {
      break;
    }
    const std::string tag =
        common::to_lower(common::trim(text.substr(open + kFence.size(), line_end - open - kFence.size())));
    const auto close = text.find(kFence, line_end + 1);
    if (close == std::string::npos) {
      break;
    }
    pos = close + kFence.size();

    if (tag != "tool" && tag != "lua") {
      continue;
    }
    const std::string body = text.substr(line_end + 1, close - line_end - 1);
    if (auto name = filename_of(body); name.has_value()) {
      out.push_back(tools::ToolSource{*name, body, tools::OriginKind::Local});
    }
  }
  return out;
}

} // namespace toolsmith::runtime
