#include "toolsmith/runtime/capabilities.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/runtime/tool_runtime.hpp"

#include <limits>

namespace toolsmith::runtime {

namespace {

using ValueResult = common::Result<script::Value>;

} // namespace

ValueResult ListToolsCapability::execute(const tools::CapabilityArgs &) {
  script::Value::Array names;
  for (const auto &name : runtime_.list_tools()) {
    names.push_back(script::Value::string(name));
  }
  return ValueResult::success(script::Value::array(std::move(names)));
}

ValueResult InspectToolCapability::execute(const tools::CapabilityArgs &args) {
  auto source = runtime_.inspect_tool(common::trim(args.at(0)));
  if (!source.ok()) {
    return ValueResult::failure(source.status());
  }
  return ValueResult::success(script::Value::string(source.value()));
}

ValueResult RemoveToolCapability::execute(const tools::CapabilityArgs &args) {
  if (auto removed = runtime_.remove_tool(common::trim(args.at(0))); !removed.ok()) {
    return ValueResult::failure(removed);
  }
  return ValueResult::success(script::Value::unit());
}

ValueResult StartServerCapability::execute(const tools::CapabilityArgs &args) {
  const std::string text = common::trim(args.at(0));
  std::optional<std::uint16_t> port;
  if (!text.empty()) {
    try {
      std::size_t consumed = 0;
      const unsigned long parsed = std::stoul(text, &consumed);
      if (consumed != text.size() || parsed > std::numeric_limits<std::uint16_t>::max()) {
        return ValueResult::failure(common::ErrorCode::InvalidArgument, "invalid port: " + text);
      }
      port = static_cast<std::uint16_t>(parsed);
    } catch (const std::exception &) {
      return ValueResult::failure(common::ErrorCode::InvalidArgument, "invalid port: " + text);
    }
  }
  if (auto started = runtime_.start_server(port); !started.ok()) {
    return ValueResult::failure(started);
  }
  return ValueResult::success(script::Value::string(
      "peer gateway listening on " + runtime_.options().gateway.host + ":" +
      std::to_string(runtime_.server_port())));
}

} // namespace toolsmith::runtime
