#include "toolsmith/tools/registry.hpp"

namespace toolsmith::tools {

NamespaceRegistry::NamespaceRegistry(const script::ExecutionLimits limits) : limits_(limits) {
  auto empty = Namespace::build({}, 0, limits_);
  current_ = empty.value();
}

common::Result<std::shared_ptr<const Namespace>>
NamespaceRegistry::rebuild(const std::vector<ToolSource> &sources) {
  return Namespace::build(sources, next_generation_.fetch_add(1), limits_);
}

void NamespaceRegistry::publish(std::shared_ptr<const Namespace> ns) {
  if (ns == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(publish_mutex_);
  current_ = std::move(ns);
}

std::shared_ptr<const Namespace> NamespaceRegistry::current() const {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  return current_;
}

common::Result<script::Value> NamespaceRegistry::execute(const std::string &name,
                                                         const std::vector<std::string> &args,
                                                         script::ICapabilityHost *host) const {
  using ResultT = common::Result<script::Value>;

  // Pin one snapshot for the whole call, including nested tool-to-tool calls.
  const auto ns = current();
  const auto &functions = ns->functions();
  const auto it = functions.find(name);
  if (it == functions.end()) {
    return ResultT::failure(common::ErrorCode::NotFound, "tool not found: " + name);
  }
  if (args.size() > 1) {
    return ResultT::failure(common::ErrorCode::ArityMismatch,
                            "tools take at most one argument, got " +
                                std::to_string(args.size()));
  }
  const auto expected = static_cast<std::size_t>(it->second.params);
  if (args.size() < expected || (args.size() > expected && !it->second.vararg)) {
    return ResultT::failure(common::ErrorCode::ArityMismatch,
                            "tool '" + name + "' takes " + std::to_string(expected) +
                                " argument(s), got " + std::to_string(args.size()));
  }

  std::vector<script::Value> values;
  values.reserve(args.size());
  for (const auto &arg : args) {
    values.push_back(script::Value::string(arg));
  }

  script::Interpreter interpreter(functions, host, limits_);
  return interpreter.call(name, values);
}

} // namespace toolsmith::tools
