#include "toolsmith/tools/capability.hpp"

#include <algorithm>

namespace toolsmith::tools {

CapabilitySpec ICapability::spec() const {
  return CapabilitySpec{std::string(name()), std::string(description()), arity()};
}

void CapabilityRegistry::register_capability(std::unique_ptr<ICapability> capability) {
  if (capability == nullptr) {
    return;
  }
  ICapability *raw = capability.get();
  by_name_[std::string(raw->name())] = raw;
  capabilities_.push_back(std::move(capability));
}

ICapability *CapabilityRegistry::get(const std::string_view name) const {
  const auto it = by_name_.find(std::string(name));
  return it == by_name_.end() ? nullptr : it->second;
}

std::vector<CapabilitySpec> CapabilityRegistry::all_specs() const {
  std::vector<CapabilitySpec> specs;
  specs.reserve(capabilities_.size());
  for (const auto &capability : capabilities_) {
    specs.push_back(capability->spec());
  }
  std::sort(specs.begin(), specs.end(),
            [](const CapabilitySpec &a, const CapabilitySpec &b) { return a.name < b.name; });
  return specs;
}

common::Result<script::Value> CapabilityRegistry::invoke(const std::string &name,
                                                         const CapabilityArgs &args) const {
  ICapability *capability = get(name);
  if (capability == nullptr) {
    return common::Result<script::Value>::failure(common::ErrorCode::NotFound,
                                                  "capability not found: " + name);
  }
  if (args.size() != capability->arity()) {
    return common::Result<script::Value>::failure(
        common::ErrorCode::ArityMismatch,
        name + " takes " + std::to_string(capability->arity()) + " argument(s), got " +
            std::to_string(args.size()));
  }
  return capability->execute(args);
}

bool CapabilityRegistry::has_capability(const std::string &name) const {
  return by_name_.count(name) != 0;
}

std::vector<std::string> CapabilityRegistry::capability_names() const {
  std::vector<std::string> names;
  names.reserve(capabilities_.size());
  for (const auto &capability : capabilities_) {
    names.emplace_back(capability->name());
  }
  return names;
}

common::Result<script::Value>
CapabilityRegistry::invoke_capability(const std::string &name,
                                      const std::vector<script::Value> &args) {
  CapabilityArgs strings;
  strings.reserve(args.size());
  for (const auto &arg : args) {
    strings.push_back(arg.to_display());
  }
  return invoke(name, strings);
}

} // namespace toolsmith::tools
