#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/script/interpreter.hpp"
#include "toolsmith/script/value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolsmith::tools {

using CapabilityArgs = std::vector<std::string>;

struct CapabilitySpec {
  std::string name;
  std::string description;
  std::size_t arity = 0;
};

/// A native operation callable from tool scripts and directly by callers.
/// Arguments arrive as strings; script values are rendered with to_display().
class ICapability {
public:
  virtual ~ICapability() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::size_t arity() const = 0;
  [[nodiscard]] virtual common::Result<script::Value> execute(const CapabilityArgs &args) = 0;

  [[nodiscard]] CapabilitySpec spec() const;
};

/// Fixed set of capabilities, populated once before use and read-only afterwards.
class CapabilityRegistry final : public script::ICapabilityHost {
public:
  CapabilityRegistry() = default;

  void register_capability(std::unique_ptr<ICapability> capability);
  [[nodiscard]] ICapability *get(std::string_view name) const;
  [[nodiscard]] std::vector<CapabilitySpec> all_specs() const;

  /// Checks arity, then runs the capability. Fails NotFound or ArityMismatch.
  [[nodiscard]] common::Result<script::Value> invoke(const std::string &name,
                                                     const CapabilityArgs &args) const;

  [[nodiscard]] bool has_capability(const std::string &name) const;

  [[nodiscard]] std::vector<std::string> capability_names() const override;
  [[nodiscard]] common::Result<script::Value>
  invoke_capability(const std::string &name, const std::vector<script::Value> &args) override;

private:
  std::vector<std::unique_ptr<ICapability>> capabilities_;
  std::unordered_map<std::string, ICapability *> by_name_;
};

} // namespace toolsmith::tools
