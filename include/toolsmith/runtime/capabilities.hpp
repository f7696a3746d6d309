#pragma once

#include "toolsmith/tools/capability.hpp"

namespace toolsmith::runtime {

class ToolRuntime;

/// Capabilities that operate on the runtime itself. They hold a reference to
/// the owning runtime and are registered by it.

class ListToolsCapability final : public tools::ICapability {
public:
  explicit ListToolsCapability(ToolRuntime &runtime) : runtime_(runtime) {}

  [[nodiscard]] std::string_view name() const override { return "list_tools"; }
  [[nodiscard]] std::string_view description() const override {
    return "Names of all tools, sorted";
  }
  [[nodiscard]] std::size_t arity() const override { return 0; }
  [[nodiscard]] common::Result<script::Value> execute(const tools::CapabilityArgs &args) override;

private:
  ToolRuntime &runtime_;
};

class InspectToolCapability final : public tools::ICapability {
public:
  explicit InspectToolCapability(ToolRuntime &runtime) : runtime_(runtime) {}

  [[nodiscard]] std::string_view name() const override { return "inspect_tool"; }
  [[nodiscard]] std::string_view description() const override {
    return "Source text of a tool";
  }
  [[nodiscard]] std::size_t arity() const override { return 1; }
  [[nodiscard]] common::Result<script::Value> execute(const tools::CapabilityArgs &args) override;

private:
  ToolRuntime &runtime_;
};

class RemoveToolCapability final : public tools::ICapability {
public:
  explicit RemoveToolCapability(ToolRuntime &runtime) : runtime_(runtime) {}

  [[nodiscard]] std::string_view name() const override { return "remove_tool"; }
  [[nodiscard]] std::string_view description() const override {
    return "Delete a tool and rebuild the namespace without it";
  }
  [[nodiscard]] std::size_t arity() const override { return 1; }
  [[nodiscard]] common::Result<script::Value> execute(const tools::CapabilityArgs &args) override;

private:
  ToolRuntime &runtime_;
};

class StartServerCapability final : public tools::ICapability {
public:
  explicit StartServerCapability(ToolRuntime &runtime) : runtime_(runtime) {}

  [[nodiscard]] std::string_view name() const override { return "start_server"; }
  [[nodiscard]] std::string_view description() const override {
    return "Start the peer gateway on a port";
  }
  [[nodiscard]] std::size_t arity() const override { return 1; }
  [[nodiscard]] common::Result<script::Value> execute(const tools::CapabilityArgs &args) override;

private:
  ToolRuntime &runtime_;
};

} // namespace toolsmith::runtime
