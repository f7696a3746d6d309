#pragma once

#include "toolsmith/tools/capability.hpp"

#include <chrono>
#include <filesystem>
#include <vector>

namespace toolsmith::tools {

struct CloneSources {
  /// Empty means the running executable (/proc/self/exe).
  std::filesystem::path executable;
  std::filesystem::path tools_dir;
  /// Copied into the target root when present (config file, .env).
  std::vector<std::filesystem::path> optional_files;
};

/// Copy the executable, the tool store (as `<target>/tools`) and the optional
/// files into `target`. Fails IOError at the first failing step; whatever was
/// copied before that step stays on disk.
[[nodiscard]] common::Status clone_agent(const std::filesystem::path &target,
                                         const CloneSources &sources);

class CloneAgentCapability final : public ICapability {
public:
  CloneAgentCapability(CloneSources sources, std::chrono::milliseconds timeout);

  [[nodiscard]] std::string_view name() const override { return "clone_agent"; }
  [[nodiscard]] std::string_view description() const override {
    return "Copy this agent (executable, tools, config) into a directory";
  }
  [[nodiscard]] std::size_t arity() const override { return 1; }
  [[nodiscard]] common::Result<script::Value> execute(const CapabilityArgs &args) override;

private:
  CloneSources sources_;
  std::chrono::milliseconds timeout_;
};

} // namespace toolsmith::tools
