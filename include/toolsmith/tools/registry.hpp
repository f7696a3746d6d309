#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/script/interpreter.hpp"
#include "toolsmith/tools/namespace.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolsmith::tools {

/// Holds the one published Namespace. Rebuilds produce a new snapshot off to
/// the side; publish() swaps it in, and executions already holding the old
/// snapshot finish against it.
class NamespaceRegistry {
public:
  explicit NamespaceRegistry(script::ExecutionLimits limits = {});

  /// Compile a complete store snapshot without publishing it.
  [[nodiscard]] common::Result<std::shared_ptr<const Namespace>>
  rebuild(const std::vector<ToolSource> &sources);

  void publish(std::shared_ptr<const Namespace> ns);
  [[nodiscard]] std::shared_ptr<const Namespace> current() const;

  /// Run a tool with zero or one string argument against the current snapshot.
  /// Fails NotFound, ArityMismatch or RuntimeError.
  [[nodiscard]] common::Result<script::Value> execute(const std::string &name,
                                                      const std::vector<std::string> &args,
                                                      script::ICapabilityHost *host) const;

  [[nodiscard]] const script::ExecutionLimits &limits() const { return limits_; }

private:
  script::ExecutionLimits limits_;
  mutable std::mutex publish_mutex_;
  std::shared_ptr<const Namespace> current_;
  std::atomic<std::uint64_t> next_generation_{1};
};

} // namespace toolsmith::tools
