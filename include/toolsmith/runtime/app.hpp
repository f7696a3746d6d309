#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/config/schema.hpp"
#include "toolsmith/runtime/tool_runtime.hpp"

#include <memory>
#include <string>
#include <vector>

namespace toolsmith::runtime {

/// Loaded configuration plus the steps that turn it into an opened runtime.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  /// Load and validate the config file (defaults when it does not exist).
  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

  /// Install the configured observer and open a runtime over the tool store.
  [[nodiscard]] common::Result<std::unique_ptr<ToolRuntime>> create_runtime();

private:
  config::Config config_;
  std::vector<std::string> warnings_;
};

} // namespace toolsmith::runtime
