#include "toolsmith/runtime/app.hpp"

#include "toolsmith/config/config.hpp"
#include "toolsmith/observability/factory.hpp"
#include "toolsmith/observability/global.hpp"

namespace toolsmith::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    return common::Result<RuntimeContext>::failure(warnings.status());
  }
  RuntimeContext context(std::move(loaded.value()));
  context.warnings_ = std::move(warnings.value());
  return common::Result<RuntimeContext>::success(std::move(context));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::unique_ptr<ToolRuntime>> RuntimeContext::create_runtime() {
  using ResultT = common::Result<std::unique_ptr<ToolRuntime>>;
  observability::set_global_observer(observability::create_observer(config_));

  auto options = options_from_config(config_);
  if (!options.ok()) {
    return ResultT::failure(options.status());
  }
  auto runtime = std::make_unique<ToolRuntime>(std::move(options.value()));
  if (auto opened = runtime->open(); !opened.ok()) {
    observability::record_error("runtime", opened.describe());
    return ResultT::failure(opened);
  }
  return ResultT::success(std::move(runtime));
}

} // namespace toolsmith::runtime
