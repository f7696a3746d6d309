#include "toolsmith/observability/factory.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/observability/log_observer.hpp"
#include "toolsmith/observability/noop_observer.hpp"

namespace toolsmith::observability {

std::string resolve_backend(const std::string &configured) {
  const std::string backend = common::to_lower(common::trim(configured));
  if (backend == "none" || backend == "noop" || backend == "off") {
    return "none";
  }
  return "log";
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  if (resolve_backend(config.observability.backend) == "none") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace toolsmith::observability
