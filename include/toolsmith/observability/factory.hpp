#pragma once

#include "toolsmith/config/schema.hpp"
#include "toolsmith/observability/observer.hpp"

#include <memory>
#include <string>

namespace toolsmith::observability {

/// Normalized backend name: "log" or "none". Unknown and empty names map to "log".
[[nodiscard]] std::string resolve_backend(const std::string &configured);

/// Builds the observer selected by observability.backend.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace toolsmith::observability
