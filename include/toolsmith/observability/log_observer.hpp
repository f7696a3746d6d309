#pragma once

#include "toolsmith/observability/observer.hpp"

#include <ostream>

namespace toolsmith::observability {

/// Writes one "[LEVEL] message" line per event, to stderr unless another stream is given.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &stream);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ostream &stream_;
};

} // namespace toolsmith::observability
