#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolsmith/observability/factory.hpp"
#include "toolsmith/observability/global.hpp"
#include "toolsmith/observability/log_observer.hpp"
#include "toolsmith/observability/noop_observer.hpp"

#include <memory>
#include <mutex>
#include <sstream>

namespace {

using toolsmith::tests::require;
namespace observability = toolsmith::observability;

struct Recorded {
  std::mutex mutex;
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;
};

class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<Recorded> sink) : sink_(std::move(sink)) {}

  void record_event(const observability::ObserverEvent &event) override {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->events.push_back(event);
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<Recorded> sink_;
};

// Installs a recording observer for one test and puts the no-op one back.
class ObserverScope {
public:
  ObserverScope() : recorded(std::make_shared<Recorded>()) {
    observability::set_global_observer(std::make_unique<RecordingObserver>(recorded));
  }
  ~ObserverScope() {
    observability::set_global_observer(std::make_unique<observability::NoopObserver>());
  }

  template <typename T> std::size_t count() {
    std::lock_guard<std::mutex> lock(recorded->mutex);
    std::size_t n = 0;
    for (const auto &event : recorded->events) {
      n += std::holds_alternative<T>(event) ? 1 : 0;
    }
    return n;
  }

  std::shared_ptr<Recorded> recorded;
};

} // namespace

void register_observability_tests(std::vector<toolsmith::tests::TestCase> &tests) {
  tests.push_back({"log_observer_formats_lines", [] {
                     std::ostringstream out;
                     observability::LogObserver observer(out);
                     observer.record_event(observability::ToolCreatedEvent{"t", "local"});
                     observer.record_event(
                         observability::ProposalQueuedEvent{"p", "10.0.0.9", "high"});
                     observer.record_metric(observability::PendingProposalsMetric{3});
                     observer.flush();
                     const std::string text = out.str();
                     require(text.find("[INFO] tool.created name=t origin=local\n") !=
                                 std::string::npos,
                             "created line: " + text);
                     require(text.find("[WARN] proposal.queued name=p sender=10.0.0.9 risk=high") !=
                                 std::string::npos,
                             "queued line");
                     require(text.find("metric.pending_proposals=3") != std::string::npos,
                             "metric line");
                   }});

  tests.push_back({"observer_factory_selects_backend", [] {
                     toolsmith::config::Config cfg;
                     require(observability::create_observer(cfg)->name() == "log", "default log");
                     cfg.observability.backend = "None";
                     require(observability::create_observer(cfg)->name() == "noop", "none");
                     cfg.observability.backend = "something-else";
                     require(observability::create_observer(cfg)->name() == "log",
                             "unknown falls back to log");
                     require(observability::resolve_backend(" OFF ") == "none", "off disables");
                     require(observability::resolve_backend("") == "log", "empty means log");
                   }});

  tests.push_back({"runtime_emits_lifecycle_events", [] {
                     ObserverScope scope;
                     toolsmith::testing::TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->create_tool("t", "function t() return 1 end").ok(), "create");
                     require(rt->execute("t").ok(), "execute");
                     require(rt->remove_tool("t").ok(), "remove");
                     require(rt->enqueue_proposal("p", "function p() return 1 end", "peer").ok(), "enqueue");
                     require(rt->reject("p").ok(), "reject");

                     require(scope.count<observability::ToolCreatedEvent>() == 1, "created");
                     require(scope.count<observability::ToolExecutedEvent>() == 1, "executed");
                     require(scope.count<observability::ToolRemovedEvent>() == 1, "removed");
                     require(scope.count<observability::NamespaceRebuiltEvent>() >= 3,
                             "rebuilt on open, create and remove");
                     require(scope.count<observability::ProposalQueuedEvent>() == 1, "queued");
                     require(scope.count<observability::ProposalDecidedEvent>() == 1, "decided");
                   }});
}
