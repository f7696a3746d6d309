#include "toolsmith/observability/global.hpp"

#include <mutex>

namespace toolsmith::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

// Events arrive from gateway threads too; hold a reference so a concurrent
// set_global_observer cannot destroy the observer mid-call.
void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tool_created(const std::string &tool, const std::string &origin) {
  record_event(ToolCreatedEvent{.tool = tool, .origin = origin});
}

void record_tool_removed(const std::string &tool) { record_event(ToolRemovedEvent{.tool = tool}); }

void record_tool_executed(const std::string &tool, std::chrono::milliseconds duration,
                          const bool success) {
  record_event(ToolExecutedEvent{.tool = tool, .duration = duration, .success = success});
}

void record_namespace_rebuilt(const std::size_t tool_count, std::chrono::milliseconds duration) {
  record_event(NamespaceRebuiltEvent{.tool_count = tool_count, .duration = duration});
}

void record_proposal_queued(const std::string &tool, const std::string &sender,
                            const std::string &risk) {
  record_event(ProposalQueuedEvent{.tool = tool, .sender = sender, .risk = risk});
}

void record_proposal_decided(const std::string &tool, const std::string &sender,
                             const bool approved) {
  record_event(ProposalDecidedEvent{.tool = tool, .sender = sender, .approved = approved});
}

void record_peer_message(const std::string &peer, const std::string &kind) {
  record_event(PeerMessageEvent{.peer = peer, .kind = kind});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace toolsmith::observability
