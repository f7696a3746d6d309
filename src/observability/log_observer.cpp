#include "toolsmith/observability/log_observer.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace toolsmith::observability {

namespace {

std::mutex g_log_mutex;

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : stream_(std::cerr) {}

LogObserver::LogObserver(std::ostream &stream) : stream_(stream) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  stream_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ToolCreatedEvent>) {
          log_line("INFO", "tool.created name=" + evt.tool + " origin=" + evt.origin);
        } else if constexpr (std::is_same_v<T, ToolRemovedEvent>) {
          log_line("INFO", "tool.removed name=" + evt.tool);
        } else if constexpr (std::is_same_v<T, ToolExecutedEvent>) {
          log_line("DEBUG", "tool.executed name=" + evt.tool +
                                " duration_ms=" + std::to_string(evt.duration.count()) +
                                " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, NamespaceRebuiltEvent>) {
          log_line("DEBUG", "namespace.rebuilt tools=" + std::to_string(evt.tool_count) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ProposalQueuedEvent>) {
          log_line("WARN", "proposal.queued name=" + evt.tool + " sender=" + evt.sender +
                               " risk=" + evt.risk);
        } else if constexpr (std::is_same_v<T, ProposalDecidedEvent>) {
          log_line("INFO", std::string("proposal.") + (evt.approved ? "approved" : "rejected") +
                               " name=" + evt.tool + " sender=" + evt.sender);
        } else if constexpr (std::is_same_v<T, PeerMessageEvent>) {
          log_line("INFO", "peer.message peer=" + evt.peer + " kind=" + evt.kind);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PendingProposalsMetric>) {
          log_line("DEBUG", "metric.pending_proposals=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, ActiveConnectionsMetric>) {
          log_line("DEBUG", "metric.active_connections=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  stream_.flush();
}

} // namespace toolsmith::observability
