#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace toolsmith::observability {

struct ToolCreatedEvent {
  std::string tool;
  std::string origin;
};

struct ToolRemovedEvent {
  std::string tool;
};

struct ToolExecutedEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct NamespaceRebuiltEvent {
  std::size_t tool_count = 0;
  std::chrono::milliseconds duration{0};
};

struct ProposalQueuedEvent {
  std::string tool;
  std::string sender;
  std::string risk;
};

struct ProposalDecidedEvent {
  std::string tool;
  std::string sender;
  bool approved = false;
};

struct PeerMessageEvent {
  std::string peer;
  std::string kind;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ToolCreatedEvent, ToolRemovedEvent, ToolExecutedEvent, NamespaceRebuiltEvent,
                 ProposalQueuedEvent, ProposalDecidedEvent, PeerMessageEvent, ErrorEvent>;

struct PendingProposalsMetric {
  std::uint64_t depth = 0;
};

struct ActiveConnectionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<PendingProposalsMetric, ActiveConnectionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace toolsmith::observability
