#pragma once

#include "toolsmith/observability/observer.hpp"

#include <memory>

namespace toolsmith::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tool_created(const std::string &tool, const std::string &origin);
void record_tool_removed(const std::string &tool);
void record_tool_executed(const std::string &tool, std::chrono::milliseconds duration,
                          bool success);
void record_namespace_rebuilt(std::size_t tool_count, std::chrono::milliseconds duration);
void record_proposal_queued(const std::string &tool, const std::string &sender,
                            const std::string &risk);
void record_proposal_decided(const std::string &tool, const std::string &sender, bool approved);
void record_peer_message(const std::string &peer, const std::string &kind);
void record_error(const std::string &component, const std::string &message);

} // namespace toolsmith::observability
