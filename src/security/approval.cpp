#include "toolsmith/security/approval.hpp"

#include "toolsmith/observability/global.hpp"
#include "toolsmith/tools/tool.hpp"

#include <algorithm>

namespace toolsmith::security {

common::Result<PendingProposal>
ApprovalQueue::enqueue(const std::string &name, const std::string &source,
                       const std::string &sender_id,
                       const std::optional<std::string> &description) {
  if (auto valid = tools::validate_tool_name(name); !valid.ok()) {
    return common::Result<PendingProposal>::failure(valid);
  }

  PendingProposal proposal;
  proposal.name = name;
  proposal.source = source;
  proposal.sender_id = sender_id;
  proposal.description = description;
  proposal.risk = classify(source);
  proposal.received_at = std::chrono::system_clock::now();

  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool duplicate =
        std::any_of(entries_.begin(), entries_.end(), [&](const PendingProposal &entry) {
          return entry.name == name && entry.sender_id == sender_id;
        });
    if (duplicate) {
      return common::Result<PendingProposal>::failure(
          common::ErrorCode::AlreadyQueued,
          "proposal '" + name + "' from " + sender_id + " is already pending");
    }
    proposal.sequence = next_sequence_++;
    entries_.push_back(proposal);
    depth = entries_.size();
  }

  observability::record_proposal_queued(name, sender_id, risk_level_to_string(proposal.risk));
  observability::record_metric(observability::PendingProposalsMetric{depth});
  return common::Result<PendingProposal>::success(std::move(proposal));
}

std::vector<PendingProposal> ApprovalQueue::list_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::size_t ApprovalQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<PendingProposal>::const_iterator
ApprovalQueue::locate(const std::string &name, const std::optional<std::string> &sender_id) const {
  return std::find_if(entries_.begin(), entries_.end(), [&](const PendingProposal &entry) {
    return entry.name == name && (!sender_id.has_value() || entry.sender_id == *sender_id);
  });
}

std::string ApprovalQueue::describe_key(const std::string &name,
                                        const std::optional<std::string> &sender_id) {
  if (sender_id.has_value()) {
    return "'" + name + "' from " + *sender_id;
  }
  return "'" + name + "'";
}

common::Result<PendingProposal>
ApprovalQueue::find(const std::string &name, const std::optional<std::string> &sender_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = locate(name, sender_id);
  if (it == entries_.end()) {
    return common::Result<PendingProposal>::failure(
        common::ErrorCode::NotFound, "no pending proposal " + describe_key(name, sender_id));
  }
  return common::Result<PendingProposal>::success(*it);
}

common::Result<PendingProposal> ApprovalQueue::approve(const std::string &name,
                                                       const std::optional<std::string> &sender_id,
                                                       const AdmitFn &admit) {
  std::lock_guard<std::mutex> decision(decision_mutex_);
  auto proposal = find(name, sender_id);
  if (!proposal.ok()) {
    return proposal;
  }

  // Admission compiles and writes the store; keep the queue readable meanwhile.
  if (admit) {
    if (auto admitted = admit(proposal.value()); !admitted.ok()) {
      return common::Result<PendingProposal>::failure(admitted);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto sequence = proposal.value().sequence;
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [sequence](const PendingProposal &entry) {
                                    return entry.sequence == sequence;
                                  }),
                   entries_.end());
  }
  observability::record_proposal_decided(name, proposal.value().sender_id, true);
  return proposal;
}

common::Result<PendingProposal> ApprovalQueue::reject(const std::string &name,
                                                      const std::optional<std::string> &sender_id) {
  std::lock_guard<std::mutex> decision(decision_mutex_);
  PendingProposal removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = locate(name, sender_id);
    if (it == entries_.end()) {
      return common::Result<PendingProposal>::failure(
          common::ErrorCode::NotFound, "no pending proposal " + describe_key(name, sender_id));
    }
    removed = *it;
    entries_.erase(it);
  }
  observability::record_proposal_decided(name, removed.sender_id, false);
  return common::Result<PendingProposal>::success(std::move(removed));
}

} // namespace toolsmith::security
