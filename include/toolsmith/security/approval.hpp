#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/security/classifier.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolsmith::security {

struct PendingProposal {
  std::string name;
  std::string source;
  std::string sender_id;
  /// Sender's free-text summary, shown to the reviewer; never used for risk.
  std::optional<std::string> description;
  RiskLevel risk = RiskLevel::HighRisk;
  std::chrono::system_clock::time_point received_at;
  std::uint64_t sequence = 0;
};

/// Externally proposed tools waiting for a decision, keyed by (name, sender).
/// Risk is computed once at intake. Nothing here touches the tool store; an
/// approval hands the proposal to the caller's admit function.
class ApprovalQueue {
public:
  using AdmitFn = std::function<common::Status(const PendingProposal &)>;

  /// Classify and queue. Fails InvalidArgument for a bad tool name and
  /// AlreadyQueued when (name, sender) is pending.
  [[nodiscard]] common::Result<PendingProposal>
  enqueue(const std::string &name, const std::string &source, const std::string &sender_id,
          const std::optional<std::string> &description = std::nullopt);

  /// Pending proposals in arrival order.
  [[nodiscard]] std::vector<PendingProposal> list_pending() const;
  [[nodiscard]] std::size_t size() const;

  /// Earliest pending proposal for `name` (from `sender_id` when given).
  [[nodiscard]] common::Result<PendingProposal>
  find(const std::string &name, const std::optional<std::string> &sender_id = std::nullopt) const;

  /// Run `admit` on the matching proposal and dequeue it once admit succeeds.
  /// A failing admit leaves the proposal queued. Fails NotFound when nothing
  /// matches, including a second approval of the same proposal.
  [[nodiscard]] common::Result<PendingProposal> approve(const std::string &name,
                                                        const std::optional<std::string> &sender_id,
                                                        const AdmitFn &admit);

  /// Drop the matching proposal. Fails NotFound.
  [[nodiscard]] common::Result<PendingProposal>
  reject(const std::string &name, const std::optional<std::string> &sender_id = std::nullopt);

private:
  [[nodiscard]] std::vector<PendingProposal>::const_iterator
  locate(const std::string &name, const std::optional<std::string> &sender_id) const;
  [[nodiscard]] static std::string describe_key(const std::string &name,
                                                const std::optional<std::string> &sender_id);

  mutable std::mutex mutex_;
  // Serializes approve/reject so a proposal is decided exactly once.
  std::mutex decision_mutex_;
  std::vector<PendingProposal> entries_;
  std::uint64_t next_sequence_ = 1;
};

} // namespace toolsmith::security
