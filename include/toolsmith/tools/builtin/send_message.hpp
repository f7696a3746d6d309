#pragma once

#include "toolsmith/gateway/client.hpp"
#include "toolsmith/tools/capability.hpp"

#include <cstdint>

namespace toolsmith::tools {

/// POSTs a text message to a peer agent and returns the peer's response body.
class SendMessageCapability final : public ICapability {
public:
  explicit SendMessageCapability(std::uint64_t timeout_ms);

  [[nodiscard]] std::string_view name() const override { return "send_message"; }
  [[nodiscard]] std::string_view description() const override {
    return "Send a text message to a peer agent (url, message)";
  }
  [[nodiscard]] std::size_t arity() const override { return 2; }
  [[nodiscard]] common::Result<script::Value> execute(const CapabilityArgs &args) override;

private:
  gateway::PeerClient client_;
};

} // namespace toolsmith::tools
