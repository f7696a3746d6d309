#pragma once

#include "toolsmith/common/http.hpp"
#include "toolsmith/common/result.hpp"
#include "toolsmith/gateway/protocol.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace toolsmith::gateway {

/// "host:port" gains "http://"; a URL without a path gains "/message".
[[nodiscard]] std::string normalize_peer_url(const std::string &url);

/// Outbound side of the peer channel. Responses are returned as raw text.
class PeerClient {
public:
  explicit PeerClient(std::uint64_t timeout_ms = 15'000);

  [[nodiscard]] common::Result<std::string> send_text(const std::string &url,
                                                      const std::string &text) const;
  [[nodiscard]] common::Result<std::string>
  share_tool(const std::string &url, const std::string &name, const std::string &source,
             const std::optional<std::string> &description = std::nullopt) const;
  [[nodiscard]] common::Result<std::string> request_tool(const std::string &url,
                                                         const std::string &name) const;

private:
  [[nodiscard]] common::Result<std::string> post(const std::string &url,
                                                 const PeerMessage &message) const;

  common::HttpClient http_;
};

} // namespace toolsmith::gateway
