#pragma once

#include "toolsmith/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace toolsmith::gateway {

enum class PeerMessageKind {
  Text,
  ToolShare,
  ToolRequest,
};

[[nodiscard]] std::string_view peer_message_kind_to_string(PeerMessageKind kind);

/// Body of POST /message.
///   {"type":"text","content":"..."}                      (also {"message":"..."} or raw text)
///   {"type":"tool_share","name":"...","source":"...","description":"..."}
///                                                        ("code" accepted for "source")
///   {"type":"tool_request","name":"..."}
/// A share's "safety_level" is accepted but never trusted; risk is computed
/// by the receiver.
struct PeerMessage {
  PeerMessageKind kind = PeerMessageKind::Text;
  std::string content;
  std::string name;
  std::string source;
  std::optional<std::string> description;
};

/// A body that is not a JSON object, or an object of unknown type, is a text
/// message. Fails ParseError for a share/request missing its fields.
[[nodiscard]] common::Result<PeerMessage> parse_peer_message(const std::string &body);

[[nodiscard]] std::string serialize_peer_message(const PeerMessage &message);

[[nodiscard]] PeerMessage make_text_message(std::string content);
[[nodiscard]] PeerMessage make_tool_share(std::string name, std::string source,
                                          std::optional<std::string> description = std::nullopt);
[[nodiscard]] PeerMessage make_tool_request(std::string name);

} // namespace toolsmith::gateway
