#include "toolsmith/gateway/protocol.hpp"

#include "toolsmith/common/json_util.hpp"

namespace toolsmith::gateway {

namespace {

std::string first_of(const common::JsonFlatMap &fields, const char *primary,
                     const char *fallback) {
  if (const auto it = fields.find(primary); it != fields.end()) {
    return it->second;
  }
  if (const auto it = fields.find(fallback); it != fields.end()) {
    return it->second;
  }
  return "";
}

bool has_field(const common::JsonFlatMap &fields, const char *key) {
  return fields.find(key) != fields.end();
}

common::Result<PeerMessage> parse_share(const common::JsonFlatMap &fields) {
  PeerMessage message = make_tool_share(first_of(fields, "name", "tool"),
                                        first_of(fields, "source", "code"));
  if (message.name.empty()) {
    return common::Result<PeerMessage>::failure(common::ErrorCode::ParseError,
                                                "tool_share requires a name");
  }
  if (message.source.empty()) {
    return common::Result<PeerMessage>::failure(common::ErrorCode::ParseError,
                                                "tool_share requires a source");
  }
  if (const auto it = fields.find("description"); it != fields.end() && !it->second.empty()) {
    message.description = it->second;
  }
  return common::Result<PeerMessage>::success(std::move(message));
}

} // namespace

std::string_view peer_message_kind_to_string(const PeerMessageKind kind) {
  switch (kind) {
  case PeerMessageKind::Text:
    return "text";
  case PeerMessageKind::ToolShare:
    return "tool_share";
  case PeerMessageKind::ToolRequest:
    return "tool_request";
  }
  return "text";
}

PeerMessage make_text_message(std::string content) {
  PeerMessage message;
  message.kind = PeerMessageKind::Text;
  message.content = std::move(content);
  return message;
}

PeerMessage make_tool_share(std::string name, std::string source,
                            std::optional<std::string> description) {
  PeerMessage message;
  message.kind = PeerMessageKind::ToolShare;
  message.name = std::move(name);
  message.source = std::move(source);
  message.description = std::move(description);
  return message;
}

PeerMessage make_tool_request(std::string name) {
  PeerMessage message;
  message.kind = PeerMessageKind::ToolRequest;
  message.name = std::move(name);
  return message;
}

common::Result<PeerMessage> parse_peer_message(const std::string &body) {
  if (!common::json_is_object(body)) {
    return common::Result<PeerMessage>::success(make_text_message(body));
  }

  const auto fields = common::json_parse_flat(body);
  const auto type_it = fields.find("type");
  if (type_it == fields.end()) {
    // Untyped objects: a name plus code is a share, otherwise text.
    if (has_field(fields, "name") && (has_field(fields, "source") || has_field(fields, "code"))) {
      return parse_share(fields);
    }
    return common::Result<PeerMessage>::success(
        make_text_message(first_of(fields, "content", "message")));
  }

  const std::string &type = type_it->second;
  if (type == "text" || type == "message") {
    return common::Result<PeerMessage>::success(
        make_text_message(first_of(fields, "content", "message")));
  }
  if (type == "tool_share" || type == "share") {
    return parse_share(fields);
  }
  if (type == "tool_request" || type == "request") {
    PeerMessage message = make_tool_request(first_of(fields, "name", "tool"));
    if (message.name.empty()) {
      return common::Result<PeerMessage>::failure(common::ErrorCode::ParseError,
                                                  "tool_request requires a name");
    }
    return common::Result<PeerMessage>::success(std::move(message));
  }
  // Unknown types are still delivered as text.
  std::string content = first_of(fields, "content", "message");
  return common::Result<PeerMessage>::success(make_text_message(content.empty() ? body : content));
}

std::string serialize_peer_message(const PeerMessage &message) {
  std::string out = "{\"type\":";
  out += common::json_quote(std::string(peer_message_kind_to_string(message.kind)));
  switch (message.kind) {
  case PeerMessageKind::Text:
    out += ",\"content\":" + common::json_quote(message.content);
    break;
  case PeerMessageKind::ToolShare:
    out += ",\"name\":" + common::json_quote(message.name);
    out += ",\"source\":" + common::json_quote(message.source);
    if (message.description.has_value()) {
      out += ",\"description\":" + common::json_quote(*message.description);
    }
    break;
  case PeerMessageKind::ToolRequest:
    out += ",\"name\":" + common::json_quote(message.name);
    break;
  }
  out += "}";
  return out;
}

} // namespace toolsmith::gateway
