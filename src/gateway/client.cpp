#include "toolsmith/gateway/client.hpp"

#include "toolsmith/common/fs.hpp"

namespace toolsmith::gateway {

std::string normalize_peer_url(const std::string &url) {
  std::string out = common::trim(url);
  if (out.empty()) {
    return out;
  }
  std::size_t authority = 0;
  const auto scheme = out.find("://");
  if (scheme == std::string::npos) {
    out = "http://" + out;
    authority = 7;
  } else {
    authority = scheme + 3;
  }
  if (out.find('/', authority) == std::string::npos) {
    out += "/message";
  }
  return out;
}

PeerClient::PeerClient(const std::uint64_t timeout_ms) : http_(timeout_ms) {}

common::Result<std::string> PeerClient::send_text(const std::string &url,
                                                  const std::string &text) const {
  return post(url, make_text_message(text));
}

common::Result<std::string>
PeerClient::share_tool(const std::string &url, const std::string &name, const std::string &source,
                       const std::optional<std::string> &description) const {
  return post(url, make_tool_share(name, source, description));
}

common::Result<std::string> PeerClient::request_tool(const std::string &url,
                                                     const std::string &name) const {
  return post(url, make_tool_request(name));
}

common::Result<std::string> PeerClient::post(const std::string &url,
                                             const PeerMessage &message) const {
  const std::string target = normalize_peer_url(url);
  if (target.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "peer url is empty");
  }
  const auto response = http_.post_json(target, serialize_peer_message(message));
  return common::response_body_or_error(response, target);
}

} // namespace toolsmith::gateway
