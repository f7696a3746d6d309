#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/security/approval.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace toolsmith::gateway {

struct GatewayOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8080;
  bool allow_public_bind = false;
  std::size_t max_connections = 32;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  std::string peer_address;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

/// What the gateway hands inbound traffic to. Implemented by the runtime.
class IPeerEndpoint {
public:
  virtual ~IPeerEndpoint() = default;

  [[nodiscard]] virtual common::Result<security::PendingProposal>
  receive_tool_share(const std::string &name, const std::string &source,
                     const std::string &sender_id,
                     const std::optional<std::string> &description) = 0;
  [[nodiscard]] virtual common::Result<std::string> lookup_tool(const std::string &name) = 0;
  virtual void receive_text(const std::string &content, const std::string &sender_id) = 0;
  [[nodiscard]] virtual std::size_t tool_count() const = 0;
  [[nodiscard]] virtual std::size_t pending_count() const = 0;
};

[[nodiscard]] bool is_loopback_host(const std::string &host);
[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// Unauthenticated HTTP endpoint for peer agents: POST /message and GET /health.
class PeerGateway {
public:
  explicit PeerGateway(IPeerEndpoint &endpoint);
  ~PeerGateway();

  PeerGateway(const PeerGateway &) = delete;
  PeerGateway &operator=(const PeerGateway &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t active_connections() const;

  /// Route one parsed request to its handler; used by every connection.
  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse handle_health() const;
  [[nodiscard]] HttpResponse handle_message(const HttpRequest &request);

  void accept_loop();
  void handle_client(int client_fd, const std::string &peer_address);
  void release_connection();

  IPeerEndpoint &endpoint_;
  GatewayOptions options_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;

  mutable std::mutex connections_mutex_;
  std::condition_variable connections_cv_;
  std::size_t active_connections_ = 0;
};

} // namespace toolsmith::gateway
