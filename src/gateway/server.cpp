#include "toolsmith/gateway/server.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/common/json_util.hpp"
#include "toolsmith/gateway/protocol.hpp"
#include "toolsmith/observability/global.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace toolsmith::gateway {

namespace {

constexpr std::size_t kMaxBodySize = 64 * 1024;
constexpr std::size_t kMaxHeaderSize = 8192;
constexpr int kListenBacklog = 64;
constexpr int kClientReadTimeoutSeconds = 10;

std::string status_text(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 202:
    return "Accepted";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "OK";
  }
}

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const auto it = request.headers.find(common::to_lower(key));
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

HttpResponse make_json_response(int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse make_error_response(int status, const std::string &error) {
  return make_json_response(status,
                            "{\"status\":\"error\",\"error\":" + common::json_quote(error) + "}");
}

void send_all(int fd, const std::string &text) {
  std::size_t sent = 0;
  while (sent < text.size()) {
    const ssize_t n = send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}

std::string address_to_string(const sockaddr_in &addr) {
  std::array<char, INET_ADDRSTRLEN> buf{};
  if (inet_ntop(AF_INET, &addr.sin_addr, buf.data(), buf.size()) == nullptr) {
    return "unknown";
  }
  return std::string(buf.data());
}

} // namespace

bool is_loopback_host(const std::string &host) {
  const std::string lowered = common::to_lower(common::trim(host));
  return lowered == "127.0.0.1" || lowered == "localhost" || lowered == "::1" ||
         lowered == "[::1]" || common::starts_with(lowered, "127.");
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::ParseError,
                                                "incomplete request");
  }

  const std::string headers_part = raw.substr(0, header_end);
  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::ParseError,
                                                "missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::ParseError,
                                                "invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  request.path = qpos == std::string::npos ? request.raw_path : request.raw_path.substr(0, qpos);
  return common::Result<HttpRequest>::success(std::move(request));
}

PeerGateway::PeerGateway(IPeerEndpoint &endpoint) : endpoint_(endpoint) {}

PeerGateway::~PeerGateway() { stop(); }

common::Status PeerGateway::start(const GatewayOptions &options) {
  if (running_) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "gateway already running");
  }
  if (!is_loopback_host(options.host) && !options.allow_public_bind) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "refusing public bind without allow_public_bind=true");
  }
  options_ = options;
  if (options_.max_connections == 0) {
    options_.max_connections = 1;
  }

  std::string host = common::to_lower(common::trim(options.host));
  if (host == "localhost") {
    host = "127.0.0.1";
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error(common::ErrorCode::NetworkError,
                                 "failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorCode::NetworkError, "bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorCode::NetworkError, "listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
}

void PeerGateway::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  // Client threads reference this object; wait for them to finish.
  std::unique_lock<std::mutex> lock(connections_mutex_);
  connections_cv_.wait(lock, [this]() { return active_connections_ == 0; });
}

std::uint16_t PeerGateway::port() const { return bound_port_; }

bool PeerGateway::is_running() const { return running_.load(); }

std::size_t PeerGateway::active_connections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return active_connections_;
}

HttpResponse PeerGateway::dispatch(const HttpRequest &request) {
  if (request.path == "/health") {
    if (request.method != "GET") {
      return make_error_response(405, "method_not_allowed");
    }
    return handle_health();
  }
  if (request.path == "/message") {
    if (request.method != "POST") {
      return make_error_response(405, "method_not_allowed");
    }
    return handle_message(request);
  }
  return make_error_response(404, "not_found");
}

HttpResponse PeerGateway::handle_health() const {
  return make_json_response(200, "{\"status\":\"ok\",\"tools\":" +
                                     std::to_string(endpoint_.tool_count()) +
                                     ",\"pending\":" + std::to_string(endpoint_.pending_count()) +
                                     "}");
}

HttpResponse PeerGateway::handle_message(const HttpRequest &request) {
  const std::string sender = request.peer_address.empty() ? "unknown" : request.peer_address;
  auto parsed = parse_peer_message(request.body);
  if (!parsed.ok()) {
    return make_error_response(400, parsed.error());
  }
  const PeerMessage &message = parsed.value();
  observability::record_peer_message(sender,
                                     std::string(peer_message_kind_to_string(message.kind)));

  switch (message.kind) {
  case PeerMessageKind::Text:
    endpoint_.receive_text(message.content, sender);
    return make_json_response(200, "{\"status\":\"ok\",\"received\":" +
                                       common::json_quote(message.content) + "}");
  case PeerMessageKind::ToolShare: {
    auto queued =
        endpoint_.receive_tool_share(message.name, message.source, sender, message.description);
    if (!queued.ok()) {
      switch (queued.code()) {
      case common::ErrorCode::AlreadyQueued:
        return make_error_response(409, "already_queued");
      case common::ErrorCode::InvalidArgument:
        return make_error_response(400, queued.error());
      default:
        return make_error_response(500, queued.error());
      }
    }
    const auto &proposal = queued.value();
    return make_json_response(
        202, "{\"status\":\"queued\",\"name\":" + common::json_quote(proposal.name) +
                 ",\"risk\":" +
                 common::json_quote(std::string(security::risk_level_to_string(proposal.risk))) +
                 "}");
  }
  case PeerMessageKind::ToolRequest: {
    auto source = endpoint_.lookup_tool(message.name);
    if (!source.ok()) {
      if (source.code() == common::ErrorCode::NotFound) {
        return make_error_response(404, "not_found");
      }
      return make_error_response(500, source.error());
    }
    return make_json_response(200, "{\"name\":" + common::json_quote(message.name) +
                                       ",\"source\":" + common::json_quote(source.value()) +
                                       "}");
  }
  }
  return make_error_response(400, "invalid_message");
}

void PeerGateway::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client =
        accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      if (active_connections_ >= options_.max_connections) {
        send_all(client,
                 render_http_response(make_error_response(503, "too_many_connections")));
        shutdown(client, SHUT_RDWR);
        close(client);
        continue;
      }
      ++active_connections_;
      observability::record_metric(
          observability::ActiveConnectionsMetric{static_cast<std::uint64_t>(active_connections_)});
    }

    const std::string peer = address_to_string(client_addr);
    std::thread([this, client, peer]() {
      handle_client(client, peer);
      shutdown(client, SHUT_RDWR);
      close(client);
      release_connection();
    }).detach();
  }
}

void PeerGateway::release_connection() {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  --active_connections_;
  observability::record_metric(observability::ActiveConnectionsMetric{static_cast<std::uint64_t>(active_connections_)});
  connections_cv_.notify_all();
}

void PeerGateway::handle_client(int client_fd, const std::string &peer_address) {
  timeval tv{};
  tv.tv_sec = kClientReadTimeoutSeconds;
  setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  bool header_parsed = false;
  while (raw.size() < (kMaxBodySize + kMaxHeaderSize)) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    const auto header_end = raw.find("\r\n\r\n");
    if (!header_parsed && header_end != std::string::npos) {
      header_parsed = true;
      auto parsed = parse_http_request(raw.substr(0, header_end + 4));
      if (parsed.ok()) {
        const std::string cl = header_lookup(parsed.value(), "content-length");
        if (!cl.empty()) {
          try {
            content_length = static_cast<std::size_t>(std::stoull(cl));
          } catch (const std::exception &) {
            content_length = 0;
          }
        }
      }
      if (content_length > kMaxBodySize) {
        send_all(client_fd, render_http_response(make_error_response(413, "request_too_large")));
        return;
      }
    }

    if (header_parsed && raw.size() >= header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  HttpResponse response;
  if (!parsed.ok()) {
    response = make_error_response(400, "invalid_request");
  } else if (parsed.value().body.size() > kMaxBodySize) {
    response = make_error_response(413, "request_too_large");
  } else {
    HttpRequest request = std::move(parsed.value());
    if (request.body.size() > content_length) {
      request.body.resize(content_length);
    }
    request.peer_address = peer_address;
    response = dispatch(request);
  }
  send_all(client_fd, render_http_response(response));
}

} // namespace toolsmith::gateway
