#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolsmith/gateway/server.hpp"
#include "toolsmith/runtime/tool_runtime.hpp"

#include <chrono>
#include <cstring>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

using toolsmith::tests::require;
using toolsmith::testing::TempWorkspace;

int connect_localhost(std::uint16_t port) {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (connect(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(sock);
    return -1;
  }
  return sock;
}

std::string read_all(int sock) {
  std::string response;
  char buffer[1024] = {0};
  while (true) {
    const ssize_t n = recv(sock, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    response.append(buffer, static_cast<std::size_t>(n));
  }
  return response;
}

std::string http_roundtrip(std::uint16_t port, const std::string &request) {
  const int sock = connect_localhost(port);
  if (sock < 0) {
    return "";
  }
  send(sock, request.data(), request.size(), MSG_NOSIGNAL);
  std::string response = read_all(sock);
  close(sock);
  return response;
}

std::string http_get_localhost(std::uint16_t port, const std::string &path) {
  return http_roundtrip(port, "GET " + path +
                                  " HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
}

std::string http_post_localhost(std::uint16_t port, const std::string &path,
                                const std::string &body) {
  return http_roundtrip(port, "POST " + path + " HTTP/1.1\r\nHost: localhost\r\n"
                                               "Content-Type: application/json\r\n"
                                               "Content-Length: " +
                                  std::to_string(body.size()) +
                                  "\r\nConnection: close\r\n\r\n" + body);
}

} // namespace

void register_gateway_integration_tests(std::vector<toolsmith::tests::TestCase> &tests) {
  tests.push_back({"gateway_health_over_socket", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->create_tool("a", "function a() return 1 end").ok(), "create");
                     require(rt->start_server(0).ok(), "start");
                     require(rt->server_running() && rt->server_port() != 0, "ephemeral port");

                     const auto response = http_get_localhost(rt->server_port(), "/health");
                     require(response.find("200 OK") != std::string::npos, "status line");
                     require(response.find("{\"status\":\"ok\",\"tools\":1,\"pending\":0}") !=
                                 std::string::npos,
                             "health body: " + response);
                     rt->stop_server();
                     require(!rt->server_running(), "stopped");
                   }});

  tests.push_back({"gateway_share_lands_in_pending", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->start_server(0).ok(), "start");
                     const std::string body =
                         R"({"type":"tool_share","name":"echo_it","source":"function echo_it(x) return x end"})";
                     const auto first = http_post_localhost(rt->server_port(), "/message", body);
                     require(first.find("202 Accepted") != std::string::npos, "queued: " + first);
                     require(first.find("\"risk\":\"safe\"") != std::string::npos, "risk");

                     const auto second = http_post_localhost(rt->server_port(), "/message", body);
                     require(second.find("409") != std::string::npos, "duplicate conflict");

                     const auto pending = rt->list_pending();
                     require(pending.size() == 1 && pending[0].sender_id == "127.0.0.1",
                             "sender is the peer address");
                     require(rt->list_tools().empty(), "not live until approved");
                     rt->stop_server();
                   }});

  tests.push_back({"gateway_text_lands_in_inbox", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->start_server(0).ok(), "start");
                     const auto response = http_post_localhost(rt->server_port(), "/message",
                                                               R"({"message":"ping"})");
                     require(response.find("{\"status\":\"ok\",\"received\":\"ping\"}") !=
                                 std::string::npos,
                             "echo body: " + response);
                     const auto got = rt->inbox().wait_pop(std::chrono::milliseconds(2'000));
                     require(got.has_value() && got->content == "ping", "inbox");
                     rt->stop_server();
                   }});

  tests.push_back({"gateway_rejects_oversized_body", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->start_server(0).ok(), "start");
                     const std::string request = "POST /message HTTP/1.1\r\nHost: localhost\r\n"
                                                 "Content-Length: 70000\r\n\r\n";
                     const auto response = http_roundtrip(rt->server_port(), request);
                     require(response.find("413") != std::string::npos, "413: " + response);
                     rt->stop_server();
                   }});

  tests.push_back({"gateway_caps_concurrent_connections", [] {
                     TempWorkspace ws;
                     auto options = toolsmith::testing::runtime_options(ws);
                     options.gateway.max_connections = 1;
                     toolsmith::runtime::ToolRuntime rt(options);
                     require(rt.open().ok(), "open");
                     require(rt.start_server(0).ok(), "start");

                     const int holder = connect_localhost(rt.server_port());
                     require(holder >= 0, "first connection");
                     std::this_thread::sleep_for(std::chrono::milliseconds(100));
                     const auto refused = http_get_localhost(rt.server_port(), "/health");
                     require(refused.find("503") != std::string::npos, "503: " + refused);
                     close(holder);
                     rt.stop_server();
                   }});

  tests.push_back({"gateway_start_twice_fails", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->start_server(0).ok(), "start");
                     require(rt->start_server(0).code() ==
                                 toolsmith::common::ErrorCode::InvalidArgument,
                             "already running");
                     rt->stop_server();
                   }});
}
