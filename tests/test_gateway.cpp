#include "test_framework.hpp"

#include "toolsmith/gateway/client.hpp"
#include "toolsmith/gateway/inbox.hpp"
#include "toolsmith/gateway/protocol.hpp"
#include "toolsmith/gateway/server.hpp"

#include <map>
#include <optional>
#include <thread>

namespace {

using toolsmith::tests::require;
namespace common = toolsmith::common;
namespace gateway = toolsmith::gateway;
namespace security = toolsmith::security;

class FakeEndpoint final : public gateway::IPeerEndpoint {
public:
  [[nodiscard]] common::Result<security::PendingProposal>
  receive_tool_share(const std::string &name, const std::string &source,
                     const std::string &sender_id,
                     const std::optional<std::string> &description) override {
    return queue.enqueue(name, source, sender_id, description);
  }

  [[nodiscard]] common::Result<std::string> lookup_tool(const std::string &name) override {
    const auto it = tools.find(name);
    if (it == tools.end()) {
      return common::Result<std::string>::failure(common::ErrorCode::NotFound, name);
    }
    return common::Result<std::string>::success(it->second);
  }

  void receive_text(const std::string &content, const std::string &sender_id) override {
    texts.push_back(sender_id + ":" + content);
  }

  [[nodiscard]] std::size_t tool_count() const override { return tools.size(); }
  [[nodiscard]] std::size_t pending_count() const override { return queue.size(); }

  security::ApprovalQueue queue;
  std::map<std::string, std::string> tools;
  std::vector<std::string> texts;
};

gateway::HttpRequest post_message(const std::string &body) {
  gateway::HttpRequest request;
  request.method = "POST";
  request.path = "/message";
  request.raw_path = "/message";
  request.body = body;
  request.peer_address = "10.1.2.3";
  return request;
}

} // namespace

void register_gateway_tests(std::vector<toolsmith::tests::TestCase> &tests) {
  tests.push_back({"protocol_parses_typed_messages", [] {
                     const auto text = gateway::parse_peer_message(R"({"type":"text","content":"hi"})");
                     require(text.ok() && text.value().kind == gateway::PeerMessageKind::Text &&
                                 text.value().content == "hi",
                             "typed text");

                     const auto share = gateway::parse_peer_message(
                         R"({"type":"tool_share","name":"t","source":"function t() return 1 end"})");
                     require(share.ok() && share.value().kind == gateway::PeerMessageKind::ToolShare,
                             "typed share");
                     require(share.value().source == "function t() return 1 end", "share source");

                     const auto request =
                         gateway::parse_peer_message(R"({"type":"tool_request","name":"t"})");
                     require(request.ok() &&
                                 request.value().kind == gateway::PeerMessageKind::ToolRequest,
                             "typed request");
                   }});

  tests.push_back({"protocol_accepts_loose_forms", [] {
                     const auto raw = gateway::parse_peer_message("just words");
                     require(raw.ok() && raw.value().kind == gateway::PeerMessageKind::Text &&
                                 raw.value().content == "just words",
                             "non-JSON body is text");

                     const auto untyped =
                         gateway::parse_peer_message(R"({"name":"t","code":"function t() return 1 end"})");
                     require(untyped.ok() &&
                                 untyped.value().kind == gateway::PeerMessageKind::ToolShare,
                             "name plus code is a share");

                     const auto message = gateway::parse_peer_message(R"({"message":"yo"})");
                     require(message.ok() && message.value().content == "yo", "message field");
                   }});

  tests.push_back({"protocol_rejects_incomplete_messages", [] {
                     require(gateway::parse_peer_message(R"({"type":"tool_share","name":"t"})")
                                     .code() == common::ErrorCode::ParseError,
                             "share without source");
                     require(gateway::parse_peer_message(R"({"type":"tool_request"})").code() ==
                                 common::ErrorCode::ParseError,
                             "request without name");
                   }});

  tests.push_back({"protocol_unknown_type_is_text", [] {
                     const auto with_content = gateway::parse_peer_message(
                         R"({"type":"teleport","content":"beam me up"})");
                     require(with_content.ok() &&
                                 with_content.value().kind == gateway::PeerMessageKind::Text &&
                                 with_content.value().content == "beam me up",
                             "content field is the text");

                     const std::string bare = R"({"type":"teleport"})";
                     const auto without_content = gateway::parse_peer_message(bare);
                     require(without_content.ok() &&
                                 without_content.value().kind == gateway::PeerMessageKind::Text &&
                                 without_content.value().content == bare,
                             "raw body is the text");
                   }});

  tests.push_back({"protocol_share_description_and_safety_level", [] {
                     const auto share = gateway::parse_peer_message(
                         R"({"type":"tool_share","name":"t","source":"function t() return 1 end",)"
                         R"("description":"returns one","safety_level":"safe"})");
                     require(share.ok(), "share parses");
                     require(share.value().description.has_value() &&
                                 *share.value().description == "returns one",
                             "description kept");

                     const auto plain = gateway::parse_peer_message(
                         R"({"type":"tool_share","name":"t","source":"function t() return 1 end",)"
                         R"("description":""})");
                     require(plain.ok() && !plain.value().description.has_value(),
                             "empty description is absent");

                     const auto wire = gateway::serialize_peer_message(gateway::make_tool_share(
                         "t", "function t() return 1 end", std::string("returns one")));
                     require(wire.find("\"description\":\"returns one\"") != std::string::npos,
                             "description serialized: " + wire);
                     const auto without = gateway::serialize_peer_message(
                         gateway::make_tool_share("t", "function t() return 1 end"));
                     require(without.find("description") == std::string::npos,
                             "absent description is omitted");
                   }});

  tests.push_back({"protocol_serialize_parses_back", [] {
                     const auto share =
                         gateway::make_tool_share("t", "function t()\n  return \"q\"\nend");
                     const auto wire = gateway::serialize_peer_message(share);
                     require(wire.find("\"type\":\"tool_share\"") != std::string::npos,
                             "type tag present");
                     const auto back = gateway::parse_peer_message(wire);
                     require(back.ok() && back.value().source == share.source,
                             "escaped source survives");
                   }});

  tests.push_back({"inbox_is_fifo_and_bounded", [] {
                     gateway::PeerInbox inbox(2);
                     inbox.push({"a", "1", {}});
                     inbox.push({"a", "2", {}});
                     inbox.push({"a", "3", {}});
                     require(inbox.size() == 2, "capacity respected");
                     require(inbox.dropped() == 1, "oldest dropped");
                     const auto first = inbox.pop();
                     require(first.has_value() && first->content == "2", "FIFO after drop");
                     const auto rest = inbox.drain();
                     require(rest.size() == 1 && rest[0].content == "3", "drain");
                     require(inbox.empty() && !inbox.pop().has_value(), "empty afterwards");
                   }});

  tests.push_back({"inbox_wait_pop_wakes_on_push", [] {
                     gateway::PeerInbox inbox;
                     require(!inbox.wait_pop(std::chrono::milliseconds(10)).has_value(),
                             "times out when empty");
                     std::thread producer([&] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                       inbox.push({"peer", "late", {}});
                     });
                     const auto got = inbox.wait_pop(std::chrono::milliseconds(2'000));
                     producer.join();
                     require(got.has_value() && got->content == "late", "woken by push");
                   }});

  tests.push_back({"client_normalizes_urls", [] {
                     require(gateway::normalize_peer_url("localhost:9000") ==
                                 "http://localhost:9000/message",
                             "scheme and path added");
                     require(gateway::normalize_peer_url("https://peer.example/api") ==
                                 "https://peer.example/api",
                             "explicit path kept");
                     require(gateway::normalize_peer_url("http://10.0.0.1:8080") ==
                                 "http://10.0.0.1:8080/message",
                             "path added to bare origin");
                     const gateway::PeerClient client(1'000);
                     require(client.send_text("", "x").code() == common::ErrorCode::InvalidArgument,
                             "empty url rejected");
                   }});

  tests.push_back({"http_request_parsing", [] {
                     const auto parsed = gateway::parse_http_request(
                         "POST /message?x=1 HTTP/1.1\r\nHost: a\r\nContent-Type: text/plain\r\n"
                         "\r\nhello");
                     require(parsed.ok(), "parse");
                     require(parsed.value().method == "POST", "method");
                     require(parsed.value().path == "/message", "query stripped");
                     require(parsed.value().headers.at("content-type") == "text/plain",
                             "headers lowercased");
                     require(parsed.value().body == "hello", "body");
                     require(!gateway::parse_http_request("GET / HTTP/1.1\r\n").ok(),
                             "incomplete head");
                   }});

  tests.push_back({"http_response_rendering", [] {
                     gateway::HttpResponse response;
                     response.status = 202;
                     response.body = "{}";
                     const auto text = gateway::render_http_response(response);
                     require(text.rfind("HTTP/1.1 202 Accepted\r\n", 0) == 0, "status line");
                     require(text.find("Content-Length: 2\r\n") != std::string::npos, "length");
                   }});

  tests.push_back({"loopback_detection", [] {
                     require(gateway::is_loopback_host("127.0.0.1"), "ipv4 loopback");
                     require(gateway::is_loopback_host("127.1.2.3"), "127/8");
                     require(gateway::is_loopback_host("LOCALHOST"), "localhost");
                     require(!gateway::is_loopback_host("0.0.0.0"), "wildcard is public");
                   }});

  tests.push_back({"gateway_refuses_public_bind", [] {
                     FakeEndpoint endpoint;
                     gateway::PeerGateway server(endpoint);
                     gateway::GatewayOptions options;
                     options.host = "0.0.0.0";
                     options.port = 0;
                     const auto started = server.start(options);
                     require(!started.ok() && started.code() == common::ErrorCode::InvalidArgument,
                             "public bind needs opt-in");
                     require(!server.is_running(), "not running");
                   }});

  tests.push_back({"dispatch_health_reports_counts", [] {
                     FakeEndpoint endpoint;
                     endpoint.tools["a"] = "function a() return 1 end";
                     gateway::PeerGateway server(endpoint);
                     gateway::HttpRequest request;
                     request.method = "GET";
                     request.path = "/health";
                     const auto response = server.dispatch(request);
                     require(response.status == 200, "health status");
                     require(response.body == "{\"status\":\"ok\",\"tools\":1,\"pending\":0}",
                             "health body: " + response.body);
                   }});

  tests.push_back({"dispatch_text_reaches_endpoint", [] {
                     FakeEndpoint endpoint;
                     gateway::PeerGateway server(endpoint);
                     const auto response =
                         server.dispatch(post_message(R"({"type":"text","content":"hey"})"));
                     require(response.status == 200, "text accepted");
                     require(endpoint.texts.size() == 1 && endpoint.texts[0] == "10.1.2.3:hey",
                             "sender is the peer address");
                   }});

  tests.push_back({"dispatch_share_queues_and_conflicts", [] {
                     FakeEndpoint endpoint;
                     gateway::PeerGateway server(endpoint);
                     const std::string body =
                         R"({"type":"tool_share","name":"peek","source":"function peek(p) return read_file(p) end"})";
                     const auto first = server.dispatch(post_message(body));
                     require(first.status == 202, "share queued");
                     require(first.body.find("\"risk\":\"medium\"") != std::string::npos,
                             "risk reported: " + first.body);
                     require(endpoint.pending_count() == 1, "one pending");

                     const auto second = server.dispatch(post_message(body));
                     require(second.status == 409, "duplicate is a conflict");
                     require(second.body.find("already_queued") != std::string::npos,
                             "conflict body");

                     const auto bad_name = server.dispatch(post_message(
                         R"({"type":"tool_share","name":"bad name","source":"function x() return 1 end"})"));
                     require(bad_name.status == 400, "invalid name is a bad request");
                   }});

  tests.push_back({"dispatch_share_keeps_description_not_safety_level", [] {
                     FakeEndpoint endpoint;
                     gateway::PeerGateway server(endpoint);
                     const auto response = server.dispatch(post_message(
                         R"({"type":"tool_share","name":"w","source":"function w(p) return )"
                         R"(write_file(p, 'x') end","description":"writes x","safety_level":"safe"})"));
                     require(response.status == 202, "share queued");
                     require(response.body.find("\"risk\":\"high\"") != std::string::npos,
                             "risk computed locally: " + response.body);
                     const auto pending = endpoint.queue.list_pending();
                     require(pending.size() == 1 && pending[0].description.has_value() &&
                                 *pending[0].description == "writes x",
                             "description queued with the proposal");
                     require(pending[0].risk == security::RiskLevel::HighRisk,
                             "sender's safety level ignored");
                   }});

  tests.push_back({"dispatch_tool_request", [] {
                     FakeEndpoint endpoint;
                     endpoint.tools["hello"] = "function hello() return \"hi\" end";
                     gateway::PeerGateway server(endpoint);
                     const auto found = server.dispatch(
                         post_message(R"({"type":"tool_request","name":"hello"})"));
                     require(found.status == 200, "found");
                     const std::string expected =
                         "\"source\":\"function hello() return \\\"hi\\\" end\"";
                     require(found.body.find(expected) != std::string::npos,
                             "source returned: " + found.body);
                     const auto missing = server.dispatch(
                         post_message(R"({"type":"tool_request","name":"nope"})"));
                     require(missing.status == 404, "unknown tool");
                   }});

  tests.push_back({"dispatch_routing_errors", [] {
                     FakeEndpoint endpoint;
                     gateway::PeerGateway server(endpoint);
                     gateway::HttpRequest get_message;
                     get_message.method = "GET";
                     get_message.path = "/message";
                     require(server.dispatch(get_message).status == 405, "wrong method");

                     gateway::HttpRequest other;
                     other.method = "GET";
                     other.path = "/admin";
                     require(server.dispatch(other).status == 404, "unknown path");

                     require(server.dispatch(post_message(R"({"type":"tool_request"})")).status ==
                                 400,
                             "malformed message");

                     const auto unknown = server.dispatch(post_message(R"({"type":"warp"})"));
                     require(unknown.status == 200, "unknown type is delivered as text");
                     require(endpoint.texts.size() == 1 &&
                                 endpoint.texts[0] == R"(10.1.2.3:{"type":"warp"})",
                             "raw body reaches the endpoint");
                   }});
}
