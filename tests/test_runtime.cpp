#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolsmith/cli/commands.hpp"
#include "toolsmith/runtime/tool_runtime.hpp"
#include "toolsmith/security/classifier.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace {

using toolsmith::tests::require;
namespace common = toolsmith::common;
namespace runtime = toolsmith::runtime;
namespace security = toolsmith::security;
using toolsmith::testing::TempWorkspace;

bool contains_name(const std::vector<std::string> &names, const std::string &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

void register_runtime_tests(std::vector<toolsmith::tests::TestCase> &tests) {
  tests.push_back({"runtime_create_then_inspect_is_byte_exact", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const std::string source =
                         "-- counts words\nfunction word_count(s)\n\tlocal n = 0\n"
                         "\tfor _ in s:gmatch('%S+') do n = n + 1 end\n\treturn n\nend\n\n";
                     require(rt->create_tool("word_count", source).ok(), "create");
                     const auto inspected = rt->inspect_tool("word_count");
                     require(inspected.ok() && inspected.value() == source, "byte-for-byte");
                     require(ws.read_file("tools/word_count.lua") == source, "stored verbatim");
                     const auto out = rt->execute("word_count", {"one two three"});
                     require(out.ok() && out.value().to_display() == "3", "executes");
                   }});

  tests.push_back({"runtime_tools_compose", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->create_tool("tool_a", "function tool_a(x) return x .. '_A' end").ok(),
                             "a");
                     require(rt->create_tool("tool_b",
                                             "function tool_b(x) return tool_a(x) .. '_B' end")
                                 .ok(),
                             "b");
                     const auto out = rt->execute("tool_b", {"test"});
                     require(out.ok() && out.value().as_string() == "test_A_B",
                             "composition: " + out.describe());
                   }});

  tests.push_back({"runtime_overwrite_loses_history", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const std::string v1 =
                         "function sq(x) return tonumber(x) * tonumber(x) end";
                     const std::string v2 =
                         "function sq(x) return tonumber(x) + tonumber(x) end";
                     require(rt->create_tool("sq", v1).ok(), "v1");
                     require(rt->execute("sq", {"5"}).value().as_int() == 25, "v1 behavior");
                     require(rt->create_tool("sq", v2).ok(), "v2");
                     require(rt->inspect_tool("sq").value() == v2, "only v2 remains");
                     require(rt->execute("sq", {"5"}).value().as_int() == 10, "v2 behavior");
                     require(rt->list_tools().size() == 1, "still one tool");
                   }});

  tests.push_back({"runtime_remove_makes_tool_unreachable", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->create_tool("t", "function t(x) return x end").ok(), "create");
                     require(rt->remove_tool("t").ok(), "remove");
                     require(!contains_name(rt->list_tools(), "t"), "not listed");
                     require(rt->inspect_tool("t").code() == common::ErrorCode::NotFound,
                             "inspect NotFound");
                     require(rt->execute("t", {"x"}).code() == common::ErrorCode::NotFound,
                             "execute NotFound");
                     require(rt->remove_tool("t").code() == common::ErrorCode::NotFound,
                             "second remove NotFound");
                   }});

  tests.push_back({"runtime_remove_keeps_file_when_rest_fails_to_compile", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const std::string a = "function a() return 'a' end";
                     require(rt->create_tool("a", a).ok(), "create a");
                     require(rt->create_tool("b", "function b() return 'b' end").ok(), "create b");
                     ws.create_file("tools/b.lua", "function b( end");

                     const auto removed = rt->remove_tool("a");
                     require(!removed.ok() && removed.code() == common::ErrorCode::CompileError,
                             "remove should fail while another tool is broken");
                     require(std::filesystem::exists(ws.path() / "tools" / "a.lua"),
                             "a.lua still on disk");
                     require(ws.read_file("tools/a.lua") == a, "a.lua unchanged");
                     require(rt->inspect_tool("a").ok(), "a still inspectable");
                     require(rt->execute("a").value().as_string() == "a", "a still runs");
                   }});

  tests.push_back({"runtime_compile_error_leaves_state_untouched", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const std::string good = "function t() return 1 end";
                     require(rt->create_tool("t", good).ok(), "create good");
                     const auto bad = rt->create_tool("t", "function t() return 1 + end");
                     require(!bad.ok() && bad.code() == common::ErrorCode::CompileError,
                             "CompileError");
                     require(rt->inspect_tool("t").value() == good, "namespace unchanged");
                     require(ws.read_file("tools/t.lua") == good, "disk unchanged");

                     const auto mismatched = rt->create_tool("u", "function other() return 1 end");
                     require(!mismatched.ok() &&
                                 mismatched.code() == common::ErrorCode::CompileError,
                             "function name must match");
                     require(!std::filesystem::exists(ws.path() / "tools" / "u.lua"),
                             "nothing written for a failed create");
                   }});

  tests.push_back({"runtime_rejects_reserved_names", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     for (const std::string name : {"read_file", "print", "while", "bad-name"}) {
                       const auto status = rt->create_tool(name, "function x() return 1 end");
                       require(!status.ok() && status.code() == common::ErrorCode::InvalidArgument,
                               "reserved name should be rejected: " + name);
                     }
                   }});

  tests.push_back({"runtime_execute_arity_and_runtime_errors", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->create_tool("zero", "function zero() return 0 end").ok(), "zero");
                     require(rt->create_tool("boom", "function boom(x) return tonumber(x) // 0 end")
                                 .ok(),
                             "boom");
                     require(rt->execute("zero", {"x"}).code() == common::ErrorCode::ArityMismatch,
                             "extra argument");
                     const auto failed = rt->execute("boom", {"4"});
                     require(!failed.ok() && failed.code() == common::ErrorCode::RuntimeError,
                             "integer division by zero");
                     require(rt->execute("missing").code() == common::ErrorCode::NotFound,
                             "missing tool");
                   }});

  tests.push_back({"runtime_capability_fallback", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->create_tool("hello", "function hello() return \"hi\" end").ok(),
                             "create");
                     const auto listed = rt->execute("list_tools");
                     require(listed.ok() && listed.value().is_array(), "list_tools via execute");
                     require(listed.value().to_debug() == "[\"hello\"]",
                             "listing: " + listed.value().to_debug());
                     const auto inspected = rt->execute("inspect_tool", {"hello"});
                     require(inspected.ok() &&
                                 inspected.value().as_string() == "function hello() return \"hi\" end",
                             "inspect_tool via execute");
                     require(rt->execute("write_file", {"x"}).code() ==
                                 common::ErrorCode::ArityMismatch,
                             "two-argument capability cannot be invoked with one argument");
                   }});

  tests.push_back({"runtime_tools_call_capabilities", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const auto note = (ws.path() / "note.txt").string();
                     require(rt->create_tool("save", "function save(p) write_file(p, 'saved') "
                                                     "return read_file(p) end")
                                 .ok(),
                             "create");
                     const auto out = rt->execute("save", {note});
                     require(out.ok() && out.value().as_string() == "saved",
                             "round trip through capabilities: " + out.describe());

                     require(rt->create_tool("peek", "function peek(p) return read_file(p) end").ok(),
                             "peek");
                     const auto missing = rt->execute("peek", {(ws.path() / "nope").string()});
                     require(!missing.ok() && missing.code() == common::ErrorCode::RuntimeError,
                             "capability failure is a RuntimeError");
                     require(missing.error().find("read_file") != std::string::npos &&
                                 missing.error().find("IOError") != std::string::npos,
                             "message names capability and kind: " + missing.error());
                   }});

  tests.push_back({"runtime_open_loads_existing_store", [] {
                     TempWorkspace ws;
                     ws.create_file("tools/greet.lua", "function greet(n) return 'hi ' .. n end");
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->execute("greet", {"ann"}).value().as_string() == "hi ann",
                             "preexisting tool is live after open");
                   }});

  tests.push_back({"runtime_open_fails_on_broken_store", [] {
                     TempWorkspace ws;
                     ws.create_file("tools/bad.lua", "function bad( end");
                     runtime::ToolRuntime rt(toolsmith::testing::runtime_options(ws));
                     const auto opened = rt.open();
                     require(!opened.ok() && opened.code() == common::ErrorCode::CompileError,
                             "broken store fails open");
                     require(opened.error().find("bad") != std::string::npos, "names the tool");
                   }});

  tests.push_back({"runtime_open_rejects_capability_shadowing", [] {
                     TempWorkspace ws;
                     ws.create_file("tools/search.lua", "function search(q) return q end");
                     runtime::ToolRuntime rt(toolsmith::testing::runtime_options(ws));
                     require(rt.open().code() == common::ErrorCode::CompileError,
                             "a stored tool may not shadow a capability");
                   }});

  tests.push_back({"runtime_risk_monotonicity", [] {
                     const std::string arithmetic =
                         "function calc(x) return tonumber(x) * 2 + 1 end";
                     require(security::classify(arithmetic) == security::RiskLevel::Safe,
                             "arithmetic is safe");
                     const std::string mixed =
                         "function calc(x) local r = tonumber(x) * 2 local l = list_tools() "
                         "local s = read_file(x) write_file(x, r) return r end";
                     require(security::classify(mixed) == security::RiskLevel::HighRisk,
                             "write_file dominates lower risks");
                   }});

  tests.push_back({"runtime_approval_flow", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const auto queued =
                         rt->enqueue_proposal("t", "function t(x) return x .. x end", "peer1");
                     require(queued.ok(), "enqueue");
                     const auto pending = rt->list_pending();
                     require(pending.size() == 1 && pending[0].name == "t" &&
                                 pending[0].risk == security::RiskLevel::Safe,
                             "pending with risk");
                     require(!contains_name(rt->list_tools(), "t"), "not live before approval");
                     require(!std::filesystem::exists(ws.path() / "tools" / "t.lua"),
                             "not stored before approval");

                     require(rt->approve("t").ok(), "approve");
                     require(contains_name(rt->list_tools(), "t"), "live after approval");
                     require(rt->list_pending().empty(), "dequeued");
                     require(rt->execute("t", {"ab"}).value().as_string() == "abab", "runs");
                     require(rt->store().load("t").value().origin ==
                                 toolsmith::tools::OriginKind::Remote,
                             "approved tools are remote");
                     require(rt->approve("t").code() == common::ErrorCode::NotFound,
                             "second approve NotFound");
                   }});

  tests.push_back({"runtime_pending_listing_shows_description", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->enqueue_proposal("dbl", "function dbl(x) return x .. x end", "peer",
                                                  std::string("doubles its input"))
                                 .ok(),
                             "enqueue with description");
                     require(rt->enqueue_proposal("bare", "function bare() return 1 end", "peer").ok(),
                             "enqueue without description");
                     const auto pending = rt->list_pending();
                     require(pending.size() == 2, "two pending");
                     require(pending[0].description.value_or("") == "doubles its input",
                             "description kept on the proposal");
                     require(!pending[1].description.has_value(), "no description given");

                     const std::string listing = toolsmith::cli::format_pending(pending);
                     require(listing.find("dbl  risk=safe") != std::string::npos, "listing: " + listing);
                     require(listing.find("description=doubles its input") != std::string::npos,
                             "description shown: " + listing);
                     require(listing.find("description=", listing.find("bare")) == std::string::npos,
                             "no description field for bare");
                     require(toolsmith::cli::format_pending({}) == "No pending proposals.\n",
                             "empty listing");
                   }});

  tests.push_back({"runtime_failed_approval_stays_pending", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->enqueue_proposal("t", "function wrong() return 1 end", "peer").ok(),
                             "enqueue");
                     const auto approved = rt->approve("t", std::string("peer"));
                     require(!approved.ok() && approved.code() == common::ErrorCode::CompileError,
                             "compile error on approval");
                     require(rt->list_pending().size() == 1, "still pending");
                     require(rt->reject("t", std::string("peer")).ok(), "reject");
                     require(rt->list_pending().empty(), "rejected");
                   }});

  tests.push_back({"runtime_enqueue_rejects_capability_names", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const auto queued = rt->enqueue_proposal(
                         "write_file", "function write_file() return 1 end", "peer");
                     require(!queued.ok() && queued.code() == common::ErrorCode::InvalidArgument,
                             "capability names cannot be proposed");
                   }});

  tests.push_back({"runtime_atomic_rebuild_under_concurrency", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     require(rt->create_tool("stable", "function stable(x) return x .. '!' end").ok(),
                             "stable");
                     std::atomic<bool> stop{false};
                     std::atomic<int> failures{0};
                     std::atomic<int> calls{0};
                     std::thread reader([&] {
                       while (!stop.load()) {
                         const auto out = rt->execute("stable", {"ok"});
                         if (!out.ok() || out.value().as_string() != "ok!") {
                           failures.fetch_add(1);
                         }
                         calls.fetch_add(1);
                       }
                     });
                     {
                       toolsmith::testing::StopAndJoin guard(stop, reader);
                       for (int i = 0; i < 40; ++i) {
                         const std::string name = "extra_" + std::to_string(i);
                         require(rt->create_tool(name, "function " + name + "() return " +
                                                           std::to_string(i) + " end")
                                     .ok(),
                                 "create " + name);
                       }
                     }
                     require(calls.load() > 0, "reader ran");
                     require(failures.load() == 0, "reader never saw a broken namespace");
                     require(rt->list_tools().size() == 41, "all tools present");
                   }});

  tests.push_back({"runtime_inbox_receives_text", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     rt->receive_text("hello", "127.0.0.1");
                     const auto messages = rt->drain_inbox();
                     require(messages.size() == 1 && messages[0].content == "hello" &&
                                 messages[0].sender == "127.0.0.1",
                             "inbox");
                     require(rt->drain_inbox().empty(), "drained");
                   }});

  tests.push_back({"runtime_lists_capabilities", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     std::vector<std::string> names;
                     for (const auto &spec : rt->capabilities()) {
                       names.push_back(spec.name);
                     }
                     for (const std::string expected :
                          {"list_tools", "inspect_tool", "remove_tool", "read_file", "write_file",
                           "search", "scrape_url", "clone_agent", "send_message", "start_server"}) {
                       require(contains_name(names, expected), "missing capability " + expected);
                     }
                   }});

  tests.push_back({"runtime_share_tool_requires_local_tool", [] {
                     TempWorkspace ws;
                     auto rt = toolsmith::testing::open_runtime(ws);
                     const auto shared = rt->share_tool("127.0.0.1:1", "absent");
                     require(!shared.ok() && shared.code() == common::ErrorCode::NotFound,
                             "unknown tool is NotFound before any network use");
                   }});
}
