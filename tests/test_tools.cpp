#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolsmith/tools/namespace.hpp"
#include "toolsmith/tools/registry.hpp"
#include "toolsmith/tools/store.hpp"
#include "toolsmith/tools/tool.hpp"

#include <atomic>
#include <thread>

namespace {

using toolsmith::tests::require;
namespace common = toolsmith::common;
namespace tools = toolsmith::tools;

tools::ToolSource tool(const std::string &name, const std::string &source,
                       tools::OriginKind origin = tools::OriginKind::Local) {
  return tools::ToolSource{name, source, origin};
}

} // namespace

void register_tools_tests(std::vector<toolsmith::tests::TestCase> &tests) {
  tests.push_back({"tool_name_validation", [] {
                     require(tools::validate_tool_name("word_count").ok(), "plain name");
                     require(tools::validate_tool_name("_x1").ok(), "underscore start");
                     const auto bad = {"", "1abc", "has-dash", "has space", "end", "local", "pairs",
                                       "print", "string"};
                     for (const auto *name : bad) {
                       const auto status = tools::validate_tool_name(name);
                       require(!status.ok(), std::string("should reject: ") + name);
                       require(status.code() == common::ErrorCode::InvalidArgument,
                               std::string("InvalidArgument for: ") + name);
                     }
                     require(!tools::validate_tool_name(std::string(65, 'a')).ok(),
                             "overlong name");
                   }});

  tests.push_back({"store_save_load_and_list_sorted", [] {
                     toolsmith::testing::TempWorkspace ws;
                     tools::ToolStore store(ws.path() / "tools");
                     require(store.ensure().ok(), "ensure");
                     require(store.save(tool("zeta", "function zeta() return 1 end")).ok(),
                             "save zeta");
                     require(store.save(tool("alpha", "function alpha() return 2 end")).ok(),
                             "save alpha");

                     const auto all = store.load_all();
                     require(all.ok() && all.value().size() == 2, "two tools");
                     require(all.value()[0].name == "alpha", "sorted by name");
                     require(store.path_for("alpha") == ws.path() / "tools" / "alpha.lua",
                             "path layout");
                     require(ws.read_file("tools/alpha.lua") == "function alpha() return 2 end",
                             "source written verbatim");
                     require(store.contains("zeta"), "contains");
                   }});

  tests.push_back({"store_overwrite_and_remove", [] {
                     toolsmith::testing::TempWorkspace ws;
                     tools::ToolStore store(ws.path() / "tools");
                     require(store.save(tool("t", "function t() return 1 end")).ok(), "first save");
                     require(store.save(tool("t", "function t() return 2 end")).ok(), "overwrite");
                     const auto loaded = store.load("t");
                     require(loaded.ok() && loaded.value().source == "function t() return 2 end",
                             "overwrite replaces source");

                     require(store.remove("t").ok(), "remove");
                     require(!store.contains("t"), "gone after remove");
                     const auto again = store.remove("t");
                     require(!again.ok() && again.code() == common::ErrorCode::NotFound,
                             "second remove is NotFound");
                     require(store.load("t").code() == common::ErrorCode::NotFound,
                             "load missing is NotFound");
                   }});

  tests.push_back({"store_tracks_remote_origin", [] {
                     toolsmith::testing::TempWorkspace ws;
                     {
                       tools::ToolStore store(ws.path() / "tools");
                       require(store.save(tool("shared", "function shared() return 1 end",
                                               tools::OriginKind::Remote))
                                   .ok(),
                               "save remote");
                       require(store.save(tool("mine", "function mine() return 1 end")).ok(),
                               "save local");
                     }
                     tools::ToolStore reopened(ws.path() / "tools");
                     const auto shared = reopened.load("shared");
                     require(shared.ok() && shared.value().origin == tools::OriginKind::Remote,
                             "remote origin survives reopen");
                     const auto mine = reopened.load("mine");
                     require(mine.ok() && mine.value().origin == tools::OriginKind::Local,
                             "local origin default");
                   }});

  tests.push_back({"store_skips_foreign_and_hidden_files", [] {
                     toolsmith::testing::TempWorkspace ws;
                     ws.create_file("tools/ok.lua", "function ok() return 1 end");
                     ws.create_file("tools/readme.md", "# notes");
                     ws.create_file("tools/.ok.lua.tmp-123", "partial");
                     ws.create_file("tools/bad-name.lua", "function x() return 1 end");
                     tools::ToolStore store(ws.path() / "tools");
                     const auto all = store.load_all();
                     require(all.ok(), "load_all should succeed");
                     require(all.value().size() == 1 && all.value()[0].name == "ok",
                             "only valid tool files are loaded");
                   }});

  tests.push_back({"store_missing_directory_is_empty", [] {
                     toolsmith::testing::TempWorkspace ws;
                     tools::ToolStore store(ws.path() / "does-not-exist");
                     const auto all = store.load_all();
                     require(all.ok() && all.value().empty(), "missing dir means no tools");
                   }});

  tests.push_back({"compile_unit_requires_single_matching_function", [] {
                     require(tools::compile_unit("inc", "function inc(x) return x + 1 end").ok(),
                             "valid unit");
                     const auto wrong_name =
                         tools::compile_unit("inc", "function other() return 1 end");
                     require(!wrong_name.ok() &&
                                 wrong_name.code() == common::ErrorCode::CompileError,
                             "function must match the tool name");
                     require(!tools::compile_unit(
                                  "inc", "function inc() return 1 end function helper() return 2 end")
                                  .ok(),
                             "extra global functions rejected");
                     require(tools::compile_unit(
                                 "inc", "local function helper() return 2 end\n"
                                        "function inc() return helper() end")
                                 .ok(),
                             "local helpers allowed");
                     require(!tools::compile_unit("inc", "").ok(), "empty source rejected");
                     require(!tools::compile_unit("inc", "function inc( end").ok(),
                             "syntax error rejected");
                   }});

  tests.push_back({"namespace_build_and_lookup", [] {
                     const auto ns = tools::Namespace::build(
                         {tool("a", "function a() return b() end"), tool("b", "function b() return 2 end")},
                         7);
                     require(ns.ok(), "build should succeed: " + ns.describe());
                     require(ns.value()->size() == 2, "size");
                     require(ns.value()->generation() == 7, "generation");
                     require(ns.value()->contains("a") && !ns.value()->contains("c"), "contains");
                     const auto found = ns.value()->find("b");
                     require(found.has_value() && found->source == "function b() return 2 end",
                             "find source");
                     require(ns.value()->names() == std::vector<std::string>({"a", "b"}),
                             "names sorted");
                   }});

  tests.push_back({"namespace_build_fails_as_a_whole", [] {
                     const auto ns = tools::Namespace::build(
                         {tool("good", "function good() return 1 end"),
                          tool("broken", "function broken( end")});
                     require(!ns.ok() && ns.code() == common::ErrorCode::CompileError,
                             "one bad tool fails the build");
                     require(ns.error().find("broken") != std::string::npos,
                             "error names the offending tool");
                   }});

  tests.push_back({"registry_execute_resolves_across_tools", [] {
                     tools::NamespaceRegistry registry;
                     require(registry.current() != nullptr, "empty namespace published at start");
                     const auto ns = registry.rebuild(
                         {tool("shout", "function shout(s) return s:upper() .. '!' end"),
                          tool("hello", "function hello(n) return shout('hi ' .. n) end")});
                     require(ns.ok(), "rebuild");
                     registry.publish(ns.value());
                     const auto out = registry.execute("hello", {"bob"}, nullptr);
                     require(out.ok() && out.value().as_string() == "HI BOB!",
                             "cross-tool call: " + out.describe());
                   }});

  tests.push_back({"registry_execute_errors", [] {
                     tools::NamespaceRegistry registry;
                     const auto ns = registry.rebuild(
                         {tool("none", "function none() return 1 end"),
                          tool("one", "function one(x) return x end")});
                     require(ns.ok(), "rebuild");
                     registry.publish(ns.value());

                     require(registry.execute("missing", {}, nullptr).code() ==
                                 common::ErrorCode::NotFound,
                             "missing tool");
                     require(registry.execute("none", {"x"}, nullptr).code() ==
                                 common::ErrorCode::ArityMismatch,
                             "extra argument");
                     require(registry.execute("one", {}, nullptr).code() ==
                                 common::ErrorCode::ArityMismatch,
                             "missing argument");
                     require(registry.execute("one", {"a", "b"}, nullptr).code() ==
                                 common::ErrorCode::ArityMismatch,
                             "two arguments");
                   }});

  tests.push_back({"registry_rebuild_does_not_publish", [] {
                     tools::NamespaceRegistry registry;
                     const auto first = registry.rebuild({tool("v", "function v() return 1 end")});
                     require(first.ok(), "first rebuild");
                     registry.publish(first.value());
                     const auto second = registry.rebuild({tool("v", "function v() return 2 end")});
                     require(second.ok(), "second rebuild");
                     require(registry.execute("v", {}, nullptr).value().as_int() == 1,
                             "unpublished snapshot is invisible");
                     registry.publish(second.value());
                     require(registry.execute("v", {}, nullptr).value().as_int() == 2,
                             "published snapshot is live");
                     require(second.value()->generation() > first.value()->generation(),
                             "generations increase");
                   }});

  tests.push_back({"registry_old_snapshot_survives_swap", [] {
                     tools::NamespaceRegistry registry;
                     const auto first = registry.rebuild({tool("v", "function v() return 1 end")});
                     registry.publish(first.value());
                     const auto held = registry.current();
                     registry.publish(registry.rebuild({}).value());
                     require(held->contains("v"), "held snapshot is unaffected by publish");
                     require(!registry.current()->contains("v"), "current has no tools");
                   }});

  tests.push_back({"registry_concurrent_execute_during_publish", [] {
                     tools::NamespaceRegistry registry;
                     registry.publish(
                         registry.rebuild({tool("v", "function v() return 1 end")}).value());
                     std::atomic<bool> stop{false};
                     std::atomic<int> bad{0};
                     std::thread reader([&] {
                       while (!stop.load()) {
                         const auto out = registry.execute("v", {}, nullptr);
                         if (!out.ok() || (out.value().as_int() != 1 && out.value().as_int() != 2)) {
                           bad.fetch_add(1);
                         }
                       }
                     });
                     {
                       toolsmith::testing::StopAndJoin guard(stop, reader);
                       for (int i = 0; i < 50; ++i) {
                         const std::string body =
                             i % 2 == 0 ? "function v() return 2 end" : "function v() return 1 end";
                         registry.publish(registry.rebuild({tool("v", body)}).value());
                       }
                     }
                     require(bad.load() == 0, "readers only ever see complete snapshots");
                   }});
}
