#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/config/schema.hpp"
#include "toolsmith/gateway/client.hpp"
#include "toolsmith/gateway/inbox.hpp"
#include "toolsmith/gateway/server.hpp"
#include "toolsmith/script/value.hpp"
#include "toolsmith/security/approval.hpp"
#include "toolsmith/tools/builtin/clone_agent.hpp"
#include "toolsmith/tools/capability.hpp"
#include "toolsmith/tools/registry.hpp"
#include "toolsmith/tools/store.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolsmith::runtime {

struct RuntimeOptions {
  std::filesystem::path tools_dir;
  std::chrono::milliseconds io_timeout{10'000};
  std::uint64_t http_timeout_ms = 15'000;
  std::size_t scrape_max_words = 200;
  script::ExecutionLimits limits;
  gateway::GatewayOptions gateway;
  /// Extra files clone_agent carries along (config file, .env).
  std::vector<std::filesystem::path> clone_files;
  /// Executable clone_agent copies; empty means the running binary.
  std::filesystem::path executable;
};

/// Resolve the runtime options a config describes (tool dir against the config dir).
[[nodiscard]] common::Result<RuntimeOptions> options_from_config(const config::Config &config);

/// The tool runtime: store, namespace registry, approval queue, native
/// capabilities and the optional peer gateway behind one facade.
///
/// create/remove/approve and proposal intake are serialized by one write lock.
/// execute, list and inspect read the last published namespace and never wait
/// for a rebuild.
class ToolRuntime final : public gateway::IPeerEndpoint {
public:
  explicit ToolRuntime(RuntimeOptions options);
  ~ToolRuntime() override;

  ToolRuntime(const ToolRuntime &) = delete;
  ToolRuntime &operator=(const ToolRuntime &) = delete;

  /// Load the store and publish its namespace. Any tool that fails to compile
  /// fails the whole open with CompileError.
  [[nodiscard]] common::Status open();

  /// Create or overwrite a tool. Compiles against the rest of the store before
  /// writing, so a CompileError leaves disk and namespace untouched.
  [[nodiscard]] common::Status create_tool(const std::string &name, const std::string &source,
                                           tools::OriginKind origin = tools::OriginKind::Local);

  /// Run a tool with zero or one argument. Falls back to a native capability
  /// of the same name. Fails NotFound, ArityMismatch or RuntimeError.
  [[nodiscard]] common::Result<script::Value> execute(const std::string &name,
                                                      const std::vector<std::string> &args = {});

  [[nodiscard]] common::Status remove_tool(const std::string &name);
  [[nodiscard]] std::vector<std::string> list_tools() const;
  [[nodiscard]] common::Result<std::string> inspect_tool(const std::string &name) const;

  [[nodiscard]] common::Result<security::PendingProposal>
  enqueue_proposal(const std::string &name, const std::string &source,
                   const std::string &sender_id,
                   const std::optional<std::string> &description = std::nullopt);
  [[nodiscard]] std::vector<security::PendingProposal> list_pending() const;
  [[nodiscard]] common::Status approve(const std::string &name,
                                       const std::optional<std::string> &sender_id = std::nullopt);
  [[nodiscard]] common::Status reject(const std::string &name,
                                      const std::optional<std::string> &sender_id = std::nullopt);

  /// Call a native capability directly with string arguments.
  [[nodiscard]] common::Result<script::Value> invoke_capability(const std::string &name,
                                                                const tools::CapabilityArgs &args);
  [[nodiscard]] std::vector<tools::CapabilitySpec> capabilities() const;

  /// Start the peer gateway; `port` overrides the configured one (0 picks a free port).
  [[nodiscard]] common::Status start_server(std::optional<std::uint16_t> port = std::nullopt);
  void stop_server();
  [[nodiscard]] bool server_running() const;
  [[nodiscard]] std::uint16_t server_port() const;

  [[nodiscard]] common::Result<std::string> send_message(const std::string &url,
                                                         const std::string &body) const;
  /// Offer a local tool to a peer's approval queue.
  [[nodiscard]] common::Result<std::string>
  share_tool(const std::string &url, const std::string &name,
             const std::optional<std::string> &description = std::nullopt) const;
  [[nodiscard]] std::vector<gateway::InboundMessage> drain_inbox();
  [[nodiscard]] gateway::PeerInbox &inbox() { return inbox_; }

  [[nodiscard]] const RuntimeOptions &options() const { return options_; }
  [[nodiscard]] const tools::ToolStore &store() const { return store_; }

  // Peer endpoint.
  [[nodiscard]] common::Result<security::PendingProposal>
  receive_tool_share(const std::string &name, const std::string &source,
                     const std::string &sender_id,
                     const std::optional<std::string> &description) override;
  [[nodiscard]] common::Result<std::string> lookup_tool(const std::string &name) override;
  void receive_text(const std::string &content, const std::string &sender_id) override;
  [[nodiscard]] std::size_t tool_count() const override;
  [[nodiscard]] std::size_t pending_count() const override;

private:
  void register_capabilities();
  [[nodiscard]] common::Status check_name(const std::string &name) const;
  [[nodiscard]] common::Status rebuild_and_publish(const std::vector<tools::ToolSource> &sources);
  [[nodiscard]] common::Status create_locked(const std::string &name, const std::string &source,
                                             tools::OriginKind origin);

  RuntimeOptions options_;
  tools::ToolStore store_;
  tools::NamespaceRegistry registry_;
  security::ApprovalQueue queue_;
  tools::CapabilityRegistry capabilities_;
  gateway::PeerClient peer_client_;
  gateway::PeerInbox inbox_;

  std::mutex write_mutex_;
  mutable std::mutex server_mutex_;
  std::unique_ptr<gateway::PeerGateway> server_;
};

} // namespace toolsmith::runtime
