#include "toolsmith/runtime/tool_runtime.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/config/config.hpp"
#include "toolsmith/observability/global.hpp"
#include "toolsmith/runtime/capabilities.hpp"
#include "toolsmith/tools/builtin/file_io.hpp"
#include "toolsmith/tools/builtin/scrape_url.hpp"
#include "toolsmith/tools/builtin/search.hpp"
#include "toolsmith/tools/builtin/send_message.hpp"
#include "toolsmith/tools/namespace.hpp"

#include <algorithm>

namespace toolsmith::runtime {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

common::Result<RuntimeOptions> options_from_config(const config::Config &config) {
  auto tools_dir = config::tools_dir(config);
  if (!tools_dir.ok()) {
    return common::Result<RuntimeOptions>::failure(tools_dir.status());
  }

  RuntimeOptions options;
  options.tools_dir = tools_dir.value();
  options.io_timeout = std::chrono::milliseconds(config.runtime.io_timeout_ms);
  options.http_timeout_ms = config.runtime.http_timeout_ms;
  options.scrape_max_words = config.scrape.max_words;
  options.limits.max_operations = config.runtime.max_operations;
  options.limits.max_call_depth = config.runtime.max_call_depth;
  options.gateway.host = config.gateway.host;
  options.gateway.port = config.gateway.port;
  options.gateway.allow_public_bind = config.gateway.allow_public_bind;
  options.gateway.max_connections = config.gateway.max_connections;

  std::error_code ec;
  if (auto path = config::config_path(); path.ok() && std::filesystem::exists(path.value(), ec)) {
    options.clone_files.push_back(path.value());
  }
  const auto local_env = std::filesystem::current_path(ec) / ".env";
  if (!ec && std::filesystem::exists(local_env, ec)) {
    options.clone_files.push_back(local_env);
  } else if (auto dir = config::config_dir(); dir.ok()) {
    const auto env_file = dir.value() / ".env";
    if (std::filesystem::exists(env_file, ec)) {
      options.clone_files.push_back(env_file);
    }
  }
  return common::Result<RuntimeOptions>::success(std::move(options));
}

ToolRuntime::ToolRuntime(RuntimeOptions options)
    : options_(std::move(options)), store_(options_.tools_dir), registry_(options_.limits),
      peer_client_(options_.http_timeout_ms) {
  register_capabilities();
}

ToolRuntime::~ToolRuntime() { stop_server(); }

void ToolRuntime::register_capabilities() {
  capabilities_.register_capability(std::make_unique<ListToolsCapability>(*this));
  capabilities_.register_capability(std::make_unique<InspectToolCapability>(*this));
  capabilities_.register_capability(std::make_unique<RemoveToolCapability>(*this));
  capabilities_.register_capability(
      std::make_unique<tools::ReadFileCapability>(options_.io_timeout));
  capabilities_.register_capability(
      std::make_unique<tools::WriteFileCapability>(options_.io_timeout));
  capabilities_.register_capability(std::make_unique<tools::SearchCapability>());
  capabilities_.register_capability(std::make_unique<tools::ScrapeUrlCapability>(
      options_.http_timeout_ms, options_.scrape_max_words));
  capabilities_.register_capability(std::make_unique<tools::CloneAgentCapability>(
      tools::CloneSources{options_.executable, options_.tools_dir, options_.clone_files},
      options_.io_timeout));
  capabilities_.register_capability(
      std::make_unique<tools::SendMessageCapability>(options_.http_timeout_ms));
  capabilities_.register_capability(std::make_unique<StartServerCapability>(*this));
}

common::Status ToolRuntime::open() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (auto ensured = store_.ensure(); !ensured.ok()) {
    return ensured;
  }
  auto sources = store_.load_all();
  if (!sources.ok()) {
    return sources.status();
  }
  for (const auto &tool : sources.value()) {
    if (capabilities_.has_capability(tool.name)) {
      return common::Status::error(common::ErrorCode::CompileError,
                                   store_.path_for(tool.name).string() +
                                       ": tool name shadows native capability '" + tool.name +
                                       "'");
    }
  }
  return rebuild_and_publish(sources.value());
}

common::Status ToolRuntime::check_name(const std::string &name) const {
  if (auto valid = tools::validate_tool_name(name); !valid.ok()) {
    return valid;
  }
  if (capabilities_.has_capability(name)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "'" + name + "' is a native capability");
  }
  return common::Status::success();
}

common::Status ToolRuntime::rebuild_and_publish(const std::vector<tools::ToolSource> &sources) {
  const auto start = std::chrono::steady_clock::now();
  auto ns = registry_.rebuild(sources);
  if (!ns.ok()) {
    return ns.status();
  }
  const std::size_t count = ns.value()->size();
  registry_.publish(std::move(ns.value()));
  observability::record_namespace_rebuilt(count, elapsed_since(start));
  return common::Status::success();
}

common::Status ToolRuntime::create_tool(const std::string &name, const std::string &source,
                                        const tools::OriginKind origin) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  return create_locked(name, source, origin);
}

common::Status ToolRuntime::create_locked(const std::string &name, const std::string &source,
                                          const tools::OriginKind origin) {
  if (auto valid = check_name(name); !valid.ok()) {
    return valid;
  }
  // Report the candidate's own compile error before touching anything else.
  if (auto unit = tools::compile_unit(name, source, registry_.limits()); !unit.ok()) {
    return unit.status();
  }

  auto loaded = store_.load_all();
  if (!loaded.ok()) {
    return loaded.status();
  }
  std::vector<tools::ToolSource> sources = std::move(loaded.value());
  tools::ToolSource candidate{name, source, origin};
  const auto it = std::find_if(sources.begin(), sources.end(),
                               [&](const tools::ToolSource &tool) { return tool.name == name; });
  if (it != sources.end()) {
    *it = candidate;
  } else {
    sources.push_back(candidate);
    std::sort(sources.begin(), sources.end(),
              [](const tools::ToolSource &a, const tools::ToolSource &b) { return a.name < b.name; });
  }

  const auto start = std::chrono::steady_clock::now();
  auto ns = registry_.rebuild(sources);
  if (!ns.ok()) {
    return ns.status();
  }
  if (auto saved = store_.save(candidate); !saved.ok()) {
    observability::record_error("store", saved.describe());
    return saved;
  }
  const std::size_t count = ns.value()->size();
  registry_.publish(std::move(ns.value()));
  observability::record_namespace_rebuilt(count, elapsed_since(start));
  observability::record_tool_created(name, std::string(tools::origin_to_string(origin)));
  return common::Status::success();
}

common::Result<script::Value> ToolRuntime::execute(const std::string &name,
                                                   const std::vector<std::string> &args) {
  using ResultT = common::Result<script::Value>;
  const auto start = std::chrono::steady_clock::now();

  ResultT result = ResultT::failure(common::ErrorCode::NotFound, "tool not found: " + name);
  const auto *capability = capabilities_.get(name);
  if (!registry_.current()->contains(name) && capability != nullptr) {
    if (args.size() > 1 || capability->arity() > 1) {
      result = ResultT::failure(common::ErrorCode::ArityMismatch,
                                "capability '" + name + "' takes " +
                                    std::to_string(capability->arity()) +
                                    " argument(s); invocations pass at most one");
    } else {
      result = capabilities_.invoke(name, args);
    }
  } else {
    result = registry_.execute(name, args, &capabilities_);
  }

  observability::record_tool_executed(name, elapsed_since(start), result.ok());
  return result;
}

common::Status ToolRuntime::remove_tool(const std::string &name) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto loaded = store_.load_all();
  if (!loaded.ok()) {
    return loaded.status();
  }
  std::vector<tools::ToolSource> sources = std::move(loaded.value());
  const auto it = std::find_if(sources.begin(), sources.end(),
                               [&](const tools::ToolSource &tool) { return tool.name == name; });
  if (it == sources.end()) {
    return common::Status::error(common::ErrorCode::NotFound, "tool not found: " + name);
  }
  sources.erase(it);

  // The remaining tools must still compile before the file goes away.
  const auto start = std::chrono::steady_clock::now();
  auto ns = registry_.rebuild(sources);
  if (!ns.ok()) {
    observability::record_error("registry", ns.describe());
    return ns.status();
  }
  if (auto removed = store_.remove(name); !removed.ok()) {
    observability::record_error("store", removed.describe());
    return removed;
  }
  const std::size_t count = ns.value()->size();
  registry_.publish(std::move(ns.value()));
  observability::record_namespace_rebuilt(count, elapsed_since(start));
  observability::record_tool_removed(name);
  return common::Status::success();
}

std::vector<std::string> ToolRuntime::list_tools() const { return registry_.current()->names(); }

common::Result<std::string> ToolRuntime::inspect_tool(const std::string &name) const {
  const auto tool = registry_.current()->find(name);
  if (!tool.has_value()) {
    return common::Result<std::string>::failure(common::ErrorCode::NotFound,
                                                "tool not found: " + name);
  }
  return common::Result<std::string>::success(tool->source);
}

common::Result<security::PendingProposal>
ToolRuntime::enqueue_proposal(const std::string &name, const std::string &source,
                              const std::string &sender_id,
                              const std::optional<std::string> &description) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (auto valid = check_name(name); !valid.ok()) {
    return common::Result<security::PendingProposal>::failure(valid);
  }
  return queue_.enqueue(name, source, sender_id, description);
}

std::vector<security::PendingProposal> ToolRuntime::list_pending() const {
  return queue_.list_pending();
}

common::Status ToolRuntime::approve(const std::string &name,
                                    const std::optional<std::string> &sender_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto approved = queue_.approve(name, sender_id, [this](const security::PendingProposal &p) {
    return create_locked(p.name, p.source, tools::OriginKind::Remote);
  });
  if (!approved.ok()) {
    return approved.status();
  }
  observability::record_metric(
      observability::PendingProposalsMetric{static_cast<std::uint64_t>(queue_.size())});
  return common::Status::success();
}

common::Status ToolRuntime::reject(const std::string &name,
                                   const std::optional<std::string> &sender_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto rejected = queue_.reject(name, sender_id);
  if (!rejected.ok()) {
    return rejected.status();
  }
  observability::record_metric(
      observability::PendingProposalsMetric{static_cast<std::uint64_t>(queue_.size())});
  return common::Status::success();
}

common::Result<script::Value> ToolRuntime::invoke_capability(const std::string &name,
                                                             const tools::CapabilityArgs &args) {
  return capabilities_.invoke(name, args);
}

std::vector<tools::CapabilitySpec> ToolRuntime::capabilities() const {
  return capabilities_.all_specs();
}

common::Status ToolRuntime::start_server(const std::optional<std::uint16_t> port) {
  std::lock_guard<std::mutex> lock(server_mutex_);
  if (server_ != nullptr && server_->is_running()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "peer gateway already running on port " +
                                     std::to_string(server_->port()));
  }
  gateway::GatewayOptions gateway_options = options_.gateway;
  if (port.has_value()) {
    gateway_options.port = *port;
  }
  auto server = std::make_unique<gateway::PeerGateway>(*this);
  if (auto started = server->start(gateway_options); !started.ok()) {
    observability::record_error("gateway", started.describe());
    return started;
  }
  server_ = std::move(server);
  return common::Status::success();
}

void ToolRuntime::stop_server() {
  std::unique_ptr<gateway::PeerGateway> server;
  {
    std::lock_guard<std::mutex> lock(server_mutex_);
    server = std::move(server_);
  }
  if (server != nullptr) {
    server->stop();
  }
}

bool ToolRuntime::server_running() const {
  std::lock_guard<std::mutex> lock(server_mutex_);
  return server_ != nullptr && server_->is_running();
}

std::uint16_t ToolRuntime::server_port() const {
  std::lock_guard<std::mutex> lock(server_mutex_);
  return server_ == nullptr ? 0 : server_->port();
}

common::Result<std::string> ToolRuntime::send_message(const std::string &url,
                                                      const std::string &body) const {
  return peer_client_.send_text(url, body);
}

common::Result<std::string>
ToolRuntime::share_tool(const std::string &url, const std::string &name,
                        const std::optional<std::string> &description) const {
  auto source = inspect_tool(name);
  if (!source.ok()) {
    return source;
  }
  return peer_client_.share_tool(url, name, source.value(), description);
}

std::vector<gateway::InboundMessage> ToolRuntime::drain_inbox() { return inbox_.drain(); }

common::Result<security::PendingProposal>
ToolRuntime::receive_tool_share(const std::string &name, const std::string &source,
                                const std::string &sender_id,
                                const std::optional<std::string> &description) {
  return enqueue_proposal(name, source, sender_id, description);
}

common::Result<std::string> ToolRuntime::lookup_tool(const std::string &name) {
  return inspect_tool(name);
}

void ToolRuntime::receive_text(const std::string &content, const std::string &sender_id) {
  inbox_.push(gateway::InboundMessage{sender_id, content, std::chrono::system_clock::now()});
}

std::size_t ToolRuntime::tool_count() const { return registry_.current()->size(); }

std::size_t ToolRuntime::pending_count() const { return queue_.size(); }

} // namespace toolsmith::runtime
