#include "toolsmith/cli/commands.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/config/config.hpp"
#include "toolsmith/runtime/app.hpp"
#include "toolsmith/runtime/reply_parser.hpp"
#include "toolsmith/security/classifier.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace toolsmith::cli {

namespace {

std::string version_string() {
#ifdef TOOLSMITH_VERSION
  return std::string("toolsmith ") + TOOLSMITH_VERSION;
#else
  return "toolsmith 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

std::optional<std::string> optional_arg(const std::vector<std::string> &args, std::size_t index) {
  if (index < args.size()) {
    return args[index];
  }
  return std::nullopt;
}

int fail(const common::Status &status) {
  std::cerr << status.describe() << "\n";
  return 1;
}

std::unique_ptr<runtime::ToolRuntime> open_runtime() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.describe() << "\n";
    return nullptr;
  }
  for (const auto &warning : context.value().warnings()) {
    std::cerr << "warning: " << warning << "\n";
  }
  auto created = context.value().create_runtime();
  if (!created.ok()) {
    std::cerr << created.describe() << "\n";
    return nullptr;
  }
  return std::move(created.value());
}

void print_inbox(runtime::ToolRuntime &runtime) {
  for (const auto &message : runtime.drain_inbox()) {
    std::cout << "[message from " << message.sender << "] " << message.content << "\n";
  }
}

int run_list() {
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  for (const auto &name : runtime->list_tools()) {
    std::cout << name << "\n";
  }
  return 0;
}

int run_inspect(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: toolsmith inspect <name>\n";
    return 1;
  }
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  auto source = runtime->inspect_tool(args[0]);
  if (!source.ok()) {
    return fail(source.status());
  }
  std::cout << source.value();
  if (!common::ends_with(source.value(), "\n")) {
    std::cout << "\n";
  }
  return 0;
}

int run_create(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    std::cerr << "usage: toolsmith create <name> <file|->\n";
    return 1;
  }
  std::string source;
  if (args[1] == "-") {
    source = read_stdin_all();
  } else {
    auto text = common::read_text_file(args[1]);
    if (!text.ok()) {
      return fail(text.status());
    }
    source = text.value();
  }

  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  if (auto created = runtime->create_tool(args[0], source); !created.ok()) {
    return fail(created);
  }
  std::cout << "Tool '" << args[0] << "' created (risk: "
            << security::risk_level_to_string(security::classify(source)) << ")\n";
  return 0;
}

int run_tool(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: toolsmith run <name> [arg]\n";
    return 1;
  }
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  std::vector<std::string> call_args;
  if (args.size() > 1) {
    call_args.push_back(join_tokens(args, 1));
  }
  auto result = runtime->execute(args[0], call_args);
  if (!result.ok()) {
    return fail(result.status());
  }
  std::cout << result.value().to_display() << "\n";
  return 0;
}

int run_remove(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: toolsmith remove <name>\n";
    return 1;
  }
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  if (auto removed = runtime->remove_tool(args[0]); !removed.ok()) {
    return fail(removed);
  }
  std::cout << "Tool '" << args[0] << "' removed\n";
  return 0;
}

int run_send(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    std::cerr << "usage: toolsmith send <url> <text>\n";
    return 1;
  }
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  auto response = runtime->send_message(args[0], join_tokens(args, 1));
  if (!response.ok()) {
    return fail(response.status());
  }
  std::cout << response.value() << "\n";
  return 0;
}

int run_share(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    std::cerr << "usage: toolsmith share <url> <name> [description]\n";
    return 1;
  }
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  std::optional<std::string> description;
  if (args.size() > 2) {
    description = args[2];
  }
  auto response = runtime->share_tool(args[0], args[1], description);
  if (!response.ok()) {
    return fail(response.status());
  }
  std::cout << response.value() << "\n";
  return 0;
}

int run_clone(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: toolsmith clone <dir>\n";
    return 1;
  }
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  auto result = runtime->invoke_capability("clone_agent", {args[0]});
  if (!result.ok()) {
    return fail(result.status());
  }
  std::cout << result.value().to_display() << "\n";
  return 0;
}

int run_capabilities() {
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  for (const auto &spec : runtime->capabilities()) {
    std::cout << spec.name << "/" << spec.arity << "  " << spec.description << "  ["
              << security::risk_level_to_string(
                     security::known_capability_risk(spec.name).value_or(security::RiskLevel::HighRisk))
              << "]\n";
  }
  return 0;
}

// One line typed at the serve prompt. Returns false when the session should end.
bool handle_prompt_line(runtime::ToolRuntime &runtime, const std::string &raw) {
  const std::string line = common::trim(raw);
  if (line.empty()) {
    return true;
  }
  if (line == "exit" || line == "quit") {
    return false;
  }

  if (auto invocation = runtime::parse_invocation(line); invocation.has_value()) {
    auto result = runtime.execute(invocation->name, invocation->args());
    if (result.ok()) {
      std::cout << "Tool Output: " << result.value().to_display() << "\n";
    } else {
      std::cout << "Tool Error: " << result.describe() << "\n";
    }
    return true;
  }

  std::istringstream stream(line);
  std::vector<std::string> words;
  for (std::string word; stream >> word;) {
    words.push_back(word);
  }
  const std::string command = words.front();
  words.erase(words.begin());

  common::Status status = common::Status::success();
  if (command == "list") {
    for (const auto &name : runtime.list_tools()) {
      std::cout << name << "\n";
    }
  } else if (command == "inspect" && !words.empty()) {
    auto source = runtime.inspect_tool(words[0]);
    if (source.ok()) {
      std::cout << source.value() << "\n";
    }
    status = source.status();
  } else if (command == "pending") {
    std::cout << format_pending(runtime.list_pending());
  } else if (command == "approve" && !words.empty()) {
    status = runtime.approve(words[0], optional_arg(words, 1));
  } else if (command == "reject" && !words.empty()) {
    status = runtime.reject(words[0], optional_arg(words, 1));
  } else if (command == "remove" && !words.empty()) {
    status = runtime.remove_tool(words[0]);
  } else if (command == "inbox") {
    print_inbox(runtime);
  } else {
    std::cout << "commands: [TOOL: name(arg)], list, inspect <name>, pending, approve <name> "
                 "[sender], reject <name> [sender], remove <name>, inbox, exit\n";
  }
  if (!status.ok()) {
    std::cout << status.describe() << "\n";
  }
  return true;
}

int run_serve(std::vector<std::string> args) {
  auto runtime = open_runtime();
  if (runtime == nullptr) {
    return 1;
  }

  std::string port_raw;
  std::string duration_raw;
  const bool once = take_flag(args, "--once");
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--duration-secs", "", duration_raw);

  std::optional<std::uint16_t> port;
  if (!port_raw.empty()) {
    try {
      const unsigned long parsed = std::stoul(port_raw);
      if (parsed > 65535) {
        throw std::out_of_range("port");
      }
      port = static_cast<std::uint16_t>(parsed);
    } catch (const std::exception &) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
  }
  if (auto started = runtime->start_server(port); !started.ok()) {
    return fail(started);
  }
  std::cout << "Peer gateway listening on " << runtime->options().gateway.host << ":"
            << runtime->server_port() << "\n";

  if (once) {
    runtime->stop_server();
    return 0;
  }
  if (!duration_raw.empty()) {
    int duration = 0;
    try {
      duration = std::stoi(duration_raw);
    } catch (const std::exception &) {
      duration = 0;
    }
    if (duration > 0) {
      std::this_thread::sleep_for(std::chrono::seconds(duration));
      print_inbox(*runtime);
      runtime->stop_server();
      return 0;
    }
  }

  std::cout << "Type [TOOL: name(arg)] or a command ('help' lists them, 'exit' quits).\n";
  std::string line;
  while (true) {
    print_inbox(*runtime);
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line) || !handle_prompt_line(*runtime, line)) {
      break;
    }
  }
  runtime->stop_server();
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  toolsmith [--config PATH] <command> [options]\n\n";
  std::cout << "TOOLS\n";
  std::cout << "  list                      List tools\n";
  std::cout << "  inspect <name>            Print a tool's source\n";
  std::cout << "  create <name> <file|->    Create or overwrite a tool\n";
  std::cout << "  run <name> [arg]          Execute a tool (or a native capability)\n";
  std::cout << "  remove <name>             Delete a tool\n";
  std::cout << "  capabilities              List native capabilities and their risk\n\n";
  std::cout << "PEERS\n";
  std::cout << "  serve [--port N] [--once] [--duration-secs N]\n";
  std::cout << "                            Run the peer gateway with an interactive prompt;\n";
  std::cout << "                            proposals are reviewed there with pending,\n";
  std::cout << "                            approve <name> [sender] and reject <name> [sender]\n";
  std::cout << "  send <url> <text>         Send a text message to a peer\n";
  std::cout << "  share <url> <name> [desc] Offer a local tool to a peer\n\n";
  std::cout << "OTHER\n";
  std::cout << "  clone <dir>               Copy this agent and its tools into a directory\n";
  std::cout << "  config-path               Print the config file location\n";
  std::cout << "  version                   Print the version\n";
}

} // namespace

std::string format_pending(const std::vector<security::PendingProposal> &pending) {
  if (pending.empty()) {
    return "No pending proposals.\n";
  }
  std::ostringstream out;
  for (const auto &proposal : pending) {
    const auto received = std::chrono::system_clock::to_time_t(proposal.received_at);
    out << proposal.name << "  risk=" << security::risk_level_to_string(proposal.risk)
        << "  from=" << proposal.sender_id << "  at=" << received;
    if (proposal.description.has_value()) {
      out << "  description=" << *proposal.description;
    }
    out << "\n";
  }
  return out.str();
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return fail(path_result.status());
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "list") {
    return run_list();
  }
  if (subcommand == "inspect") {
    return run_inspect(args);
  }
  if (subcommand == "create") {
    return run_create(args);
  }
  if (subcommand == "run") {
    return run_tool(args);
  }
  if (subcommand == "remove") {
    return run_remove(args);
  }
  if (subcommand == "capabilities") {
    return run_capabilities();
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "send") {
    return run_send(args);
  }
  if (subcommand == "share") {
    return run_share(args);
  }
  if (subcommand == "clone") {
    return run_clone(args);
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace toolsmith::cli
