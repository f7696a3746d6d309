#include "toolsmith/config/config.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <type_traits>

namespace toolsmith::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".toolsmith";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TOOLSMITH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TOOLSMITH_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory's.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  static const std::regex host_re(
      R"(^(([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)*[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?|((25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9]))$)");
  return std::regex_match(host, host_re);
}

bool is_loopback_host(const std::string &host) {
  return host == "127.0.0.1" || host == "localhost" || common::starts_with(host, "127.");
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::IOError, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> tools_dir(const Config &config) {
  std::filesystem::path dir(common::expand_path(config.runtime.tools_dir));
  if (dir.is_relative()) {
    const auto cfg_dir = config_dir();
    if (!cfg_dir.ok()) {
      return common::Result<std::filesystem::path>::failure(cfg_dir.status());
    }
    dir = cfg_dir.value() / dir;
  }
  return common::Result<std::filesystem::path>::success(dir.lexically_normal());
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *dir = std::getenv("TOOLSMITH_TOOLS_DIR"); dir != nullptr && *dir) {
    config.runtime.tools_dir = dir;
  }

  if (const char *port = std::getenv("TOOLSMITH_GATEWAY_PORT"); port != nullptr && *port) {
    try {
      const unsigned long parsed = std::stoul(port);
      if (parsed > 0 && parsed <= std::numeric_limits<std::uint16_t>::max()) {
        config.gateway.port = static_cast<std::uint16_t>(parsed);
      }
    } catch (const std::exception &) {
      // Malformed overrides keep the file value.
    }
  }

  if (const char *backend = std::getenv("TOOLSMITH_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();
  Config config;
  common::Status status = common::Status::success();

  const auto read_string = [&](const char *key, std::string &field) {
    if (!status.ok()) {
      return;
    }
    auto value = doc.string_or(key, field);
    if (value.ok()) {
      field = std::move(value.value());
    } else {
      status = value.status();
    }
  };
  const auto read_u64 = [&](const char *key, auto &field, const std::uint64_t max) {
    if (!status.ok()) {
      return;
    }
    const auto value = doc.u64_or(key, field);
    if (!value.ok()) {
      status = value.status();
    } else if (value.value() > max) {
      status = common::Status::error(common::ErrorCode::ParseError,
                                     std::string(key) + " out of range: " +
                                         std::to_string(value.value()));
    } else {
      field = static_cast<std::remove_reference_t<decltype(field)>>(value.value());
    }
  };
  constexpr auto u32_max = std::numeric_limits<std::uint32_t>::max();
  constexpr auto u64_max = std::numeric_limits<std::uint64_t>::max();

  read_string("runtime.tools_dir", config.runtime.tools_dir);
  read_u64("runtime.io_timeout_ms", config.runtime.io_timeout_ms, u64_max);
  read_u64("runtime.http_timeout_ms", config.runtime.http_timeout_ms, u64_max);
  read_u64("runtime.max_operations", config.runtime.max_operations, u64_max);
  read_u64("runtime.max_call_depth", config.runtime.max_call_depth, u32_max);
  read_u64("scrape.max_words", config.scrape.max_words, u32_max);
  read_string("gateway.host", config.gateway.host);
  read_u64("gateway.port", config.gateway.port, std::numeric_limits<std::uint16_t>::max());
  read_u64("gateway.max_connections", config.gateway.max_connections, u32_max);
  read_string("observability.backend", config.observability.backend);
  if (status.ok()) {
    const auto public_bind =
        doc.bool_or("gateway.allow_public_bind", config.gateway.allow_public_bind);
    if (public_bind.ok()) {
      config.gateway.allow_public_bind = public_bind.value();
    } else {
      status = public_bind.status();
    }
  }

  if (!status.ok()) {
    return common::Result<Config>::failure(status);
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.status());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(),
                                           path.string() + ": " + parsed.error());
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  std::ostringstream out;
  out << "[runtime]\n";
  out << "tools_dir = " << common::quote_toml_string(config.runtime.tools_dir) << "\n";
  out << "io_timeout_ms = " << config.runtime.io_timeout_ms << "\n";
  out << "http_timeout_ms = " << config.runtime.http_timeout_ms << "\n";
  out << "max_operations = " << config.runtime.max_operations << "\n";
  out << "max_call_depth = " << config.runtime.max_call_depth << "\n\n";

  out << "[scrape]\n";
  out << "max_words = " << config.scrape.max_words << "\n\n";

  out << "[gateway]\n";
  out << "host = " << common::quote_toml_string(config.gateway.host) << "\n";
  out << "port = " << config.gateway.port << "\n";
  out << "allow_public_bind = " << bool_to_toml(config.gateway.allow_public_bind) << "\n";
  out << "max_connections = " << config.gateway.max_connections << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), out.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ResultT = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.runtime.tools_dir).empty()) {
    return ResultT::failure(common::ErrorCode::InvalidArgument, "runtime.tools_dir is empty");
  }
  if (config.runtime.io_timeout_ms == 0 || config.runtime.http_timeout_ms == 0) {
    return ResultT::failure(common::ErrorCode::InvalidArgument,
                            "runtime timeouts must be greater than zero");
  }
  if (config.runtime.max_operations == 0) {
    return ResultT::failure(common::ErrorCode::InvalidArgument,
                            "runtime.max_operations must be greater than zero");
  }
  if (config.runtime.max_call_depth == 0 || config.runtime.max_call_depth > 1024) {
    return ResultT::failure(common::ErrorCode::InvalidArgument,
                            "runtime.max_call_depth must be between 1 and 1024");
  }
  if (config.scrape.max_words == 0) {
    return ResultT::failure(common::ErrorCode::InvalidArgument,
                            "scrape.max_words must be greater than zero");
  }

  if (!is_valid_host(config.gateway.host)) {
    return ResultT::failure(common::ErrorCode::InvalidArgument,
                            "Invalid gateway.host: " + config.gateway.host);
  }
  if (config.gateway.port == 0) {
    return ResultT::failure(common::ErrorCode::InvalidArgument, "gateway.port must be 1-65535");
  }
  if (config.gateway.max_connections == 0) {
    return ResultT::failure(common::ErrorCode::InvalidArgument,
                            "gateway.max_connections must be greater than zero");
  }
  if (!is_loopback_host(config.gateway.host)) {
    if (!config.gateway.allow_public_bind) {
      return ResultT::failure(common::ErrorCode::InvalidArgument,
                              "gateway.host " + config.gateway.host +
                                  " is not loopback; set gateway.allow_public_bind = true");
    }
    warnings.push_back("gateway binds a public address; peers are not authenticated");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop" && backend != "off" &&
      !backend.empty()) {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  if (config.runtime.io_timeout_ms > 600'000) {
    warnings.push_back("runtime.io_timeout_ms exceeds 10 minutes");
  }

  return ResultT::success(std::move(warnings));
}

} // namespace toolsmith::config
