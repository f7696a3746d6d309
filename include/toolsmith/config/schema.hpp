#pragma once

#include <cstdint>
#include <string>

namespace toolsmith::config {

struct RuntimeConfig {
  std::string tools_dir = "tools";
  std::uint64_t io_timeout_ms = 10'000;
  std::uint64_t http_timeout_ms = 15'000;
  std::uint64_t max_operations = 1'000'000;
  std::uint32_t max_call_depth = 64;
};

struct ScrapeConfig {
  std::uint32_t max_words = 200;
};

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8080;
  bool allow_public_bind = false;
  std::uint32_t max_connections = 32;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  RuntimeConfig runtime;
  ScrapeConfig scrape;
  GatewayConfig gateway;
  ObservabilityConfig observability;
};

} // namespace toolsmith::config
