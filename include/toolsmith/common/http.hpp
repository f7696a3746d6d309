#pragma once

#include "toolsmith/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace toolsmith::common {

/// Outcome of one transfer. `status` is 0 when no HTTP response arrived.
struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  bool truncated = false;
  std::string network_error_message;
};

/// Blocking libcurl client. Each call uses its own easy handle, so one client may be
/// shared across threads.
class HttpClient {
public:
  static constexpr std::size_t DEFAULT_MAX_BODY_BYTES = 8 * 1024 * 1024;

  explicit HttpClient(std::uint64_t timeout_ms = 15'000,
                      std::size_t max_body_bytes = DEFAULT_MAX_BODY_BYTES);

  [[nodiscard]] HttpResponse get(const std::string &url) const;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const std::string &body) const;

  [[nodiscard]] std::uint64_t timeout_ms() const { return timeout_ms_; }

private:
  [[nodiscard]] HttpResponse perform(const std::string &url, const std::string *json_body) const;

  std::uint64_t timeout_ms_;
  std::size_t max_body_bytes_;
};

/// Map a transport outcome onto the error taxonomy: Timeout, NetworkError for transport
/// failures, oversized bodies and non-2xx statuses, otherwise the response body.
[[nodiscard]] Result<std::string> response_body_or_error(const HttpResponse &response,
                                                         const std::string &url);

} // namespace toolsmith::common
