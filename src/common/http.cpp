#include "toolsmith/common/http.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace toolsmith::common {

namespace {

struct BodySink {
  std::string *body = nullptr;
  std::size_t limit = 0;
  bool overflow = false;
};

// Returning less than the chunk size makes curl abort with CURLE_WRITE_ERROR.
size_t append_body(char *data, size_t size, size_t count, void *userdata) {
  auto *sink = static_cast<BodySink *>(userdata);
  const size_t bytes = size * count;
  if (sink->body->size() + bytes > sink->limit) {
    sink->overflow = true;
    return 0;
  }
  sink->body->append(data, bytes);
  return bytes;
}

struct CurlDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

void init_curl_once() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

HttpClient::HttpClient(const std::uint64_t timeout_ms, const std::size_t max_body_bytes)
    : timeout_ms_(timeout_ms), max_body_bytes_(max_body_bytes) {}

HttpResponse HttpClient::get(const std::string &url) const { return perform(url, nullptr); }

HttpResponse HttpClient::post_json(const std::string &url, const std::string &body) const {
  return perform(url, &body);
}

HttpResponse HttpClient::perform(const std::string &url, const std::string *json_body) const {
  HttpResponse response;
  init_curl_once();

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  BodySink sink{&response.body, max_body_bytes_, false};
  CURL *handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms_));
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, "toolsmith/0.1");

  std::unique_ptr<curl_slist, SlistDeleter> headers;
  if (json_body != nullptr) {
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, json_body->c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
  } else {
    // Page fetches follow redirects; peer posts go exactly where they are addressed.
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
  }

  const CURLcode code = curl_easy_perform(handle);
  if (sink.overflow) {
    response.truncated = true;
    response.network_error = true;
    response.network_error_message =
        "response body exceeds " + std::to_string(max_body_bytes_) + " bytes";
  } else if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }
  return response;
}

Result<std::string> response_body_or_error(const HttpResponse &response, const std::string &url) {
  if (response.timeout) {
    return Result<std::string>::failure(ErrorCode::Timeout, "request to " + url + " timed out");
  }
  if (response.network_error) {
    return Result<std::string>::failure(ErrorCode::NetworkError,
                                        "request to " + url +
                                            " failed: " + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return Result<std::string>::failure(ErrorCode::NetworkError,
                                        "request to " + url + " returned HTTP " +
                                            std::to_string(response.status));
  }
  return Result<std::string>::success(response.body);
}

} // namespace toolsmith::common
