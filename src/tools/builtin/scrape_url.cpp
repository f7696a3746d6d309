#include "toolsmith/tools/builtin/scrape_url.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/common/http.hpp"

#include <regex>
#include <sstream>

namespace toolsmith::tools {

namespace {

// Remove <tag ...>...</tag> blocks. Scanned by hand: a lazy [\s\S]*? regex
// recurses per character in libstdc++ and overflows on large pages.
std::string drop_elements(const std::string &html, const std::string &tag) {
  const std::string lower = common::to_lower(html);
  const std::string open = "<" + tag;
  const std::string close = "</" + tag;

  std::string out;
  out.reserve(html.size());
  std::size_t pos = 0;
  while (pos < html.size()) {
    const auto start = lower.find(open, pos);
    if (start == std::string::npos) {
      out.append(html, pos, std::string::npos);
      break;
    }
    out.append(html, pos, start - pos);
    out.push_back(' ');
    const auto end = lower.find(close, start + open.size());
    if (end == std::string::npos) {
      break;
    }
    const auto gt = lower.find('>', end);
    pos = gt == std::string::npos ? html.size() : gt + 1;
  }
  return out;
}

std::string drop_comments(const std::string &html) {
  std::string out;
  out.reserve(html.size());
  std::size_t pos = 0;
  while (pos < html.size()) {
    const auto start = html.find("<!--", pos);
    if (start == std::string::npos) {
      out.append(html, pos, std::string::npos);
      break;
    }
    out.append(html, pos, start - pos);
    const auto end = html.find("-->", start + 4);
    if (end == std::string::npos) {
      break;
    }
    pos = end + 3;
  }
  return out;
}

std::string decode_entities(std::string text) {
  static const std::pair<const char *, const char *> kEntities[] = {
      {"&nbsp;", " "}, {"&lt;", "<"},   {"&gt;", ">"},  {"&quot;", "\""},
      {"&#39;", "'"},  {"&apos;", "'"}, {"&amp;", "&"},
  };
  for (const auto &[entity, replacement] : kEntities) {
    const std::string needle(entity);
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
      text.replace(pos, needle.size(), replacement);
      pos += 1;
    }
  }
  return text;
}

} // namespace

common::Result<std::string> extract_body_text(const std::string &html,
                                              const std::size_t max_words) {
  const std::string lower = common::to_lower(html);
  std::size_t body_open = std::string::npos;
  for (std::size_t pos = lower.find("<body"); pos != std::string::npos;
       pos = lower.find("<body", pos + 1)) {
    const char next = pos + 5 < lower.size() ? lower[pos + 5] : '\0';
    if (next == '>' || next == ' ' || next == '\t' || next == '\n' || next == '\r' ||
        next == '/') {
      body_open = pos;
      break;
    }
  }
  if (body_open == std::string::npos) {
    return common::Result<std::string>::failure(common::ErrorCode::ParseError,
                                                "document has no <body> element");
  }
  const auto content_start = lower.find('>', body_open);
  if (content_start == std::string::npos) {
    return common::Result<std::string>::failure(common::ErrorCode::ParseError,
                                                "unterminated <body> tag");
  }
  auto content_end = lower.find("</body", content_start);
  if (content_end == std::string::npos) {
    content_end = html.size();
  }

  std::string text = html.substr(content_start + 1, content_end - content_start - 1);
  text = drop_comments(text);
  text = drop_elements(text, "script");
  text = drop_elements(text, "style");
  text = std::regex_replace(text, std::regex("<[^>]*>"), " ");
  text = decode_entities(std::move(text));

  std::istringstream words(text);
  std::string word;
  std::string out;
  std::size_t count = 0;
  while (count < max_words && words >> word) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += word;
    ++count;
  }
  return common::Result<std::string>::success(std::move(out));
}

ScrapeUrlCapability::ScrapeUrlCapability(const std::uint64_t timeout_ms,
                                         const std::size_t max_words)
    : timeout_ms_(timeout_ms), max_words_(max_words) {}

common::Result<script::Value> ScrapeUrlCapability::execute(const CapabilityArgs &args) {
  const std::string url = common::trim(args.at(0));
  if (url.empty()) {
    return common::Result<script::Value>::failure(common::ErrorCode::NetworkError, "empty url");
  }

  const common::HttpClient client(timeout_ms_);
  const auto body = common::response_body_or_error(client.get(url), url);
  if (!body.ok()) {
    return common::Result<script::Value>::failure(body.status());
  }
  auto text = extract_body_text(body.value(), max_words_);
  if (!text.ok()) {
    return common::Result<script::Value>::failure(text.code(), url + ": " + text.error());
  }
  return common::Result<script::Value>::success(script::Value::string(std::move(text.value())));
}

} // namespace toolsmith::tools
