#include "toolsmith/common/toml.hpp"

#include "toolsmith/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace toolsmith::common {

namespace {

// Drops a trailing `# comment`, ignoring '#' inside quoted strings.
std::string without_comment(const std::string &line) {
  char open_quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (open_quote != '\0') {
      if (ch == '\\' && open_quote == '"') {
        ++i;
      } else if (ch == open_quote) {
        open_quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      open_quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

bool is_bare_key(const std::string &key) {
  if (key.empty()) {
    return false;
  }
  for (const char ch : key) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '_' || ch == '-' || ch == '.';
    if (!ok) {
      return false;
    }
  }
  return true;
}

Status shape_error(const std::string &key, const TomlEntry &entry, const char *expected) {
  return Status::error(ErrorCode::ParseError, "line " + std::to_string(entry.line) + ": " + key +
                                                  " expects " + expected + ", got " + entry.raw);
}

} // namespace

void TomlDocument::set(std::string key, TomlEntry entry) {
  entries_[std::move(key)] = std::move(entry);
}

bool TomlDocument::has(const std::string &key) const { return find(key) != nullptr; }

const TomlEntry *TomlDocument::find(const std::string &key) const {
  const auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

Result<std::string> TomlDocument::string_or(const std::string &key,
                                            const std::string &fallback) const {
  const TomlEntry *entry = find(key);
  if (entry == nullptr) {
    return Result<std::string>::success(fallback);
  }
  const std::string &raw = entry->raw;
  if (raw.size() >= 2 && raw.front() == '\'' && raw.back() == '\'') {
    return Result<std::string>::success(raw.substr(1, raw.size() - 2));
  }
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return Result<std::string>::failure(shape_error(key, *entry, "a quoted string"));
  }
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 2 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char escaped = raw[++i];
    switch (escaped) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(escaped);
      break;
    }
  }
  return Result<std::string>::success(std::move(out));
}

Result<bool> TomlDocument::bool_or(const std::string &key, const bool fallback) const {
  const TomlEntry *entry = find(key);
  if (entry == nullptr) {
    return Result<bool>::success(fallback);
  }
  if (entry->raw == "true") {
    return Result<bool>::success(true);
  }
  if (entry->raw == "false") {
    return Result<bool>::success(false);
  }
  return Result<bool>::failure(shape_error(key, *entry, "true or false"));
}

Result<std::uint64_t> TomlDocument::u64_or(const std::string &key,
                                           const std::uint64_t fallback) const {
  const TomlEntry *entry = find(key);
  if (entry == nullptr) {
    return Result<std::uint64_t>::success(fallback);
  }
  // TOML allows '_' between digits.
  std::string digits;
  digits.reserve(entry->raw.size());
  for (const char ch : entry->raw) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t value = 0;
  const char *first = digits.data();
  const char *last = first + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (digits.empty() || ec != std::errc() || ptr != last) {
    return Result<std::uint64_t>::failure(shape_error(key, *entry, "an unsigned integer"));
  }
  return Result<std::uint64_t>::success(value);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  const auto fail = [&line_number](const std::string &what) {
    return Result<TomlDocument>::failure(ErrorCode::ParseError,
                                         "line " + std::to_string(line_number) + ": " + what);
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string text = trim(without_comment(line));
    if (text.empty()) {
      continue;
    }

    if (text.front() == '[') {
      if (text.back() != ']') {
        return fail("unterminated section header");
      }
      section = trim(text.substr(1, text.size() - 2));
      if (!is_bare_key(section)) {
        return fail("invalid section name '" + section + "'");
      }
      continue;
    }

    const std::size_t eq = text.find('=');
    if (eq == std::string::npos) {
      return fail("expected key = value");
    }
    const std::string key = trim(text.substr(0, eq));
    if (!is_bare_key(key)) {
      return fail("invalid key '" + key + "'");
    }
    std::string full_key = section.empty() ? key : section + "." + key;
    if (document.has(full_key)) {
      return fail("duplicate key '" + full_key + "'");
    }
    document.set(std::move(full_key), TomlEntry{trim(text.substr(eq + 1)), line_number});
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string quoted = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      quoted += "\\\"";
      break;
    case '\\':
      quoted += "\\\\";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default:
      quoted.push_back(ch);
      break;
    }
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace toolsmith::common
