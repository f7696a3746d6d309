#include "toolsmith/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace toolsmith::common {

namespace {

constexpr std::size_t npos = std::string::npos;

class Scanner {
public:
  explicit Scanner(const std::string &text) : text_(text) {}

  [[nodiscard]] bool done() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return done() ? '\0' : text_[pos_]; }
  [[nodiscard]] std::size_t pos() const { return pos_; }
  void advance(std::size_t count = 1) { pos_ += count; }
  void seek(std::size_t pos) { pos_ = pos; }

  void skip_ws() {
    while (!done() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  // Position of the quote closing the string that opens at the cursor.
  [[nodiscard]] std::size_t string_end() const {
    for (std::size_t i = pos_ + 1; i < text_.size(); ++i) {
      if (text_[i] == '\\') {
        ++i;
      } else if (text_[i] == '"') {
        return i;
      }
    }
    return npos;
  }

  // Position of the bracket closing the object or array that opens at the cursor.
  [[nodiscard]] std::size_t container_end() const {
    const char open = peek();
    const char close = open == '{' ? '}' : ']';
    std::size_t depth = 0;
    for (std::size_t i = pos_; i < text_.size(); ++i) {
      const char ch = text_[i];
      if (ch == '"') {
        Scanner inner(text_);
        inner.seek(i);
        i = inner.string_end();
        if (i == npos) {
          return npos;
        }
      } else if (ch == open) {
        ++depth;
      } else if (ch == close && --depth == 0) {
        return i;
      }
    }
    return npos;
  }

  // Scalar literal (number, true, false, null) starting at the cursor.
  [[nodiscard]] std::size_t scalar_end() const {
    std::size_t i = pos_;
    while (i < text_.size() && text_[i] != ',' && text_[i] != '}' && text_[i] != ']' &&
           std::isspace(static_cast<unsigned char>(text_[i])) == 0) {
      ++i;
    }
    return i;
  }

private:
  const std::string &text_;
  std::size_t pos_ = 0;
};

void append_utf8(std::string &out, const unsigned int code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

constexpr unsigned int kReplacementCharacter = 0xFFFD;

bool is_high_surrogate(const unsigned int unit) { return unit >= 0xD800 && unit <= 0xDBFF; }
bool is_low_surrogate(const unsigned int unit) { return unit >= 0xDC00 && unit <= 0xDFFF; }

bool parse_hex4(const std::string &raw, const std::size_t at, unsigned int &out) {
  if (at + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = at; i < at + 4; ++i) {
    const auto ch = static_cast<unsigned char>(raw[i]);
    if (std::isxdigit(ch) == 0) {
      return false;
    }
    const unsigned int digit =
        std::isdigit(ch) != 0 ? ch - '0' : static_cast<unsigned int>(std::tolower(ch) - 'a' + 10);
    out = (out << 4) | digit;
  }
  return true;
}

// Decodes the body of a JSON string literal (without its quotes).
std::string unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char code = raw[++i];
    unsigned int code_point = 0;
    switch (code) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (parse_hex4(raw, i + 1, code_point)) {
        i += 4;
        // A surrogate pair spans two escapes; a lone half becomes U+FFFD.
        unsigned int low = 0;
        if (is_high_surrogate(code_point) && i + 2 < raw.size() && raw[i + 1] == '\\' &&
            raw[i + 2] == 'u' && parse_hex4(raw, i + 3, low) && is_low_surrogate(low)) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        } else if (is_high_surrogate(code_point) || is_low_surrogate(code_point)) {
          code_point = kReplacementCharacter;
        }
        append_utf8(out, code_point);
      } else {
        out.push_back('u');
      }
      break;
    default:
      out.push_back(code);
      break;
    }
  }
  return out;
}

} // namespace

std::string json_quote(const std::string &value) {
  std::string quoted;
  quoted.reserve(value.size() + 2);
  quoted.push_back('"');
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
    case '\r':
      quoted += "\\r";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
        quoted += buf;
      } else {
        quoted.push_back(ch);
      }
      break;
    }
  }
  quoted.push_back('"');
  return quoted;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap members;
  Scanner scan(json);
  scan.skip_ws();
  if (scan.peek() != '{') {
    return members;
  }
  scan.advance();

  while (true) {
    scan.skip_ws();
    if (scan.peek() == ',') {
      scan.advance();
      continue;
    }
    if (scan.peek() != '"') {
      break;
    }
    const std::size_t key_end = scan.string_end();
    if (key_end == npos) {
      break;
    }
    std::string key = unescape(json.substr(scan.pos() + 1, key_end - scan.pos() - 1));
    scan.seek(key_end + 1);
    scan.skip_ws();
    if (scan.peek() != ':') {
      break;
    }
    scan.advance();
    scan.skip_ws();
    if (scan.done()) {
      break;
    }

    const std::size_t start = scan.pos();
    if (scan.peek() == '"') {
      const std::size_t end = scan.string_end();
      if (end == npos) {
        break;
      }
      members[std::move(key)] = unescape(json.substr(start + 1, end - start - 1));
      scan.seek(end + 1);
    } else if (scan.peek() == '{' || scan.peek() == '[') {
      const std::size_t end = scan.container_end();
      if (end == npos) {
        break;
      }
      members[std::move(key)] = json.substr(start, end - start + 1);
      scan.seek(end + 1);
    } else {
      const std::size_t end = scan.scalar_end();
      members[std::move(key)] = json.substr(start, end - start);
      scan.seek(end);
    }
  }
  return members;
}

bool json_is_object(const std::string &text) {
  Scanner scan(text);
  scan.skip_ws();
  if (scan.peek() != '{') {
    return false;
  }
  const std::size_t end = scan.container_end();
  if (end == npos) {
    return false;
  }
  scan.seek(end + 1);
  scan.skip_ws();
  return scan.done();
}

} // namespace toolsmith::common
