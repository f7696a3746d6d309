#include "toolsmith/security/classifier.hpp"

#include "toolsmith/common/fs.hpp"
#include "toolsmith/script/lua_state.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace toolsmith::security {

namespace {

constexpr std::array<std::pair<std::string_view, RiskLevel>, 6> kKnownCapabilities = {{
    {"list_tools", RiskLevel::LowRisk},
    {"inspect_tool", RiskLevel::LowRisk},
    {"send_message", RiskLevel::LowRisk},
    {"read_file", RiskLevel::MediumRisk},
    {"scrape_url", RiskLevel::MediumRisk},
    {"write_file", RiskLevel::HighRisk},
}};

enum class TokenKind { Identifier, Keyword, String, Number, Punct };

struct Token {
  TokenKind kind = TokenKind::Punct;
  std::string text;
  int line = 1;
  int column = 1;
};

bool is_ident_start(const char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool is_ident_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

// Token scan of Lua source. Comments are dropped; string literals keep their
// raw body. Only as much of the grammar as reference detection needs.
class LuaScanner {
public:
  explicit LuaScanner(const std::string &source) : source_(source) {}

  common::Result<std::vector<Token>> scan() {
    using ResultT = common::Result<std::vector<Token>>;
    std::vector<Token> tokens;
    while (true) {
      skip_space_and_comments();
      if (!error_.empty()) {
        return ResultT::failure(common::ErrorCode::ParseError, error_);
      }
      if (at_end()) {
        return ResultT::success(std::move(tokens));
      }
      Token token;
      token.line = line_;
      token.column = column_;
      const char ch = peek();
      if (is_ident_start(ch)) {
        while (!at_end() && is_ident_char(peek())) {
          token.text.push_back(advance());
        }
        token.kind = script::is_lua_keyword(token.text) && token.text != "_ENV"
                         ? TokenKind::Keyword
                         : TokenKind::Identifier;
      } else if (std::isdigit(static_cast<unsigned char>(ch)) != 0 ||
                 (ch == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
        token.kind = TokenKind::Number;
        scan_number(token.text);
      } else if (ch == '"' || ch == '\'') {
        token.kind = TokenKind::String;
        if (!scan_quoted(token.text)) {
          return ResultT::failure(common::ErrorCode::ParseError, error_);
        }
      } else if (ch == '[' && long_bracket_level() >= 0) {
        token.kind = TokenKind::String;
        if (!scan_long_bracket(token.text)) {
          return ResultT::failure(common::ErrorCode::ParseError, error_);
        }
      } else {
        token.kind = TokenKind::Punct;
        scan_punct(token.text);
      }
      tokens.push_back(std::move(token));
    }
  }

private:
  [[nodiscard]] bool at_end() const { return pos_ >= source_.size(); }

  [[nodiscard]] char peek(const std::size_t ahead = 0) const {
    return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
  }

  char advance() {
    const char ch = source_[pos_++];
    if (ch == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    return ch;
  }

  void fail(const std::string &message) {
    error_ = "line " + std::to_string(line_) + ": " + message;
  }

  // Level of a long bracket opening at the cursor ("[[" is 0, "[==[" is 2),
  // or -1 when the cursor is not on one.
  [[nodiscard]] int long_bracket_level() const {
    if (peek() != '[') {
      return -1;
    }
    std::size_t ahead = 1;
    while (peek(ahead) == '=') {
      ++ahead;
    }
    return peek(ahead) == '[' ? static_cast<int>(ahead - 1) : -1;
  }

  bool scan_long_bracket(std::string &body) {
    const int level = long_bracket_level();
    for (int i = 0; i < level + 2; ++i) {
      advance();
    }
    const std::string closing = "]" + std::string(static_cast<std::size_t>(level), '=') + "]";
    const auto end = source_.find(closing, pos_);
    if (end == std::string::npos) {
      fail("unfinished long string or comment");
      return false;
    }
    while (pos_ < end) {
      body.push_back(advance());
    }
    for (std::size_t i = 0; i < closing.size(); ++i) {
      advance();
    }
    return true;
  }

  bool scan_quoted(std::string &body) {
    const char quote = advance();
    while (!at_end()) {
      const char ch = advance();
      if (ch == quote) {
        return true;
      }
      if (ch == '\n') {
        break;
      }
      if (ch == '\\' && !at_end()) {
        body.push_back(ch);
        body.push_back(advance());
        continue;
      }
      body.push_back(ch);
    }
    fail("unfinished string");
    return false;
  }

  void scan_number(std::string &text) {
    while (!at_end()) {
      const char ch = peek();
      const char previous = text.empty() ? '\0' : static_cast<char>(std::tolower(text.back()));
      if (is_ident_char(ch) || ch == '.' ||
          ((ch == '+' || ch == '-') && (previous == 'e' || previous == 'p'))) {
        text.push_back(advance());
        continue;
      }
      break;
    }
  }

  void scan_punct(std::string &text) {
    static const std::array<std::string_view, 11> kMulti = {
        {"...", "..", "::", "==", "~=", "<=", ">=", "//", "<<", ">>", "->"}};
    for (const auto candidate : kMulti) {
      if (source_.compare(pos_, candidate.size(), candidate) == 0) {
        for (std::size_t i = 0; i < candidate.size(); ++i) {
          text.push_back(advance());
        }
        return;
      }
    }
    text.push_back(advance());
  }

  void skip_space_and_comments() {
    while (!at_end()) {
      const char ch = peek();
      if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
        advance();
        continue;
      }
      if (ch == '-' && peek(1) == '-') {
        advance();
        advance();
        if (long_bracket_level() >= 0) {
          std::string ignored;
          if (!scan_long_bracket(ignored)) {
            return;
          }
          continue;
        }
        while (!at_end() && peek() != '\n') {
          advance();
        }
        continue;
      }
      return;
    }
  }

  const std::string &source_;
  std::size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
  std::string error_;
};

bool is_punct(const Token &token, const std::string_view text) {
  return token.kind == TokenKind::Punct && token.text == text;
}

bool is_keyword(const Token &token, const std::string_view text) {
  return token.kind == TokenKind::Keyword && token.text == text;
}

// Names the source binds itself: function names, parameters, locals and
// loop variables. Scope is ignored.
std::unordered_set<std::string> declared_names(const std::vector<Token> &list) {
  std::unordered_set<std::string> declared;
  // "a, b <const>, c" starting at i.
  const auto collect_list = [&](std::size_t i) {
    while (i < list.size() && list[i].kind == TokenKind::Identifier) {
      declared.insert(list[i].text);
      ++i;
      if (i + 2 < list.size() && is_punct(list[i], "<") && is_punct(list[i + 2], ">")) {
        i += 3;
      }
      if (i >= list.size() || !is_punct(list[i], ",")) {
        return;
      }
      ++i;
    }
  };
  for (std::size_t i = 0; i < list.size(); ++i) {
    if (is_keyword(list[i], "function")) {
      std::size_t j = i + 1;
      if (j < list.size() && list[j].kind == TokenKind::Identifier) {
        declared.insert(list[j].text);
      }
      while (j < list.size() && !is_punct(list[j], "(")) {
        ++j;
      }
      for (++j; j < list.size() && !is_punct(list[j], ")"); ++j) {
        if (list[j].kind == TokenKind::Identifier) {
          declared.insert(list[j].text);
        }
      }
    } else if (is_keyword(list[i], "local") || is_keyword(list[i], "for")) {
      collect_list(i + 1);
    }
  }
  return declared;
}

bool starts_call_arguments(const Token &token) {
  return is_punct(token, "(") || is_punct(token, "{") || token.kind == TokenKind::String;
}

} // namespace

std::string risk_level_to_string(const RiskLevel level) {
  switch (level) {
  case RiskLevel::Safe:
    return "safe";
  case RiskLevel::LowRisk:
    return "low";
  case RiskLevel::MediumRisk:
    return "medium";
  case RiskLevel::HighRisk:
    return "high";
  }
  return "high";
}

common::Result<RiskLevel> risk_level_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "safe") {
    return common::Result<RiskLevel>::success(RiskLevel::Safe);
  }
  if (normalized == "low" || normalized == "lowrisk") {
    return common::Result<RiskLevel>::success(RiskLevel::LowRisk);
  }
  if (normalized == "medium" || normalized == "mediumrisk") {
    return common::Result<RiskLevel>::success(RiskLevel::MediumRisk);
  }
  if (normalized == "high" || normalized == "highrisk") {
    return common::Result<RiskLevel>::success(RiskLevel::HighRisk);
  }
  return common::Result<RiskLevel>::failure(common::ErrorCode::InvalidArgument,
                                            "unknown risk level: " + value);
}

std::optional<RiskLevel> known_capability_risk(const std::string_view name) {
  for (const auto &[known, level] : kKnownCapabilities) {
    if (known == name) {
      return level;
    }
  }
  return std::nullopt;
}

Classification classify_detailed(const std::string &source) {
  Classification out;
  LuaScanner scanner(source);
  const auto tokens = scanner.scan();
  if (!tokens.ok()) {
    out.level = RiskLevel::HighRisk;
    out.error = tokens.error();
    return out;
  }
  const auto &list = tokens.value();
  const auto declared = declared_names(list);

  for (std::size_t i = 0; i < list.size(); ++i) {
    const auto &token = list[i];
    std::optional<RiskLevel> level;
    if (token.kind == TokenKind::Identifier) {
      // A known capability counts wherever it is named, including as a field.
      level = known_capability_risk(token.text);
      const bool member = i > 0 && (is_punct(list[i - 1], ".") || is_punct(list[i - 1], ":"));
      const bool called = i + 1 < list.size() && starts_call_arguments(list[i + 1]);
      if (!level.has_value() && called && !member && declared.count(token.text) == 0 &&
          !script::is_sandbox_global(token.text)) {
        level = RiskLevel::HighRisk;
      }
    } else if (token.kind == TokenKind::String) {
      // _G["write_file"] and friends.
      level = known_capability_risk(token.text);
    }
    if (!level.has_value()) {
      continue;
    }
    out.references.push_back(CapabilityReference{token.text, *level, token.line, token.column});
    out.level = std::max(out.level, *level);
  }
  return out;
}

RiskLevel classify(const std::string &source) { return classify_detailed(source).level; }

} // namespace toolsmith::security
