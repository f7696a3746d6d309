#pragma once

#include "toolsmith/tools/capability.hpp"

#include <cstddef>
#include <cstdint>

namespace toolsmith::tools {

/// Readable text of the document's <body>: script and style elements dropped,
/// tags removed, entities decoded, whitespace collapsed, first max_words words.
/// Fails ParseError when there is no <body>.
[[nodiscard]] common::Result<std::string> extract_body_text(const std::string &html,
                                                            std::size_t max_words);

class ScrapeUrlCapability final : public ICapability {
public:
  ScrapeUrlCapability(std::uint64_t timeout_ms, std::size_t max_words);

  [[nodiscard]] std::string_view name() const override { return "scrape_url"; }
  [[nodiscard]] std::string_view description() const override {
    return "Fetch a page and return the first words of its body text";
  }
  [[nodiscard]] std::size_t arity() const override { return 1; }
  [[nodiscard]] common::Result<script::Value> execute(const CapabilityArgs &args) override;

private:
  std::uint64_t timeout_ms_;
  std::size_t max_words_;
};

} // namespace toolsmith::tools
