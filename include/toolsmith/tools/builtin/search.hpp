#pragma once

#include "toolsmith/tools/capability.hpp"

namespace toolsmith::tools {

/// Placeholder search: no backend is queried. Returns a fixed, deterministic
/// answer derived from the query so scripts composing it behave predictably.
class SearchCapability final : public ICapability {
public:
  [[nodiscard]] std::string_view name() const override { return "search"; }
  [[nodiscard]] std::string_view description() const override {
    return "Stub search; returns a canned result for the query";
  }
  [[nodiscard]] std::size_t arity() const override { return 1; }
  [[nodiscard]] common::Result<script::Value> execute(const CapabilityArgs &args) override;
};

} // namespace toolsmith::tools
