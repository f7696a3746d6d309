#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/script/compiler.hpp"
#include "toolsmith/script/interpreter.hpp"
#include "toolsmith/tools/tool.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolsmith::tools {

/// Compile one tool source. The source must define exactly one global
/// function, named `name`. Fails CompileError.
[[nodiscard]] common::Result<script::CompiledFunction>
compile_unit(const std::string &name, const std::string &source,
             const script::ExecutionLimits &limits = {});

/// Immutable set of callable tool functions built from a full store snapshot.
/// Shared between readers through shared_ptr<const Namespace>.
class Namespace {
public:
  /// Compile every source into a fresh namespace; any failure fails the whole
  /// build with CompileError naming the offending tool.
  [[nodiscard]] static common::Result<std::shared_ptr<const Namespace>>
  build(const std::vector<ToolSource> &sources, std::uint64_t generation = 0,
        const script::ExecutionLimits &limits = {});

  [[nodiscard]] const script::FunctionTable &functions() const { return functions_; }
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] bool contains(const std::string &name) const;
  [[nodiscard]] std::optional<ToolSource> find(const std::string &name) const;
  [[nodiscard]] std::size_t size() const { return sources_.size(); }
  [[nodiscard]] std::uint64_t generation() const { return generation_; }

private:
  // Restricts construction to build() while still allowing make_shared.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  explicit Namespace(ConstructionKey) {}

private:
  script::FunctionTable functions_;
  std::map<std::string, ToolSource> sources_;
  std::uint64_t generation_ = 0;
};

} // namespace toolsmith::tools
