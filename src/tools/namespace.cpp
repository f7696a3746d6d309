#include "toolsmith/tools/namespace.hpp"

#include <utility>

namespace toolsmith::tools {

common::Result<script::CompiledFunction> compile_unit(const std::string &name,
                                                      const std::string &source,
                                                      const script::ExecutionLimits &limits) {
  return script::compile_function(name, source, limits);
}

common::Result<std::shared_ptr<const Namespace>>
Namespace::build(const std::vector<ToolSource> &sources, const std::uint64_t generation,
                 const script::ExecutionLimits &limits) {
  using ResultT = common::Result<std::shared_ptr<const Namespace>>;

  auto ns = std::make_shared<Namespace>(ConstructionKey{});
  ns->generation_ = generation;
  for (const auto &tool : sources) {
    if (ns->sources_.count(tool.name) != 0) {
      return ResultT::failure(common::ErrorCode::CompileError,
                              tool.name + ": defined more than once");
    }
    auto unit = compile_unit(tool.name, tool.source, limits);
    if (!unit.ok()) {
      return ResultT::failure(unit.status());
    }
    ns->functions_.emplace(tool.name, std::move(unit.value()));
    ns->sources_.emplace(tool.name, tool);
  }
  return ResultT::success(std::move(ns));
}

std::vector<std::string> Namespace::names() const {
  std::vector<std::string> out;
  out.reserve(sources_.size());
  for (const auto &[name, _] : sources_) {
    out.push_back(name);
  }
  return out;
}

bool Namespace::contains(const std::string &name) const { return sources_.count(name) != 0; }

std::optional<ToolSource> Namespace::find(const std::string &name) const {
  const auto it = sources_.find(name);
  if (it == sources_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace toolsmith::tools
