#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/script/lua_state.hpp"

#include <cstddef>
#include <string>

namespace toolsmith::script {

inline constexpr std::size_t kMaxSourceBytes = 64 * 1024;

/// Precompiled tool chunk. Loading the bytecode into a state and running it
/// defines exactly one global function, `name`.
struct CompiledFunction {
  std::string name;
  std::string bytecode;
  int params = 0;
  bool vararg = false;
};

/// Compile a tool source and run its top level once in a scratch state. The
/// chunk must define a global Lua function called `name` and must not assign
/// any other global. Fails CompileError with Lua's "name:line: message" text.
[[nodiscard]] common::Result<CompiledFunction>
compile_function(const std::string &name, const std::string &source,
                 const ExecutionLimits &limits = {});

} // namespace toolsmith::script
