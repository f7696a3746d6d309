#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/script/compiler.hpp"
#include "toolsmith/script/lua_state.hpp"
#include "toolsmith/script/value.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace toolsmith::script {

/// Host-provided operations exposed to scripts as global functions.
class ICapabilityHost {
public:
  virtual ~ICapabilityHost() = default;

  [[nodiscard]] virtual std::vector<std::string> capability_names() const = 0;
  [[nodiscard]] virtual common::Result<Value> invoke_capability(const std::string &name,
                                                                const std::vector<Value> &args) = 0;
};

using FunctionTable = std::map<std::string, CompiledFunction>;

/// Runs one top-level call in a fresh sandboxed state holding every function
/// of the table plus the host's capabilities. Borrows the table, which must
/// outlive the interpreter; create one per call.
class Interpreter {
public:
  Interpreter(const FunctionTable &functions, ICapabilityHost *host, ExecutionLimits limits = {});

  /// Fails NotFound for an unknown function, ArityMismatch when the argument
  /// count does not fit, and RuntimeError for script errors, exhausted limits
  /// and failing capabilities. The first return value becomes the result.
  [[nodiscard]] common::Result<Value> call(const std::string &name,
                                           const std::vector<Value> &args);

  [[nodiscard]] std::uint64_t operations() const { return operations_; }

private:
  const FunctionTable &functions_;
  ICapabilityHost *host_;
  ExecutionLimits limits_;
  std::uint64_t operations_ = 0;
};

} // namespace toolsmith::script
