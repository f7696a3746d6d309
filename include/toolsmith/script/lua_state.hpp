#pragma once

#include "toolsmith/script/value.hpp"

extern "C" {
#include <lua.h>
}

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace toolsmith::script {

struct ExecutionLimits {
  std::uint64_t max_operations = 1'000'000;
  std::uint32_t max_call_depth = 64;
  std::size_t max_memory_bytes = 64 * 1024 * 1024;
};

/// Owns one sandboxed lua_State. Only the base, string, table, math and utf8
/// libraries are opened; load, loadfile, dofile, require, collectgarbage and
/// string.dump are removed. Allocation is capped at max_memory_bytes from the
/// start; the operation budget and call depth apply once arm_limits() is called.
class LuaState {
public:
  struct Budget {
    ExecutionLimits limits;
    std::size_t memory_used = 0;
    std::uint64_t operations = 0;
    int hook_interval = 1;
  };

  explicit LuaState(const ExecutionLimits &limits);
  ~LuaState();

  LuaState(const LuaState &) = delete;
  LuaState &operator=(const LuaState &) = delete;

  [[nodiscard]] bool valid() const { return state_ != nullptr; }
  [[nodiscard]] lua_State *get() const { return state_; }

  void arm_limits();
  void disarm_limits();

  [[nodiscard]] std::uint64_t operations() const { return budget_.operations; }
  [[nodiscard]] std::size_t memory_used() const { return budget_.memory_used; }

private:
  Budget budget_;
  lua_State *state_ = nullptr;
};

/// Message carried by the error object on top of the stack; pops it.
[[nodiscard]] std::string pop_error_message(lua_State *state);

/// Push a Value; arrays become 1-based sequence tables. May raise a Lua error
/// on allocation failure, so call it from a protected context.
void push_value(lua_State *state, const Value &value);

/// Convert the value at index without invoking metamethods. nil maps to
/// unit, a proper 1..n sequence table to an array, and functions, userdata
/// and other tables to a "type: address" string.
[[nodiscard]] Value to_value(lua_State *state, int index);

[[nodiscard]] bool is_lua_keyword(std::string_view word);

/// Globals every sandboxed state defines (base functions and library tables).
[[nodiscard]] bool is_sandbox_global(std::string_view name);

/// Keywords and sandbox globals; such names cannot be tool names.
[[nodiscard]] bool is_reserved_name(std::string_view name);

} // namespace toolsmith::script
