#include "toolsmith/script/interpreter.hpp"

extern "C" {
#include <lauxlib.h>
}

#include <exception>

namespace toolsmith::script {

namespace {

struct CallSetup {
  const FunctionTable *functions;
  ICapabilityHost *host;
  const std::vector<std::string> *capabilities;
  const std::string *target;
  const std::vector<Value> *args;
};

int push_value_protected(lua_State *state) {
  push_value(state, *static_cast<const Value *>(lua_touserdata(state, 1)));
  return 1;
}

// Global function bound to one capability; upvalues are the host and the name.
int call_capability(lua_State *state) {
  bool failed = false;
  {
    auto *host = static_cast<ICapabilityHost *>(lua_touserdata(state, lua_upvalueindex(1)));
    std::size_t length = 0;
    const char *raw_name = lua_tolstring(state, lua_upvalueindex(2), &length);
    const std::string name(raw_name, length);

    std::vector<Value> args;
    const int count = lua_gettop(state);
    for (int i = 1; i <= count; ++i) {
      args.push_back(to_value(state, i));
    }

    Value outcome;
    try {
      auto result = host->invoke_capability(name, args);
      if (result.ok()) {
        outcome = result.value();
      } else {
        outcome = Value::string("capability '" + name + "' failed: " + result.describe());
        failed = true;
      }
    } catch (const std::exception &e) {
      outcome = Value::string("capability '" + name + "' failed: " + e.what());
      failed = true;
    }

    // A failed conversion leaves its own error object on the stack.
    lua_pushcfunction(state, push_value_protected);
    lua_pushlightuserdata(state, &outcome);
    if (lua_pcall(state, 1, 1, 0) != LUA_OK) {
      failed = true;
    }
  }
  // Raised outside the scope above so no destructor is skipped.
  if (failed) {
    return lua_error(state);
  }
  return 1;
}

// Loads every tool chunk, binds the capabilities, then calls the target with
// the arguments. Runs protected; its one result is the target's first return.
int install_and_call(lua_State *state) {
  const auto *setup = static_cast<const CallSetup *>(lua_touserdata(state, 1));
  lua_settop(state, 0);

  for (const auto &entry : *setup->functions) {
    const CompiledFunction &compiled = entry.second;
    if (luaL_loadbufferx(state, compiled.bytecode.data(), compiled.bytecode.size(),
                         compiled.name.c_str(), "b") != LUA_OK) {
      return lua_error(state);
    }
    lua_call(state, 0, 0);
  }

  // Bound after the tool chunks so top-level code never reaches a capability.
  for (const std::string &capability : *setup->capabilities) {
    lua_pushlightuserdata(state, setup->host);
    lua_pushlstring(state, capability.data(), capability.size());
    lua_pushcclosure(state, call_capability, 2);
    lua_setglobal(state, capability.c_str());
  }

  lua_pushglobaltable(state);
  lua_pushlstring(state, setup->target->data(), setup->target->size());
  lua_rawget(state, -2);
  lua_remove(state, -2);
  luaL_checkstack(state, static_cast<int>(setup->args->size()) + 1, "too many arguments");
  for (const Value &arg : *setup->args) {
    push_value(state, arg);
  }
  lua_call(state, static_cast<int>(setup->args->size()), 1);
  return 1;
}

} // namespace

Interpreter::Interpreter(const FunctionTable &functions, ICapabilityHost *host,
                         const ExecutionLimits limits)
    : functions_(functions), host_(host), limits_(limits) {}

common::Result<Value> Interpreter::call(const std::string &name, const std::vector<Value> &args) {
  using ResultT = common::Result<Value>;

  const auto it = functions_.find(name);
  if (it == functions_.end()) {
    return ResultT::failure(common::ErrorCode::NotFound, "function not found: " + name);
  }
  const auto expected = static_cast<std::size_t>(it->second.params);
  if (args.size() < expected || (args.size() > expected && !it->second.vararg)) {
    return ResultT::failure(common::ErrorCode::ArityMismatch,
                            "'" + name + "' takes " + std::to_string(expected) +
                                " argument(s), got " + std::to_string(args.size()));
  }

  LuaState lua(limits_);
  if (!lua.valid()) {
    return ResultT::failure(common::ErrorCode::RuntimeError, "unable to create a script state");
  }
  lua_State *state = lua.get();

  const std::vector<std::string> capabilities =
      host_ != nullptr ? host_->capability_names() : std::vector<std::string>{};
  CallSetup setup{&functions_, host_, &capabilities, &name, &args};

  lua_pushcfunction(state, install_and_call);
  lua_pushlightuserdata(state, &setup);
  lua.arm_limits();
  const int status = lua_pcall(state, 1, 1, 0);
  lua.disarm_limits();
  operations_ = lua.operations();

  if (status != LUA_OK) {
    std::string message = pop_error_message(state);
    if (status == LUA_ERRMEM) {
      message += " (limit " + std::to_string(limits_.max_memory_bytes) + " bytes)";
    }
    return ResultT::failure(common::ErrorCode::RuntimeError, "in '" + name + "': " + message);
  }
  Value result = to_value(state, -1);
  lua_pop(state, 1);
  return ResultT::success(std::move(result));
}

} // namespace toolsmith::script
