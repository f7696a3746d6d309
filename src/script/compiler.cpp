#include "toolsmith/script/compiler.hpp"

extern "C" {
#include <lauxlib.h>
}

#include <new>
#include <vector>

namespace toolsmith::script {

namespace {

int append_chunk(lua_State *, const void *data, const std::size_t size, void *userdata) {
  try {
    static_cast<std::string *>(userdata)->append(static_cast<const char *>(data), size);
  } catch (const std::bad_alloc &) {
    return 1;
  }
  return 0;
}

// Shallow copy of the global table, returned as the single result.
int snapshot_globals(lua_State *state) {
  lua_newtable(state);
  lua_pushglobaltable(state);
  lua_pushnil(state);
  while (lua_next(state, -2) != 0) {
    lua_pushvalue(state, -2);
    lua_insert(state, -2);
    lua_rawset(state, -5);
  }
  lua_pop(state, 1);
  return 1;
}

std::string key_name(lua_State *state, const int index) {
  if (lua_type(state, index) == LUA_TSTRING) {
    return lua_tostring(state, index);
  }
  return std::string("[") + lua_typename(state, lua_type(state, index)) + " key]";
}

// Globals that differ between the table at `pristine` and the live one.
std::vector<std::string> changed_globals(lua_State *state, const int pristine) {
  std::vector<std::string> changed;
  lua_pushglobaltable(state);
  const int live = lua_gettop(state);

  lua_pushnil(state);
  while (lua_next(state, live) != 0) {
    lua_pushvalue(state, -2);
    lua_rawget(state, pristine);
    if (lua_rawequal(state, -1, -2) == 0) {
      changed.push_back(key_name(state, -3));
    }
    lua_pop(state, 2);
  }

  lua_pushnil(state);
  while (lua_next(state, pristine) != 0) {
    lua_pushvalue(state, -2);
    lua_rawget(state, live);
    if (lua_isnil(state, -1)) {
      changed.push_back(key_name(state, -3));
    }
    lua_pop(state, 2);
  }

  lua_pop(state, 1);
  return changed;
}

} // namespace

common::Result<CompiledFunction> compile_function(const std::string &name,
                                                  const std::string &source,
                                                  const ExecutionLimits &limits) {
  using ResultT = common::Result<CompiledFunction>;
  const auto fail = [&name](const std::string &message) {
    return ResultT::failure(common::ErrorCode::CompileError, name + ": " + message);
  };

  if (source.size() > kMaxSourceBytes) {
    return fail("source is " + std::to_string(source.size()) + " bytes, limit is " +
                std::to_string(kMaxSourceBytes));
  }

  LuaState lua(limits);
  if (!lua.valid()) {
    return fail("unable to create a script state");
  }
  lua_State *state = lua.get();

  const std::string chunk_name = "=" + name;
  if (luaL_loadbufferx(state, source.data(), source.size(), chunk_name.c_str(), "t") != LUA_OK) {
    return ResultT::failure(common::ErrorCode::CompileError, pop_error_message(state));
  }
  const int chunk = lua_gettop(state);

  CompiledFunction compiled;
  compiled.name = name;
  if (lua_dump(state, append_chunk, &compiled.bytecode, 0) != 0) {
    return fail("unable to serialize the compiled chunk");
  }

  lua_pushcfunction(state, snapshot_globals);
  if (lua_pcall(state, 0, 1, 0) != LUA_OK) {
    return fail(pop_error_message(state));
  }
  const int pristine = lua_gettop(state);

  lua_pushvalue(state, chunk);
  lua.arm_limits();
  const int status = lua_pcall(state, 0, 0, 0);
  lua.disarm_limits();
  if (status != LUA_OK) {
    return ResultT::failure(common::ErrorCode::CompileError, pop_error_message(state));
  }

  bool defines_name = false;
  std::string others;
  for (const auto &global : changed_globals(state, pristine)) {
    if (global == name) {
      defines_name = true;
      continue;
    }
    others += others.empty() ? global : ", " + global;
  }
  if (!others.empty()) {
    return fail("top-level code may only define '" + name + "', it also assigns " + others);
  }
  if (!defines_name) {
    return fail("no global function named '" + name + "' is defined");
  }

  lua_getglobal(state, name.c_str());
  if (lua_type(state, -1) != LUA_TFUNCTION || lua_iscfunction(state, -1) != 0) {
    return fail("'" + name + "' must be a Lua function, got " +
                lua_typename(state, lua_type(state, -1)));
  }
  lua_Debug info;
  lua_getinfo(state, ">u", &info);
  compiled.params = static_cast<int>(info.nparams);
  compiled.vararg = info.isvararg != 0;
  return ResultT::success(std::move(compiled));
}

} // namespace toolsmith::script
