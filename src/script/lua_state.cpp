#include "toolsmith/script/lua_state.hpp"

extern "C" {
#include <lauxlib.h>
#include <lualib.h>
}

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unordered_set>

namespace toolsmith::script {

namespace {

constexpr int kHookInterval = 1000;
constexpr int kMaxConversionDepth = 32;

LuaState::Budget *budget_of(lua_State *state) {
  return *static_cast<LuaState::Budget **>(lua_getextraspace(state));
}

void *limited_alloc(void *userdata, void *block, const std::size_t old_size_hint,
                    const std::size_t new_size) {
  auto *budget = static_cast<LuaState::Budget *>(userdata);
  const std::size_t old_size = block == nullptr ? 0 : old_size_hint;
  if (new_size == 0) {
    budget->memory_used -= old_size;
    std::free(block);
    return nullptr;
  }
  const std::size_t projected = budget->memory_used - old_size + new_size;
  if (new_size > old_size && projected > budget->limits.max_memory_bytes) {
    return nullptr;
  }
  void *resized = std::realloc(block, new_size);
  if (resized != nullptr) {
    budget->memory_used = projected;
  }
  return resized;
}

void limit_hook(lua_State *state, lua_Debug *event) {
  LuaState::Budget *budget = budget_of(state);
  if (event->event == LUA_HOOKCOUNT) {
    budget->operations += static_cast<std::uint64_t>(budget->hook_interval);
    if (budget->operations > budget->limits.max_operations) {
      luaL_error(state, "operation limit of %I exceeded",
                 static_cast<lua_Integer>(budget->limits.max_operations));
    }
    return;
  }
  // Level 0 is the function being entered; one extra level covers the
  // host frame every call runs under.
  lua_Debug frame;
  if (lua_getstack(state, static_cast<int>(budget->limits.max_call_depth) + 1, &frame) != 0) {
    luaL_error(state, "call depth limit of %d exceeded",
               static_cast<int>(budget->limits.max_call_depth));
  }
}

int open_sandbox(lua_State *state) {
  static const std::array<luaL_Reg, 5> libraries = {{
      {"_G", luaopen_base},
      {LUA_STRLIBNAME, luaopen_string},
      {LUA_TABLIBNAME, luaopen_table},
      {LUA_MATHLIBNAME, luaopen_math},
      {LUA_UTF8LIBNAME, luaopen_utf8},
  }};
  for (const auto &library : libraries) {
    luaL_requiref(state, library.name, library.func, 1);
    lua_pop(state, 1);
  }
  for (const char *name : {"dofile", "loadfile", "load", "require", "collectgarbage"}) {
    lua_pushnil(state);
    lua_setglobal(state, name);
  }
  lua_getglobal(state, LUA_STRLIBNAME);
  lua_pushnil(state);
  lua_setfield(state, -2, "dump");
  lua_pop(state, 1);
  return 0;
}

std::string describe_opaque(lua_State *state, const int index) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%s: %p", lua_typename(state, lua_type(state, index)),
                lua_topointer(state, index));
  return buffer;
}

bool collect_sequence(lua_State *state, int index, int depth, Value::Array &out);

Value convert(lua_State *state, const int index, const int depth) {
  switch (lua_type(state, index)) {
  case LUA_TNONE:
  case LUA_TNIL:
    return Value::unit();
  case LUA_TBOOLEAN:
    return Value::boolean(lua_toboolean(state, index) != 0);
  case LUA_TNUMBER:
    if (lua_isinteger(state, index) != 0) {
      return Value::integer(static_cast<std::int64_t>(lua_tointeger(state, index)));
    }
    return Value::floating(static_cast<double>(lua_tonumber(state, index)));
  case LUA_TSTRING: {
    std::size_t length = 0;
    const char *text = lua_tolstring(state, index, &length);
    return Value::string(std::string(text, length));
  }
  case LUA_TTABLE: {
    Value::Array items;
    if (depth < kMaxConversionDepth && collect_sequence(state, index, depth, items)) {
      return Value::array(std::move(items));
    }
    return Value::string(describe_opaque(state, index));
  }
  default:
    return Value::string(describe_opaque(state, index));
  }
}

bool collect_sequence(lua_State *state, const int index, const int depth, Value::Array &out) {
  if (lua_checkstack(state, 3) == 0) {
    return false;
  }
  const auto length = static_cast<lua_Integer>(lua_rawlen(state, index));
  lua_Integer entries = 0;
  bool sequence = true;
  lua_pushnil(state);
  while (lua_next(state, index) != 0) {
    lua_pop(state, 1);
    const bool integral_key = lua_isinteger(state, -1) != 0;
    const lua_Integer key = integral_key ? lua_tointeger(state, -1) : 0;
    if (!integral_key || key < 1 || key > length) {
      sequence = false;
      lua_pop(state, 1);
      break;
    }
    ++entries;
  }
  if (!sequence || entries != length) {
    return false;
  }
  out.reserve(static_cast<std::size_t>(length));
  for (lua_Integer i = 1; i <= length; ++i) {
    lua_rawgeti(state, index, i);
    out.push_back(convert(state, lua_gettop(state), depth + 1));
    lua_pop(state, 1);
  }
  return true;
}

const std::unordered_set<std::string> &sandbox_globals() {
  static const std::unordered_set<std::string> names = [] {
    std::unordered_set<std::string> found;
    LuaState lua(ExecutionLimits{});
    if (!lua.valid()) {
      return found;
    }
    lua_State *state = lua.get();
    lua_pushglobaltable(state);
    lua_pushnil(state);
    while (lua_next(state, -2) != 0) {
      if (lua_type(state, -2) == LUA_TSTRING) {
        found.insert(lua_tostring(state, -2));
      }
      lua_pop(state, 1);
    }
    lua_pop(state, 1);
    return found;
  }();
  return names;
}

} // namespace

LuaState::LuaState(const ExecutionLimits &limits) {
  budget_.limits = limits;
  state_ = lua_newstate(limited_alloc, &budget_);
  if (state_ == nullptr) {
    return;
  }
  *static_cast<Budget **>(lua_getextraspace(state_)) = &budget_;
  lua_pushcfunction(state_, open_sandbox);
  if (lua_pcall(state_, 0, 0, 0) != LUA_OK) {
    lua_close(state_);
    state_ = nullptr;
  }
}

LuaState::~LuaState() {
  if (state_ != nullptr) {
    lua_close(state_);
  }
}

void LuaState::arm_limits() {
  budget_.operations = 0;
  budget_.hook_interval = static_cast<int>(
      std::clamp<std::uint64_t>(budget_.limits.max_operations, 1, kHookInterval));
  lua_sethook(state_, limit_hook, LUA_MASKCALL | LUA_MASKCOUNT, budget_.hook_interval);
}

void LuaState::disarm_limits() { lua_sethook(state_, nullptr, 0, 0); }

std::string pop_error_message(lua_State *state) {
  std::string message;
  const int type = lua_type(state, -1);
  if (type == LUA_TSTRING || type == LUA_TNUMBER) {
    message = convert(state, lua_gettop(state), 0).to_display();
  } else {
    message = std::string("error object is a ") + lua_typename(state, type) + " value";
  }
  lua_pop(state, 1);
  return message;
}

void push_value(lua_State *state, const Value &value) {
  luaL_checkstack(state, 2, "value nesting too deep");
  switch (value.kind()) {
  case Value::Kind::Unit:
    lua_pushnil(state);
    break;
  case Value::Kind::Bool:
    lua_pushboolean(state, value.as_bool() ? 1 : 0);
    break;
  case Value::Kind::Int:
    lua_pushinteger(state, static_cast<lua_Integer>(value.as_int()));
    break;
  case Value::Kind::Float:
    lua_pushnumber(state, static_cast<lua_Number>(value.as_float()));
    break;
  case Value::Kind::String:
    lua_pushlstring(state, value.as_string().data(), value.as_string().size());
    break;
  case Value::Kind::Array: {
    const auto &items = value.as_array();
    lua_createtable(state, static_cast<int>(items.size()), 0);
    lua_Integer position = 1;
    for (const auto &item : items) {
      push_value(state, item);
      lua_rawseti(state, -2, position++);
    }
    break;
  }
  }
}

Value to_value(lua_State *state, const int index) {
  return convert(state, lua_absindex(state, index), 0);
}

bool is_lua_keyword(const std::string_view word) {
  static const std::unordered_set<std::string_view> keywords = {
      "and",   "break", "do",   "else", "elseif", "end",    "false", "for",
      "function", "goto", "if", "in",   "local",  "nil",    "not",   "or",
      "repeat", "return", "then", "true", "until", "while", "_ENV"};
  return keywords.count(word) > 0;
}

bool is_sandbox_global(const std::string_view name) {
  return sandbox_globals().count(std::string(name)) > 0;
}

bool is_reserved_name(const std::string_view name) {
  return is_lua_keyword(name) || is_sandbox_global(name);
}

} // namespace toolsmith::script
