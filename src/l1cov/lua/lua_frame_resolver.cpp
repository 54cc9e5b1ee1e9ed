#include "l1cov/lua/lua_frame_resolver.hpp"

namespace l1cov::lua {

std::optional<source_position> lua_frame_resolver::resolve(int stack_depth) const {
  if (!state_ || stack_depth < 0) {
    return std::nullopt;
  }

  lua_Debug ar{};
  if (!lua_getstack(state_, stack_depth, &ar)) {
    return std::nullopt;
  }
  if (!lua_getinfo(state_, "Sl", &ar) || !ar.source || ar.source[0] != '@' || ar.currentline <= 0) {
    return std::nullopt;
  }

  return source_position{std::string(ar.source + 1), static_cast<uint32_t>(ar.currentline)};
}

} // namespace l1cov::lua
