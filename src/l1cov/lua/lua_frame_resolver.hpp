#pragma once

#include <lua.hpp>

#include "l1cov/engine/frame_resolver.hpp"

namespace l1cov::lua {

// stack depth 0 is the function running on the lua state when resolve() is called
class lua_frame_resolver : public frame_resolver {
public:
  explicit lua_frame_resolver(lua_State* state) : state_(state) {}

  std::optional<source_position> resolve(int stack_depth) const override;

private:
  lua_State* state_ = nullptr;
};

} // namespace l1cov::lua
