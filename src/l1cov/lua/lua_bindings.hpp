#pragma once

#include <sol/sol.hpp>

#include "l1cov/engine/coverage_session.hpp"

namespace l1cov::lua {

// exposes the session to scripts as a global "l1cov" table.
// the session must outlive the lua state.
void install_lua_bindings(sol::state_view lua, coverage_session& session);

} // namespace l1cov::lua
