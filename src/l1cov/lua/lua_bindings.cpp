#include "l1cov/lua/lua_bindings.hpp"

#include <cstdint>
#include <string>
#include <tuple>

#include <redlog.hpp>

#include "l1cov/lua/lua_frame_resolver.hpp"

namespace l1cov::lua {
namespace {

// (ok, error message) as two lua return values
std::tuple<bool, std::string> to_lua_status(const status& outcome) {
  if (!outcome.ok()) {
    redlog::get_logger("l1cov.lua").wrn(
        "coverage call rejected", redlog::field("code", error_code_name(outcome.code)),
        redlog::field("error", outcome.message)
    );
  }
  return {outcome.ok(), outcome.message};
}

uint32_t to_line(int line) { return line > 0 ? static_cast<uint32_t>(line) : 0; }

} // namespace

void install_lua_bindings(sol::state_view lua, coverage_session& session) {
  auto log = redlog::get_logger("l1cov.lua");
  log.dbg("installing l1cov lua bindings");

  sol::table module = lua.create_named_table("l1cov");

  // depth 0 is the lua function calling this binding
  module.set_function("mark_current_line_covered", [&session](sol::this_state state, sol::optional<int> depth) {
    lua_frame_resolver resolver(state);
    return to_lua_status(session.mark_current_line_covered(resolver, depth.value_or(0) + 1));
  });

  module.set_function("mark_covered", [&session](const std::string& path, int line) {
    return to_lua_status(session.mark_covered(path, to_line(line)));
  });

  // returns value unchanged so a condition can be wrapped in place
  module.set_function(
      "record_condition",
      [&session](const std::string& path, int line, int index, sol::object value) {
        const bool outcome = value.valid() && value.get_type() != sol::type::lua_nil &&
                             !(value.get_type() == sol::type::boolean && !value.as<bool>());
        const uint32_t condition_index = index > 0 ? static_cast<uint32_t>(index) : 0;
        to_lua_status(session.record_condition(path, to_line(line), condition_index, outcome));
        return value;
      }
  );

  module.set_function("was_executed", [&session](const std::string& path, int line) {
    return session.was_executed(path, to_line(line));
  });

  module.set_function("was_covered", [&session](const std::string& path, int line) {
    return session.was_covered(path, to_line(line));
  });

  module.set_function("execution_count", [&session](const std::string& path, int line) {
    return static_cast<int64_t>(session.execution_count(path, to_line(line)));
  });

  module.set_function("is_registered", [&session](const std::string& path) { return session.is_registered(path); });

  log.dbg("l1cov lua bindings installed");
}

} // namespace l1cov::lua
