#include <doctest/doctest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <sol/sol.hpp>

#include "l1cov/engine/coverage_engine.hpp"
#include "l1cov/engine/coverage_session.hpp"
#include "l1cov/lua/lua_bindings.hpp"
#include "l1cov/lua/lua_coverage_hook.hpp"
#include "l1cov/lua/lua_frame_resolver.hpp"
#include "l1cov/util/file_utils.hpp"
#include "l1cov/util/path_utils.hpp"

namespace {

// line 9 is covered through check(), line 10 directly; line 12 never runs
const std::string k_script = "local function add(a, b)\n"
                             "  return a + b\n"
                             "end\n"
                             "local function check(value)\n"
                             "  l1cov.mark_current_line_covered(1)\n"
                             "  return value\n"
                             "end\n"
                             "local total = add(1, 2)\n"
                             "check(total == 3)\n"
                             "l1cov.mark_current_line_covered()\n"
                             "if l1cov.record_condition(SCRIPT, 11, 0, total > 5) then\n"
                             "  total = 0\n"
                             "end\n"
                             "return total\n";

struct script_fixture {
  std::filesystem::path dir;
  std::string path;

  script_fixture() {
    dir = std::filesystem::temp_directory_path() / "l1cov_lua_adapter";
    std::filesystem::remove_all(dir);
    path = (dir / "script.lua").string();
    REQUIRE(l1cov::util::write_file(path, k_script));
  }

  ~script_fixture() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }
};

} // namespace

TEST_CASE("lua hook records lines, functions and assertion marks") {
  script_fixture fixture;

  auto started = l1cov::start(l1cov::coverage_config{});
  REQUIRE(started.ok());
  auto& session = *started.value;

  sol::state lua;
  lua.open_libraries(sol::lib::base);
  lua["SCRIPT"] = fixture.path;
  l1cov::lua::install_lua_bindings(lua, session);

  l1cov::lua::lua_coverage_hook hook(session, lua.lua_state());
  REQUIRE(hook.attach().ok());
  CHECK(hook.attached());

  auto result = lua.safe_script_file(fixture.path);
  hook.detach();
  REQUIRE(result.valid());
  CHECK(result.get<int>() == 3);
  CHECK(lua_gethook(lua.lua_state()) == nullptr);
  CHECK(hook.event_count() > 0);

  const std::string& path = fixture.path;
  CHECK(session.is_registered(path));
  CHECK(session.was_executed(path, 2));
  CHECK(session.was_executed(path, 8));
  CHECK(session.was_executed(path, 14));
  CHECK_FALSE(session.was_executed(path, 12));

  CHECK(session.was_covered(path, 9));
  CHECK(session.was_covered(path, 10));
  CHECK_FALSE(session.was_covered(path, 5));
  CHECK_FALSE(session.was_covered(path, 8));

  auto summary = session.summary();
  REQUIRE(summary.ok());
  const auto* file = summary.value.find_file(l1cov::util::normalize_path(path));
  REQUIRE(file != nullptr);

  REQUIRE(file->functions.size() == 2);
  CHECK(file->functions[0].name == "add");
  CHECK(file->functions[0].execution_count == 1);
  CHECK(file->functions[1].name == "check");
  CHECK(file->functions[1].execution_count == 1);

  bool found_condition = false;
  for (const auto& condition : file->conditions) {
    if (condition.line == 11 && condition.index == 0) {
      found_condition = true;
      CHECK(condition.true_count == 0);
      CHECK(condition.false_count == 1);
    }
  }
  CHECK(found_condition);
  CHECK(summary.value.anomalies.internal_faults == 0);
}

TEST_CASE("lua hook tracks chunks under their normalized path once the session runs") {
  script_fixture fixture;
  const std::string chunk = (fixture.dir / "." / "retry.lua").string();
  REQUIRE(l1cov::util::write_file(chunk, "local n = 1\nn = n + 1\nreturn n\n"));
  const std::string normalized = l1cov::util::normalize_path(chunk);
  REQUIRE(normalized != chunk);

  l1cov::coverage_session session{l1cov::coverage_config{}};
  sol::state lua;
  l1cov::lua::lua_coverage_hook hook(session, lua.lua_state());
  REQUIRE(hook.attach().ok());

  // events before start cannot register the chunk and must not pin it as untracked
  auto early = lua.safe_script_file(chunk);
  REQUIRE(early.valid());
  CHECK_FALSE(session.is_registered(normalized));

  REQUIRE(session.start().ok());
  auto tracked = lua.safe_script_file(chunk);
  hook.detach();
  REQUIRE(tracked.valid());
  CHECK(tracked.get<int>() == 2);

  const std::vector<std::string> expected_files = {normalized};
  CHECK(session.tracked_files() == expected_files);
  CHECK(session.execution_count(normalized, 1) == 1);
  CHECK(session.execution_count(normalized, 2) == 1);
  CHECK(session.execution_count(normalized, 3) == 1);
}

TEST_CASE("lua hook refuses a second attach on the same state") {
  auto started = l1cov::start(l1cov::coverage_config{});
  REQUIRE(started.ok());

  sol::state lua;
  l1cov::lua::lua_coverage_hook first(*started.value, lua.lua_state());
  l1cov::lua::lua_coverage_hook second(*started.value, lua.lua_state());

  REQUIRE(first.attach().ok());
  CHECK(second.attach().code == l1cov::error_code::invalid_argument);
  first.detach();
  CHECK(second.attach().ok());
}

TEST_CASE("lua bindings return lifecycle errors as values") {
  auto started = l1cov::start(l1cov::coverage_config{});
  REQUIRE(started.ok());
  auto& session = *started.value;
  REQUIRE(session.register_file("mem.lua", "x = 1\ny = 2\n").ok());

  sol::state lua;
  lua.open_libraries(sol::lib::base);
  l1cov::lua::install_lua_bindings(lua, session);

  auto marked = lua.safe_script("ok, err = l1cov.mark_covered('mem.lua', 2)");
  REQUIRE(marked.valid());
  CHECK(lua["ok"].get<bool>());
  CHECK(session.was_covered("mem.lua", 2));

  auto queried = lua.safe_script(
      "covered = l1cov.was_covered('mem.lua', 2)\n"
      "count = l1cov.execution_count('mem.lua', 2)\n"
  );
  REQUIRE(queried.valid());
  CHECK(lua["covered"].get<bool>());
  CHECK(lua["count"].get<int>() == 1);

  REQUIRE(session.stop().ok());
  auto closed = lua.safe_script("ok, err = l1cov.mark_covered('mem.lua', 1)");
  REQUIRE(closed.valid());
  CHECK_FALSE(lua["ok"].get<bool>());
  CHECK_FALSE(lua["err"].get<std::string>().empty());
}

TEST_CASE("lua_frame_resolver finds nothing outside a running chunk") {
  sol::state lua;
  l1cov::lua::lua_frame_resolver resolver(lua.lua_state());
  CHECK_FALSE(resolver.resolve(0).has_value());
  CHECK_FALSE(resolver.resolve(-1).has_value());
}
