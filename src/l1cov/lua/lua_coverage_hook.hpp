#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include <lua.hpp>
#include <redlog.hpp>

#include "l1cov/core/result.hpp"
#include "l1cov/engine/coverage_session.hpp"

namespace l1cov::lua {

/**
 * drives a coverage_session from a live lua state through the debug hook.
 *
 * line events become record_execution, call events become record_function_entry. a chunk loaded
 * from a file ("@path") is read from disk and registered on its first event; other chunks are ignored.
 * the hook never raises into lua code.
 */
class lua_coverage_hook {
public:
  lua_coverage_hook(coverage_session& session, lua_State* state);
  ~lua_coverage_hook();

  lua_coverage_hook(const lua_coverage_hook&) = delete;
  lua_coverage_hook& operator=(const lua_coverage_hook&) = delete;

  // one hook per lua state
  status attach();
  // restores the hook that was installed before attach()
  void detach();

  bool attached() const { return attached_; }
  uint64_t event_count() const { return events_; }

private:
  static void dispatch(lua_State* state, lua_Debug* ar);
  void on_event(lua_State* state, lua_Debug* ar);

  // registered path for a chunk source, empty when the chunk is not tracked
  const std::string& resolve_chunk(const char* source);

  coverage_session& session_;
  lua_State* state_ = nullptr;
  bool attached_ = false;
  uint64_t events_ = 0;

  lua_Hook previous_hook_ = nullptr;
  int previous_mask_ = 0;
  int previous_count_ = 0;

  std::unordered_map<std::string, std::string> chunk_paths_;
  redlog::logger log_ = redlog::get_logger("l1cov.lua.hook");
};

} // namespace l1cov::lua
