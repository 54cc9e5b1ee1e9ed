#include "l1cov/lua/lua_coverage_hook.hpp"

#include <exception>

#include "l1cov/util/file_utils.hpp"
#include "l1cov/util/path_utils.hpp"

namespace l1cov::lua {
namespace {

// registry slot holding the hook object of a state; only its address is used
const char k_hook_registry_key = 0;

lua_coverage_hook* hook_from_registry(lua_State* state) {
  lua_rawgetp(state, LUA_REGISTRYINDEX, &k_hook_registry_key);
  auto* hook = static_cast<lua_coverage_hook*>(lua_touserdata(state, -1));
  lua_pop(state, 1);
  return hook;
}

} // namespace

lua_coverage_hook::lua_coverage_hook(coverage_session& session, lua_State* state) : session_(session), state_(state) {}

lua_coverage_hook::~lua_coverage_hook() { detach(); }

status lua_coverage_hook::attach() {
  if (attached_) {
    return ok_status();
  }
  if (!state_) {
    return make_status(error_code::invalid_argument, "lua state is null");
  }
  if (hook_from_registry(state_) != nullptr) {
    return make_status(error_code::invalid_argument, "a coverage hook is already attached to this lua state");
  }

  lua_pushlightuserdata(state_, this);
  lua_rawsetp(state_, LUA_REGISTRYINDEX, &k_hook_registry_key);

  previous_hook_ = lua_gethook(state_);
  previous_mask_ = lua_gethookmask(state_);
  previous_count_ = lua_gethookcount(state_);

  lua_sethook(state_, &lua_coverage_hook::dispatch, LUA_MASKLINE | LUA_MASKCALL, 0);
  attached_ = true;

  log_.dbg("lua coverage hook attached");
  return ok_status();
}

void lua_coverage_hook::detach() {
  if (!attached_) {
    return;
  }

  lua_sethook(state_, previous_hook_, previous_mask_, previous_count_);
  lua_pushnil(state_);
  lua_rawsetp(state_, LUA_REGISTRYINDEX, &k_hook_registry_key);
  attached_ = false;

  log_.dbg(
      "lua coverage hook detached", redlog::field("events", events_), redlog::field("chunks", chunk_paths_.size())
  );
}

void lua_coverage_hook::dispatch(lua_State* state, lua_Debug* ar) {
  lua_coverage_hook* hook = hook_from_registry(state);
  if (hook) {
    hook->on_event(state, ar);
  }
}

const std::string& lua_coverage_hook::resolve_chunk(const char* source) {
  auto it = chunk_paths_.find(source);
  if (it != chunk_paths_.end()) {
    return it->second;
  }

  static const std::string untracked;

  std::string path;
  if (source[0] == '@') {
    std::string candidate = util::normalize_path(source + 1);
    auto text = util::read_file_string(candidate);
    if (!text) {
      log_.wrn("cannot read lua chunk source, not tracking it", redlog::field("path", candidate));
    } else {
      status registered = session_.register_file(candidate, *text);
      if (!registered.ok()) {
        // not cached, a later event retries once the session accepts files
        log_.dbg(
            "failed to register lua chunk", redlog::field("path", candidate),
            redlog::field("error", registered.message)
        );
        return untracked;
      }
      if (session_.is_registered(candidate)) {
        path = std::move(candidate);
      }
    }
  }

  return chunk_paths_.emplace(source, std::move(path)).first->second;
}

void lua_coverage_hook::on_event(lua_State* state, lua_Debug* ar) {
  ++events_;

  try {
    if (ar->event == LUA_HOOKLINE) {
      if (!lua_getinfo(state, "S", ar) || !ar->source) {
        return;
      }
      const std::string& path = resolve_chunk(ar->source);
      if (path.empty() || ar->currentline <= 0) {
        return;
      }
      status recorded = session_.record_execution(path, static_cast<uint32_t>(ar->currentline));
      if (!recorded.ok()) {
        log_.trc("line event dropped", redlog::field("error", recorded.message));
      }
      return;
    }

    if (ar->event == LUA_HOOKCALL || ar->event == LUA_HOOKTAILCALL) {
      if (!lua_getinfo(state, "Sn", ar) || !ar->source || !ar->what) {
        return;
      }
      // the main chunk and c functions have no definition to attribute
      if (ar->what[0] != 'L' || ar->linedefined <= 0) {
        return;
      }
      const std::string& path = resolve_chunk(ar->source);
      if (path.empty()) {
        return;
      }
      status recorded = session_.record_function_entry(
          path, static_cast<uint32_t>(ar->linedefined), ar->name ? std::string_view(ar->name) : std::string_view()
      );
      if (!recorded.ok()) {
        log_.trc("call event dropped", redlog::field("error", recorded.message));
      }
    }
  } catch (const std::exception& e) {
    // unwinding through lua frames is not an option here
    log_.err("lua coverage hook failed", redlog::field("error", e.what()));
  }
}

} // namespace l1cov::lua
