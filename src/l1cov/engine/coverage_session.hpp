#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <redlog.hpp>

#include "l1cov/core/result.hpp"
#include "l1cov/engine/coverage_config.hpp"
#include "l1cov/engine/coverage_summary.hpp"
#include "l1cov/engine/frame_resolver.hpp"
#include "l1cov/engine/path_filter.hpp"
#include "l1cov/track/coverage_marker.hpp"
#include "l1cov/track/execution_tracker.hpp"
#include "l1cov/track/file_coverage.hpp"

namespace l1cov {

namespace report {
class report_formatter;
}

enum class session_state { created, running, stopped };

inline constexpr const char* session_state_name(session_state state) {
  switch (state) {
  case session_state::created:
    return "created";
  case session_state::running:
    return "running";
  case session_state::stopped:
  default:
    return "stopped";
  }
}

/**
 * coverage_session owns the coverage data of one run.
 *
 * States move created -> running -> stopped and never back. At most one session is running per process.
 * Tracking calls are safe from any thread; they never throw into the instrumented program and report
 * lifecycle misuse through the returned status. Queries answer neutral defaults for unknown files.
 */
class coverage_session {
public:
  explicit coverage_session(coverage_config config);
  ~coverage_session();

  coverage_session(const coverage_session&) = delete;
  coverage_session& operator=(const coverage_session&) = delete;

  status start();
  // stops accepting tracking calls, drains in-flight ones and releases the process-wide slot
  status stop();

  session_state state() const { return state_.load(std::memory_order_acquire); }
  const coverage_config& config() const { return config_; }

  // the running session of this process, if any
  static coverage_session* active();

  // classifies outside the file map lock; concurrent registrations of one path: last writer wins
  status register_file(std::string_view path, std::string_view source_text);

  status record_execution(std::string_view path, uint32_t line);
  status mark_covered(std::string_view path, uint32_t line);
  status record_function_entry(std::string_view path, uint32_t defined_line, std::string_view name = {});
  status record_condition(std::string_view path, uint32_t line, uint32_t index, bool outcome);
  status mark_current_line_covered(const frame_resolver& resolver, int stack_depth = 0);

  bool was_executed(std::string_view path, uint32_t line) const;
  bool was_covered(std::string_view path, uint32_t line) const;
  uint64_t execution_count(std::string_view path, uint32_t line) const;
  bool is_registered(std::string_view path) const;
  std::vector<std::string> tracked_files() const;

  path_decision decide(std::string_view path) const;

  result<coverage_summary> summary() const;
  // stops a running session and renders its summary
  result<std::string> report(const report::report_formatter& formatter);

private:
  template <typename Fn> status track(const char* operation, std::string_view path, Fn&& fn);

  status admission_status() const;
  std::shared_ptr<track::file_coverage> find_file(std::string_view path) const;
  void note_untracked_event(std::string_view path);
  void note_ambiguous(const path_decision& decision, const std::string& path);

  coverage_config config_;
  path_filter filter_;
  track::execution_tracker tracker_;
  track::coverage_marker marker_;

  std::atomic<session_state> state_{session_state::created};
  std::atomic<uint32_t> in_flight_{0};

  // transparent so lookups by string_view do not allocate
  struct path_hash {
    using is_transparent = void;
    size_t operator()(std::string_view path) const noexcept { return std::hash<std::string_view>{}(path); }
  };

  mutable std::shared_mutex files_mutex_;
  std::unordered_map<std::string, std::shared_ptr<track::file_coverage>, path_hash, std::equal_to<>> files_;

  mutable std::mutex ambiguous_mutex_;
  std::set<std::string> ambiguous_paths_;

  std::atomic<uint64_t> unregistered_file_events_{0};
  std::atomic<uint64_t> internal_faults_{0};

  mutable redlog::logger log_ = redlog::get_logger("l1cov.session");

  static std::atomic<coverage_session*> active_session_;
};

} // namespace l1cov
