#include "l1cov/engine/coverage_session.hpp"

#include <algorithm>
#include <exception>
#include <new>
#include <thread>

#include "l1cov/analysis/source_file.hpp"
#include "l1cov/report/report_formatter.hpp"
#include "l1cov/util/path_utils.hpp"

namespace l1cov {

std::atomic<coverage_session*> coverage_session::active_session_{nullptr};

namespace {

// keeps stop() waiting while a tracking call is inside the session
class in_flight_guard {
public:
  explicit in_flight_guard(std::atomic<uint32_t>& counter) : counter_(counter) { counter_.fetch_add(1); }
  ~in_flight_guard() { counter_.fetch_sub(1); }

  in_flight_guard(const in_flight_guard&) = delete;
  in_flight_guard& operator=(const in_flight_guard&) = delete;

private:
  std::atomic<uint32_t>& counter_;
};

} // namespace

coverage_session::coverage_session(coverage_config config)
    : config_(std::move(config)), filter_(config_.include_patterns, config_.exclude_patterns),
      tracker_(config_.track_blocks) {}

coverage_session::~coverage_session() {
  if (state() == session_state::running) {
    status stopped = stop();
    if (!stopped.ok()) {
      log_.wrn("failed to stop session on destruction", redlog::field("error", stopped.message));
    }
  }
}

coverage_session* coverage_session::active() { return active_session_.load(std::memory_order_acquire); }

status coverage_session::start() {
  session_state current = state();
  if (current == session_state::running) {
    return make_status(error_code::session_already_active, "session is already running");
  }
  if (current == session_state::stopped) {
    return make_status(error_code::session_closed, "a stopped session cannot be restarted");
  }

  status config_status = path_filter::validate(config_.include_patterns, config_.exclude_patterns);
  if (!config_status.ok()) {
    log_.err("invalid coverage configuration", redlog::field("error", config_status.message));
    return config_status;
  }

  coverage_session* expected_slot = nullptr;
  if (!active_session_.compare_exchange_strong(expected_slot, this, std::memory_order_acq_rel)) {
    log_.wrn("another coverage session is already running");
    return make_status(error_code::session_already_active, "another coverage session is already running");
  }

  session_state expected_state = session_state::created;
  if (!state_.compare_exchange_strong(expected_state, session_state::running)) {
    active_session_.store(nullptr, std::memory_order_release);
    return make_status(error_code::session_already_active, "session was started concurrently");
  }

  log_.inf(
      "coverage session started", redlog::field("track_blocks", config_.track_blocks),
      redlog::field("track_conditions", config_.track_conditions),
      redlog::field("include_patterns", config_.include_patterns.size()),
      redlog::field("exclude_patterns", config_.exclude_patterns.size())
  );
  return ok_status();
}

status coverage_session::stop() {
  session_state expected = session_state::running;
  if (!state_.compare_exchange_strong(expected, session_state::stopped)) {
    if (expected == session_state::created) {
      return make_status(error_code::session_not_started, "session was never started");
    }
    return make_status(error_code::session_closed, "session is already stopped");
  }

  while (in_flight_.load() != 0) {
    std::this_thread::yield();
  }

  coverage_session* self = this;
  active_session_.compare_exchange_strong(self, nullptr, std::memory_order_acq_rel);

  log_.inf("coverage session stopped", redlog::field("files", tracked_files().size()));
  return ok_status();
}

status coverage_session::admission_status() const {
  // sequentially consistent so stop() either sees our in-flight count or we see the stopped state
  switch (state_.load()) {
  case session_state::running:
    return ok_status();
  case session_state::created:
    return make_status(error_code::session_not_started, "session has not been started");
  case session_state::stopped:
  default:
    return make_status(error_code::session_closed, "session is stopped");
  }
}

std::shared_ptr<track::file_coverage> coverage_session::find_file(std::string_view path) const {
  std::shared_lock<std::shared_mutex> lock(files_mutex_);
  auto it = files_.find(path);
  if (it != files_.end()) {
    return it->second;
  }

  std::string normalized = util::normalize_path(path);
  it = files_.find(normalized);
  return it == files_.end() ? nullptr : it->second;
}

void coverage_session::note_ambiguous(const path_decision& decision, const std::string& path) {
  if (!decision.ambiguous) {
    return;
  }
  std::lock_guard<std::mutex> lock(ambiguous_mutex_);
  if (ambiguous_paths_.insert(path).second) {
    log_.vrb(
        "path matched include and exclude, excluding", redlog::field("path", path),
        redlog::field("pattern", decision.pattern)
    );
  }
}

void coverage_session::note_untracked_event(std::string_view path) {
  std::string normalized = util::normalize_path(path);
  path_decision decision = filter_.decide(normalized);
  if (!decision.included) {
    note_ambiguous(decision, normalized);
    return;
  }

  uint64_t previous = unregistered_file_events_.fetch_add(1, std::memory_order_relaxed);
  if (previous == 0) {
    log_.dbg("event for unregistered file ignored", redlog::field("path", normalized));
  }
}

template <typename Fn> status coverage_session::track(const char* operation, std::string_view path, Fn&& fn) {
  in_flight_guard guard(in_flight_);

  status admitted = admission_status();
  if (!admitted.ok()) {
    return admitted;
  }

  try {
    std::shared_ptr<track::file_coverage> file = find_file(path);
    if (!file) {
      note_untracked_event(path);
      return ok_status();
    }
    fn(*file);
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& e) {
    internal_faults_.fetch_add(1, std::memory_order_relaxed);
    log_.err(
        "internal fault during tracking call", redlog::field("operation", operation),
        redlog::field("path", std::string(path)), redlog::field("error", e.what())
    );
  }
  return ok_status();
}

status coverage_session::register_file(std::string_view path, std::string_view source_text) {
  in_flight_guard guard(in_flight_);

  status admitted = admission_status();
  if (!admitted.ok()) {
    return admitted;
  }

  std::string normalized = util::normalize_path(path);
  path_decision decision = filter_.decide(normalized);
  note_ambiguous(decision, normalized);
  if (!decision.included) {
    log_.trc(
        "skipping excluded file", redlog::field("path", normalized),
        redlog::field("rule", path_rule_name(decision.rule)), redlog::field("pattern", decision.pattern)
    );
    return ok_status();
  }

  try {
    std::shared_ptr<track::file_coverage> current = find_file(normalized);
    if (current && current->source().text() == source_text) {
      return ok_status();
    }

    // classification runs unlocked, the map lock only covers the swap
    auto coverage = std::make_shared<track::file_coverage>(analysis::source_file::create(normalized, source_text));

    bool replaced = false;
    {
      std::unique_lock<std::shared_mutex> lock(files_mutex_);
      auto it = files_.find(normalized);
      if (it != files_.end()) {
        if (it->second->source().text() == source_text) {
          return ok_status();
        }
        replaced = true;
        it->second = coverage;
      } else {
        files_.emplace(normalized, coverage);
      }
    }

    log_.dbg(
        replaced ? "re-registered file with new source" : "registered file", redlog::field("path", normalized),
        redlog::field("lines", coverage->source().line_count()),
        redlog::field("executable", coverage->source().executable_line_count())
    );
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& e) {
    internal_faults_.fetch_add(1, std::memory_order_relaxed);
    log_.err("failed to register file", redlog::field("path", normalized), redlog::field("error", e.what()));
  }
  return ok_status();
}

status coverage_session::record_execution(std::string_view path, uint32_t line) {
  return track("record_execution", path, [&](track::file_coverage& file) {
    if (tracker_.record_execution(file, line) == track::execution_outcome::anomalous) {
      log_.ped("execution of non-executable line", redlog::field("path", file.path()), redlog::field("line", line));
    }
  });
}

status coverage_session::mark_covered(std::string_view path, uint32_t line) {
  return track("mark_covered", path, [&](track::file_coverage& file) {
    track::mark_outcome outcome = marker_.mark_covered(file, line);
    if (outcome.anomalous && outcome.newly_covered) {
      log_.dbg("covered mark on non-executable line", redlog::field("path", file.path()), redlog::field("line", line));
    }
  });
}

status coverage_session::record_function_entry(std::string_view path, uint32_t defined_line, std::string_view name) {
  return track("record_function_entry", path, [&](track::file_coverage& file) {
    tracker_.record_function_entry(file, defined_line, name);
  });
}

status coverage_session::record_condition(std::string_view path, uint32_t line, uint32_t index, bool outcome) {
  if (!config_.track_conditions) {
    return admission_status();
  }
  return track("record_condition", path, [&](track::file_coverage& file) {
    track::condition_record& condition = file.condition_at(line, index);
    auto& counter = outcome ? condition.true_count : condition.false_count;
    counter.fetch_add(1, std::memory_order_relaxed);
  });
}

status coverage_session::mark_current_line_covered(const frame_resolver& resolver, int stack_depth) {
  status admitted = admission_status();
  if (!admitted.ok()) {
    return admitted;
  }

  std::optional<source_position> position;
  try {
    position = resolver.resolve(stack_depth);
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& e) {
    internal_faults_.fetch_add(1, std::memory_order_relaxed);
    log_.err("frame resolution failed", redlog::field("depth", stack_depth), redlog::field("error", e.what()));
    return ok_status();
  }

  if (!position) {
    log_.dbg("no source position at stack depth", redlog::field("depth", stack_depth));
    return ok_status();
  }
  return mark_covered(position->path, position->line);
}

bool coverage_session::was_executed(std::string_view path, uint32_t line) const {
  auto file = find_file(path);
  return file ? track::execution_tracker::was_executed(*file, line) : false;
}

bool coverage_session::was_covered(std::string_view path, uint32_t line) const {
  auto file = find_file(path);
  return file ? track::coverage_marker::was_covered(*file, line) : false;
}

uint64_t coverage_session::execution_count(std::string_view path, uint32_t line) const {
  auto file = find_file(path);
  return file ? track::execution_tracker::execution_count(*file, line) : 0;
}

bool coverage_session::is_registered(std::string_view path) const { return find_file(path) != nullptr; }

std::vector<std::string> coverage_session::tracked_files() const {
  std::vector<std::string> paths;
  {
    std::shared_lock<std::shared_mutex> lock(files_mutex_);
    paths.reserve(files_.size());
    for (const auto& [path, file] : files_) {
      paths.push_back(path);
    }
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}

path_decision coverage_session::decide(std::string_view path) const {
  return filter_.decide(util::normalize_path(path));
}

result<coverage_summary> coverage_session::summary() const {
  if (state() == session_state::created) {
    return error_result<coverage_summary>(error_code::session_not_started, "session has not been started");
  }

  std::vector<std::shared_ptr<track::file_coverage>> files;
  {
    std::shared_lock<std::shared_mutex> lock(files_mutex_);
    files.reserve(files_.size());
    for (const auto& [path, file] : files_) {
      files.push_back(file);
    }
  }
  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a->path() < b->path(); });

  summary_options options;
  options.include_blocks = config_.track_blocks;
  options.include_conditions = config_.track_conditions;

  coverage_summary out;
  out.blocks_tracked = config_.track_blocks;
  out.conditions_tracked = config_.track_conditions;
  out.files.reserve(files.size());

  for (const auto& file : files) {
    file_summary entry = summarize_file(*file, options);
    out.totals.add(entry.totals);
    out.functions.insert(out.functions.end(), entry.functions.begin(), entry.functions.end());

    const auto& anomalies = file->anomalies();
    out.anomalies.non_executable_executions += anomalies.non_executable_executions.load(std::memory_order_acquire);
    out.anomalies.non_executable_marks += anomalies.non_executable_marks.load(std::memory_order_acquire);
    out.anomalies.out_of_range_events += anomalies.out_of_range_events.load(std::memory_order_acquire);

    out.files.push_back(std::move(entry));
  }

  out.anomalies.unregistered_file_events = unregistered_file_events_.load(std::memory_order_acquire);
  out.anomalies.internal_faults = internal_faults_.load(std::memory_order_acquire);
  {
    std::lock_guard<std::mutex> lock(ambiguous_mutex_);
    out.anomalies.ambiguous_paths = ambiguous_paths_.size();
  }

  return ok_result(std::move(out));
}

result<std::string> coverage_session::report(const report::report_formatter& formatter) {
  if (state() == session_state::running) {
    status stopped = stop();
    if (!stopped.ok()) {
      return error_result<std::string>(stopped);
    }
  }

  auto snapshot = summary();
  if (!snapshot.ok()) {
    return error_result<std::string>(snapshot.status_info);
  }

  try {
    return ok_result(formatter.render(snapshot.value));
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& e) {
    log_.err("formatter failed", redlog::field("formatter", formatter.name()), redlog::field("error", e.what()));
    return error_result<std::string>(error_code::internal_error, std::string("formatter failed: ") + e.what());
  }
}

} // namespace l1cov
