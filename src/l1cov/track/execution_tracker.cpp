#include "l1cov/track/execution_tracker.hpp"

namespace l1cov::track {

execution_outcome execution_tracker::record_execution(file_coverage& file, uint32_t line) const {
  line_record& record = file.line(line);
  record.execution_count.fetch_add(1, std::memory_order_acq_rel);

  if (track_blocks_) {
    auto& blocks = file.blocks();
    for (size_t index : file.blocks_triggered_by(line)) {
      blocks[index].execution_count.fetch_add(1, std::memory_order_relaxed);
    }
  }

  // each anomalous event lands in exactly one counter
  if (line == 0 || line > file.source().line_count()) {
    file.anomalies().out_of_range_events.fetch_add(1, std::memory_order_relaxed);
    return execution_outcome::anomalous;
  }

  if (record.kind == line_kind::non_executable) {
    file.anomalies().non_executable_executions.fetch_add(1, std::memory_order_relaxed);
    return execution_outcome::anomalous;
  }

  return execution_outcome::recorded;
}

void execution_tracker::record_function_entry(file_coverage& file, uint32_t defined_line, std::string_view name)
    const {
  function_record& function = file.function_at(defined_line, name);
  function.execution_count.fetch_add(1, std::memory_order_relaxed);

  if (track_blocks_ && function.body_block != static_cast<size_t>(-1)) {
    file.blocks()[function.body_block].execution_count.fetch_add(1, std::memory_order_relaxed);
  }
}

bool execution_tracker::was_executed(const file_coverage& file, uint32_t line) {
  return execution_count(file, line) > 0;
}

uint64_t execution_tracker::execution_count(const file_coverage& file, uint32_t line) {
  const line_record* record = file.find_line(line);
  return record ? record->execution_count.load(std::memory_order_acquire) : 0;
}

} // namespace l1cov::track
