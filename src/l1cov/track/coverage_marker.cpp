#include "l1cov/track/coverage_marker.hpp"

namespace l1cov::track {

mark_outcome coverage_marker::mark_covered(file_coverage& file, uint32_t line) const {
  mark_outcome outcome;
  line_record& record = file.line(line);

  // repeated marks never add executions: only the 0 -> 1 transition is ours to make
  uint64_t expected = 0;
  outcome.implicit_execution =
      record.execution_count.compare_exchange_strong(expected, 1, std::memory_order_acq_rel, std::memory_order_acquire);

  outcome.newly_covered = !record.covered.exchange(true, std::memory_order_acq_rel);

  const bool in_range = line >= 1 && line <= file.source().line_count();
  if (!in_range || record.kind == line_kind::non_executable) {
    outcome.anomalous = true;
    if (outcome.newly_covered) {
      auto& counter = in_range ? file.anomalies().non_executable_marks : file.anomalies().out_of_range_events;
      counter.fetch_add(1, std::memory_order_relaxed);
    }
  }

  return outcome;
}

bool coverage_marker::was_covered(const file_coverage& file, uint32_t line) {
  const line_record* record = file.find_line(line);
  return record ? record->covered.load(std::memory_order_acquire) : false;
}

} // namespace l1cov::track
