#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "l1cov/core/types.hpp"

namespace l1cov {

namespace track {
class file_coverage;
}

inline double coverage_percent(uint64_t hit, uint64_t total) {
  // nothing to cover counts as fully covered
  if (total == 0) {
    return 100.0;
  }
  return 100.0 * static_cast<double>(hit) / static_cast<double>(total);
}

struct line_summary {
  uint32_t number = 0;
  line_kind kind = line_kind::non_executable;
  uint64_t execution_count = 0;
  bool covered = false;
  std::string text;

  line_status status() const {
    if (!counts_as_executable(kind)) {
      return line_status::non_executable;
    }
    if (covered) {
      return line_status::covered;
    }
    return execution_count > 0 ? line_status::executed : line_status::not_executed;
  }

  bool operator==(const line_summary&) const = default;
};

struct function_summary {
  std::string file;
  std::string name;
  std::string id;
  uint32_t defined_line = 0;
  uint32_t end_line = 0;
  uint64_t execution_count = 0;
  bool anonymous = false;
  bool discovered = false;

  bool operator==(const function_summary&) const = default;
};

struct block_summary {
  block_type type = block_type::other;
  uint32_t start_line = 0;
  uint32_t end_line = 0;
  uint64_t execution_count = 0;
  std::optional<block_key> parent;

  block_key key() const { return block_key{start_line, end_line}; }

  bool operator==(const block_summary&) const = default;
};

struct condition_summary {
  uint32_t line = 0;
  uint32_t index = 0;
  std::string expression;
  uint64_t true_count = 0;
  uint64_t false_count = 0;

  uint32_t covered_outcomes() const { return (true_count > 0 ? 1u : 0u) + (false_count > 0 ? 1u : 0u); }

  bool operator==(const condition_summary&) const = default;
};

struct coverage_totals {
  uint64_t total_files = 0;
  uint64_t total_lines = 0;
  uint64_t executable_lines = 0;
  uint64_t executed_lines = 0;
  uint64_t covered_lines = 0;
  uint64_t total_functions = 0;
  uint64_t executed_functions = 0;
  uint64_t total_blocks = 0;
  uint64_t executed_blocks = 0;
  uint64_t total_condition_outcomes = 0;
  uint64_t covered_condition_outcomes = 0;

  double line_coverage_percent() const { return coverage_percent(covered_lines, executable_lines); }
  double execution_percent() const { return coverage_percent(executed_lines, executable_lines); }
  double function_coverage_percent() const { return coverage_percent(executed_functions, total_functions); }
  double block_coverage_percent() const { return coverage_percent(executed_blocks, total_blocks); }
  double condition_coverage_percent() const {
    return coverage_percent(covered_condition_outcomes, total_condition_outcomes);
  }

  void add(const coverage_totals& other);

  bool operator==(const coverage_totals&) const = default;
};

struct anomaly_summary {
  uint64_t non_executable_executions = 0;
  uint64_t non_executable_marks = 0;
  uint64_t out_of_range_events = 0;
  uint64_t unregistered_file_events = 0;
  uint64_t ambiguous_paths = 0;
  uint64_t internal_faults = 0;

  uint64_t total() const {
    return non_executable_executions + non_executable_marks + out_of_range_events + unregistered_file_events +
           ambiguous_paths + internal_faults;
  }

  bool operator==(const anomaly_summary&) const = default;
};

struct file_summary {
  std::string path;
  coverage_totals totals;
  uint64_t non_executable_executions = 0;
  std::vector<line_summary> lines;
  std::vector<function_summary> functions;
  std::vector<block_summary> blocks;
  std::vector<condition_summary> conditions;

  const block_summary* find_block(const block_key& key) const;

  bool operator==(const file_summary&) const = default;
};

struct coverage_summary {
  coverage_totals totals;
  std::vector<file_summary> files; // sorted by path
  std::vector<function_summary> functions;
  anomaly_summary anomalies;
  bool blocks_tracked = true;
  bool conditions_tracked = true;

  const file_summary* find_file(std::string_view path) const;

  bool operator==(const coverage_summary&) const = default;
};

struct summary_options {
  bool include_blocks = true;
  bool include_conditions = true;
};

// snapshot of one file's records
file_summary summarize_file(const track::file_coverage& file, const summary_options& options);

} // namespace l1cov
