#pragma once

#include <cstdint>

#include "l1cov/track/file_coverage.hpp"

namespace l1cov::track {

enum class execution_outcome {
  recorded,
  anomalous, // the line is not executable according to the classifier
};

// per-line execution counting on a registered file
class execution_tracker {
public:
  explicit execution_tracker(bool track_blocks = true) : track_blocks_(track_blocks) {}

  execution_outcome record_execution(file_coverage& file, uint32_t line) const;

  // a function was entered; also enters its body block
  void record_function_entry(file_coverage& file, uint32_t defined_line, std::string_view name) const;

  static bool was_executed(const file_coverage& file, uint32_t line);
  static uint64_t execution_count(const file_coverage& file, uint32_t line);

private:
  bool track_blocks_ = true;
};

} // namespace l1cov::track
