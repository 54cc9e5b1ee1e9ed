#pragma once

#include <cstdint>

#include "l1cov/track/file_coverage.hpp"

namespace l1cov::track {

struct mark_outcome {
  bool newly_covered = false;
  bool implicit_execution = false; // the line had not executed yet and one execution was recorded
  bool anomalous = false;          // the line is not executable according to the classifier
};

// assertion-validated coverage; a covered line always has at least one execution
class coverage_marker {
public:
  mark_outcome mark_covered(file_coverage& file, uint32_t line) const;

  static bool was_covered(const file_coverage& file, uint32_t line);
};

} // namespace l1cov::track
