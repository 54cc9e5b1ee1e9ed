#pragma once

#include <string>

#include "l1cov/engine/coverage_summary.hpp"

namespace l1cov::report {

// renders a coverage summary; implementations are pure and deterministic
class report_formatter {
public:
  virtual ~report_formatter() = default;

  virtual std::string name() const = 0;
  virtual std::string render(const coverage_summary& summary) const = 0;
};

} // namespace l1cov::report
