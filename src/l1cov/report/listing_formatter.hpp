#pragma once

#include "l1cov/report/report_formatter.hpp"

namespace l1cov::report {

/**
 * annotated source listing, one block per file.
 *
 * every line carries a status marker and its execution count:
 *   '+'  covered by an assertion
 *   '-'  executed but not covered
 *   '!'  executable, never executed
 *   ' '  not executable
 */
class listing_formatter : public report_formatter {
public:
  std::string name() const override { return "listing"; }
  std::string render(const coverage_summary& summary) const override;

  static char status_marker(line_status status);
};

} // namespace l1cov::report
