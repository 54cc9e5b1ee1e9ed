#pragma once

#include "l1cov/report/report_formatter.hpp"

namespace l1cov::report {

// per-file table with totals and anomaly counters
class summary_formatter : public report_formatter {
public:
  std::string name() const override { return "summary"; }
  std::string render(const coverage_summary& summary) const override;
};

} // namespace l1cov::report
