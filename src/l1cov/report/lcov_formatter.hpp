#pragma once

#include <string>

#include "l1cov/report/report_formatter.hpp"

namespace l1cov::report {

// lcov tracefile; conditions are written as BRDA records with branch 0 for true and 1 for false
class lcov_formatter : public report_formatter {
public:
  explicit lcov_formatter(std::string test_name = "l1cov") : test_name_(std::move(test_name)) {}

  std::string name() const override { return "lcov"; }
  std::string render(const coverage_summary& summary) const override;

private:
  std::string test_name_;
};

} // namespace l1cov::report
