#pragma once

#include <string>

#include "l1cov/core/result.hpp"
#include "l1cov/report/report_formatter.hpp"

namespace l1cov::report {

class report_writer {
public:
  // renders and writes to path, creating missing parent directories
  static status write(const std::string& path, const report_formatter& formatter, const coverage_summary& summary);
};

} // namespace l1cov::report
