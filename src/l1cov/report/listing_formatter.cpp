#include "l1cov/report/listing_formatter.hpp"

#include <sstream>

#include "l1cov/util/format_utils.hpp"

namespace l1cov::report {

char listing_formatter::status_marker(line_status status) {
  switch (status) {
  case line_status::covered:
    return '+';
  case line_status::executed:
    return '-';
  case line_status::not_executed:
    return '!';
  case line_status::non_executable:
  default:
    return ' ';
  }
}

std::string listing_formatter::render(const coverage_summary& summary) const {
  std::ostringstream out;

  for (const auto& file : summary.files) {
    out << "==> " << file.path << " (" << file.totals.covered_lines << "/" << file.totals.executable_lines
        << " covered, " << file.totals.executed_lines << " executed, "
        << util::format_percent(file.totals.line_coverage_percent()) << ")\n";

    for (const auto& line : file.lines) {
      const line_status status = line.status();
      std::string count;
      if (status != line_status::non_executable || line.execution_count > 0) {
        count = std::to_string(line.execution_count) + "x";
      }
      out << util::align_right(std::to_string(line.number), 6) << " " << status_marker(status) << " "
          << util::align_right(count, 8) << " | " << line.text << "\n";
    }
    out << "\n";
  }

  out << "total: " << summary.totals.covered_lines << "/" << summary.totals.executable_lines << " lines covered ("
      << util::format_percent(summary.totals.line_coverage_percent()) << ")\n";
  return out.str();
}

} // namespace l1cov::report
