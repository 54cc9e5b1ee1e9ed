#include "l1cov/report/summary_formatter.hpp"

#include <algorithm>
#include <sstream>

#include "l1cov/util/format_utils.hpp"

namespace l1cov::report {
namespace {

void write_row(
    std::ostringstream& out, const std::string& label, size_t label_width, const coverage_totals& totals,
    bool blocks, bool conditions
) {
  out << util::align_left(label, label_width) << "  " << util::align_right(std::to_string(totals.executable_lines), 6)
      << "  " << util::align_right(std::to_string(totals.executed_lines), 8) << "  "
      << util::align_right(std::to_string(totals.covered_lines), 7) << "  "
      << util::align_right(util::format_percent(totals.line_coverage_percent()), 8) << "  "
      << util::align_right(util::format_ratio(totals.executed_functions, totals.total_functions), 9);
  if (blocks) {
    out << "  " << util::align_right(util::format_ratio(totals.executed_blocks, totals.total_blocks), 9);
  }
  if (conditions) {
    out << "  "
        << util::align_right(
               util::format_ratio(totals.covered_condition_outcomes, totals.total_condition_outcomes), 10
           );
  }
  out << "\n";
}

} // namespace

std::string summary_formatter::render(const coverage_summary& summary) const {
  size_t label_width = 5;
  for (const auto& file : summary.files) {
    label_width = std::max(label_width, file.path.size());
  }

  std::ostringstream out;
  out << util::align_left("file", label_width) << "  " << util::align_right("lines", 6) << "  "
      << util::align_right("executed", 8) << "  " << util::align_right("covered", 7) << "  "
      << util::align_right("cover", 8) << "  " << util::align_right("functions", 9);
  if (summary.blocks_tracked) {
    out << "  " << util::align_right("blocks", 9);
  }
  if (summary.conditions_tracked) {
    out << "  " << util::align_right("conditions", 10);
  }
  out << "\n";

  for (const auto& file : summary.files) {
    write_row(out, file.path, label_width, file.totals, summary.blocks_tracked, summary.conditions_tracked);
  }
  write_row(out, "total", label_width, summary.totals, summary.blocks_tracked, summary.conditions_tracked);

  const auto& anomalies = summary.anomalies;
  if (anomalies.total() > 0) {
    out << "\nanomalies:\n";
    auto write_anomaly = [&out](const char* label, uint64_t value) {
      if (value > 0) {
        out << "  " << label << ": " << value << "\n";
      }
    };
    write_anomaly("non-executable executions", anomalies.non_executable_executions);
    write_anomaly("non-executable marks", anomalies.non_executable_marks);
    write_anomaly("out of range events", anomalies.out_of_range_events);
    write_anomaly("unregistered file events", anomalies.unregistered_file_events);
    write_anomaly("ambiguous paths", anomalies.ambiguous_paths);
    write_anomaly("internal faults", anomalies.internal_faults);
  }
  return out.str();
}

} // namespace l1cov::report
