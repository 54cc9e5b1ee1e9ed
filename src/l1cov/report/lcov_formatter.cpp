#include "l1cov/report/lcov_formatter.hpp"

#include <sstream>

namespace l1cov::report {
namespace {

std::string branch_taken(uint64_t count, bool evaluated) {
  if (!evaluated) {
    return "-";
  }
  return std::to_string(count);
}

} // namespace

std::string lcov_formatter::render(const coverage_summary& summary) const {
  std::ostringstream out;

  for (const auto& file : summary.files) {
    out << "TN:" << test_name_ << "\n";
    out << "SF:" << file.path << "\n";

    for (const auto& function : file.functions) {
      out << "FN:" << function.defined_line << "," << function.id << "\n";
    }
    for (const auto& function : file.functions) {
      out << "FNDA:" << function.execution_count << "," << function.id << "\n";
    }
    out << "FNF:" << file.totals.total_functions << "\n";
    out << "FNH:" << file.totals.executed_functions << "\n";

    if (summary.conditions_tracked) {
      for (const auto& condition : file.conditions) {
        const bool evaluated = condition.true_count + condition.false_count > 0;
        out << "BRDA:" << condition.line << "," << condition.index << ",0,"
            << branch_taken(condition.true_count, evaluated) << "\n";
        out << "BRDA:" << condition.line << "," << condition.index << ",1,"
            << branch_taken(condition.false_count, evaluated) << "\n";
      }
      out << "BRF:" << file.totals.total_condition_outcomes << "\n";
      out << "BRH:" << file.totals.covered_condition_outcomes << "\n";
    }

    for (const auto& line : file.lines) {
      if (!counts_as_executable(line.kind)) {
        continue;
      }
      out << "DA:" << line.number << "," << line.execution_count << "\n";
    }
    out << "LF:" << file.totals.executable_lines << "\n";
    out << "LH:" << file.totals.executed_lines << "\n";
    out << "end_of_record\n";
  }

  return out.str();
}

} // namespace l1cov::report
