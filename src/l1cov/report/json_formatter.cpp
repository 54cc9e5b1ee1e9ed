#include "l1cov/report/json_formatter.hpp"

namespace l1cov {

NLOHMANN_JSON_SERIALIZE_ENUM(
    line_kind, {
                   {line_kind::non_executable, "non_executable"},
                   {line_kind::executable, "executable"},
                   {line_kind::block_start, "block_start"},
                   {line_kind::block_end, "block_end"},
               }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    line_status, {
                     {line_status::non_executable, "non_executable"},
                     {line_status::not_executed, "not_executed"},
                     {line_status::executed, "executed"},
                     {line_status::covered, "covered"},
                 }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    block_type, {
                    {block_type::branch, "branch"},
                    {block_type::loop, "loop"},
                    {block_type::function_body, "function_body"},
                    {block_type::other, "other"},
                }
)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    function_summary, file, name, id, defined_line, end_line, execution_count, anonymous, discovered
)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(condition_summary, line, index, expression, true_count, false_count)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    anomaly_summary, non_executable_executions, non_executable_marks, out_of_range_events, unregistered_file_events,
    ambiguous_paths, internal_faults
)

void to_json(nlohmann::json& j, const coverage_totals& totals) {
  j = nlohmann::json{
      {"total_files", totals.total_files},
      {"total_lines", totals.total_lines},
      {"executable_lines", totals.executable_lines},
      {"executed_lines", totals.executed_lines},
      {"covered_lines", totals.covered_lines},
      {"line_coverage_percent", totals.line_coverage_percent()},
      {"total_functions", totals.total_functions},
      {"executed_functions", totals.executed_functions},
      {"total_blocks", totals.total_blocks},
      {"executed_blocks", totals.executed_blocks},
      {"total_condition_outcomes", totals.total_condition_outcomes},
      {"covered_condition_outcomes", totals.covered_condition_outcomes},
  };
}

void to_json(nlohmann::json& j, const line_summary& line) {
  j = nlohmann::json{
      {"number", line.number},
      {"kind", line.kind},
      {"status", line.status()},
      {"execution_count", line.execution_count},
      {"covered", line.covered},
      {"text", line.text},
  };
}

void to_json(nlohmann::json& j, const block_summary& block) {
  j = nlohmann::json{
      {"type", block.type},
      {"start_line", block.start_line},
      {"end_line", block.end_line},
      {"execution_count", block.execution_count},
  };
  if (block.parent) {
    j["parent"] = nlohmann::json{{"start_line", block.parent->start_line}, {"end_line", block.parent->end_line}};
  } else {
    j["parent"] = nullptr;
  }
}

void to_json(nlohmann::json& j, const file_summary& file) {
  j = nlohmann::json{
      {"path", file.path},
      {"totals", file.totals},
      {"non_executable_executions", file.non_executable_executions},
      {"lines", file.lines},
      {"functions", file.functions},
      {"blocks", file.blocks},
      {"conditions", file.conditions},
  };
}

} // namespace l1cov

namespace l1cov::report {

nlohmann::json json_formatter::to_json(const coverage_summary& summary) {
  nlohmann::json j;
  j["version"] = 1;
  j["totals"] = summary.totals;
  j["anomalies"] = summary.anomalies;
  j["blocks_tracked"] = summary.blocks_tracked;
  j["conditions_tracked"] = summary.conditions_tracked;
  j["files"] = summary.files;
  j["functions"] = summary.functions;
  return j;
}

std::string json_formatter::render(const coverage_summary& summary) const {
  // source text is not guaranteed to be valid utf-8
  return to_json(summary).dump(indent_, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace l1cov::report
