#include "l1cov/engine/coverage_summary.hpp"

#include "l1cov/track/file_coverage.hpp"

namespace l1cov {
namespace {

line_summary summarize_line(uint32_t number, const track::line_record& record, const std::string& text) {
  line_summary line;
  line.number = number;
  line.kind = record.kind;
  // covered first: once it reads true the matching execution is already visible
  line.covered = record.covered.load(std::memory_order_acquire);
  line.execution_count = record.execution_count.load(std::memory_order_acquire);
  line.text = text;
  return line;
}

} // namespace

void coverage_totals::add(const coverage_totals& other) {
  total_files += other.total_files;
  total_lines += other.total_lines;
  executable_lines += other.executable_lines;
  executed_lines += other.executed_lines;
  covered_lines += other.covered_lines;
  total_functions += other.total_functions;
  executed_functions += other.executed_functions;
  total_blocks += other.total_blocks;
  executed_blocks += other.executed_blocks;
  total_condition_outcomes += other.total_condition_outcomes;
  covered_condition_outcomes += other.covered_condition_outcomes;
}

const block_summary* file_summary::find_block(const block_key& key) const {
  for (const auto& block : blocks) {
    if (block.key() == key) {
      return &block;
    }
  }
  return nullptr;
}

const file_summary* coverage_summary::find_file(std::string_view path) const {
  for (const auto& file : files) {
    if (file.path == path) {
      return &file;
    }
  }
  return nullptr;
}

file_summary summarize_file(const track::file_coverage& file, const summary_options& options) {
  const auto& source = file.source();

  file_summary out;
  out.path = file.path();
  out.totals.total_files = 1;
  out.totals.total_lines = source.line_count();
  out.lines.reserve(source.line_count());

  for (uint32_t number = 1; number <= source.line_count(); ++number) {
    const track::line_record* record = file.find_line(number);
    line_summary line = summarize_line(number, *record, source.line_text(number));

    if (counts_as_executable(line.kind)) {
      out.totals.executable_lines += 1;
      if (line.execution_count > 0) {
        out.totals.executed_lines += 1;
      }
      if (line.covered) {
        out.totals.covered_lines += 1;
      }
    }
    out.lines.push_back(std::move(line));
  }

  for (const auto& [number, record] : file.overflow_lines()) {
    out.lines.push_back(summarize_line(number, *record, std::string()));
  }

  for (const track::function_record* record : file.functions()) {
    function_summary function;
    function.file = out.path;
    function.name = record->name;
    function.id = record->id;
    function.defined_line = record->defined_line;
    function.end_line = record->end_line;
    function.execution_count = record->execution_count.load(std::memory_order_acquire);
    function.anonymous = record->name.empty();
    function.discovered = record->discovered;

    out.totals.total_functions += 1;
    if (function.execution_count > 0) {
      out.totals.executed_functions += 1;
    }
    out.functions.push_back(std::move(function));
  }

  if (options.include_blocks) {
    for (const auto& record : file.blocks()) {
      block_summary block;
      block.type = record.descriptor.type;
      block.start_line = record.descriptor.start_line;
      block.end_line = record.descriptor.end_line;
      block.parent = record.descriptor.parent;
      block.execution_count = record.execution_count.load(std::memory_order_acquire);

      out.totals.total_blocks += 1;
      if (block.execution_count > 0) {
        out.totals.executed_blocks += 1;
      }
      out.blocks.push_back(std::move(block));
    }
  }

  if (options.include_conditions) {
    for (const track::condition_record* record : file.conditions()) {
      condition_summary condition;
      condition.line = record->line;
      condition.index = record->index;
      condition.expression = record->expression;
      condition.true_count = record->true_count.load(std::memory_order_acquire);
      condition.false_count = record->false_count.load(std::memory_order_acquire);

      out.totals.total_condition_outcomes += 2;
      out.totals.covered_condition_outcomes += condition.covered_outcomes();
      out.conditions.push_back(std::move(condition));
    }
  }

  out.non_executable_executions = file.anomalies().non_executable_executions.load(std::memory_order_acquire);
  return out;
}

} // namespace l1cov
