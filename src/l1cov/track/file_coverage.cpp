#include "l1cov/track/file_coverage.hpp"

#include <algorithm>

namespace l1cov::track {
namespace {

const std::vector<size_t> k_no_blocks;

} // namespace

file_coverage::file_coverage(std::shared_ptr<const analysis::source_file> source)
    : source_(std::move(source)), lines_(source_->line_count()) {
  for (uint32_t i = 0; i < lines_.size(); ++i) {
    lines_[i].kind = source_->kind(i + 1);
  }

  const auto& structure = source_->structure();

  for (const auto& block : structure.blocks) {
    block_record& record = blocks_.emplace_back(block);
    if (block.type == block_type::function_body) {
      continue;
    }
    record.trigger_line = find_trigger_line(block);
    if (record.trigger_line != 0) {
      blocks_by_trigger_[record.trigger_line].push_back(blocks_.size() - 1);
    }
  }

  for (const auto& function : structure.functions) {
    std::string id = function.name.empty() ? synthetic_function_id(path(), function.defined_line) : function.name;
    function_record& record =
        functions_.emplace_back(function.name, std::move(id), function.defined_line, function.end_line, false);

    for (size_t i = 0; i < blocks_.size(); ++i) {
      const auto& descriptor = blocks_[i].descriptor;
      if (descriptor.type == block_type::function_body && descriptor.start_line == function.defined_line &&
          descriptor.end_line == function.end_line) {
        record.body_block = i;
        break;
      }
    }
    // two functions on one line share the first definition
    functions_by_line_.emplace(function.defined_line, functions_.size() - 1);
  }

  for (const auto& condition : structure.conditions) {
    conditions_.emplace_back(condition.line, condition.index, condition.expression);
    conditions_by_key_.emplace(condition_key(condition.line, condition.index), conditions_.size() - 1);
  }
}

uint32_t file_coverage::find_trigger_line(const analysis::block_descriptor& block) const {
  // a block counts as entered when the first statement of its body runs
  for (uint32_t line = block.start_line + 1; line < block.end_line; ++line) {
    if (counts_as_executable(source_->kind(line))) {
      return line;
    }
  }
  if (block.start_line == block.end_line && counts_as_executable(source_->kind(block.start_line))) {
    return block.start_line;
  }
  return 0;
}

line_record& file_coverage::line(uint32_t number) {
  if (number >= 1 && number <= lines_.size()) {
    return lines_[number - 1];
  }

  std::lock_guard<std::mutex> lock(discovered_mutex_);
  auto& slot = overflow_lines_[number];
  if (!slot) {
    slot = std::make_unique<line_record>();
  }
  return *slot;
}

const line_record* file_coverage::find_line(uint32_t number) const {
  if (number >= 1 && number <= lines_.size()) {
    return &lines_[number - 1];
  }

  std::lock_guard<std::mutex> lock(discovered_mutex_);
  auto it = overflow_lines_.find(number);
  return it == overflow_lines_.end() ? nullptr : it->second.get();
}

std::vector<std::pair<uint32_t, const line_record*>> file_coverage::overflow_lines() const {
  std::vector<std::pair<uint32_t, const line_record*>> out;
  {
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    out.reserve(overflow_lines_.size());
    for (const auto& [number, record] : overflow_lines_) {
      out.emplace_back(number, record.get());
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
  return out;
}

const std::vector<size_t>& file_coverage::blocks_triggered_by(uint32_t line) const {
  auto it = blocks_by_trigger_.find(line);
  return it == blocks_by_trigger_.end() ? k_no_blocks : it->second;
}

function_record& file_coverage::function_at(uint32_t defined_line, std::string_view runtime_name) {
  auto it = functions_by_line_.find(defined_line);
  if (it != functions_by_line_.end()) {
    return functions_[it->second];
  }

  std::lock_guard<std::mutex> lock(discovered_mutex_);
  auto found = discovered_functions_by_line_.find(defined_line);
  if (found != discovered_functions_by_line_.end()) {
    return discovered_functions_[found->second];
  }

  std::string name(runtime_name);
  std::string id = name.empty() ? synthetic_function_id(path(), defined_line) : name;
  function_record& record = discovered_functions_.emplace_back(std::move(name), std::move(id), defined_line, 0, true);
  discovered_functions_by_line_.emplace(defined_line, discovered_functions_.size() - 1);
  return record;
}

std::vector<const function_record*> file_coverage::functions() const {
  std::vector<const function_record*> out;
  out.reserve(functions_.size());
  for (const auto& function : functions_) {
    out.push_back(&function);
  }
  {
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    for (const auto& function : discovered_functions_) {
      out.push_back(&function);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const function_record* a, const function_record* b) {
    return a->defined_line < b->defined_line;
  });
  return out;
}

condition_record& file_coverage::condition_at(uint32_t line, uint32_t index) {
  const uint64_t key = condition_key(line, index);
  auto it = conditions_by_key_.find(key);
  if (it != conditions_by_key_.end()) {
    return conditions_[it->second];
  }

  std::lock_guard<std::mutex> lock(discovered_mutex_);
  auto found = discovered_conditions_by_key_.find(key);
  if (found != discovered_conditions_by_key_.end()) {
    return discovered_conditions_[found->second];
  }

  condition_record& record = discovered_conditions_.emplace_back(line, index, std::string());
  discovered_conditions_by_key_.emplace(key, discovered_conditions_.size() - 1);
  return record;
}

std::vector<const condition_record*> file_coverage::conditions() const {
  std::vector<const condition_record*> out;
  out.reserve(conditions_.size());
  for (const auto& condition : conditions_) {
    out.push_back(&condition);
  }
  {
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    for (const auto& condition : discovered_conditions_) {
      out.push_back(&condition);
    }
  }
  std::sort(out.begin(), out.end(), [](const condition_record* a, const condition_record* b) {
    return a->line != b->line ? a->line < b->line : a->index < b->index;
  });
  return out;
}

std::string file_coverage::synthetic_function_id(std::string_view path, uint32_t line) {
  return "<anonymous@" + std::string(path) + ":" + std::to_string(line) + ">";
}

} // namespace l1cov::track
