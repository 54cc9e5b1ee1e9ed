#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "l1cov/analysis/source_file.hpp"
#include "l1cov/core/types.hpp"

namespace l1cov::track {

// counters are atomics so tracking calls never take the file lock on the hot path.
// writers bump execution_count before publishing covered, readers load covered first.
struct line_record {
  std::atomic<uint64_t> execution_count{0};
  std::atomic<bool> covered{false};
  line_kind kind = line_kind::non_executable;
};

struct block_record {
  explicit block_record(const analysis::block_descriptor& block) : descriptor(block) {}

  analysis::block_descriptor descriptor;
  uint32_t trigger_line = 0; // 0 when the block has no executable body
  std::atomic<uint64_t> execution_count{0};
};

struct function_record {
  function_record(std::string function_name, std::string function_id, uint32_t defined, uint32_t end, bool found)
      : name(std::move(function_name)), id(std::move(function_id)), defined_line(defined), end_line(end),
        discovered(found) {}

  std::string name;
  std::string id;
  uint32_t defined_line = 0;
  uint32_t end_line = 0;
  bool discovered = false; // seen at runtime without a static definition
  size_t body_block = static_cast<size_t>(-1);
  std::atomic<uint64_t> execution_count{0};
};

struct condition_record {
  condition_record(uint32_t condition_line, uint32_t condition_index, std::string text)
      : line(condition_line), index(condition_index), expression(std::move(text)) {}

  uint32_t line = 0;
  uint32_t index = 0;
  std::string expression;
  std::atomic<uint64_t> true_count{0};
  std::atomic<uint64_t> false_count{0};
};

struct file_anomalies {
  std::atomic<uint64_t> non_executable_executions{0};
  std::atomic<uint64_t> non_executable_marks{0};
  std::atomic<uint64_t> out_of_range_events{0};
};

// all dynamic records of one registered file
class file_coverage {
public:
  explicit file_coverage(std::shared_ptr<const analysis::source_file> source);

  file_coverage(const file_coverage&) = delete;
  file_coverage& operator=(const file_coverage&) = delete;

  const analysis::source_file& source() const { return *source_; }
  const std::string& path() const { return source_->path(); }

  // creates an overflow record for lines past the end of the source
  line_record& line(uint32_t number);
  const line_record* find_line(uint32_t number) const;

  // overflow records in line order
  std::vector<std::pair<uint32_t, const line_record*>> overflow_lines() const;

  const std::vector<size_t>& blocks_triggered_by(uint32_t line) const;
  std::deque<block_record>& blocks() { return blocks_; }
  const std::deque<block_record>& blocks() const { return blocks_; }

  function_record& function_at(uint32_t defined_line, std::string_view runtime_name);
  std::vector<const function_record*> functions() const;

  condition_record& condition_at(uint32_t line, uint32_t index);
  std::vector<const condition_record*> conditions() const;

  file_anomalies& anomalies() { return anomalies_; }
  const file_anomalies& anomalies() const { return anomalies_; }

  static std::string synthetic_function_id(std::string_view path, uint32_t line);

private:
  static uint64_t condition_key(uint32_t line, uint32_t index) { return (static_cast<uint64_t>(line) << 32) | index; }

  uint32_t find_trigger_line(const analysis::block_descriptor& block) const;

  std::shared_ptr<const analysis::source_file> source_;
  std::vector<line_record> lines_;

  std::deque<block_record> blocks_;
  std::unordered_map<uint32_t, std::vector<size_t>> blocks_by_trigger_;

  std::deque<function_record> functions_;
  std::unordered_map<uint32_t, size_t> functions_by_line_;

  std::deque<condition_record> conditions_;
  std::unordered_map<uint64_t, size_t> conditions_by_key_;

  file_anomalies anomalies_;

  // guards the runtime-discovered records below
  mutable std::mutex discovered_mutex_;
  std::unordered_map<uint32_t, std::unique_ptr<line_record>> overflow_lines_;
  std::deque<function_record> discovered_functions_;
  std::unordered_map<uint32_t, size_t> discovered_functions_by_line_;
  std::deque<condition_record> discovered_conditions_;
  std::unordered_map<uint64_t, size_t> discovered_conditions_by_key_;
};

} // namespace l1cov::track
