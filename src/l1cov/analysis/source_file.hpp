#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "l1cov/analysis/structure_analyzer.hpp"
#include "l1cov/core/types.hpp"

namespace l1cov::analysis {

// immutable source text plus its classification; built once per registration
class source_file {
public:
  static std::shared_ptr<const source_file> create(std::string path, std::string_view source_text);

  const std::string& path() const { return path_; }
  const std::string& text() const { return text_; }
  uint32_t line_count() const { return static_cast<uint32_t>(lines_.size()); }

  // 1-based; out of range lines are non_executable with empty text
  line_kind kind(uint32_t line) const;
  const std::string& line_text(uint32_t line) const;

  const std::vector<std::string>& lines() const { return lines_; }
  const std::vector<line_kind>& kinds() const { return kinds_; }
  const source_structure& structure() const { return structure_; }

  size_t executable_line_count() const { return executable_lines_; }

private:
  source_file() = default;

  std::string path_;
  std::string text_;
  std::vector<std::string> lines_;
  std::vector<line_kind> kinds_;
  source_structure structure_;
  size_t executable_lines_ = 0;
};

} // namespace l1cov::analysis
