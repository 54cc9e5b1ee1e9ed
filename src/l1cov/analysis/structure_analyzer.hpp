#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "l1cov/analysis/line_classifier.hpp"
#include "l1cov/core/types.hpp"

namespace l1cov::analysis {

struct function_descriptor {
  std::string name; // empty for anonymous functions
  uint32_t defined_line = 0;
  uint32_t end_line = 0;
};

struct block_descriptor {
  block_type type = block_type::other;
  uint32_t start_line = 0;
  uint32_t end_line = 0;
  std::optional<block_key> parent;

  block_key key() const { return block_key{start_line, end_line}; }
};

// one operand of a short-circuit condition chain
struct condition_descriptor {
  uint32_t line = 0;
  uint32_t index = 0;
  std::string expression;
};

struct source_structure {
  std::vector<function_descriptor> functions;
  std::vector<block_descriptor> blocks;
  std::vector<condition_descriptor> conditions;
};

class structure_analyzer {
public:
  source_structure analyze(const std::vector<scanned_line>& lines) const;

  // operands of the controlling expression when the line starts with if/elseif/while/until
  static std::vector<std::string> condition_operands(const std::string& code);
};

} // namespace l1cov::analysis
