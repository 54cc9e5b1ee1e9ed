#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "l1cov/core/types.hpp"

namespace l1cov::analysis {

// one classified source line; code holds the line with comments removed and
// string literals collapsed to "" so later passes can look at keywords safely
struct scanned_line {
  line_kind kind = line_kind::non_executable;
  std::string code;
};

// lexical state carried from one line to the next
struct lexer_state {
  enum class mode : uint8_t {
    code,
    long_comment,
    long_string,
    short_string,
  };

  mode current = mode::code;
  size_t level = 0;
  char quote = 0;
};

class line_classifier {
public:
  std::vector<scanned_line> scan(const std::vector<std::string>& lines) const;
  std::vector<scanned_line> scan(std::string_view source_text) const;

  // classifies one line and advances state
  scanned_line scan_line(std::string_view line, lexer_state& state) const;

  static line_kind classify_code(std::string_view code);
};

// line kinds for lines 1..N; element 0 is line 1
std::vector<line_kind> classify(std::string_view source_text);

} // namespace l1cov::analysis
