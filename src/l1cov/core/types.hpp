#pragma once

#include <cstdint>

namespace l1cov {

enum class line_kind : uint8_t {
  non_executable,
  executable,
  block_start,
  block_end,
};

inline constexpr const char* line_kind_name(line_kind kind) {
  switch (kind) {
  case line_kind::executable:
    return "executable";
  case line_kind::block_start:
    return "block_start";
  case line_kind::block_end:
    return "block_end";
  case line_kind::non_executable:
  default:
    return "non_executable";
  }
}

// executable and block_start lines run statements; block_end lines are structural
inline constexpr bool counts_as_executable(line_kind kind) {
  return kind == line_kind::executable || kind == line_kind::block_start;
}

enum class block_type : uint8_t {
  branch,
  loop,
  function_body,
  other,
};

inline constexpr const char* block_type_name(block_type type) {
  switch (type) {
  case block_type::branch:
    return "branch";
  case block_type::loop:
    return "loop";
  case block_type::function_body:
    return "function_body";
  case block_type::other:
  default:
    return "other";
  }
}

// rendering state of a single line
enum class line_status : uint8_t {
  non_executable,
  not_executed,
  executed,
  covered,
};

inline constexpr const char* line_status_name(line_status status) {
  switch (status) {
  case line_status::not_executed:
    return "not_executed";
  case line_status::executed:
    return "executed";
  case line_status::covered:
    return "covered";
  case line_status::non_executable:
  default:
    return "non_executable";
  }
}

// blocks are looked up by their line span, never through pointers
struct block_key {
  uint32_t start_line = 0;
  uint32_t end_line = 0;

  bool operator==(const block_key&) const = default;
};

} // namespace l1cov
