#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "l1cov/core/result.hpp"

namespace l1cov {

enum class path_rule {
  default_include,  // no include patterns configured
  include_pattern,  // admitted by an include pattern
  exclude_pattern,  // rejected by an exclude pattern
  no_include_match, // include patterns configured, none matched
};

inline constexpr const char* path_rule_name(path_rule rule) {
  switch (rule) {
  case path_rule::default_include:
    return "default_include";
  case path_rule::include_pattern:
    return "include_pattern";
  case path_rule::exclude_pattern:
    return "exclude_pattern";
  case path_rule::no_include_match:
  default:
    return "no_include_match";
  }
}

// which rule decided a path, and whether include and exclude both claimed it
struct path_decision {
  bool included = true;
  path_rule rule = path_rule::default_include;
  std::string pattern;
  bool ambiguous = false;
};

// include/exclude selection of tracked paths; exclude wins when both match
class path_filter {
public:
  path_filter() = default;
  path_filter(std::vector<std::string> include_patterns, std::vector<std::string> exclude_patterns);

  // rejects empty or malformed globs and patterns listed as both include and exclude
  static status validate(const std::vector<std::string>& include_patterns,
                         const std::vector<std::string>& exclude_patterns);

  path_decision decide(std::string_view normalized_path) const;

  // a pattern without '/' also matches the final path component
  static bool pattern_matches(std::string_view pattern, std::string_view normalized_path);

private:
  static const std::string* first_match(const std::vector<std::string>& patterns, std::string_view path);

  std::vector<std::string> include_patterns_;
  std::vector<std::string> exclude_patterns_;
};

} // namespace l1cov
