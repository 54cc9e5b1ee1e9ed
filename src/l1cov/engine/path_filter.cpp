#include "l1cov/engine/path_filter.hpp"

#include <algorithm>

#include "l1cov/util/glob.hpp"

namespace l1cov {

path_filter::path_filter(std::vector<std::string> include_patterns, std::vector<std::string> exclude_patterns)
    : include_patterns_(std::move(include_patterns)), exclude_patterns_(std::move(exclude_patterns)) {}

status path_filter::validate(const std::vector<std::string>& include_patterns,
                             const std::vector<std::string>& exclude_patterns) {
  auto check_list = [](const std::vector<std::string>& patterns, const char* list_name) -> status {
    for (const auto& pattern : patterns) {
      std::string problem = util::glob_validation_error(pattern);
      if (!problem.empty()) {
        return make_status(
            error_code::configuration_error,
            std::string("invalid ") + list_name + " pattern '" + pattern + "': " + problem
        );
      }
    }
    return ok_status();
  };

  status include_status = check_list(include_patterns, "include");
  if (!include_status.ok()) {
    return include_status;
  }
  status exclude_status = check_list(exclude_patterns, "exclude");
  if (!exclude_status.ok()) {
    return exclude_status;
  }

  for (const auto& pattern : include_patterns) {
    if (std::find(exclude_patterns.begin(), exclude_patterns.end(), pattern) != exclude_patterns.end()) {
      return make_status(
          error_code::configuration_error, "pattern '" + pattern + "' is listed as both include and exclude"
      );
    }
  }

  return ok_status();
}

bool path_filter::pattern_matches(std::string_view pattern, std::string_view normalized_path) {
  if (util::glob_match(pattern, normalized_path)) {
    return true;
  }
  if (pattern.find('/') != std::string_view::npos) {
    return false;
  }
  size_t slash = normalized_path.rfind('/');
  if (slash == std::string_view::npos) {
    return false;
  }
  return util::glob_match(pattern, normalized_path.substr(slash + 1));
}

const std::string* path_filter::first_match(const std::vector<std::string>& patterns, std::string_view path) {
  for (const auto& pattern : patterns) {
    if (pattern_matches(pattern, path)) {
      return &pattern;
    }
  }
  return nullptr;
}

path_decision path_filter::decide(std::string_view normalized_path) const {
  path_decision decision;

  const std::string* include = first_match(include_patterns_, normalized_path);
  const std::string* exclude = first_match(exclude_patterns_, normalized_path);

  if (exclude) {
    decision.included = false;
    decision.rule = path_rule::exclude_pattern;
    decision.pattern = *exclude;
    decision.ambiguous = include != nullptr;
    return decision;
  }

  if (include_patterns_.empty()) {
    decision.included = true;
    decision.rule = path_rule::default_include;
    return decision;
  }

  if (include) {
    decision.included = true;
    decision.rule = path_rule::include_pattern;
    decision.pattern = *include;
    return decision;
  }

  decision.included = false;
  decision.rule = path_rule::no_include_match;
  return decision;
}

} // namespace l1cov
