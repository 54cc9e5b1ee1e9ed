#include "l1cov/util/glob.hpp"

namespace l1cov::util {
namespace {

// matches a bracket class starting at pattern[pi] == '['; returns false on a malformed class
bool match_class(std::string_view pattern, size_t& pi, char ch, bool& matched) {
  size_t i = pi + 1;
  bool negate = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }

  bool found = false;
  bool first = true;
  while (i < pattern.size() && (first || pattern[i] != ']')) {
    first = false;
    char low = pattern[i];
    if (low == '\\' && i + 1 < pattern.size()) {
      low = pattern[++i];
    }
    char high = low;
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      high = pattern[i + 2];
      i += 2;
    }
    if (ch >= low && ch <= high) {
      found = true;
    }
    ++i;
  }

  if (i >= pattern.size()) {
    return false;
  }

  pi = i + 1;
  matched = (found != negate) && ch != '/';
  return true;
}

bool match_from(std::string_view pattern, size_t pi, std::string_view path, size_t si) {
  while (pi < pattern.size()) {
    char pc = pattern[pi];

    if (pc == '*') {
      bool double_star = pi + 1 < pattern.size() && pattern[pi + 1] == '*';
      if (double_star) {
        size_t next = pi + 2;
        if (next < pattern.size() && pattern[next] == '/') {
          // "**/" may consume zero directories
          if (match_from(pattern, next + 1, path, si)) {
            return true;
          }
        }
        for (size_t k = si; k <= path.size(); ++k) {
          if (match_from(pattern, next, path, k)) {
            return true;
          }
        }
        return false;
      }

      for (size_t k = si; k <= path.size(); ++k) {
        if (match_from(pattern, pi + 1, path, k)) {
          return true;
        }
        if (k < path.size() && path[k] == '/') {
          break;
        }
      }
      return false;
    }

    if (si >= path.size()) {
      return false;
    }

    if (pc == '?') {
      if (path[si] == '/') {
        return false;
      }
      ++pi;
      ++si;
      continue;
    }

    if (pc == '[') {
      bool matched = false;
      size_t class_pi = pi;
      if (!match_class(pattern, class_pi, path[si], matched)) {
        // malformed class compares literally
        if (path[si] != '[') {
          return false;
        }
        ++pi;
        ++si;
        continue;
      }
      if (!matched) {
        return false;
      }
      pi = class_pi;
      ++si;
      continue;
    }

    if (pc == '\\' && pi + 1 < pattern.size()) {
      ++pi;
      pc = pattern[pi];
    }

    if (pc != path[si]) {
      return false;
    }
    ++pi;
    ++si;
  }

  return si == path.size();
}

} // namespace

bool glob_match(std::string_view pattern, std::string_view path) { return match_from(pattern, 0, path, 0); }

std::string glob_validation_error(std::string_view pattern) {
  if (pattern.empty()) {
    return "pattern is empty";
  }

  for (size_t i = 0; i < pattern.size(); ++i) {
    char ch = pattern[i];
    if (ch == '\\') {
      if (i + 1 >= pattern.size()) {
        return "pattern ends with a dangling escape";
      }
      ++i;
      continue;
    }
    if (ch == '[') {
      bool matched = false;
      size_t pi = i;
      if (!match_class(pattern, pi, 'a', matched)) {
        return "unterminated character class at offset " + std::to_string(i);
      }
      i = pi - 1;
    }
  }

  return std::string();
}

} // namespace l1cov::util
