#include "l1cov/util/path_utils.hpp"

#include <algorithm>
#include <filesystem>

namespace l1cov::util {

std::string normalize_path(std::string_view path) {
  if (path.empty()) {
    return std::string();
  }

  std::string slashed(path.begin(), path.end());
  std::replace(slashed.begin(), slashed.end(), '\\', '/');

  std::string normalized = std::filesystem::path(slashed).lexically_normal().generic_string();

  while (normalized.size() > 2 && normalized.compare(0, 2, "./") == 0) {
    normalized.erase(0, 2);
  }
  while (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  if (normalized.empty()) {
    return ".";
  }
  return normalized;
}

} // namespace l1cov::util
