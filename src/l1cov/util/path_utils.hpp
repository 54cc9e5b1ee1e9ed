#pragma once

#include <string>
#include <string_view>

namespace l1cov::util {

// lexical normalization: forward slashes, no "." segments, ".." folded where possible, no leading "./"
std::string normalize_path(std::string_view path);

} // namespace l1cov::util
