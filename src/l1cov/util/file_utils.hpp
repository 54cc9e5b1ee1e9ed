#pragma once

#include <optional>
#include <string>

namespace l1cov::util {

// whole file contents, nullopt when it cannot be opened or read
std::optional<std::string> read_file_string(const std::string& file_path);

// writes through a sibling temporary and renames it into place, parent directories are created
bool write_file(const std::string& file_path, const std::string& data);

bool file_exists(const std::string& file_path);

} // namespace l1cov::util
