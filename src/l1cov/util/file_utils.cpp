#include "l1cov/util/file_utils.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace l1cov::util {
namespace fs = std::filesystem;

std::optional<std::string> read_file_string(const std::string& file_path) {
  std::ifstream in(file_path, std::ios::binary | std::ios::ate);
  if (!in) {
    return std::nullopt;
  }

  const std::streamoff size = in.tellg();
  if (size < 0) {
    return std::nullopt;
  }

  std::string content(static_cast<size_t>(size), '\0');
  in.seekg(0);
  if (size > 0 && !in.read(content.data(), size)) {
    return std::nullopt;
  }
  return content;
}

bool write_file(const std::string& file_path, const std::string& data) {
  const fs::path target(file_path);
  std::error_code ec;
  if (!target.parent_path().empty()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      return false;
    }
  }

  fs::path staging = target;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out || !out.write(data.data(), static_cast<std::streamsize>(data.size())) || !out.flush()) {
      fs::remove(staging, ec);
      return false;
    }
  }

  fs::rename(staging, target, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(staging, cleanup);
    return false;
  }
  return true;
}

bool file_exists(const std::string& file_path) {
  std::error_code ec;
  return fs::exists(file_path, ec);
}

} // namespace l1cov::util
