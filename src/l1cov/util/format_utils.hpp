#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace l1cov::util {

// "25.00%"
inline std::string format_percent(double value, int precision = 2) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value << '%';
  return out.str();
}

inline std::string format_ratio(uint64_t hit, uint64_t total) {
  return std::to_string(hit) + "/" + std::to_string(total);
}

// column helpers for the text reports
inline std::string align_left(std::string text, size_t width) {
  if (text.size() < width) {
    text.resize(width, ' ');
  }
  return text;
}

inline std::string align_right(const std::string& text, size_t width) {
  if (text.size() >= width) {
    return text;
  }
  return std::string(width - text.size(), ' ') + text;
}

} // namespace l1cov::util
