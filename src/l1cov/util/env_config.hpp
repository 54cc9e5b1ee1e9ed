#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace l1cov::util {

// typed access to PREFIX_NAME environment variables.
// unset or blank variables yield the fallback; malformed ones are logged and yield the fallback.
class env_config {
public:
  explicit env_config(std::string prefix);

  std::string variable_name(std::string_view name) const;

  // trimmed value, nullopt when unset or blank
  std::optional<std::string> value(std::string_view name) const;

  std::string text(std::string_view name, std::string fallback) const;
  bool flag(std::string_view name, bool fallback) const;
  int integer(std::string_view name, int fallback) const;
  std::vector<std::string> list(std::string_view name, char separator = ',') const;

private:
  void report_invalid(std::string_view name, std::string_view raw, const char* expected) const;

  std::string prefix_;
};

} // namespace l1cov::util
