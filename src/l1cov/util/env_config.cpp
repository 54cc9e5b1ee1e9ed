#include "l1cov/util/env_config.hpp"

#include <charconv>
#include <cstdlib>

#include <redlog.hpp>

#include "l1cov/util/string_utils.hpp"

namespace l1cov::util {

env_config::env_config(std::string prefix) : prefix_(std::move(prefix)) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_.push_back('_');
  }
}

std::string env_config::variable_name(std::string_view name) const { return prefix_ + std::string(name); }

std::optional<std::string> env_config::value(std::string_view name) const {
  const char* raw = std::getenv(variable_name(name).c_str());
  if (!raw) {
    return std::nullopt;
  }
  std::string trimmed = trim_copy(raw);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string env_config::text(std::string_view name, std::string fallback) const {
  auto raw = value(name);
  return raw ? *raw : fallback;
}

bool env_config::flag(std::string_view name, bool fallback) const {
  auto raw = value(name);
  if (!raw) {
    return fallback;
  }

  const std::string lowered = to_lower(*raw);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  report_invalid(name, *raw, "a boolean");
  return fallback;
}

int env_config::integer(std::string_view name, int fallback) const {
  auto raw = value(name);
  if (!raw) {
    return fallback;
  }

  int parsed = 0;
  const char* first = raw->data();
  const char* last = raw->data() + raw->size();
  auto [end, error] = std::from_chars(first, last, parsed);
  if (error != std::errc() || end != last) {
    report_invalid(name, *raw, "an integer");
    return fallback;
  }
  return parsed;
}

std::vector<std::string> env_config::list(std::string_view name, char separator) const {
  std::vector<std::string> items;
  auto raw = value(name);
  if (!raw) {
    return items;
  }

  std::string_view rest(*raw);
  while (!rest.empty()) {
    size_t cut = rest.find(separator);
    std::string_view item = trim_view(rest.substr(0, cut));
    if (!item.empty()) {
      items.emplace_back(item);
    }
    if (cut == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(cut + 1);
  }
  return items;
}

void env_config::report_invalid(std::string_view name, std::string_view raw, const char* expected) const {
  redlog::get_logger("l1cov.env").wrn(
      "ignoring malformed environment value", redlog::field("name", variable_name(name)),
      redlog::field("value", std::string(raw)), redlog::field("expected", expected)
  );
}

} // namespace l1cov::util
