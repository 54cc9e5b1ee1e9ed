#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "l1cov/core/result.hpp"
#include "l1cov/report/report_formatter.hpp"

namespace l1cov::report {

using formatter_factory = std::function<std::unique_ptr<report_formatter>()>;

// name -> formatter factory; formatters are added here without touching the session
class formatter_registry {
public:
  formatter_registry() = default;

  // registry holding listing, summary, json and lcov
  static formatter_registry with_builtin();

  // replaces an existing factory of the same name
  status register_formatter(std::string name, formatter_factory factory);

  result<std::unique_ptr<report_formatter>> create(std::string_view name) const;
  bool contains(std::string_view name) const;
  std::vector<std::string> names() const;

private:
  std::map<std::string, formatter_factory, std::less<>> factories_;
};

} // namespace l1cov::report
