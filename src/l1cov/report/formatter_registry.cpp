#include "l1cov/report/formatter_registry.hpp"

#include "l1cov/report/cobertura_formatter.hpp"
#include "l1cov/report/json_formatter.hpp"
#include "l1cov/report/lcov_formatter.hpp"
#include "l1cov/report/listing_formatter.hpp"
#include "l1cov/report/summary_formatter.hpp"

namespace l1cov::report {

formatter_registry formatter_registry::with_builtin() {
  formatter_registry registry;
  registry.register_formatter("listing", [] { return std::make_unique<listing_formatter>(); });
  registry.register_formatter("summary", [] { return std::make_unique<summary_formatter>(); });
  registry.register_formatter("json", [] { return std::make_unique<json_formatter>(); });
  registry.register_formatter("lcov", [] { return std::make_unique<lcov_formatter>(); });
  registry.register_formatter("cobertura", [] { return std::make_unique<cobertura_formatter>(); });
  return registry;
}

status formatter_registry::register_formatter(std::string name, formatter_factory factory) {
  if (name.empty()) {
    return make_status(error_code::invalid_argument, "formatter name is empty");
  }
  if (!factory) {
    return make_status(error_code::invalid_argument, "formatter factory for '" + name + "' is empty");
  }
  factories_[std::move(name)] = std::move(factory);
  return ok_status();
}

result<std::unique_ptr<report_formatter>> formatter_registry::create(std::string_view name) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) {
    return error_result<std::unique_ptr<report_formatter>>(
        error_code::unknown_formatter, "unknown formatter '" + std::string(name) + "'"
    );
  }

  auto formatter = it->second();
  if (!formatter) {
    return error_result<std::unique_ptr<report_formatter>>(
        error_code::internal_error, "formatter factory for '" + std::string(name) + "' returned nothing"
    );
  }
  return ok_result(std::move(formatter));
}

bool formatter_registry::contains(std::string_view name) const { return factories_.find(name) != factories_.end(); }

std::vector<std::string> formatter_registry::names() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& [name, factory] : factories_) {
    out.push_back(name);
  }
  return out;
}

} // namespace l1cov::report
