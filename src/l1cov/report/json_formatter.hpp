#pragma once

#include <nlohmann/json.hpp>

#include "l1cov/report/report_formatter.hpp"

namespace l1cov::report {

class json_formatter : public report_formatter {
public:
  explicit json_formatter(int indent = 2) : indent_(indent) {}

  std::string name() const override { return "json"; }
  std::string render(const coverage_summary& summary) const override;

  static nlohmann::json to_json(const coverage_summary& summary);

private:
  int indent_ = 2;
};

} // namespace l1cov::report
