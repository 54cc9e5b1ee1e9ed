#pragma once

#include <string>
#include <string_view>

#include "l1cov/report/report_formatter.hpp"

namespace l1cov::report {

// cobertura xml, one package and one class per file.
// line-rate is covered over executable lines; branch-rate comes from condition outcomes.
// the timestamp is fixed at 0 so equal summaries render equal documents.
class cobertura_formatter : public report_formatter {
public:
  std::string name() const override { return "cobertura"; }
  std::string render(const coverage_summary& summary) const override;

  static std::string escape_xml(std::string_view text);
};

} // namespace l1cov::report
