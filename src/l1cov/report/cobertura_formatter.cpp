#include "l1cov/report/cobertura_formatter.hpp"

#include <iomanip>
#include <map>
#include <sstream>

namespace l1cov::report {
namespace {

std::string rate(double percent) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << percent / 100.0;
  return out.str();
}

std::string strip_lua_extension(std::string name) {
  constexpr std::string_view extension = ".lua";
  const size_t cut = name.size() - extension.size();
  if (name.size() > extension.size() && name.compare(cut, extension.size(), extension) == 0) {
    name.resize(cut);
  }
  return name;
}

// "lib/coverage/engine.lua" -> "lib.coverage.engine"
std::string package_name(const std::string& path) {
  std::string name = strip_lua_extension(path);
  for (char& ch : name) {
    if (ch == '/') {
      ch = '.';
    }
  }
  return name;
}

std::string class_name(const std::string& path) {
  const size_t slash = path.rfind('/');
  return strip_lua_extension(slash == std::string::npos ? path : path.substr(slash + 1));
}

struct line_branches {
  uint32_t covered = 0;
  uint32_t total = 0;
};

std::map<uint32_t, line_branches> branches_by_line(const file_summary& file) {
  std::map<uint32_t, line_branches> out;
  for (const auto& condition : file.conditions) {
    auto& branches = out[condition.line];
    branches.covered += condition.covered_outcomes();
    branches.total += 2;
  }
  return out;
}

} // namespace

std::string cobertura_formatter::escape_xml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out += ch;
    }
  }
  return out;
}

std::string cobertura_formatter::render(const coverage_summary& summary) const {
  const coverage_totals& totals = summary.totals;
  const bool branches = summary.conditions_tracked;

  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  out << "<!DOCTYPE coverage SYSTEM \"http://cobertura.sourceforge.net/xml/coverage-04.dtd\">\n";
  out << "<coverage line-rate=\"" << rate(totals.line_coverage_percent()) << "\" branch-rate=\""
      << (branches ? rate(totals.condition_coverage_percent()) : rate(0.0)) << "\" lines-covered=\""
      << totals.covered_lines << "\" lines-valid=\"" << totals.executable_lines << "\" branches-covered=\""
      << (branches ? totals.covered_condition_outcomes : 0) << "\" branches-valid=\""
      << (branches ? totals.total_condition_outcomes : 0) << "\" complexity=\"0\" version=\"0.1\" timestamp=\"0\">\n";
  out << "  <sources>\n    <source>.</source>\n  </sources>\n";
  out << "  <packages>\n";

  for (const auto& file : summary.files) {
    const std::string line_rate = rate(file.totals.line_coverage_percent());
    const std::string branch_rate = branches ? rate(file.totals.condition_coverage_percent()) : rate(0.0);

    out << "    <package name=\"" << escape_xml(package_name(file.path)) << "\" line-rate=\"" << line_rate
        << "\" branch-rate=\"" << branch_rate << "\" complexity=\"0\">\n";
    out << "      <classes>\n";
    out << "        <class name=\"" << escape_xml(class_name(file.path)) << "\" filename=\"" << escape_xml(file.path)
        << "\" line-rate=\"" << line_rate << "\" branch-rate=\"" << branch_rate << "\" complexity=\"0\">\n";

    out << "          <methods>\n";
    for (const auto& function : file.functions) {
      out << "            <method name=\"" << escape_xml(function.id) << "\" signature=\"()V\" line-rate=\""
          << (function.execution_count > 0 ? "1" : "0") << "\" branch-rate=\"0\">\n";
      out << "              <lines>\n";
      out << "                <line number=\"" << function.defined_line << "\" hits=\"" << function.execution_count
          << "\" branch=\"false\"/>\n";
      out << "              </lines>\n";
      out << "            </method>\n";
    }
    out << "          </methods>\n";

    const auto line_branch_counts = branches ? branches_by_line(file) : std::map<uint32_t, line_branches>{};
    out << "          <lines>\n";
    for (const auto& line : file.lines) {
      if (!counts_as_executable(line.kind)) {
        continue;
      }
      out << "            <line number=\"" << line.number << "\" hits=\"" << line.execution_count << "\"";
      auto found = line_branch_counts.find(line.number);
      if (found == line_branch_counts.end()) {
        out << " branch=\"false\"/>\n";
        continue;
      }
      const line_branches& counts = found->second;
      const auto percent = static_cast<int>(coverage_percent(counts.covered, counts.total));
      out << " branch=\"true\" condition-coverage=\"" << percent << "% (" << counts.covered << "/" << counts.total
          << ")\"/>\n";
    }
    out << "          </lines>\n";
    out << "        </class>\n";
    out << "      </classes>\n";
    out << "    </package>\n";
  }

  out << "  </packages>\n";
  out << "</coverage>\n";
  return out.str();
}

} // namespace l1cov::report
