#include <doctest/doctest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "l1cov/engine/coverage_engine.hpp"
#include "l1cov/report/cobertura_formatter.hpp"
#include "l1cov/report/formatter_registry.hpp"
#include "l1cov/report/json_formatter.hpp"
#include "l1cov/report/lcov_formatter.hpp"
#include "l1cov/report/listing_formatter.hpp"
#include "l1cov/report/report_writer.hpp"
#include "l1cov/report/summary_formatter.hpp"
#include "l1cov/util/file_utils.hpp"

namespace {

const std::string k_report_source = "local a = 1\n"
                                    "local b = 2\n"
                                    "\n"
                                    "-- comment\n"
                                    "print(a + b)\n"
                                    "\n"
                                    "--[[\n"
                                    "block comment\n"
                                    "]]\n"
                                    "return a\n";

const std::string k_function_source = "local function f(x)\n"
                                      "  if x > 0 and x < 5 then\n"
                                      "    return 1\n"
                                      "  end\n"
                                      "  return 0\n"
                                      "end\n";

l1cov::coverage_summary quarter_covered_summary() {
  auto started = l1cov::start(l1cov::coverage_config{});
  REQUIRE(started.ok());
  auto& session = *started.value;
  REQUIRE(session.register_file("a.lua", k_report_source).ok());
  session.record_execution("a.lua", 1);
  session.record_execution("a.lua", 2);
  session.record_execution("a.lua", 5);
  session.mark_covered("a.lua", 1);
  REQUIRE(session.stop().ok());

  auto summary = session.summary();
  REQUIRE(summary.ok());
  return summary.value;
}

bool contains(const std::string& text, const std::string& needle) { return text.find(needle) != std::string::npos; }

class file_count_formatter : public l1cov::report::report_formatter {
public:
  std::string name() const override { return "file_count"; }
  std::string render(const l1cov::coverage_summary& summary) const override {
    return std::to_string(summary.files.size());
  }
};

std::filesystem::path scratch_dir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("l1cov_" + name);
  std::filesystem::remove_all(dir);
  return dir;
}

} // namespace

TEST_CASE("listing_formatter annotates every line with its status") {
  auto summary = quarter_covered_summary();
  std::string listing = l1cov::report::listing_formatter().render(summary);

  CHECK(contains(listing, "==> a.lua (1/4 covered, 3 executed, 25.00%)\n"));
  CHECK(contains(listing, "     1 +       1x | local a = 1\n"));
  CHECK(contains(listing, "     2 -       1x | local b = 2\n"));
  CHECK(contains(listing, "    10 !       0x | return a\n"));
  CHECK(contains(listing, "total: 1/4 lines covered (25.00%)\n"));

  CHECK(l1cov::report::listing_formatter::status_marker(l1cov::line_status::non_executable) == ' ');
}

TEST_CASE("summary_formatter prints a table with totals") {
  auto summary = quarter_covered_summary();
  std::string table = l1cov::report::summary_formatter().render(summary);

  CHECK(contains(table, "file"));
  CHECK(contains(table, "a.lua"));
  CHECK(contains(table, "total"));
  CHECK(contains(table, "25.00%"));
  CHECK_FALSE(contains(table, "anomalies:"));

  summary.anomalies.unregistered_file_events = 3;
  CHECK(contains(l1cov::report::summary_formatter().render(summary), "unregistered file events: 3"));
}

TEST_CASE("json_formatter emits the summary as structured records") {
  auto summary = quarter_covered_summary();
  std::string text = l1cov::report::json_formatter().render(summary);

  auto j = nlohmann::json::parse(text);
  CHECK(j["version"] == 1);
  CHECK(j["totals"]["executable_lines"] == 4);
  CHECK(j["totals"]["executed_lines"] == 3);
  CHECK(j["totals"]["covered_lines"] == 1);
  CHECK(j["totals"]["line_coverage_percent"].get<double>() == doctest::Approx(25.0));
  REQUIRE(j["files"].size() == 1);

  const auto& file = j["files"][0];
  CHECK(file["path"] == "a.lua");
  REQUIRE(file["lines"].size() == 10);
  CHECK(file["lines"][0]["status"] == "covered");
  CHECK(file["lines"][0]["kind"] == "executable");
  CHECK(file["lines"][1]["status"] == "executed");
  CHECK(file["lines"][2]["status"] == "non_executable");
  CHECK(file["lines"][9]["status"] == "not_executed");
  CHECK(file["lines"][4]["text"] == "print(a + b)");
  CHECK(j["anomalies"]["internal_faults"] == 0);

  CHECK(text == l1cov::report::json_formatter().render(summary));
}

TEST_CASE("lcov_formatter writes tracefile records") {
  auto summary = quarter_covered_summary();
  std::string lcov = l1cov::report::lcov_formatter().render(summary);

  CHECK(lcov.rfind("TN:l1cov\nSF:a.lua\n", 0) == 0);
  CHECK(contains(lcov, "DA:1,1\n"));
  CHECK(contains(lcov, "DA:10,0\n"));
  CHECK_FALSE(contains(lcov, "DA:3,"));
  CHECK(contains(lcov, "FNF:0\nFNH:0\n"));
  CHECK(contains(lcov, "LF:4\nLH:3\nend_of_record\n"));
}

TEST_CASE("lcov_formatter writes functions and condition branches") {
  auto started = l1cov::start(l1cov::coverage_config{});
  REQUIRE(started.ok());
  auto& session = *started.value;
  REQUIRE(session.register_file("f.lua", k_function_source).ok());
  session.record_function_entry("f.lua", 1, "f");
  session.record_execution("f.lua", 2);
  session.record_condition("f.lua", 2, 0, true);

  auto rendered = session.report(l1cov::report::lcov_formatter("unit"));
  REQUIRE(rendered.ok());
  CHECK(session.state() == l1cov::session_state::stopped);

  const std::string& lcov = rendered.value;
  CHECK(contains(lcov, "TN:unit\n"));
  CHECK(contains(lcov, "FN:1,f\n"));
  CHECK(contains(lcov, "FNDA:1,f\n"));
  CHECK(contains(lcov, "FNF:1\nFNH:1\n"));
  CHECK(contains(lcov, "BRDA:2,0,0,1\n"));
  CHECK(contains(lcov, "BRDA:2,0,1,0\n"));
  CHECK(contains(lcov, "BRDA:2,1,0,-\n"));
  CHECK(contains(lcov, "BRDA:2,1,1,-\n"));
  CHECK(contains(lcov, "BRF:4\nBRH:1\n"));
}

TEST_CASE("cobertura_formatter writes one class per file with line hits") {
  auto summary = quarter_covered_summary();
  std::string xml = l1cov::report::cobertura_formatter().render(summary);

  CHECK(xml.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n", 0) == 0);
  CHECK(contains(xml, "<coverage line-rate=\"0.2500\" branch-rate=\"1.0000\" lines-covered=\"1\" lines-valid=\"4\""));
  CHECK(contains(xml, "timestamp=\"0\">\n"));
  CHECK(contains(xml, "<package name=\"a\" line-rate=\"0.2500\""));
  CHECK(contains(xml, "<class name=\"a\" filename=\"a.lua\""));
  CHECK(contains(xml, "<line number=\"1\" hits=\"1\" branch=\"false\"/>\n"));
  CHECK(contains(xml, "<line number=\"10\" hits=\"0\" branch=\"false\"/>\n"));
  CHECK_FALSE(contains(xml, "<line number=\"3\""));
  CHECK(xml.size() > 11);
  CHECK(xml.compare(xml.size() - 12, 12, "</coverage>\n") == 0);
  CHECK(xml == l1cov::report::cobertura_formatter().render(summary));
}

TEST_CASE("cobertura_formatter reports methods and condition coverage") {
  auto started = l1cov::start(l1cov::coverage_config{});
  REQUIRE(started.ok());
  auto& session = *started.value;
  REQUIRE(session.register_file("lib/util/f.lua", k_function_source).ok());
  session.record_function_entry("lib/util/f.lua", 1, "f");
  session.record_execution("lib/util/f.lua", 2);
  session.record_condition("lib/util/f.lua", 2, 0, true);

  auto rendered = session.report(l1cov::report::cobertura_formatter());
  REQUIRE(rendered.ok());
  const std::string& xml = rendered.value;

  CHECK(contains(xml, "branches-covered=\"1\" branches-valid=\"4\""));
  CHECK(contains(xml, "<package name=\"lib.util.f\""));
  CHECK(contains(xml, "<class name=\"f\" filename=\"lib/util/f.lua\""));
  CHECK(contains(xml, "<method name=\"f\" signature=\"()V\" line-rate=\"1\" branch-rate=\"0\">\n"));
  CHECK(contains(xml, "<line number=\"1\" hits=\"1\" branch=\"false\"/>\n"));
  CHECK(contains(xml, "<line number=\"2\" hits=\"1\" branch=\"true\" condition-coverage=\"25% (1/4)\"/>\n"));
}

TEST_CASE("cobertura_formatter escapes xml attribute text") {
  CHECK(l1cov::report::cobertura_formatter::escape_xml("a<b & \"c\" 'd'>") ==
        "a&lt;b &amp; &quot;c&quot; &apos;d&apos;&gt;");
  CHECK(l1cov::report::cobertura_formatter::escape_xml("plain/path.lua") == "plain/path.lua");
}

TEST_CASE("formatter_registry resolves formatters by name") {
  auto registry = l1cov::report::formatter_registry::with_builtin();
  const std::vector<std::string> builtin{"cobertura", "json", "lcov", "listing", "summary"};
  CHECK(registry.names() == builtin);

  auto lcov = registry.create("lcov");
  REQUIRE(lcov.ok());
  CHECK(lcov.value->name() == "lcov");
  auto cobertura = registry.create("cobertura");
  REQUIRE(cobertura.ok());
  CHECK(cobertura.value->name() == "cobertura");

  auto missing = registry.create("html");
  CHECK(missing.status_info.code == l1cov::error_code::unknown_formatter);
  CHECK(missing.value == nullptr);

  CHECK(registry.register_formatter("file_count", [] { return std::make_unique<file_count_formatter>(); }).ok());
  CHECK(registry.contains("file_count"));
  auto custom = registry.create("file_count");
  REQUIRE(custom.ok());
  CHECK(custom.value->render(quarter_covered_summary()) == "1");

  CHECK(registry.register_formatter("", [] { return std::make_unique<file_count_formatter>(); }).code ==
        l1cov::error_code::invalid_argument);
  CHECK(registry.register_formatter("empty", nullptr).code == l1cov::error_code::invalid_argument);
}

TEST_CASE("report_writer persists a rendering and creates directories") {
  auto dir = scratch_dir("report_writer");
  auto path = (dir / "nested" / "coverage.info").string();
  auto summary = quarter_covered_summary();
  l1cov::report::lcov_formatter formatter;

  REQUIRE(l1cov::report::report_writer::write(path, formatter, summary).ok());
  auto written = l1cov::util::read_file_string(path);
  REQUIRE(written.has_value());
  CHECK(*written == formatter.render(summary));

  std::filesystem::remove_all(dir);
}

TEST_CASE("report_writer reports io errors") {
  auto dir = scratch_dir("report_writer_blocked");
  auto blocker = (dir / "blocker").string();
  REQUIRE(l1cov::util::write_file(blocker, "not a directory"));

  auto status = l1cov::report::report_writer::write(
      blocker + "/sub/report.txt", l1cov::report::summary_formatter(), quarter_covered_summary()
  );
  CHECK(status.code == l1cov::error_code::io_error);

  CHECK(l1cov::report::report_writer::write("", l1cov::report::summary_formatter(), quarter_covered_summary())
            .code == l1cov::error_code::invalid_argument);

  std::filesystem::remove_all(dir);
}

TEST_CASE("finish renders the configured format and writes the output file") {
  auto dir = scratch_dir("finish");
  l1cov::coverage_config config;
  config.report_format = "json";
  config.output_file = (dir / "coverage.json").string();

  auto started = l1cov::start(config);
  REQUIRE(started.ok());
  auto& session = *started.value;
  REQUIRE(session.register_file("a.lua", k_report_source).ok());
  session.record_execution("a.lua", 1);

  auto rendered = l1cov::finish(session);
  REQUIRE(rendered.ok());
  CHECK(session.state() == l1cov::session_state::stopped);
  CHECK(l1cov::coverage_session::active() == nullptr);

  auto written = l1cov::util::read_file_string(config.output_file);
  REQUIRE(written.has_value());
  CHECK(*written == rendered.value);
  CHECK(nlohmann::json::parse(*written)["totals"]["executed_lines"] == 1);

  std::filesystem::remove_all(dir);
}

TEST_CASE("finish fails on an unknown report format") {
  l1cov::coverage_config config;
  config.report_format = "html";
  auto started = l1cov::start(config);
  REQUIRE(started.ok());

  auto rendered = l1cov::finish(*started.value);
  CHECK(rendered.status_info.code == l1cov::error_code::unknown_formatter);
}
