#include "l1cov/report/report_writer.hpp"

#include <exception>
#include <new>

#include <redlog.hpp>

#include "l1cov/util/file_utils.hpp"

namespace l1cov::report {

status report_writer::write(const std::string& path, const report_formatter& formatter,
                            const coverage_summary& summary) {
  auto log = redlog::get_logger("l1cov.report");

  if (path.empty()) {
    return make_status(error_code::invalid_argument, "report path is empty");
  }

  std::string content;
  try {
    content = formatter.render(summary);
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& e) {
    log.err("formatter failed", redlog::field("formatter", formatter.name()), redlog::field("error", e.what()));
    return make_status(error_code::internal_error, std::string("formatter failed: ") + e.what());
  }

  if (!util::write_file(path, content)) {
    log.err("failed to write report", redlog::field("path", path), redlog::field("formatter", formatter.name()));
    return make_status(error_code::io_error, "failed to write report to " + path);
  }

  log.inf(
      "coverage report written", redlog::field("path", path), redlog::field("formatter", formatter.name()),
      redlog::field("bytes", content.size())
  );
  return ok_status();
}

} // namespace l1cov::report
