#include "l1cov/engine/coverage_engine.hpp"

#include <redlog.hpp>

#include "l1cov/core/logging.hpp"
#include "l1cov/engine/source_discovery.hpp"
#include "l1cov/report/formatter_registry.hpp"
#include "l1cov/report/report_writer.hpp"

namespace l1cov {

result<std::shared_ptr<coverage_session>> start(coverage_config config) {
  if (config.verbose > 0) {
    configure_logging(config.verbose);
  }

  auto session = std::make_shared<coverage_session>(std::move(config));
  status started = session->start();
  if (!started.ok()) {
    return error_result<std::shared_ptr<coverage_session>>(std::move(started));
  }

  if (!session->config().source_roots.empty()) {
    auto discovered = discover_sources(*session, session->config().source_roots);
    if (!discovered.ok()) {
      return error_result<std::shared_ptr<coverage_session>>(std::move(discovered.status_info));
    }
  }
  return ok_result(std::move(session));
}

result<std::string> finish(coverage_session& session) {
  auto log = redlog::get_logger("l1cov.engine");
  const coverage_config& config = session.config();

  auto registry = report::formatter_registry::with_builtin();
  auto formatter = registry.create(config.report_format);
  if (!formatter.ok()) {
    log.err("cannot render report", redlog::field("format", config.report_format));
    return error_result<std::string>(formatter.status_info);
  }

  auto rendered = session.report(*formatter.value);
  if (!rendered.ok()) {
    return rendered;
  }

  if (!config.output_file.empty()) {
    auto snapshot = session.summary();
    if (!snapshot.ok()) {
      return error_result<std::string>(snapshot.status_info);
    }
    status written = report::report_writer::write(config.output_file, *formatter.value, snapshot.value);
    if (!written.ok()) {
      return error_result<std::string>(std::move(written));
    }
  }

  return rendered;
}

} // namespace l1cov
