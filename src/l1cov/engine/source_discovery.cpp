#include "l1cov/engine/source_discovery.hpp"

#include <filesystem>
#include <system_error>

#include <redlog.hpp>

#include "l1cov/util/file_utils.hpp"
#include "l1cov/util/path_utils.hpp"

namespace l1cov {
namespace fs = std::filesystem;

result<discovery_report> discover_sources(coverage_session& session, const std::vector<std::string>& roots) {
  auto log = redlog::get_logger("l1cov.discovery");
  discovery_report report;

  if (session.state() != session_state::running) {
    return error_result<discovery_report>(error_code::session_not_started, "discovery needs a running session");
  }

  for (const auto& root : roots) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      log.wrn("source root is not a directory, skipping", redlog::field("root", root));
      continue;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      log.wrn("cannot walk source root", redlog::field("root", root), redlog::field("error", ec.message()));
      continue;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        log.wrn("error while walking source root", redlog::field("root", root), redlog::field("error", ec.message()));
        break;
      }

      const fs::directory_entry& entry = *it;
      std::error_code type_ec;
      if (!entry.is_regular_file(type_ec) || entry.path().extension() != ".lua") {
        continue;
      }

      const std::string path = util::normalize_path(entry.path().generic_string());
      if (session.is_registered(path)) {
        ++report.already_known;
        continue;
      }
      if (!session.decide(path).included) {
        ++report.filtered;
        continue;
      }

      auto text = util::read_file_string(path);
      if (!text) {
        ++report.unreadable;
        log.wrn("cannot read discovered source", redlog::field("path", path));
        continue;
      }

      status registered = session.register_file(path, *text);
      if (!registered.ok()) {
        return error_result<discovery_report>(std::move(registered));
      }
      ++report.registered;
      log.trc("registered discovered source", redlog::field("path", path));
    }
  }

  log.dbg(
      "source discovery finished", redlog::field("registered", report.registered),
      redlog::field("already_known", report.already_known), redlog::field("filtered", report.filtered),
      redlog::field("unreadable", report.unreadable)
  );
  return ok_result(report);
}

} // namespace l1cov
