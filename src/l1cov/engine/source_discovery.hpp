#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "l1cov/core/result.hpp"
#include "l1cov/engine/coverage_session.hpp"

namespace l1cov {

struct discovery_report {
  size_t registered = 0;  // files added to the session by this pass
  size_t already_known = 0;
  size_t filtered = 0;    // .lua files the include/exclude rules reject
  size_t unreadable = 0;
};

// walks each root for .lua files and registers the ones the session's filter admits,
// so sources that never run still appear in reports at 0%.
// files the session already tracks keep their data. missing roots are logged and skipped.
result<discovery_report> discover_sources(coverage_session& session, const std::vector<std::string>& roots);

} // namespace l1cov
