#pragma once

#include <memory>
#include <string>

#include "l1cov/core/result.hpp"
#include "l1cov/engine/coverage_config.hpp"
#include "l1cov/engine/coverage_session.hpp"

namespace l1cov {

// creates and starts a session, then registers sources found under config.source_roots.
// fails with configuration_error or session_already_active
result<std::shared_ptr<coverage_session>> start(coverage_config config);

// stops the session and renders it with config().report_format.
// when config().output_file is set the rendering is also written there.
result<std::string> finish(coverage_session& session);

} // namespace l1cov
