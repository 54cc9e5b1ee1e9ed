#pragma once

#include "l1cov/analysis/line_classifier.hpp"
#include "l1cov/analysis/source_file.hpp"
#include "l1cov/analysis/structure_analyzer.hpp"
#include "l1cov/core/result.hpp"
#include "l1cov/core/types.hpp"
#include "l1cov/engine/coverage_config.hpp"
#include "l1cov/engine/coverage_engine.hpp"
#include "l1cov/engine/coverage_session.hpp"
#include "l1cov/engine/coverage_summary.hpp"
#include "l1cov/engine/frame_resolver.hpp"
#include "l1cov/engine/path_filter.hpp"
#include "l1cov/engine/source_discovery.hpp"
#include "l1cov/report/cobertura_formatter.hpp"
#include "l1cov/report/formatter_registry.hpp"
#include "l1cov/report/json_formatter.hpp"
#include "l1cov/report/lcov_formatter.hpp"
#include "l1cov/report/listing_formatter.hpp"
#include "l1cov/report/report_writer.hpp"
#include "l1cov/report/summary_formatter.hpp"
