#pragma once

#include <string>
#include <vector>

#include "l1cov/util/env_config.hpp"

namespace l1cov {

struct coverage_config {
  bool track_blocks = true;
  bool track_conditions = true;

  // globs over normalized paths; an empty include list admits every path
  std::vector<std::string> include_patterns;
  std::vector<std::string> exclude_patterns;

  // directories searched for .lua files at start, so unloaded sources report at 0%
  std::vector<std::string> source_roots;

  // formatter used by report writers ("summary", "listing", "json", "lcov", "cobertura")
  std::string report_format = "summary";
  std::string output_file;
  int verbose = 0;

  static coverage_config from_environment() {
    util::env_config env("L1COV");

    coverage_config config;
    config.track_blocks = env.flag("TRACK_BLOCKS", config.track_blocks);
    config.track_conditions = env.flag("TRACK_CONDITIONS", config.track_conditions);
    config.include_patterns = env.list("INCLUDE");
    config.exclude_patterns = env.list("EXCLUDE");
    config.source_roots = env.list("SOURCE_ROOTS");
    config.report_format = env.text("FORMAT", config.report_format);
    config.output_file = env.text("OUTPUT", config.output_file);
    config.verbose = env.integer("VERBOSE", config.verbose);
    return config;
  }
};

} // namespace l1cov
