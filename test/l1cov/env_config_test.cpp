#include <doctest/doctest.h>

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "l1cov/core/logging.hpp"
#include "l1cov/engine/coverage_config.hpp"
#include "l1cov/util/env_config.hpp"

namespace {

class scoped_env {
public:
  scoped_env(std::string name, const std::string& value) : name_(std::move(name)) {
    setenv(name_.c_str(), value.c_str(), 1);
  }
  ~scoped_env() { unsetenv(name_.c_str()); }

  scoped_env(const scoped_env&) = delete;
  scoped_env& operator=(const scoped_env&) = delete;

private:
  std::string name_;
};

} // namespace

TEST_CASE("coverage_config uses defaults without environment") {
  auto config = l1cov::coverage_config::from_environment();
  CHECK(config.track_blocks);
  CHECK(config.track_conditions);
  CHECK(config.include_patterns.empty());
  CHECK(config.exclude_patterns.empty());
  CHECK(config.source_roots.empty());
  CHECK(config.report_format == "summary");
  CHECK(config.output_file.empty());
  CHECK(config.verbose == 0);
}

TEST_CASE("coverage_config reads L1COV_ variables") {
  scoped_env blocks("L1COV_TRACK_BLOCKS", "false");
  scoped_env conditions("L1COV_TRACK_CONDITIONS", "yes");
  scoped_env include("L1COV_INCLUDE", "src/**, lib/*.lua,,");
  scoped_env exclude("L1COV_EXCLUDE", "src/vendor/**");
  scoped_env roots("L1COV_SOURCE_ROOTS", "src, lib");
  scoped_env format("L1COV_FORMAT", "lcov");
  scoped_env output("L1COV_OUTPUT", "out/coverage.info");
  scoped_env verbose("L1COV_VERBOSE", " 2 ");

  auto config = l1cov::coverage_config::from_environment();
  CHECK_FALSE(config.track_blocks);
  CHECK(config.track_conditions);
  const std::vector<std::string> expected_include{"src/**", "lib/*.lua"};
  CHECK(config.include_patterns == expected_include);
  REQUIRE(config.exclude_patterns.size() == 1);
  CHECK(config.exclude_patterns[0] == "src/vendor/**");
  const std::vector<std::string> expected_roots{"src", "lib"};
  CHECK(config.source_roots == expected_roots);
  CHECK(config.report_format == "lcov");
  CHECK(config.output_file == "out/coverage.info");
  CHECK(config.verbose == 2);
}

TEST_CASE("env_config falls back to defaults on malformed values") {
  scoped_env number("L1COV_TEST_NUMBER", "12abc");
  scoped_env flag("L1COV_TEST_FLAG", "maybe");
  scoped_env blank("L1COV_TEST_BLANK", "   ");

  l1cov::util::env_config env("L1COV");
  CHECK(env.variable_name("TEST_NUMBER") == "L1COV_TEST_NUMBER");
  CHECK(env.integer("TEST_NUMBER", 7) == 7);
  CHECK(env.integer("TEST_MISSING", 42) == 42);
  CHECK(env.flag("TEST_FLAG", true));
  CHECK_FALSE(env.flag("TEST_FLAG", false));
  CHECK_FALSE(env.value("TEST_BLANK").has_value());
  CHECK(env.text("TEST_BLANK", "fallback") == "fallback");
  CHECK(env.list("TEST_BLANK").empty());

}

TEST_CASE("verbosity maps to increasingly detailed log levels") {
  CHECK(l1cov::log_level_for_verbosity(-1) == redlog::level::info);
  CHECK(l1cov::log_level_for_verbosity(0) == redlog::level::info);
  CHECK(l1cov::log_level_for_verbosity(1) == redlog::level::verbose);
  CHECK(l1cov::log_level_for_verbosity(2) == redlog::level::trace);
  CHECK(l1cov::log_level_for_verbosity(3) == redlog::level::debug);
  CHECK(l1cov::log_level_for_verbosity(4) == redlog::level::pedantic);
  CHECK(l1cov::log_level_for_verbosity(9) == redlog::level::pedantic);

  l1cov::configure_logging(0);
}
