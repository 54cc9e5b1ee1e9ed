#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "l1cov/analysis/line_classifier.hpp"

using l1cov::line_kind;
using l1cov::analysis::classify;

TEST_CASE("line_classifier returns nothing for empty input") {
  CHECK(classify("").empty());
}

TEST_CASE("line_classifier splits lines like the source") {
  CHECK(classify("x = 1\n").size() == 1);
  CHECK(classify("x = 1").size() == 1);
  CHECK(classify("\n").size() == 1);

  auto kinds = classify("x = 1\r\n\r\ny = 2\r\n");
  REQUIRE(kinds.size() == 3);
  CHECK(kinds[0] == line_kind::executable);
  CHECK(kinds[1] == line_kind::non_executable);
  CHECK(kinds[2] == line_kind::executable);
}

TEST_CASE("line_classifier treats blank and comment lines as non executable") {
  auto kinds = classify("   \n-- a comment\n\t\nlocal x = 1 -- trailing\n");
  REQUIRE(kinds.size() == 4);
  CHECK(kinds[0] == line_kind::non_executable);
  CHECK(kinds[1] == line_kind::non_executable);
  CHECK(kinds[2] == line_kind::non_executable);
  CHECK(kinds[3] == line_kind::executable);
}

TEST_CASE("line_classifier sees code after a comment closed on the same line") {
  const std::string source = "local x = 0\n"
                             "-- comment\n"
                             "--[[ note --]] x = 1\n";
  auto kinds = classify(source);
  REQUIRE(kinds.size() == 3);
  CHECK(kinds[2] == line_kind::executable);
}

TEST_CASE("line_classifier skips everything inside a multi-line comment") {
  const std::string source = "local a = 1\n"
                             "local b = 2\n"
                             "\n"
                             "--[[\n"
                             "local c = 3\n"
                             "if c then\n"
                             "  print(c)\n"
                             "end\n"
                             "]]\n"
                             "print(a)\n";
  auto kinds = classify(source);
  REQUIRE(kinds.size() == 10);
  CHECK(kinds[0] == line_kind::executable);
  CHECK(kinds[1] == line_kind::executable);
  for (size_t line = 4; line <= 9; ++line) {
    CAPTURE(line);
    CHECK(kinds[line - 1] == line_kind::non_executable);
  }
  CHECK(kinds[9] == line_kind::executable);
}

TEST_CASE("line_classifier keeps code that precedes a comment opener") {
  auto kinds = classify("x = 1 --[[ starts here\nstill comment\n]] y = 2\n");
  REQUIRE(kinds.size() == 3);
  CHECK(kinds[0] == line_kind::executable);
  CHECK(kinds[1] == line_kind::non_executable);
  CHECK(kinds[2] == line_kind::executable);
}

TEST_CASE("line_classifier only closes long brackets of the same level") {
  const std::string source = "--[==[\n"
                             "]]\n"
                             "x = 1\n"
                             "]==]\n"
                             "y = 2\n";
  auto kinds = classify(source);
  REQUIRE(kinds.size() == 5);
  CHECK(kinds[0] == line_kind::non_executable);
  CHECK(kinds[1] == line_kind::non_executable);
  CHECK(kinds[2] == line_kind::non_executable);
  CHECK(kinds[3] == line_kind::non_executable);
  CHECK(kinds[4] == line_kind::executable);
}

TEST_CASE("line_classifier ignores comment markers inside strings") {
  const std::string source = "local s = \"--[[ not a comment\"\n"
                             "local t = '-- nor this'\n"
                             "x = 1\n";
  auto kinds = classify(source);
  REQUIRE(kinds.size() == 3);
  CHECK(kinds[0] == line_kind::executable);
  CHECK(kinds[1] == line_kind::executable);
  CHECK(kinds[2] == line_kind::executable);
}

TEST_CASE("line_classifier treats lines inside long strings as non executable") {
  const std::string source = "local s = [[\n"
                             "text line\n"
                             "if not code\n"
                             "]]\n"
                             "print(s)\n";
  auto kinds = classify(source);
  REQUIRE(kinds.size() == 5);
  CHECK(kinds[0] == line_kind::executable);
  CHECK(kinds[1] == line_kind::non_executable);
  CHECK(kinds[2] == line_kind::non_executable);
  CHECK(kinds[3] == line_kind::non_executable);
  CHECK(kinds[4] == line_kind::executable);
}

TEST_CASE("line_classifier follows backslash continued strings") {
  const std::string source = "local s = \"abc\\\n"
                             "def -- still string\\\n"
                             "ghi\"\n"
                             "x = 1\n";
  auto kinds = classify(source);
  REQUIRE(kinds.size() == 4);
  CHECK(kinds[0] == line_kind::executable);
  CHECK(kinds[1] == line_kind::non_executable);
  CHECK(kinds[2] == line_kind::non_executable);
  CHECK(kinds[3] == line_kind::executable);
}

TEST_CASE("line_classifier marks block openers and closers") {
  const std::string source = "local function f(x)\n"
                             "  if x then\n"
                             "    return 1\n"
                             "  else\n"
                             "    return 2\n"
                             "  end\n"
                             "end\n"
                             "local t = {\n"
                             "  1,\n"
                             "}\n"
                             "for i = 1, 3 do end\n"
                             "while false do\n"
                             "end)\n"
                             "callback(function() end)\n";
  auto kinds = classify(source);
  REQUIRE(kinds.size() == 14);
  CHECK(kinds[0] == line_kind::block_start);
  CHECK(kinds[1] == line_kind::block_start);
  CHECK(kinds[2] == line_kind::executable);
  CHECK(kinds[3] == line_kind::block_end);
  CHECK(kinds[4] == line_kind::executable);
  CHECK(kinds[5] == line_kind::block_end);
  CHECK(kinds[6] == line_kind::block_end);
  CHECK(kinds[7] == line_kind::executable);
  CHECK(kinds[8] == line_kind::executable);
  CHECK(kinds[9] == line_kind::block_end);
  CHECK(kinds[10] == line_kind::block_start);
  CHECK(kinds[11] == line_kind::block_start);
  CHECK(kinds[12] == line_kind::block_end);
  CHECK(kinds[13] == line_kind::block_start);
}

TEST_CASE("line_classifier degrades on an unterminated comment") {
  auto kinds = classify("x = 1\n--[[ never closed\ny = 2\nz = 3");
  REQUIRE(kinds.size() == 4);
  CHECK(kinds[0] == line_kind::executable);
  CHECK(kinds[1] == line_kind::non_executable);
  CHECK(kinds[2] == line_kind::non_executable);
  CHECK(kinds[3] == line_kind::non_executable);
}

TEST_CASE("line_classifier strips comments and strings from code text") {
  l1cov::analysis::line_classifier classifier;
  auto scanned = classifier.scan(std::string_view("if s == \"end\" then -- check\n"));
  REQUIRE(scanned.size() == 1);
  CHECK(scanned[0].kind == line_kind::block_start);
  CHECK(scanned[0].code == "if s == \"\" then");
}

TEST_CASE("executable and block_start lines count as executable") {
  CHECK(l1cov::counts_as_executable(line_kind::executable));
  CHECK(l1cov::counts_as_executable(line_kind::block_start));
  CHECK_FALSE(l1cov::counts_as_executable(line_kind::block_end));
  CHECK_FALSE(l1cov::counts_as_executable(line_kind::non_executable));
}
