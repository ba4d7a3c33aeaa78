#include "catch2/catch_test_macros.hpp"

#include "sat/dimacs.h"

#include <sstream>
#include <stdexcept>
#include <vector>

using namespace dmcr;

namespace {
SolverOutput parse(std::string const &text) {
  auto in = std::istringstream(text);
  return parseSolution(in);
}
} // namespace

TEST_CASE("solver output") {
  SECTION("single value line") {
    auto sol = parse("s SATISFIABLE\nv 1 -2 3 0\n");
    CHECK(sol.status == SolverOutput::Status::satisfiable);
    CHECK(sol.values == std::vector{1, -2, 3});
  }

  SECTION("comments are ignored, even between value lines") {
    auto sol = parse("c comment\nc more\nv 1 2\nc in between\nv -3 0\n");
    CHECK(sol.status == SolverOutput::Status::unknown);
    CHECK(sol.values == std::vector{1, 2, -3});
  }

  SECTION("value lines continue until zero") {
    auto sol = parse("v 1 -2\nv 3\nv -4 0\nv 5 0\n");
    CHECK(sol.values == std::vector{1, -2, 3, -4});
  }

  SECTION("nothing after the terminating zero is read") {
    auto sol = parse("v 1 0 7 8\nthis is not dimacs\n");
    CHECK(sol.values == std::vector{1});
  }

  SECTION("missing terminator") {
    auto sol = parse("s SATISFIABLE\nv 1 2\n");
    CHECK(sol.values == std::vector{1, 2});
  }

  SECTION("whitespace, blank lines and line endings") {
    auto sol = parse("\n  \nv\t+1   -2\r\nv\r\nv 0\r\n");
    CHECK(sol.values == std::vector{1, -2});
  }

  SECTION("no value line at all") {
    CHECK(parse("").values.empty());
    CHECK(parse("c just a comment\n").values.empty());
    CHECK(parse("s SATISFIABLE\n").values.empty());
  }

  SECTION("unsatisfiable") {
    auto sol = parse("c solver\ns UNSATISFIABLE\nv 1 0\n");
    CHECK(sol.status == SolverOutput::Status::unsatisfiable);
    CHECK(sol.values.empty());
  }
}

TEST_CASE("malformed solver output") {
  CHECK_THROWS_AS(parse("s UNKNOWN\n"), IllegalFormat);
  CHECK_THROWS_AS(parse("1 2 0\n"), IllegalFormat);
  CHECK_THROWS_AS(parse("values 1 2 0\n"), IllegalFormat);
  CHECK_THROWS_AS(parse("v 1 2\nx\n"), IllegalFormat);

  // values that are not integers
  CHECK_THROWS_AS(parse("v 1 two 0\n"), std::runtime_error);
  CHECK_THROWS_AS(parse("v 1 2x 0\n"), std::runtime_error);
  CHECK_THROWS_AS(parse("v 1 99999999999 0\n"), std::runtime_error);
  CHECK_THROWS_AS(parse("v +\n"), std::runtime_error);
}
