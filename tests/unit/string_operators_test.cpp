#include <catch2/catch_test_macros.hpp>

#include "tests/support/fixtures.hpp"

using namespace verdict;
using verdict::test::arr;
using verdict::test::obj;
using verdict::test::state_of;

namespace {
constexpr auto MATCHED = evaluation_state::matched;
constexpr auto NOT_MATCHED = evaluation_state::not_matched;
} // namespace

TEST_CASE("$contains on strings and arrays", "[operators][string]") {
  PredicateEvaluator ev;
  const auto doc = obj({{"bio", "loves graph theory"}, {"tags", arr({"x", 2, true})}, {"n", 12}});

  REQUIRE(state_of(ev, doc, "bio", obj({{"$contains", "graph"}})) == MATCHED);
  REQUIRE(state_of(ev, doc, "bio", obj({{"$contains", "Graph"}})) == NOT_MATCHED);
  REQUIRE(state_of(ev, doc, "bio", obj({{"$contains", 1}})) == NOT_MATCHED);
  REQUIRE(state_of(ev, doc, "tags", obj({{"$contains", 2.0}})) == MATCHED);
  REQUIRE(state_of(ev, doc, "tags", obj({{"$contains", "y"}})) == NOT_MATCHED);
  REQUIRE(state_of(ev, doc, "n", obj({{"$contains", 1}})) == NOT_MATCHED);
}

TEST_CASE("$startsWith and $endsWith", "[operators][string]") {
  PredicateEvaluator ev;
  const auto doc = obj({{"file", "report.pdf"}, {"n", 42}});

  REQUIRE(state_of(ev, doc, "file", obj({{"$startsWith", "rep"}})) == MATCHED);
  REQUIRE(state_of(ev, doc, "file", obj({{"$startsWith", "pdf"}})) == NOT_MATCHED);
  REQUIRE(state_of(ev, doc, "file", obj({{"$endsWith", ".pdf"}})) == MATCHED);
  REQUIRE(state_of(ev, doc, "file", obj({{"$endsWith", ".doc"}})) == NOT_MATCHED);
  REQUIRE(state_of(ev, doc, "file", obj({{"$startsWith", ""}})) == MATCHED);
  REQUIRE(state_of(ev, doc, "n", obj({{"$startsWith", "4"}})) == NOT_MATCHED);
  REQUIRE(state_of(ev, doc, "file", obj({{"$endsWith", 5}})) == NOT_MATCHED);
}
