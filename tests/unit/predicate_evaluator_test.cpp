/** \file predicate_evaluator_test.cpp
 *  \brief Tri-state semantics of single-predicate evaluation.
 */

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>

#include "tests/support/fixtures.hpp"

using namespace verdict;
using verdict::test::arr;
using verdict::test::obj;
using verdict::test::pred;

TEST_CASE("adult check matches when age is present", "[predicate]") {
  PredicateEvaluator ev;
  auto r = ev.evaluate(obj({{"age", 25}}), pred("a", {{"age", obj({{"$gte", 18}})}}));
  REQUIRE(r.predicate_id == "a");
  REQUIRE(r.state == evaluation_state::matched);
  REQUIRE(r.matched());
  REQUIRE(r.is_determined());
  REQUIRE(r.missing_paths.empty());
  REQUIRE_FALSE(r.failure_reason.has_value());
  REQUIRE_FALSE(r.reason().has_value());
}

TEST_CASE("missing field makes the predicate undetermined", "[predicate]") {
  PredicateEvaluator ev;
  auto r = ev.evaluate(obj({}), pred("a", {{"age", obj({{"$gte", 18}})}}));
  REQUIRE(r.state == evaluation_state::undetermined);
  REQUIRE_FALSE(r.is_determined());
  REQUIRE(r.missing_paths == std::set<std::string>{"age"});
  REQUIRE(r.reason() == "Missing data at: age");
}

TEST_CASE("every absent path is reported", "[predicate]") {
  PredicateEvaluator ev;
  const auto doc = obj({{"user", obj({{"name", "Ada"}})}, {"age", 10}});
  auto r = ev.evaluate(doc, pred("p", {
                                         {"user.name", "Ada"},
                                         {"user.address.city", "Oslo"},
                                         {"salary", obj({{"$gt", 0}})},
                                         {"age", obj({{"$gte", 18}})},
                                     }));
  REQUIRE(r.state == evaluation_state::undetermined);
  REQUIRE(r.missing_paths == std::set<std::string>{"salary", "user.address.city"});
  REQUIRE(r.reason() == "Missing data at: salary, user.address.city");
}

TEST_CASE("fully resolved predicates are always determined", "[predicate]") {
  PredicateEvaluator ev;
  const auto doc = obj({{"a", 1}, {"b", "x"}, {"c", arr({1, 2})}, {"d", nullptr}});

  for (const auto& p : {pred("p1", {{"a", 1}, {"b", "x"}}),
                        pred("p2", {{"a", obj({{"$gt", 5}})}}),
                        pred("p3", {{"c", obj({{"$size", 2}})}, {"d", obj({{"$type", "null"}})}}),
                        pred("p4", {{"b", obj({{"$in", arr({"y", "z"})}})}})}) {
    INFO(p.id);
    auto r = ev.evaluate(doc, p);
    REQUIRE(r.is_determined());
    REQUIRE(r.missing_paths.empty());
  }
}

TEST_CASE("clauses are AND-ed", "[predicate]") {
  PredicateEvaluator ev;
  const auto doc = obj({{"age", 30}, {"country", "NO"}});

  REQUIRE(ev.evaluate(doc, pred("p", {{"age", obj({{"$gte", 18}})}, {"country", "NO"}})).matched());
  auto r = ev.evaluate(doc, pred("p", {{"age", obj({{"$gte", 18}})}, {"country", "SE"}}));
  REQUIRE(r.state == evaluation_state::not_matched);
  REQUIRE(r.reason() == "Non-matching values");
}

TEST_CASE("unknown operator is undetermined regardless of other clauses", "[predicate]") {
  PredicateEvaluator ev;
  const auto doc = obj({{"age", 30}, {"name", "x"}});

  auto r = ev.evaluate(doc, pred("p", {{"age", obj({{"$gte", 18}, {"$foo", 1}})}, {"name", "x"}}));
  REQUIRE(r.state == evaluation_state::undetermined);
  REQUIRE(r.missing_paths.empty());
  REQUIRE(r.failure_reason == "Unknown operator: $foo");

  auto other = ev.evaluate(doc, pred("p", {{"age", obj({{"$lt", 0}})}, {"name", obj({{"$foo", 1}})}}));
  REQUIRE(other.state == evaluation_state::undetermined);
}

TEST_CASE("missing data wins over clause errors", "[predicate]") {
  PredicateEvaluator ev;
  auto r = ev.evaluate(obj({{"a", 1}}), pred("p", {{"a", obj({{"$foo", 1}})}, {"z", 1}}));
  REQUIRE(r.state == evaluation_state::undetermined);
  REQUIRE(r.missing_paths == std::set<std::string>{"z"});
}

TEST_CASE("empty $or never matches", "[predicate]") {
  PredicateEvaluator ev;
  auto r = ev.evaluate(obj({{"value", 5}}), pred("p", {{"value", obj({{"$or", arr({})}})}}));
  REQUIRE(r.state == evaluation_state::not_matched);
}

TEST_CASE("predicate without a query is an undefined reference", "[predicate]") {
  PredicateEvaluator ev;
  auto r = ev.evaluate(obj({{"age", 1}}), predicate{"ghost", {}});
  REQUIRE(r.predicate_id == "ghost");
  REQUIRE(r.state == evaluation_state::undetermined);
  REQUIRE(r.missing_paths == std::set<std::string>{"predicate definition"});
  REQUIRE(r.reason() == "Predicate definition not found");
}

TEST_CASE("custom operators extend the table", "[predicate][custom]") {
  auto table = std::make_shared<OperatorTable>();
  auto added = table->register_operator(
      "$length", [](const value& v, const value& operand, const match_context&) -> operator_result {
        auto n = operand.as_integer();
        if (!n) {
          return std::unexpected(core::error{core::error_code::invalid_operand, "$length expects an integer", "test"});
        }
        if (!v.is_string()) return false;
        return static_cast<std::int64_t>(v.as_string().size()) == *n;
      });
  REQUIRE(added.has_value());

  PredicateEvaluator ev(table);
  REQUIRE(table->frozen());

  const auto doc = obj({{"code", "ABC123"}});
  REQUIRE(ev.evaluate(doc, pred("p", {{"code", obj({{"$length", 6}})}})).matched());
  REQUIRE(ev.evaluate(doc, pred("p", {{"code", obj({{"$length", 3}})}})).state == evaluation_state::not_matched);
  REQUIRE(ev.evaluate(doc, pred("p", {{"code", obj({{"$length", "six"}})}})).state == evaluation_state::undetermined);
  // Custom and built-in operators combine in one condition.
  REQUIRE(ev.evaluate(doc, pred("p", {{"code", obj({{"$length", 6}, {"$startsWith", "AB"}})}})).matched());

  auto late = table->register_operator(
      "$late", [](const value&, const value&, const match_context&) -> operator_result { return true; });
  REQUIRE_FALSE(late.has_value());
  REQUIRE(late.error().code == core::error_code::precondition_failed);
}

TEST_CASE("a throwing handler is isolated", "[predicate][custom]") {
  auto table = std::make_shared<OperatorTable>();
  REQUIRE(table
              ->register_operator("$explode",
                                  [](const value&, const value&, const match_context&) -> operator_result {
                                    throw std::runtime_error("boom");
                                  })
              .has_value());
  PredicateEvaluator ev(table);

  auto r = ev.evaluate(obj({{"x", 1}}), pred("p", {{"x", obj({{"$explode", true}})}}));
  REQUIRE(r.predicate_id == "p");
  REQUIRE(r.state == evaluation_state::undetermined);
  REQUIRE(r.failure_reason == "Internal error during evaluation");

  // The evaluator stays usable afterwards.
  REQUIRE(ev.evaluate(obj({{"x", 1}}), pred("q", {{"x", 1}})).matched());
}

TEST_CASE("evaluator requires a table", "[predicate]") {
  REQUIRE_THROWS_AS(PredicateEvaluator(std::shared_ptr<OperatorTable>{}), std::invalid_argument);
}
