/** \file value_test.cpp
 *  \brief Equality, ordering and type vocabulary of document values.
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>

#include "tests/support/fixtures.hpp"
#include "verdict/value.hpp"

using namespace verdict;
using verdict::test::arr;
using verdict::test::obj;

TEST_CASE("numbers compare by value across representations", "[value]") {
  REQUIRE(value(1) == value(1.0));
  REQUIRE(value(std::int64_t{42}) == value(42.0));
  REQUIRE(value(1) != value(1.5));
  REQUIRE(compare(value(2), value(1.5)) == 1);
  REQUIRE(compare(value(1.5), value(2)) == -1);
  REQUIRE(compare(value(3), value(3.0)) == 0);
}

TEST_CASE("large integers do not collapse through double", "[value]") {
  const std::int64_t big = std::numeric_limits<std::int64_t>::max();
  REQUIRE(value(big) != value(big - 1));
  REQUIRE(compare(value(big), value(big - 1)) == 1);
}

TEST_CASE("strings order lexicographically", "[value]") {
  REQUIRE(compare(value("apple"), value("banana")) == -1);
  REQUIRE(compare(value("b"), value("B")) == 1);
  REQUIRE(compare(value("same"), value("same")) == 0);
}

TEST_CASE("cross-family pairs are unequal and unordered", "[value]") {
  REQUIRE(value("1") != value(1));
  REQUIRE(value(true) != value(1));
  REQUIRE(value(nullptr) != value(0));
  REQUIRE_FALSE(compare(value("1"), value(1)).has_value());
  REQUIRE_FALSE(compare(value(true), value(false)).has_value());
  REQUIRE_FALSE(compare(value(nullptr), value(nullptr)).has_value());
  REQUIRE_FALSE(compare(arr({1}), arr({1})).has_value());
}

TEST_CASE("containers compare deeply", "[value]") {
  REQUIRE(arr({1, "a", nullptr}) == arr({1.0, "a", nullptr}));
  REQUIRE(arr({1, 2}) != arr({2, 1}));
  REQUIRE(obj({{"a", 1}, {"b", arr({true})}}) == obj({{"b", arr({true})}, {"a", 1.0}}));
  REQUIRE(obj({{"a", 1}}) != obj({{"a", 1}, {"b", 2}}));
}

TEST_CASE("type vocabulary", "[value]") {
  REQUIRE(value(1).type() == value_type::number);
  REQUIRE(value(1.5).type() == value_type::number);
  REQUIRE(value("x").type() == value_type::string);
  REQUIRE(value(false).type() == value_type::boolean);
  REQUIRE(value().type() == value_type::null);
  REQUIRE(arr({}).type() == value_type::array);
  REQUIRE(obj({}).type() == value_type::object);

  REQUIRE(parse_type_name("number") == value_type::number);
  REQUIRE(parse_type_name("boolean") == value_type::boolean);
  REQUIRE_FALSE(parse_type_name("integer").has_value());
  REQUIRE(type_name(value_type::array) == "array");
}

TEST_CASE("integral view of doubles", "[value]") {
  REQUIRE(value(3.0).as_integer() == 3);
  REQUIRE_FALSE(value(3.5).as_integer().has_value());
  REQUIRE_FALSE(value("3").as_integer().has_value());
}

TEST_CASE("diagnostic rendering", "[value]") {
  REQUIRE(to_string(obj({{"a", arr({1, "x", nullptr, true})}})) == R"({"a":[1,"x",null,true]})");
}

TEST_CASE("integers and doubles compare exactly beyond 2^53", "[value]") {
  const std::int64_t odd = 9007199254740993LL;   // 2^53 + 1, not representable as double
  const double even = 9007199254740992.0;        // 2^53

  REQUIRE(value(odd) != value(even));
  REQUIRE(compare(value(odd), value(even)) == 1);
  REQUIRE(compare(value(even), value(odd)) == -1);
  REQUIRE(value(odd - 1) == value(even));

  REQUIRE(compare(value(2), value(2.5)) == -1);
  REQUIRE(compare(value(-2), value(-2.5)) == 1);
  REQUIRE(compare(value(std::numeric_limits<std::int64_t>::max()), value(1e19)) == -1);
  REQUIRE(compare(value(std::numeric_limits<std::int64_t>::min()), value(-1e19)) == 1);
}
