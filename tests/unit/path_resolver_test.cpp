#include <catch2/catch_test_macros.hpp>

#include "tests/support/fixtures.hpp"
#include "verdict/path_resolver.hpp"

using namespace verdict;
using verdict::test::arr;
using verdict::test::obj;

TEST_CASE("resolve walks nested objects", "[path]") {
  const auto doc = obj({{"user", obj({{"address", obj({{"city", "Oslo"}})}})}, {"age", 25}});

  auto top = resolve(doc, "age");
  REQUIRE(top.has_value());
  REQUIRE(**top == value(25));

  auto nested = resolve(doc, "user.address.city");
  REQUIRE(nested.has_value());
  REQUIRE(**nested == value("Oslo"));

  auto whole = resolve(doc, "user.address");
  REQUIRE(whole.has_value());
  REQUIRE((*whole)->is_object());
}

TEST_CASE("missing keys report missing_data with the full original path", "[path]") {
  const auto doc = obj({{"user", obj({{"name", "Ada"}})}});

  auto r = resolve(doc, "user.address.city");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::missing_data);
  REQUIRE(r.error().message == "Missing data at: user.address.city");

  auto top = resolve(doc, "salary");
  REQUIRE_FALSE(top.has_value());
  REQUIRE(top.error().message == "Missing data at: salary");
}

TEST_CASE("explicit null is found, not missing", "[path]") {
  const auto doc = obj({{"middle_name", nullptr}});
  auto r = resolve(doc, "middle_name");
  REQUIRE(r.has_value());
  REQUIRE((*r)->is_null());
}

TEST_CASE("arrays and scalars are terminal", "[path]") {
  const auto doc = obj({{"tags", arr({"a", "b"})}, {"name", "x"}, {"items", arr({obj({{"id", 1}})})}});

  REQUIRE_FALSE(resolve(doc, "tags.0").has_value());
  REQUIRE_FALSE(resolve(doc, "name.length").has_value());
  REQUIRE_FALSE(resolve(doc, "items.id").has_value());

  auto tags = resolve(doc, "tags");
  REQUIRE(tags.has_value());
  REQUIRE((*tags)->as_array().size() == 2);
}

TEST_CASE("resolving against a non-object document", "[path]") {
  REQUIRE_FALSE(resolve(value(5), "a").has_value());
  REQUIRE_FALSE(resolve(arr({1}), "a").has_value());
}

TEST_CASE("split_path keeps empty segments", "[path]") {
  REQUIRE(split_path("a.b.c") == std::vector<std::string_view>{"a", "b", "c"});
  REQUIRE(split_path("a") == std::vector<std::string_view>{"a"});
  REQUIRE(split_path("a..b") == std::vector<std::string_view>{"a", "", "b"});
}
