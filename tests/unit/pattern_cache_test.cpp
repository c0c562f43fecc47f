#include <catch2/catch_test_macros.hpp>

#include <regex>
#include <string>
#include <thread>
#include <vector>

#include "verdict/cache/pattern_cache.hpp"

using verdict::cache::PatternCache;
using verdict::core::error_code;

TEST_CASE("pattern cache compiles once and reuses", "[cache][regex]") {
  PatternCache cache;

  auto first = cache.get_or_compile("^admin");
  REQUIRE(first.has_value());
  auto second = cache.get_or_compile("^admin");
  REQUIRE(second.has_value());
  REQUIRE(first->get() == second->get());

  REQUIRE(std::regex_search("admin_user", **first));
  REQUIRE_FALSE(std::regex_search("user_admin", **first));

  auto s = cache.stats();
  REQUIRE(s.misses == 1);
  REQUIRE(s.hits == 1);
  REQUIRE(cache.size() == 1);
}

TEST_CASE("malformed patterns are reported and not cached", "[cache][regex]") {
  PatternCache cache;

  auto r = cache.get_or_compile("([a-z");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::invalid_operand);
  REQUIRE(r.error().component == "operators.regex");
  REQUIRE(r.error().message.rfind("Invalid pattern '([a-z'", 0) == 0);
  REQUIRE(cache.size() == 0);
}

TEST_CASE("pattern cache is bounded", "[cache][regex]") {
  PatternCache cache(4, 1);
  REQUIRE(cache.capacity() == 4);
  for (int i = 0; i < 20; ++i) {
    REQUIRE(cache.get_or_compile("p" + std::to_string(i)).has_value());
  }
  REQUIRE(cache.size() == 4);
  REQUIRE(cache.stats().evictions == 16);

  // An evicted pattern is simply recompiled.
  auto again = cache.get_or_compile("p0");
  REQUIRE(again.has_value());
  REQUIRE(std::regex_search("xp0x", **again));
}

TEST_CASE("pattern cache under concurrent lookups", "[cache][regex][concurrency]") {
  PatternCache cache(8, 2);
  std::vector<std::thread> threads;
  std::vector<int> matched(4, 0);
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, &matched, t] {
      for (int i = 0; i < 200; ++i) {
        const std::string suffix = std::to_string(i % 12);
        auto re = cache.get_or_compile("^id-" + suffix + "$");
        if (re && std::regex_search("id-" + suffix, **re)) ++matched[t];
      }
    });
  }
  for (auto& th : threads) th.join();

  for (int m : matched) REQUIRE(m == 200);
  REQUIRE(cache.size() <= cache.capacity());
}

TEST_CASE("pattern cache capacity below shard count", "[cache][regex]") {
  PatternCache cache(3, 8);
  REQUIRE(cache.capacity() == 3);
  for (int i = 0; i < 20; ++i) {
    REQUIRE(cache.get_or_compile("q" + std::to_string(i)).has_value());
  }
  REQUIRE(cache.size() <= 3);
}
