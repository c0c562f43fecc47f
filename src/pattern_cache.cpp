#include "verdict/cache/pattern_cache.hpp"

#include <utility>

namespace verdict::cache {

auto PatternCache::get_or_compile(const std::string& pattern)
    -> std::expected<compiled_pattern, core::error> {
  if (auto hit = cache_.get(pattern)) {
    return *hit;
  }
  try {
    auto compiled = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    cache_.put(pattern, compiled);
    return compiled;
  } catch (const std::regex_error& e) {
    return std::unexpected(core::error{
        core::error_code::invalid_operand,
        "Invalid pattern '" + pattern + "': " + e.what(),
        "operators.regex"});
  }
}

} // namespace verdict::cache
