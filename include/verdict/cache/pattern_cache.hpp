#pragma once

/** \file pattern_cache.hpp
 *  \brief Bounded, thread-safe cache of compiled $regex patterns.
 *
 * Compilation happens outside the shard lock: two threads missing on the same
 * pattern both compile it and the later put() simply replaces the earlier
 * entry. Eviction racing with lookup only costs a recompile.
 * Malformed patterns are reported as invalid_operand and never cached.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <regex>
#include <string>

#include "verdict/cache/lru_cache.hpp"
#include "verdict/error.hpp"

namespace verdict::cache {

class PatternCache {
public:
    using compiled_pattern = std::shared_ptr<const std::regex>;

    static constexpr std::size_t DEFAULT_CAPACITY = 256;
    static constexpr std::size_t DEFAULT_NUM_SHARDS = 8;

    explicit PatternCache(std::size_t capacity = DEFAULT_CAPACITY,
                          std::size_t num_shards = DEFAULT_NUM_SHARDS)
        : cache_(capacity, num_shards) {}

    /** \brief Return the compiled ECMAScript pattern, compiling it on a miss. */
    auto get_or_compile(const std::string& pattern) -> std::expected<compiled_pattern, core::error>;

    [[nodiscard]] auto size() const -> std::size_t { return cache_.size(); }
    [[nodiscard]] auto capacity() const -> std::size_t { return cache_.capacity(); }
    [[nodiscard]] auto stats() const -> CacheStats { return cache_.stats(); }
    auto clear() -> void { cache_.clear(); }

private:
    ShardedLruCache<std::string, compiled_pattern> cache_;
};

} // namespace verdict::cache
