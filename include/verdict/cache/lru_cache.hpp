/** \file lru_cache.hpp
 *  \brief Thread-safe, entry-bounded LRU cache with sharding for reduced contention
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace verdict::cache {

/**
 * \brief Snapshot of cache counters
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t inserts{0};
    std::uint64_t updates{0};

    [[nodiscard]] auto hit_rate() const -> double {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/**
 * \brief LRU cache shard holding at most `capacity` entries
 */
template<typename K, typename V, typename Hash = std::hash<K>>
class LruCacheShard {
public:
    struct Entry {
        K key;
        V value;
    };

    using ListIterator = typename std::list<Entry>::iterator;

    explicit LruCacheShard(std::size_t capacity)
        : capacity_(std::max<std::size_t>(1, capacity)) {}

    // Non-copyable and non-movable due to mutex
    LruCacheShard(const LruCacheShard&) = delete;
    LruCacheShard& operator=(const LruCacheShard&) = delete;
    LruCacheShard(LruCacheShard&&) = delete;
    LruCacheShard& operator=(LruCacheShard&&) = delete;

    /**
     * \brief Get value and mark it most recently used
     */
    [[nodiscard]] auto get(const K& key) -> std::optional<V> {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        auto list_it = it->second;
        if (list_it != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
        }

        hits_.fetch_add(1, std::memory_order_relaxed);
        return list_it->value;
    }

    /**
     * \brief Insert or replace; evicts the least recently used entry when full
     */
    auto put(const K& key, V value) -> void {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            auto list_it = it->second;
            list_it->value = std::move(value);
            if (list_it != lru_list_.begin()) {
                lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
            }
            updates_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        while (index_.size() >= capacity_ && !lru_list_.empty()) {
            index_.erase(lru_list_.back().key);
            lru_list_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        lru_list_.emplace_front(Entry{key, std::move(value)});
        index_[key] = lru_list_.begin();
        inserts_.fetch_add(1, std::memory_order_relaxed);
    }

    auto clear() -> void {
        std::unique_lock lock(mutex_);
        lru_list_.clear();
        index_.clear();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    [[nodiscard]] auto stats() const -> CacheStats {
        return CacheStats{hits_.load(), misses_.load(), evictions_.load(),
                          inserts_.load(), updates_.load()};
    }

private:
    mutable std::shared_mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<K, ListIterator, Hash> index_;
    std::size_t capacity_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> inserts_{0};
    std::atomic<std::uint64_t> updates_{0};
};

/**
 * \brief Sharded LRU cache for high concurrency
 *
 * Capacity is split across shards, the remainder going one entry each to the
 * first shards, so capacity() equals the requested capacity (at least 1).
 * The shard count is clamped to the capacity. Recency is tracked per shard
 * rather than globally.
 */
template<typename K, typename V, typename Hash = std::hash<K>>
class ShardedLruCache {
public:
    static constexpr std::size_t DEFAULT_NUM_SHARDS = 16;

    explicit ShardedLruCache(std::size_t capacity,
                             std::size_t num_shards = DEFAULT_NUM_SHARDS)
        : num_shards_(std::clamp<std::size_t>(num_shards, 1, std::max<std::size_t>(1, capacity)))
        , hasher_() {
        capacity = std::max<std::size_t>(1, capacity);
        const auto per_shard = capacity / num_shards_;
        const auto remainder = capacity % num_shards_;
        shards_.reserve(num_shards_);
        for (std::size_t i = 0; i < num_shards_; ++i) {
            shards_.emplace_back(std::make_unique<LruCacheShard<K, V, Hash>>(per_shard + (i < remainder ? 1 : 0)));
        }
    }

    [[nodiscard]] auto get(const K& key) -> std::optional<V> {
        return shard_for(key).get(key);
    }

    auto put(const K& key, V value) -> void {
        shard_for(key).put(key, std::move(value));
    }

    auto clear() -> void {
        for (auto& shard : shards_) {
            shard->clear();
        }
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->size();
        }
        return total;
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->capacity();
        }
        return total;
    }

    [[nodiscard]] auto stats() const -> CacheStats {
        CacheStats total;
        for (const auto& shard : shards_) {
            const auto s = shard->stats();
            total.hits += s.hits;
            total.misses += s.misses;
            total.evictions += s.evictions;
            total.inserts += s.inserts;
            total.updates += s.updates;
        }
        return total;
    }

private:
    [[nodiscard]] auto shard_for(const K& key) -> LruCacheShard<K, V, Hash>& {
        return *shards_[hasher_(key) % num_shards_];
    }

    std::size_t num_shards_;
    std::vector<std::unique_ptr<LruCacheShard<K, V, Hash>>> shards_;
    Hash hasher_;
};

} // namespace verdict::cache
