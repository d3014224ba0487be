#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace deplink::query {

/**
 * @brief Configuration for the query result cache
 */
struct QueryCacheConfig {
    size_t maxEntries = 1000;                   ///< Maximum number of cache entries
    std::chrono::milliseconds defaultTTL{300000}; ///< Default TTL (5 minutes)
    double optimizeTargetRatio = 0.75;          ///< optimize() shrinks to this share of maxEntries
};

/**
 * @brief Statistics for cache performance monitoring
 */
struct CacheStats {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> evictions{0};
    std::atomic<uint64_t> invalidations{0};
    std::atomic<uint64_t> insertions{0};
    std::atomic<uint64_t> ttlExpirations{0};
    std::atomic<size_t> currentSize{0};
    size_t maxSize = 0;

    CacheStats() = default;

    // Copy constructor (needed because of atomic members)
    CacheStats(const CacheStats& other) { *this = other; }

    CacheStats& operator=(const CacheStats& other) {
        if (this != &other) {
            hits.store(other.hits.load());
            misses.store(other.misses.load());
            evictions.store(other.evictions.load());
            invalidations.store(other.invalidations.load());
            insertions.store(other.insertions.load());
            ttlExpirations.store(other.ttlExpirations.load());
            currentSize.store(other.currentSize.load());
            maxSize = other.maxSize;
        }
        return *this;
    }

    double hitRate() const {
        uint64_t total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / total : 0.0;
    }

    void reset() {
        hits.store(0);
        misses.store(0);
        evictions.store(0);
        invalidations.store(0);
        insertions.store(0);
        ttlExpirations.store(0);
    }
};

/**
 * @brief A cached, fully evaluated query result
 */
struct CachedQuery {
    nlohmann::json rows = nlohmann::json::array();
    size_t totalMatched = 0;
};

/**
 * @brief Thread-safe LRU + TTL cache of query results keyed by plan cache key
 */
class QueryCache {
public:
    struct CacheEntry {
        CachedQuery data;
        std::chrono::system_clock::time_point insertTime;
        std::chrono::system_clock::time_point lastAccessTime;
        std::chrono::milliseconds ttl{0};
        size_t accessCount = 0;

        bool isExpired() const {
            auto now = std::chrono::system_clock::now();
            return (now - insertTime) > ttl;
        }
    };

    struct OptimizeReport {
        size_t expired = 0;
        size_t evicted = 0;
    };

    explicit QueryCache(const QueryCacheConfig& config = {});

    /**
     * @brief Get a cached result
     * @return nullopt if not found or expired
     */
    std::optional<CachedQuery> get(const std::string& key);

    /**
     * @brief Store a result; a zero ttl uses the configured default
     */
    void put(const std::string& key, const CachedQuery& value,
             std::chrono::milliseconds ttl = std::chrono::milliseconds{0});

    bool contains(const std::string& key) const;

    void invalidate(const std::string& key);

    /**
     * @brief Clear entire cache
     * @return number of entries dropped
     */
    size_t clear();

    size_t size() const;

    /**
     * @brief Evict up to count least recently used entries
     */
    size_t evict(size_t count = 1);

    /**
     * @brief Remove expired entries
     */
    size_t removeExpired();

    /**
     * @brief Drop expired entries, then evict least recently used entries
     * until the cache is at most optimizeTargetRatio * maxEntries.
     */
    OptimizeReport optimize();

    CacheStats getStats() const;

    void resetStats();

private:
    using ListIterator = std::list<std::string>::iterator;

    struct Slot {
        std::shared_ptr<CacheEntry> entry;
        ListIterator lruPosition;
    };

    mutable std::shared_mutex mutex_;
    QueryCacheConfig config_;

    std::list<std::string> lruList_; ///< front = most recently used
    std::unordered_map<std::string, Slot> cache_;

    mutable CacheStats stats_;

    void moveToFront(Slot& slot);
    void erase(std::unordered_map<std::string, Slot>::iterator it);
    size_t removeExpiredLocked();
    bool evictLRU();
};

} // namespace deplink::query
