#pragma once

#include <deplink/inference/inference_types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace deplink::inference {

struct InferenceCacheKey {
    InferenceKind kind = InferenceKind::Hierarchical;
    std::string rootId;
    std::string edgeType;
    std::uint64_t paramsHash = 0;

    std::string str() const;
};

struct InferenceCacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t insertions = 0;
    std::uint64_t evictions = 0;
    std::uint64_t invalidations = 0;
    std::size_t size = 0;
    std::size_t capacity = 0;

    double hitRate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/**
 * Memo cache for completed inference results.
 *
 * Lookups run under a shared lock and bump an atomic access tick; only
 * insertion, eviction and invalidation take the exclusive lock. Each entry
 * remembers every address its result depends on so a write to any of them
 * drops the entry.
 */
class InferenceCache {
public:
    explicit InferenceCache(std::size_t capacity = 2000);

    std::optional<InferenceResult> get(const InferenceCacheKey& key);

    // Partial results are ignored, as are results computed before an
    // invalidation when the generation read at start is passed.
    void put(const InferenceCacheKey& key, const InferenceResult& result,
             std::optional<std::uint64_t> generation = std::nullopt);

    /// Drops entries whose dependency set contains address. Entries whose
    /// traversal met dangling edges are dropped too when dropDangling is set.
    std::size_t invalidateAddress(const std::string& address, bool dropDangling = false);

    void clear();

    /// Bumped by every invalidation and clear.
    std::uint64_t generation() const;

    std::size_t size() const;
    InferenceCacheStats stats() const;

private:
    struct Entry {
        InferenceResult result;
        std::unordered_set<std::string> dependsOn;
        mutable std::atomic<std::uint64_t> lastAccess{0};
    };

    void evictOldest();
    void eraseEntry(const std::string& key);

    std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
    std::unordered_map<std::string, std::unordered_set<std::string>> byAddress_;
    std::atomic<std::uint64_t> tick_{0};
    std::atomic<std::uint64_t> generation_{0};

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> insertions_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> invalidations_{0};
};

} // namespace deplink::inference
