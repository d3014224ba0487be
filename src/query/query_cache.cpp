#include <algorithm>
#include <cmath>
#include <mutex>
#include <deplink/query/query_cache.h>

namespace deplink::query {

QueryCache::QueryCache(const QueryCacheConfig& config) : config_(config) {
    if (config_.maxEntries == 0)
        config_.maxEntries = 1;
    config_.optimizeTargetRatio = std::clamp(config_.optimizeTargetRatio, 0.0, 1.0);
    stats_.maxSize = config_.maxEntries;
}

std::optional<CachedQuery> QueryCache::get(const std::string& key) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it == cache_.end()) {
            stats_.misses.fetch_add(1);
            return std::nullopt;
        }
    }

    // Hit path mutates LRU order and access metadata, so it needs the
    // exclusive lock; re-check since the entry may have gone meanwhile.
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        stats_.misses.fetch_add(1);
        return std::nullopt;
    }

    if (it->second.entry->isExpired()) {
        erase(it);
        stats_.ttlExpirations.fetch_add(1);
        stats_.misses.fetch_add(1);
        return std::nullopt;
    }

    auto& entry = *it->second.entry;
    entry.lastAccessTime = std::chrono::system_clock::now();
    entry.accessCount++;
    moveToFront(it->second);
    stats_.hits.fetch_add(1);
    return entry.data;
}

void QueryCache::put(const std::string& key, const CachedQuery& value,
                     std::chrono::milliseconds ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto effectiveTtl = ttl.count() > 0 ? ttl : config_.defaultTTL;

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        auto& entry = *it->second.entry;
        entry.data = value;
        entry.insertTime = now;
        entry.lastAccessTime = now;
        entry.ttl = effectiveTtl;
        moveToFront(it->second);
        return;
    }

    while (cache_.size() >= config_.maxEntries) {
        if (!evictLRU())
            break;
    }

    auto entry = std::make_shared<CacheEntry>();
    entry->data = value;
    entry->insertTime = now;
    entry->lastAccessTime = now;
    entry->ttl = effectiveTtl;

    lruList_.push_front(key);
    cache_[key] = Slot{std::move(entry), lruList_.begin()};

    stats_.insertions.fetch_add(1);
    stats_.currentSize.store(cache_.size());
}

bool QueryCache::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end())
        return false;
    return !it->second.entry->isExpired();
}

void QueryCache::invalidate(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        erase(it);
        stats_.invalidations.fetch_add(1);
    }
}

size_t QueryCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t dropped = cache_.size();
    cache_.clear();
    lruList_.clear();
    stats_.invalidations.fetch_add(dropped);
    stats_.currentSize.store(0);
    return dropped;
}

size_t QueryCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

size_t QueryCache::evict(size_t count) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t evicted = 0;
    while (evicted < count && evictLRU())
        ++evicted;
    return evicted;
}

size_t QueryCache::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return removeExpiredLocked();
}

QueryCache::OptimizeReport QueryCache::optimize() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    OptimizeReport report;
    report.expired = removeExpiredLocked();

    auto target = static_cast<size_t>(
        std::floor(static_cast<double>(config_.maxEntries) * config_.optimizeTargetRatio));
    while (cache_.size() > target && evictLRU())
        ++report.evicted;
    return report;
}

CacheStats QueryCache::getStats() const {
    return stats_;
}

void QueryCache::resetStats() {
    stats_.reset();
    stats_.maxSize = config_.maxEntries;
}

void QueryCache::moveToFront(Slot& slot) {
    lruList_.splice(lruList_.begin(), lruList_, slot.lruPosition);
    slot.lruPosition = lruList_.begin();
}

void QueryCache::erase(std::unordered_map<std::string, Slot>::iterator it) {
    lruList_.erase(it->second.lruPosition);
    cache_.erase(it);
    stats_.currentSize.store(cache_.size());
}

size_t QueryCache::removeExpiredLocked() {
    size_t count = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->second.entry->isExpired()) {
            lruList_.erase(it->second.lruPosition);
            it = cache_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    if (count > 0) {
        stats_.ttlExpirations.fetch_add(count);
        stats_.currentSize.store(cache_.size());
    }
    return count;
}

bool QueryCache::evictLRU() {
    if (lruList_.empty())
        return false;
    auto it = cache_.find(lruList_.back());
    if (it == cache_.end()) {
        lruList_.pop_back();
        return true;
    }
    erase(it);
    stats_.evictions.fetch_add(1);
    return true;
}

} // namespace deplink::query
