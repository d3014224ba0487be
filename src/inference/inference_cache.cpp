#include <limits>
#include <memory>
#include <mutex>
#include <deplink/inference/inference_cache.h>

namespace deplink::inference {

std::string InferenceCacheKey::str() const {
    return std::string(inferenceKindToString(kind)) + "|" + rootId + "|" + edgeType + "|" +
           std::to_string(paramsHash);
}

InferenceCache::InferenceCache(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

std::optional<InferenceResult> InferenceCache::get(const InferenceCacheKey& key) {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key.str());
    if (it == entries_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    it->second->lastAccess.store(tick_.fetch_add(1, std::memory_order_relaxed) + 1,
                                 std::memory_order_relaxed);
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second->result;
}

void InferenceCache::put(const InferenceCacheKey& key, const InferenceResult& result,
                         std::optional<std::uint64_t> generation) {
    if (result.partial || !result.completed())
        return;

    auto entry = std::make_unique<Entry>();
    entry->result = result;
    entry->dependsOn.insert(result.rootId);
    for (const auto& node : result.nodes) {
        entry->dependsOn.insert(node.address);
        entry->dependsOn.insert(node.path.begin(), node.path.end());
    }
    entry->dependsOn.insert(result.visited.begin(), result.visited.end());
    for (const auto& edge : result.edges) {
        entry->dependsOn.insert(edge.from);
        entry->dependsOn.insert(edge.to);
    }
    entry->lastAccess.store(tick_.fetch_add(1, std::memory_order_relaxed) + 1);

    const auto id = key.str();
    std::unique_lock lock(mutex_);
    if (generation && *generation != generation_.load())
        return;
    if (entries_.contains(id))
        eraseEntry(id);
    while (entries_.size() >= capacity_)
        evictOldest();
    for (const auto& address : entry->dependsOn)
        byAddress_[address].insert(id);
    entries_.emplace(id, std::move(entry));
    insertions_.fetch_add(1, std::memory_order_relaxed);
}

std::size_t InferenceCache::invalidateAddress(const std::string& address, bool dropDangling) {
    std::unique_lock lock(mutex_);
    std::unordered_set<std::string> doomed;
    if (auto it = byAddress_.find(address); it != byAddress_.end())
        doomed = it->second;
    if (dropDangling) {
        for (const auto& [id, entry] : entries_) {
            if (entry->result.danglingEdges > 0)
                doomed.insert(id);
        }
    }
    generation_.fetch_add(1);
    for (const auto& id : doomed)
        eraseEntry(id);
    invalidations_.fetch_add(doomed.size(), std::memory_order_relaxed);
    return doomed.size();
}

void InferenceCache::clear() {
    std::unique_lock lock(mutex_);
    generation_.fetch_add(1);
    entries_.clear();
    byAddress_.clear();
}

std::uint64_t InferenceCache::generation() const {
    return generation_.load();
}

std::size_t InferenceCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

InferenceCacheStats InferenceCache::stats() const {
    InferenceCacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.insertions = insertions_.load();
    s.evictions = evictions_.load();
    s.invalidations = invalidations_.load();
    s.size = size();
    s.capacity = capacity_;
    return s;
}

void InferenceCache::evictOldest() {
    auto oldest = entries_.end();
    auto oldestTick = std::numeric_limits<std::uint64_t>::max();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        auto t = it->second->lastAccess.load(std::memory_order_relaxed);
        if (t < oldestTick) {
            oldestTick = t;
            oldest = it;
        }
    }
    if (oldest == entries_.end())
        return;
    eraseEntry(oldest->first);
    evictions_.fetch_add(1, std::memory_order_relaxed);
}

void InferenceCache::eraseEntry(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end())
        return;
    for (const auto& address : it->second->dependsOn) {
        auto idx = byAddress_.find(address);
        if (idx == byAddress_.end())
            continue;
        idx->second.erase(key);
        if (idx->second.empty())
            byAddress_.erase(idx);
    }
    entries_.erase(it);
}

} // namespace deplink::inference
