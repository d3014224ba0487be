#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <future>
#include <deplink/core/uuid.h>
#include <deplink/inference/optimized_inference_engine.h>

namespace deplink::inference {

namespace {

const char* directionName(graph::EdgeDirection direction) {
    return direction == graph::EdgeDirection::Out ? "out" : "in";
}

} // namespace

OptimizedInferenceEngine::OptimizedInferenceEngine(std::shared_ptr<graph::GraphStore> store,
                                                   InferenceEngineConfig config,
                                                   EdgeTypeRegistry registry)
    : InferenceEngine(std::move(store), config, std::move(registry)),
      cache_(config.cacheCapacity) {
    if (config_.enableParallel) {
        auto threads = std::max<std::size_t>(config_.maxConcurrency, 1);
        pool_ = std::make_unique<boost::asio::thread_pool>(threads);
        spdlog::debug("[OptimizedInferenceEngine] parallel expansion with {} workers", threads);
    }
}

OptimizedInferenceEngine::~OptimizedInferenceEngine() {
    detach();
    if (pool_) {
        pool_->join();
    }
}

template <typename Compute>
Result<InferenceResult> OptimizedInferenceEngine::memoized(const InferenceCacheKey& key,
                                                           Compute&& compute) {
    if (config_.enableCache) {
        if (auto hit = cache_.get(key)) {
            spdlog::trace("[OptimizedInferenceEngine] cache hit {}", key.str());
            return std::move(*hit);
        }
    }
    const auto generation = cache_.generation();
    auto result = compute();
    if (result && config_.enableCache)
        cache_.put(key, result.value(), generation);
    return result;
}

Result<InferenceResult> OptimizedInferenceEngine::queryHierarchical(
    const std::string& rootId, const std::string& edgeType, const HierarchicalOptions& options) {
    InferenceCacheKey key{InferenceKind::Hierarchical, rootId, edgeType,
                          core::fnv1a("children=" + std::to_string(options.includeChildren) +
                                      ";depth=" + std::to_string(options.maxDepth) +
                                      ";dir=" + directionName(options.direction))};
    return memoized(key, [&] { return InferenceEngine::queryHierarchical(rootId, edgeType, options); });
}

Result<InferenceResult> OptimizedInferenceEngine::queryTransitive(const std::string& rootId,
                                                                  const std::string& edgeType,
                                                                  const TransitiveOptions& options) {
    InferenceCacheKey key{InferenceKind::Transitive, rootId, edgeType,
                          core::fnv1a("length=" + std::to_string(options.maxPathLength) +
                                      ";intermediate=" +
                                      std::to_string(options.includeIntermediate))};
    return memoized(key, [&] { return InferenceEngine::queryTransitive(rootId, edgeType, options); });
}

Result<InferenceResult> OptimizedInferenceEngine::queryInheritable(
    const std::string& rootId, const std::string& edgeType, const InheritableOptions& options) {
    InferenceCacheKey key{InferenceKind::Inheritable, rootId, edgeType,
                          core::fnv1a("inherited=" + std::to_string(options.includeInherited) +
                                      ";depth=" + std::to_string(options.maxInheritanceDepth))};
    return memoized(key,
                    [&] { return InferenceEngine::queryInheritable(rootId, edgeType, options); });
}

Result<void> OptimizedInferenceEngine::expandLevel(const std::vector<FrontierEntry>& frontier,
                                                   int depth, const TraversalSpec& spec,
                                                   TraversalState& state) {
    if (!pool_ || frontier.size() < 2)
        return InferenceEngine::expandLevel(frontier, depth, spec, state);

    const std::size_t workers =
        std::min(std::max<std::size_t>(config_.maxConcurrency, 1), frontier.size());
    const std::size_t chunk = (frontier.size() + workers - 1) / workers;

    std::vector<std::future<Result<void>>> futures;
    futures.reserve(workers);
    for (std::size_t begin = 0; begin < frontier.size(); begin += chunk) {
        const std::size_t end = std::min(begin + chunk, frontier.size());
        futures.push_back(boost::asio::post(
            *pool_, boost::asio::use_future([this, &frontier, &spec, &state, depth, begin,
                                             end]() -> Result<void> {
                for (std::size_t i = begin; i < end; ++i) {
                    if (state.timedOut.load())
                        break;
                    if (auto r = expandEntry(frontier[i], depth, spec, state); !r)
                        return r;
                }
                return Result<void>{};
            })));
    }

    // Every worker must finish before the frontier and state go out of scope.
    Result<void> outcome;
    for (auto& future : futures) {
        try {
            auto r = future.get();
            if (!r && outcome)
                outcome = r;
        } catch (const std::exception& e) {
            if (outcome)
                outcome = Error{ErrorCode::InternalError,
                                std::string("Parallel expansion failed: ") + e.what()};
        }
    }
    return outcome;
}

void OptimizedInferenceEngine::onEdgeWritten(const graph::GraphEdge& edge) {
    auto dropped = cache_.invalidateAddress(edge.from) + cache_.invalidateAddress(edge.to);
    if (dropped > 0) {
        spdlog::debug("[OptimizedInferenceEngine] edge {} -> {} invalidated {} entries", edge.from,
                      edge.to, dropped);
    }
}

void OptimizedInferenceEngine::onNodeWritten(const std::string& address) {
    // A new node may resolve an edge that used to dangle.
    cache_.invalidateAddress(address, true);
}

void OptimizedInferenceEngine::onDataChange(const graph::DataChangeEvent& event) {
    if (!event.record.is_object())
        return;
    if (event.table == "edges") {
        graph::GraphEdge edge;
        edge.from = event.record.value("from", "");
        edge.to = event.record.value("to", "");
        onEdgeWritten(edge);
    } else if (event.table == "nodes") {
        onNodeWritten(event.record.value("address", ""));
    }
}

void OptimizedInferenceEngine::attachTo(graph::GraphWriter& writer) {
    detach();
    attached_ = &writer.changes();
    listenerId_ =
        attached_->subscribe([this](const graph::DataChangeEvent& event) { onDataChange(event); });
}

void OptimizedInferenceEngine::detach() {
    if (attached_) {
        attached_->unsubscribe(listenerId_);
        attached_ = nullptr;
    }
}

void OptimizedInferenceEngine::clearCache() {
    cache_.clear();
}

InferenceCacheStats OptimizedInferenceEngine::getCacheStats() const {
    return cache_.stats();
}

} // namespace deplink::inference
