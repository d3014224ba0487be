#pragma once

#include <deplink/core/event_channel.h>
#include <deplink/graph/graph_writer.h>
#include <deplink/inference/inference_cache.h>
#include <deplink/inference/inference_engine.h>

#include <boost/asio/thread_pool.hpp>

#include <memory>

namespace deplink::inference {

/**
 * InferenceEngine with memoized results and an optional parallel level
 * expansion. Results are identical to the base engine in both modes.
 */
class OptimizedInferenceEngine : public InferenceEngine {
public:
    OptimizedInferenceEngine(std::shared_ptr<graph::GraphStore> store,
                             InferenceEngineConfig config = {},
                             EdgeTypeRegistry registry = EdgeTypeRegistry::withDefaults());
    ~OptimizedInferenceEngine() override;

    Result<InferenceResult> queryHierarchical(const std::string& rootId,
                                              const std::string& edgeType,
                                              const HierarchicalOptions& options = {}) override;

    Result<InferenceResult> queryTransitive(const std::string& rootId, const std::string& edgeType,
                                            const TransitiveOptions& options = {}) override;

    Result<InferenceResult> queryInheritable(const std::string& rootId,
                                             const std::string& edgeType,
                                             const InheritableOptions& options = {}) override;

    // Invalidation hooks for the write path.
    void onEdgeWritten(const graph::GraphEdge& edge);
    void onNodeWritten(const std::string& address);
    void onDataChange(const graph::DataChangeEvent& event);

    /// Subscribes cache invalidation to the writer. The writer must outlive
    /// this engine or detach() must be called first.
    void attachTo(graph::GraphWriter& writer);
    void detach();

    void clearCache();
    InferenceCacheStats getCacheStats() const;

protected:
    Result<void> expandLevel(const std::vector<FrontierEntry>& frontier, int depth,
                             const TraversalSpec& spec, TraversalState& state) override;

private:
    template <typename Compute>
    Result<InferenceResult> memoized(const InferenceCacheKey& key, Compute&& compute);

    InferenceCache cache_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    core::EventChannel<graph::DataChangeEvent>* attached_ = nullptr;
    core::EventChannel<graph::DataChangeEvent>::ListenerId listenerId_ = 0;
};

} // namespace deplink::inference
