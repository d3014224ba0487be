#pragma once

#include <deplink/core/types.h>
#include <deplink/graph/graph_store.h>
#include <deplink/inference/edge_type_registry.h>
#include <deplink/inference/inference_types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace deplink::inference {

/**
 * Derives edges from the asserted graph: hierarchical closure, transitive
 * closure with shortest paths, and relations inherited through extends /
 * implements chains.
 *
 * Traversals are level-synchronous breadth-first searches. Every frontier is
 * processed in address order so results do not depend on store iteration
 * order. Cycles end a branch and are counted, never reported as failures.
 */
class InferenceEngine {
public:
    InferenceEngine(std::shared_ptr<graph::GraphStore> store, InferenceEngineConfig config = {},
                    EdgeTypeRegistry registry = EdgeTypeRegistry::withDefaults());
    virtual ~InferenceEngine() = default;

    InferenceEngine(const InferenceEngine&) = delete;
    InferenceEngine& operator=(const InferenceEngine&) = delete;

    virtual Result<InferenceResult> queryHierarchical(const std::string& rootId,
                                                      const std::string& edgeType,
                                                      const HierarchicalOptions& options = {});

    virtual Result<InferenceResult> queryTransitive(const std::string& rootId,
                                                    const std::string& edgeType,
                                                    const TransitiveOptions& options = {});

    virtual Result<InferenceResult> queryInheritable(const std::string& rootId,
                                                     const std::string& edgeType,
                                                     const InheritableOptions& options = {});

    /// Hierarchical inference for every requested type plus transitive inference
    /// for the types the registry marks transitive. A failing type is skipped.
    Result<InferAllResult> inferAll(const std::string& rootId,
                                    const std::vector<std::string>& edgeTypes = {});

    /// Checks the edge type hierarchy and searches transitive types for cycles.
    Result<ValidationResult> validate();

    const std::shared_ptr<graph::GraphStore>& store() const noexcept { return store_; }
    const EdgeTypeRegistry& registry() const noexcept { return registry_; }
    const InferenceEngineConfig& config() const noexcept { return config_; }

protected:
    struct FrontierEntry {
        std::string address;
        std::vector<std::string> path;
    };

    struct TraversalSpec {
        std::string rootId;
        std::vector<std::string> edgeTypes;
        graph::EdgeDirection direction = graph::EdgeDirection::Out;
        int maxDepth = 0;
        std::optional<SteadyTimePoint> deadline;
    };

    /**
     * Visited set shared by every worker of one traversal. claim() is the
     * atomic check-and-mark: the first claim of an address wins, except that
     * within one level the lexicographically smallest parent is kept so the
     * parallel expansion yields the same paths as the sequential one.
     */
    class TraversalState {
    public:
        TraversalState(const std::string& root);

        bool isVisited(const std::string& address) const;
        bool claim(const std::string& address, int depth, const std::vector<std::string>& parentPath);
        std::vector<FrontierEntry> takeLevel(int depth);
        std::vector<InferredNode> collected() const;

        std::atomic<std::size_t> cycles{0};
        std::atomic<std::size_t> edgesTraversed{0};
        std::atomic<std::size_t> dangling{0};
        std::atomic<bool> timedOut{false};

    private:
        struct Visit {
            int depth;
            std::vector<std::string> path;
        };
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Visit> visited_;
        std::vector<std::string> claimOrder_;
    };

    struct TraversalOutcome {
        std::vector<InferredNode> nodes; // depth, then address
        std::size_t cyclesDetected = 0;
        std::size_t edgesTraversed = 0;
        std::size_t danglingEdges = 0;
        bool timedOut = false;
    };

    Result<TraversalOutcome> traverse(const TraversalSpec& spec);

    /// Expands one BFS level. The default implementation walks the frontier on
    /// the calling thread.
    virtual Result<void> expandLevel(const std::vector<FrontierEntry>& frontier, int depth,
                                     const TraversalSpec& spec, TraversalState& state);

    /// Expands a single frontier entry; safe to call from several threads.
    Result<void> expandEntry(const FrontierEntry& entry, int depth, const TraversalSpec& spec,
                             TraversalState& state);

    Result<void> requireNode(const std::string& address);

    static bool expired(const std::optional<SteadyTimePoint>& deadline);

    std::shared_ptr<graph::GraphStore> store_;
    InferenceEngineConfig config_;
    EdgeTypeRegistry registry_;
};

} // namespace deplink::inference
