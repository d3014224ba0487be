#pragma once

#include <deplink/core/types.h>
#include <deplink/graph/graph_types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deplink::graph {

/**
 * Node/edge store consumed by the inference, query and realtime layers.
 *
 * Implementations guarantee read-after-write visibility within one process and
 * must be safe for concurrent readers. getEdges returns edges in insertion order.
 */
class GraphStore {
public:
    GraphStore() : instanceId_(nextInstanceId()) {}
    virtual ~GraphStore() = default;

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    /// Process-unique; never reused after the store is destroyed.
    std::uint64_t instanceId() const noexcept { return instanceId_; }

    virtual Result<std::optional<GraphNode>> getNode(std::string_view address) = 0;

    // Inserts or replaces the node (no partial mutation).
    virtual Result<void> putNode(const GraphNode& node) = 0;

    virtual Result<std::vector<GraphEdge>> getEdges(std::string_view address,
                                                    std::optional<std::string_view> edgeType,
                                                    EdgeDirection direction) = 0;

    // Inserts the edge; an edge with the same (from, to, edgeType) is replaced.
    virtual Result<void> putEdge(const GraphEdge& edge) = 0;

    virtual Result<std::vector<GraphNode>> allNodes(const NodeFilter& filter = {}) = 0;

    // Drops every node of the file together with its outgoing edges. Returns the
    // number of nodes removed.
    virtual Result<std::size_t> removeNodesForFile(std::string_view projectName,
                                                   std::string_view filePath) = 0;

    virtual Result<std::vector<GraphEdge>> allEdges() = 0;

private:
    static std::uint64_t nextInstanceId() {
        static std::atomic<std::uint64_t> counter{0};
        return counter.fetch_add(1) + 1;
    }

    const std::uint64_t instanceId_;
};

std::shared_ptr<GraphStore> makeMemoryGraphStore();

// Opens (or creates) a SQLite-backed store; ":memory:" gives a private database.
Result<std::shared_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath);

// Shared checks applied by every implementation before a write.
Result<void> checkNodeForWrite(const GraphNode& node);
Result<void> checkEdgeForWrite(const GraphEdge& edge);

} // namespace deplink::graph
