#pragma once

#include <deplink/core/event_channel.h>
#include <deplink/core/types.h>
#include <deplink/graph/graph_store.h>

#include <memory>
#include <string>
#include <vector>

namespace deplink::graph {

/**
 * Nodes and edges produced by analysing one file. Applying a batch replaces
 * whatever the previous run recorded for that file.
 */
struct FileBatch {
    std::string projectName;
    std::string filePath;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
};

struct BatchSummary {
    std::size_t nodesRemoved = 0;
    std::size_t nodesWritten = 0;
    std::size_t edgesWritten = 0;
};

struct ValidationReport {
    std::size_t nodeCount = 0;
    std::size_t edgeCount = 0;
    std::vector<GraphEdge> danglingEdges;
    std::vector<std::string> provenanceViolations;

    bool ok() const noexcept { return danglingEdges.empty() && provenanceViolations.empty(); }
};

/**
 * The single write path into a GraphStore.
 *
 * Every successful write is announced on changes() so caches and realtime
 * queries can react; listeners run synchronously on the writing thread.
 */
class GraphWriter {
public:
    explicit GraphWriter(std::shared_ptr<GraphStore> store);

    Result<void> writeNode(const GraphNode& node);
    Result<void> writeEdge(const GraphEdge& edge);

    Result<BatchSummary> applyBatch(const FileBatch& batch);

    // Read-only scan for edges whose endpoints are missing and for provenance
    // that contradicts the edge's asserted/inferred shape.
    Result<ValidationReport> validate();

    core::EventChannel<DataChangeEvent>& changes() noexcept { return changes_; }

    const std::shared_ptr<GraphStore>& store() const noexcept { return store_; }

private:
    std::shared_ptr<GraphStore> store_;
    core::EventChannel<DataChangeEvent> changes_{"graph-writer"};
};

} // namespace deplink::graph
