#include <spdlog/spdlog.h>

#include <unordered_set>
#include <deplink/graph/graph_writer.h>

namespace deplink::graph {

namespace {

nlohmann::json nodeRecord(const GraphNode& node) {
    return nlohmann::json{{"address", node.address},
                          {"nodeType", nodeTypeToString(node.type)},
                          {"metadata", node.metadata}};
}

} // namespace

GraphWriter::GraphWriter(std::shared_ptr<GraphStore> store) : store_(std::move(store)) {}

Result<void> GraphWriter::writeNode(const GraphNode& node) {
    auto existing = store_->getNode(node.address);
    if (!existing)
        return existing.error();
    if (auto put = store_->putNode(node); !put)
        return put;

    DataChangeEvent event;
    event.type = existing.value() ? ChangeType::Update : ChangeType::Insert;
    event.table = "nodes";
    event.record = nodeRecord(node);
    changes_.emit(event);
    return {};
}

Result<void> GraphWriter::writeEdge(const GraphEdge& edge) {
    if (auto put = store_->putEdge(edge); !put)
        return put;

    DataChangeEvent event;
    event.type = ChangeType::Insert;
    event.table = "edges";
    event.record = edge.toJson();
    changes_.emit(event);
    return {};
}

Result<BatchSummary> GraphWriter::applyBatch(const FileBatch& batch) {
    const std::string filePath = AddressCodec::normalizePath(batch.filePath);

    // Reject the whole batch before touching the store.
    std::unordered_set<std::string> batchNodes;
    for (const auto& node : batch.nodes) {
        auto parsed = AddressCodec::parse(node.address);
        if (!parsed.isValid) {
            return Error{ErrorCode::AddressFormatError, "Invalid node address '" + node.address + "'"};
        }
        if (parsed.projectName != batch.projectName || parsed.filePath != filePath) {
            return Error{ErrorCode::InvalidArgument,
                         "Node " + node.address + " does not belong to " + batch.projectName +
                             "/" + filePath};
        }
        batchNodes.insert(node.address);
    }
    for (const auto& edge : batch.edges) {
        if (!batchNodes.contains(edge.from)) {
            return Error{ErrorCode::InvalidArgument,
                         "Edge source " + edge.from + " is not part of the batch"};
        }
        if (auto check = checkEdgeForWrite(edge); !check)
            return check.error();
    }

    NodeFilter fileFilter;
    fileFilter.projectName = batch.projectName;
    fileFilter.filePath = filePath;
    auto previous = store_->allNodes(fileFilter);
    if (!previous)
        return previous.error();

    auto removed = store_->removeNodesForFile(batch.projectName, filePath);
    if (!removed)
        return removed.error();

    BatchSummary summary;
    summary.nodesRemoved = removed.value();
    for (const auto& node : previous.value()) {
        if (batchNodes.contains(node.address))
            continue;
        DataChangeEvent event;
        event.type = ChangeType::Delete;
        event.table = "nodes";
        event.record = nodeRecord(node);
        changes_.emit(event);
    }

    for (const auto& node : batch.nodes) {
        if (auto w = writeNode(node); !w)
            return w.error();
        ++summary.nodesWritten;
    }
    for (const auto& edge : batch.edges) {
        if (auto w = writeEdge(edge); !w)
            return w.error();
        ++summary.edgesWritten;
    }

    spdlog::debug("[GraphWriter] {}/{}: removed {} nodes, wrote {} nodes and {} edges",
                  batch.projectName, filePath, summary.nodesRemoved, summary.nodesWritten,
                  summary.edgesWritten);
    return summary;
}

Result<ValidationReport> GraphWriter::validate() {
    auto nodes = store_->allNodes();
    if (!nodes)
        return nodes.error();
    auto edges = store_->allEdges();
    if (!edges)
        return edges.error();

    std::unordered_set<std::string> known;
    for (const auto& node : nodes.value())
        known.insert(node.address);

    ValidationReport report;
    report.nodeCount = nodes.value().size();
    report.edgeCount = edges.value().size();
    for (const auto& edge : edges.value()) {
        if (!known.contains(edge.from) || !known.contains(edge.to))
            report.danglingEdges.push_back(edge);
        if (auto check = checkEdgeForWrite(edge); !check)
            report.provenanceViolations.push_back(check.error().message);
    }
    if (!report.danglingEdges.empty()) {
        spdlog::info("[GraphWriter] validation found {} dangling edges", report.danglingEdges.size());
    }
    return report;
}

} // namespace deplink::graph
