#pragma once

#include <deplink/core/types.h>
#include <deplink/graph/address.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deplink::graph {

/**
 * A node of the symbolic graph. Identity is the canonical address string; the
 * metadata blob (location, documentation, visibility, ...) belongs to whoever
 * extracted the node and is replaced wholesale on re-analysis.
 */
struct GraphNode {
    std::string address;
    NodeType type = NodeType::Unknown;
    nlohmann::json metadata = nlohmann::json::object();

    // Builds a node from an address string; fails with AddressFormatError.
    static Result<GraphNode> fromAddress(std::string_view address,
                                         nlohmann::json metadata = nlohmann::json::object());
};

/**
 * Provenance of an inferred edge. Asserted edges carry none.
 */
struct EdgeProvenance {
    std::string derivedBy; // rule id, "hierarchical", "transitive" or "inheritance"
    int depth = 1;
};

struct GraphEdge {
    std::string from;
    std::string to;
    std::string edgeType;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<EdgeProvenance> provenance;

    bool isInferred() const noexcept { return provenance.has_value(); }

    // (from, to, edgeType) identity used for deduplication.
    std::string key() const { return from + "\x1f" + edgeType + "\x1f" + to; }

    nlohmann::json toJson() const;
};

enum class EdgeDirection { Out, In };

struct NodeFilter {
    std::vector<NodeType> nodeTypes; // empty matches every type
    std::optional<std::string> projectName;
    std::optional<std::string> filePath;

    bool matches(const GraphNode& node) const;
};

enum class ChangeType { Insert, Update, Delete };

const char* changeTypeToString(ChangeType type) noexcept;

/**
 * A single mutation observed on the write path.
 */
struct DataChangeEvent {
    ChangeType type = ChangeType::Insert;
    std::string table; // "nodes" or "edges"
    nlohmann::json record = nlohmann::json::object();
    TimePoint timestamp = std::chrono::system_clock::now();

    nlohmann::json toJson() const;
};

} // namespace deplink::graph
