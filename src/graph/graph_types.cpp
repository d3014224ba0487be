#include <algorithm>
#include <deplink/graph/graph_types.h>

namespace deplink::graph {

Result<GraphNode> GraphNode::fromAddress(std::string_view address, nlohmann::json metadata) {
    auto parsed = AddressCodec::parse(address);
    if (!parsed.isValid) {
        std::string msg = "Invalid address '" + std::string(address) + "'";
        if (!parsed.errors.empty())
            msg += ": " + parsed.errors.front();
        return Error{ErrorCode::AddressFormatError, msg};
    }
    GraphNode node;
    node.address = AddressCodec::create(parsed.projectName, parsed.filePath, *parsed.type(),
                                        parsed.symbolName);
    node.type = *parsed.type();
    node.metadata = metadata.is_object() ? std::move(metadata) : nlohmann::json::object();
    return node;
}

nlohmann::json GraphEdge::toJson() const {
    nlohmann::json j;
    j["from"] = from;
    j["to"] = to;
    j["edgeType"] = edgeType;
    j["metadata"] = metadata;
    if (provenance) {
        j["derivedBy"] = provenance->derivedBy;
        j["depth"] = provenance->depth;
    }
    return j;
}

bool NodeFilter::matches(const GraphNode& node) const {
    if (!nodeTypes.empty() &&
        std::find(nodeTypes.begin(), nodeTypes.end(), node.type) == nodeTypes.end()) {
        return false;
    }
    if (!projectName && !filePath)
        return true;
    auto parsed = AddressCodec::parse(node.address);
    if (!parsed.isValid)
        return false;
    if (projectName && parsed.projectName != *projectName)
        return false;
    if (filePath && parsed.filePath != AddressCodec::normalizePath(*filePath))
        return false;
    return true;
}

const char* changeTypeToString(ChangeType type) noexcept {
    switch (type) {
        case ChangeType::Insert:
            return "INSERT";
        case ChangeType::Update:
            return "UPDATE";
        case ChangeType::Delete:
            return "DELETE";
    }
    return "UPDATE";
}

nlohmann::json DataChangeEvent::toJson() const {
    return nlohmann::json{
        {"type", changeTypeToString(type)},
        {"table", table},
        {"record", record},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp.time_since_epoch())
                          .count()},
    };
}

} // namespace deplink::graph
