#include <deplink/inference/inference_types.h>

namespace deplink::inference {

const char* inferenceKindToString(InferenceKind kind) noexcept {
    switch (kind) {
        case InferenceKind::Hierarchical:
            return "hierarchical";
        case InferenceKind::Transitive:
            return "transitive";
        case InferenceKind::Inheritable:
            return "inheritable";
    }
    return "hierarchical";
}

const char* inferenceStateToString(InferenceState state) noexcept {
    switch (state) {
        case InferenceState::Pending:
            return "pending";
        case InferenceState::Traversing:
            return "traversing";
        case InferenceState::Completed:
            return "completed";
        case InferenceState::TimedOut:
            return "timed_out";
        case InferenceState::Failed:
            return "failed";
    }
    return "failed";
}

std::vector<std::string> InferenceResult::addresses() const {
    std::vector<std::string> out;
    out.reserve(nodes.size());
    for (const auto& node : nodes)
        out.push_back(node.address);
    return out;
}

nlohmann::json InferenceResult::toJson() const {
    nlohmann::json j;
    j["kind"] = inferenceKindToString(kind);
    j["state"] = inferenceStateToString(state);
    j["rootId"] = rootId;
    j["edgeType"] = edgeType;
    j["partial"] = partial;
    j["cyclesDetected"] = cyclesDetected;
    j["edgesTraversed"] = edgesTraversed;
    j["danglingEdges"] = danglingEdges;
    j["elapsedMs"] = elapsed.count();
    auto& jn = j["nodes"] = nlohmann::json::array();
    for (const auto& node : nodes) {
        jn.push_back({{"address", node.address}, {"depth", node.depth}, {"path", node.path}});
    }
    auto& je = j["edges"] = nlohmann::json::array();
    for (const auto& edge : edges)
        je.push_back(edge.toJson());
    return j;
}

} // namespace deplink::inference
