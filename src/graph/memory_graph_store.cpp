#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <deplink/graph/graph_store.h>

namespace deplink::graph {

Result<void> checkNodeForWrite(const GraphNode& node) {
    auto parsed = AddressCodec::parse(node.address);
    if (!parsed.isValid) {
        return Error{ErrorCode::AddressFormatError,
                     "Invalid node address '" + node.address + "'" +
                         (parsed.errors.empty() ? "" : ": " + parsed.errors.front())};
    }
    if (parsed.type() != node.type) {
        return Error{ErrorCode::InvalidArgument,
                     "Node type does not match address '" + node.address + "'"};
    }
    return {};
}

Result<void> checkEdgeForWrite(const GraphEdge& edge) {
    if (edge.from.empty() || edge.to.empty() || edge.edgeType.empty()) {
        return Error{ErrorCode::InvalidArgument, "Edge requires from, to and edgeType"};
    }
    if (edge.provenance) {
        if (edge.provenance->derivedBy.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "Inferred edge " + edge.from + " -> " + edge.to + " lacks derivedBy"};
        }
        if (edge.provenance->depth < 1) {
            return Error{ErrorCode::InvalidArgument, "Inferred edge depth must be >= 1"};
        }
    } else if (edge.metadata.is_object() && edge.metadata.contains("derivedBy")) {
        return Error{ErrorCode::InvalidArgument,
                     "Asserted edge " + edge.from + " -> " + edge.to + " carries provenance"};
    }
    return {};
}

namespace {

class MemoryGraphStore final : public GraphStore {
public:
    Result<std::optional<GraphNode>> getNode(std::string_view address) override {
        std::shared_lock lock(mutex_);
        auto it = nodes_.find(std::string(address));
        if (it == nodes_.end())
            return std::optional<GraphNode>{};
        return std::optional<GraphNode>{it->second};
    }

    Result<void> putNode(const GraphNode& node) override {
        if (auto check = checkNodeForWrite(node); !check)
            return check;
        std::unique_lock lock(mutex_);
        nodes_[node.address] = node;
        return {};
    }

    Result<std::vector<GraphEdge>> getEdges(std::string_view address,
                                            std::optional<std::string_view> edgeType,
                                            EdgeDirection direction) override {
        std::shared_lock lock(mutex_);
        const auto& index = direction == EdgeDirection::Out ? outIndex_ : inIndex_;
        std::vector<GraphEdge> out;
        auto it = index.find(std::string(address));
        if (it == index.end())
            return out;
        for (auto seq : it->second) {
            const auto& edge = edges_.at(seq);
            if (!edgeType || edge.edgeType == *edgeType)
                out.push_back(edge);
        }
        return out;
    }

    Result<void> putEdge(const GraphEdge& edge) override {
        if (auto check = checkEdgeForWrite(edge); !check)
            return check;
        std::unique_lock lock(mutex_);
        auto key = edge.key();
        if (auto it = edgeByKey_.find(key); it != edgeByKey_.end()) {
            edges_[it->second] = edge;
            return {};
        }
        auto seq = nextSeq_++;
        edges_.emplace(seq, edge);
        edgeByKey_.emplace(std::move(key), seq);
        outIndex_[edge.from].insert(seq);
        inIndex_[edge.to].insert(seq);
        return {};
    }

    Result<std::vector<GraphNode>> allNodes(const NodeFilter& filter) override {
        std::shared_lock lock(mutex_);
        std::vector<GraphNode> out;
        for (const auto& [address, node] : nodes_) {
            if (filter.matches(node))
                out.push_back(node);
        }
        std::sort(out.begin(), out.end(),
                  [](const GraphNode& a, const GraphNode& b) { return a.address < b.address; });
        return out;
    }

    Result<std::size_t> removeNodesForFile(std::string_view projectName,
                                           std::string_view filePath) override {
        NodeFilter filter;
        filter.projectName = std::string(projectName);
        filter.filePath = std::string(filePath);

        std::unique_lock lock(mutex_);
        std::vector<std::string> doomed;
        for (const auto& [address, node] : nodes_) {
            if (filter.matches(node))
                doomed.push_back(address);
        }
        for (const auto& address : doomed) {
            nodes_.erase(address);
            auto it = outIndex_.find(address);
            if (it == outIndex_.end())
                continue;
            auto seqs = it->second;
            for (auto seq : seqs)
                eraseEdge(seq);
        }
        spdlog::debug("[MemoryGraphStore] removed {} nodes for {}/{}", doomed.size(), projectName,
                      filePath);
        return doomed.size();
    }

    Result<std::vector<GraphEdge>> allEdges() override {
        std::shared_lock lock(mutex_);
        std::vector<GraphEdge> out;
        out.reserve(edges_.size());
        for (const auto& [seq, edge] : edges_)
            out.push_back(edge);
        return out;
    }

private:
    void eraseEdge(std::uint64_t seq) {
        auto it = edges_.find(seq);
        if (it == edges_.end())
            return;
        const auto& edge = it->second;
        edgeByKey_.erase(edge.key());
        if (auto o = outIndex_.find(edge.from); o != outIndex_.end()) {
            o->second.erase(seq);
            if (o->second.empty())
                outIndex_.erase(o);
        }
        if (auto i = inIndex_.find(edge.to); i != inIndex_.end()) {
            i->second.erase(seq);
            if (i->second.empty())
                inIndex_.erase(i);
        }
        edges_.erase(it);
    }

    std::shared_mutex mutex_;
    std::unordered_map<std::string, GraphNode> nodes_;
    // Sequence-ordered storage keeps getEdges in insertion order.
    std::map<std::uint64_t, GraphEdge> edges_;
    std::unordered_map<std::string, std::uint64_t> edgeByKey_;
    std::unordered_map<std::string, std::set<std::uint64_t>> outIndex_;
    std::unordered_map<std::string, std::set<std::uint64_t>> inIndex_;
    std::uint64_t nextSeq_ = 1;
};

} // namespace

std::shared_ptr<GraphStore> makeMemoryGraphStore() {
    return std::make_shared<MemoryGraphStore>();
}

} // namespace deplink::graph
