#pragma once

#include <deplink/graph/address.h>
#include <deplink/graph/graph_store.h>
#include <deplink/graph/graph_writer.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace deplink::test {

// "proj/<file>#<Type>:<name>"
inline std::string addr(const std::string& file, graph::NodeType type, const std::string& name,
                        const std::string& project = "proj") {
    return graph::AddressCodec::create(project, file, type, name);
}

inline std::string fn(const std::string& name, const std::string& file = "src/app.ts") {
    return addr(file, graph::NodeType::Function, name);
}

inline std::string cls(const std::string& name, const std::string& file = "src/model.ts") {
    return addr(file, graph::NodeType::Class, name);
}

inline graph::GraphEdge edge(const std::string& from, const std::string& to,
                             const std::string& edgeType) {
    graph::GraphEdge e;
    e.from = from;
    e.to = to;
    e.edgeType = edgeType;
    return e;
}

/**
 * Small graph builder over an in-memory store. Every write goes through a
 * GraphWriter so change listeners see the same events production code does.
 */
class GraphBuilder {
public:
    GraphBuilder()
        : store_(graph::makeMemoryGraphStore()),
          writer_(std::make_shared<graph::GraphWriter>(store_)) {}

    explicit GraphBuilder(std::shared_ptr<graph::GraphStore> store)
        : store_(std::move(store)), writer_(std::make_shared<graph::GraphWriter>(store_)) {}

    GraphBuilder& node(const std::string& address,
                       nlohmann::json metadata = nlohmann::json::object()) {
        auto n = graph::GraphNode::fromAddress(address, std::move(metadata));
        if (!n)
            throw std::invalid_argument("bad fixture address: " + address);
        auto w = writer_->writeNode(n.value());
        if (!w)
            throw std::runtime_error("fixture node write failed: " + w.error().message);
        return *this;
    }

    GraphBuilder& link(const std::string& from, const std::string& to,
                       const std::string& edgeType) {
        auto w = writer_->writeEdge(edge(from, to, edgeType));
        if (!w)
            throw std::runtime_error("fixture edge write failed: " + w.error().message);
        return *this;
    }

    // Writes the nodes and a "calls" chain between them.
    GraphBuilder& chain(const std::vector<std::string>& addresses,
                        const std::string& edgeType = "calls") {
        for (const auto& a : addresses)
            node(a);
        for (std::size_t i = 1; i < addresses.size(); ++i)
            link(addresses[i - 1], addresses[i], edgeType);
        return *this;
    }

    const std::shared_ptr<graph::GraphStore>& store() const { return store_; }
    graph::GraphWriter& writer() { return *writer_; }

private:
    std::shared_ptr<graph::GraphStore> store_;
    std::shared_ptr<graph::GraphWriter> writer_;
};

} // namespace deplink::test
