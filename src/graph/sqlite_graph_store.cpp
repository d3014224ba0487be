#include <spdlog/spdlog.h>

#include <mutex>
#include <deplink/graph/database.h>
#include <deplink/graph/graph_store.h>

namespace deplink::graph {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS graph_nodes (
    address    TEXT PRIMARY KEY,
    node_type  TEXT NOT NULL,
    project    TEXT NOT NULL,
    file_path  TEXT NOT NULL,
    metadata   TEXT NOT NULL DEFAULT '{}'
);
CREATE INDEX IF NOT EXISTS idx_graph_nodes_file ON graph_nodes(project, file_path);
CREATE INDEX IF NOT EXISTS idx_graph_nodes_type ON graph_nodes(node_type);
CREATE TABLE IF NOT EXISTS graph_edges (
    seq          INTEGER PRIMARY KEY AUTOINCREMENT,
    from_address TEXT NOT NULL,
    to_address   TEXT NOT NULL,
    edge_type    TEXT NOT NULL,
    metadata     TEXT NOT NULL DEFAULT '{}',
    derived_by   TEXT,
    depth        INTEGER,
    UNIQUE(from_address, to_address, edge_type)
);
CREATE INDEX IF NOT EXISTS idx_graph_edges_from ON graph_edges(from_address, edge_type);
CREATE INDEX IF NOT EXISTS idx_graph_edges_to ON graph_edges(to_address, edge_type);
)sql";

nlohmann::json parseMetadata(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return nlohmann::json::object();
    return j;
}

class SqliteGraphStore final : public GraphStore {
public:
    explicit SqliteGraphStore(Database db) : db_(std::move(db)) {}

    Result<void> initialize() {
        std::lock_guard lock(mutex_);
        return db_.execute(kSchema);
    }

    Result<std::optional<GraphNode>> getNode(std::string_view address) override {
        std::lock_guard lock(mutex_);
        auto stmtResult =
            db_.prepare("SELECT address, node_type, metadata FROM graph_nodes WHERE address = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, address); !r)
            return r.error();
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            return std::optional<GraphNode>{};
        return std::optional<GraphNode>{readNode(stmt)};
    }

    Result<void> putNode(const GraphNode& node) override {
        if (auto check = checkNodeForWrite(node); !check)
            return check;
        auto parsed = AddressCodec::parse(node.address);

        std::lock_guard lock(mutex_);
        auto stmtResult = db_.prepare(
            "INSERT OR REPLACE INTO graph_nodes (address, node_type, project, file_path, metadata) "
            "VALUES (?, ?, ?, ?, ?)");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bindAll(node.address, nodeTypeToString(node.type), parsed.projectName,
                                  parsed.filePath, node.metadata.dump());
        if (!bound)
            return bound;
        return stmt.execute();
    }

    Result<std::vector<GraphEdge>> getEdges(std::string_view address,
                                            std::optional<std::string_view> edgeType,
                                            EdgeDirection direction) override {
        std::string sql = "SELECT from_address, to_address, edge_type, metadata, derived_by, depth "
                          "FROM graph_edges WHERE ";
        sql += direction == EdgeDirection::Out ? "from_address = ?" : "to_address = ?";
        if (edgeType)
            sql += " AND edge_type = ?";
        sql += " ORDER BY seq";

        std::lock_guard lock(mutex_);
        auto stmtResult = db_.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, address); !r)
            return r.error();
        if (edgeType) {
            if (auto r = stmt.bind(2, *edgeType); !r)
                return r.error();
        }
        return readEdges(stmt);
    }

    Result<void> putEdge(const GraphEdge& edge) override {
        if (auto check = checkEdgeForWrite(edge); !check)
            return check;

        std::lock_guard lock(mutex_);
        auto stmtResult = db_.prepare(
            "INSERT INTO graph_edges (from_address, to_address, edge_type, metadata, derived_by, "
            "depth) VALUES (?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(from_address, to_address, edge_type) DO UPDATE SET "
            "metadata = excluded.metadata, derived_by = excluded.derived_by, "
            "depth = excluded.depth");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bindAll(edge.from, edge.to, edge.edgeType, edge.metadata.dump());
        if (!bound)
            return bound;
        if (edge.provenance) {
            bound = stmt.bind(5, edge.provenance->derivedBy);
            if (bound)
                bound = stmt.bind(6, edge.provenance->depth);
        } else {
            bound = stmt.bind(5, nullptr);
            if (bound)
                bound = stmt.bind(6, nullptr);
        }
        if (!bound)
            return bound;
        return stmt.execute();
    }

    Result<std::vector<GraphNode>> allNodes(const NodeFilter& filter) override {
        std::vector<GraphNode> out;
        {
            std::lock_guard lock(mutex_);
            auto stmtResult = db_.prepare(
                "SELECT address, node_type, metadata FROM graph_nodes ORDER BY address");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto node = readNode(stmt);
                if (filter.matches(node))
                    out.push_back(std::move(node));
            }
        }
        return out;
    }

    Result<std::size_t> removeNodesForFile(std::string_view projectName,
                                           std::string_view filePath) override {
        const std::string normalized = AddressCodec::normalizePath(filePath);
        std::lock_guard lock(mutex_);
        std::size_t removed = 0;
        auto txn = db_.transaction([&]() -> Result<void> {
            auto edgesStmt = db_.prepare(
                "DELETE FROM graph_edges WHERE from_address IN "
                "(SELECT address FROM graph_nodes WHERE project = ? AND file_path = ?)");
            if (!edgesStmt)
                return edgesStmt.error();
            Statement edges = std::move(edgesStmt).value();
            if (auto r = edges.bindAll(projectName, std::string_view(normalized)); !r)
                return r;
            if (auto r = edges.execute(); !r)
                return r;

            auto nodesStmt =
                db_.prepare("DELETE FROM graph_nodes WHERE project = ? AND file_path = ?");
            if (!nodesStmt)
                return nodesStmt.error();
            Statement nodes = std::move(nodesStmt).value();
            if (auto r = nodes.bindAll(projectName, std::string_view(normalized)); !r)
                return r;
            if (auto r = nodes.execute(); !r)
                return r;
            removed = static_cast<std::size_t>(db_.changes());
            return {};
        });
        if (!txn) {
            spdlog::error("[SqliteGraphStore] removeNodesForFile {}/{} failed: {}", projectName,
                          normalized, txn.error().message);
            return txn.error();
        }
        return removed;
    }

    Result<std::vector<GraphEdge>> allEdges() override {
        std::lock_guard lock(mutex_);
        auto stmtResult =
            db_.prepare("SELECT from_address, to_address, edge_type, metadata, derived_by, depth "
                        "FROM graph_edges ORDER BY seq");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        return readEdges(stmt);
    }

private:
    static GraphNode readNode(const Statement& stmt) {
        GraphNode node;
        node.address = stmt.getString(0);
        node.type = nodeTypeFromString(stmt.getString(1)).value_or(NodeType::Unknown);
        node.metadata = parseMetadata(stmt.getString(2));
        return node;
    }

    static Result<std::vector<GraphEdge>> readEdges(Statement& stmt) {
        std::vector<GraphEdge> out;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            GraphEdge edge;
            edge.from = stmt.getString(0);
            edge.to = stmt.getString(1);
            edge.edgeType = stmt.getString(2);
            edge.metadata = parseMetadata(stmt.getString(3));
            if (!stmt.isNull(4)) {
                edge.provenance = EdgeProvenance{stmt.getString(4), stmt.getInt(5)};
            }
            out.push_back(std::move(edge));
        }
        return out;
    }

    // One connection shared by every caller; statements never outlive the lock.
    std::mutex mutex_;
    Database db_;
};

} // namespace

Result<std::shared_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath) {
    Database db;
    auto mode = dbPath == ":memory:" ? ConnectionMode::Memory : ConnectionMode::Create;
    if (auto opened = db.open(dbPath, mode); !opened) {
        return opened.error();
    }
    if (mode != ConnectionMode::Memory) {
        if (auto wal = db.enableWAL(); !wal) {
            spdlog::warn("[SqliteGraphStore] WAL unavailable for {}: {}", dbPath,
                         wal.error().message);
        }
    }
    auto store = std::make_shared<SqliteGraphStore>(std::move(db));
    if (auto init = store->initialize(); !init) {
        return init.error();
    }
    spdlog::debug("[SqliteGraphStore] opened {}", dbPath);
    return std::shared_ptr<GraphStore>(std::move(store));
}

} // namespace deplink::graph
