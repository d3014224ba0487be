#pragma once

#include <deplink/core/types.h>
#include <deplink/graph/graph_types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deplink::query {

enum class QueryDialect { SQL, GraphQL, NaturalLanguage };

const char* dialectToString(QueryDialect dialect) noexcept;

// Accepts "SQL", "GraphQL" and "NaturalLanguage" in any case.
Result<QueryDialect> dialectFromString(std::string_view name);

// SELECT/MATCH leading keyword -> SQL, leading '{' or "query" -> GraphQL,
// anything else -> NaturalLanguage.
QueryDialect detectDialect(std::string_view text);

enum class ConditionOp {
    Equal,
    NotEqual,
    Greater,
    Less,
    GreaterEqual,
    LessEqual,
    Like,
    In,
    NotIn,
    Exists,
    NotExists
};

const char* conditionOpToString(ConditionOp op) noexcept;

/**
 * A single predicate over a result row. The field resolves against the
 * reserved row fields first, then against top-level metadata keys (with or
 * without a "metadata." prefix).
 */
struct Condition {
    std::string field;
    ConditionOp op = ConditionOp::Equal;
    nlohmann::json value; // array for In / NotIn, null for Exists / NotExists

    bool matches(const nlohmann::json& row) const;
};

// OR of AND groups. AND binds tighter than OR, so a flat WHERE clause
// always fits this shape.
using ConditionGroup = std::vector<Condition>;

enum class TraversalMode { Direct, Transitive, Inherited };

const char* traversalModeToString(TraversalMode mode) noexcept;

struct Traversal {
    std::string from;
    std::string edgeType;
    graph::EdgeDirection direction = graph::EdgeDirection::Out;
    std::optional<int> depth; // per-mode default when unset
    TraversalMode mode = TraversalMode::Direct;
};

struct Projection {
    std::string field;
    std::string alias; // empty means the field name

    const std::string& outputName() const noexcept { return alias.empty() ? field : alias; }
};

struct OrderBy {
    std::string field;
    bool descending = false;
};

/**
 * Dialect-independent form of a query. Every surface syntax compiles into
 * this plan; the engine only ever executes plans.
 */
struct QueryPlan {
    QueryDialect dialect = QueryDialect::SQL;
    std::vector<std::string> nodeTypes; // canonical spellings; empty matches all
    std::vector<ConditionGroup> conditions;
    std::optional<Traversal> traversal;
    std::vector<Projection> projections; // empty selects every field
    std::optional<OrderBy> orderBy;
    std::optional<std::size_t> limit;
    std::size_t offset = 0;

    bool matches(const nlohmann::json& row) const;

    nlohmann::json toJson() const;

    // Canonical dump without the dialect, so equivalent queries written in
    // different dialects share a cache entry.
    std::string cacheKey() const;
};

// Resolves a field against a result row; null when absent.
nlohmann::json resolveField(const nlohmann::json& row, std::string_view field);

// Total order used by ORDER BY: null < bool < number < string < other.
int compareValues(const nlohmann::json& a, const nlohmann::json& b);

// SQL LIKE with % and _ wildcards, ASCII case-insensitive.
bool likeMatch(std::string_view text, std::string_view pattern);

} // namespace deplink::query
