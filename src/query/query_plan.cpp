#include <algorithm>
#include <cctype>
#include <deplink/query/query_plan.h>

namespace deplink::query {

namespace {

std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

int typeRank(const nlohmann::json& v) {
    if (v.is_null())
        return 0;
    if (v.is_boolean())
        return 1;
    if (v.is_number())
        return 2;
    if (v.is_string())
        return 3;
    return 4;
}

// Equality that treats "2" and 2 as the same value; filters written in a
// query string often compare metadata stored with the other type.
bool looselyEqual(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number())
        return a.get<double>() == b.get<double>();
    if (a.is_string() && b.is_number())
        return a.get<std::string>() == b.dump();
    if (a.is_number() && b.is_string())
        return a.dump() == b.get<std::string>();
    return a == b;
}

bool likeMatchAt(std::string_view text, std::size_t ti, std::string_view pattern,
                 std::size_t pi) {
    while (pi < pattern.size()) {
        char p = pattern[pi];
        if (p == '%') {
            while (pi < pattern.size() && pattern[pi] == '%')
                ++pi;
            if (pi == pattern.size())
                return true;
            for (std::size_t k = ti; k <= text.size(); ++k) {
                if (likeMatchAt(text, k, pattern, pi))
                    return true;
            }
            return false;
        }
        if (ti >= text.size())
            return false;
        if (p != '_' && std::tolower(static_cast<unsigned char>(p)) !=
                            std::tolower(static_cast<unsigned char>(text[ti])))
            return false;
        ++ti;
        ++pi;
    }
    return ti == text.size();
}

} // namespace

const char* dialectToString(QueryDialect dialect) noexcept {
    switch (dialect) {
        case QueryDialect::SQL:
            return "SQL";
        case QueryDialect::GraphQL:
            return "GraphQL";
        case QueryDialect::NaturalLanguage:
            return "NaturalLanguage";
    }
    return "SQL";
}

Result<QueryDialect> dialectFromString(std::string_view name) {
    auto upper = toUpper(name);
    if (upper == "SQL")
        return QueryDialect::SQL;
    if (upper == "GRAPHQL")
        return QueryDialect::GraphQL;
    if (upper == "NATURALLANGUAGE")
        return QueryDialect::NaturalLanguage;
    return Error{ErrorCode::UnsupportedDialect,
                 "Unsupported query dialect: '" + std::string(name) + "'"};
}

QueryDialect detectDialect(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
        ++i;
    if (i < text.size() && text[i] == '{')
        return QueryDialect::GraphQL;

    std::size_t j = i;
    while (j < text.size() && std::isalpha(static_cast<unsigned char>(text[j])))
        ++j;
    auto word = toUpper(text.substr(i, j - i));
    if (word == "SELECT" || word == "MATCH")
        return QueryDialect::SQL;
    if (word == "QUERY") {
        // "query Name { ... }" is GraphQL; "query for ..." stays natural language.
        auto brace = text.find('{', j);
        if (brace != std::string_view::npos) {
            bool nameOnly = true;
            for (std::size_t k = j; k < brace; ++k) {
                char c = text[k];
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' &&
                    !std::isspace(static_cast<unsigned char>(c))) {
                    nameOnly = false;
                    break;
                }
            }
            if (nameOnly)
                return QueryDialect::GraphQL;
        }
    }
    return QueryDialect::NaturalLanguage;
}

const char* conditionOpToString(ConditionOp op) noexcept {
    switch (op) {
        case ConditionOp::Equal:
            return "=";
        case ConditionOp::NotEqual:
            return "!=";
        case ConditionOp::Greater:
            return ">";
        case ConditionOp::Less:
            return "<";
        case ConditionOp::GreaterEqual:
            return ">=";
        case ConditionOp::LessEqual:
            return "<=";
        case ConditionOp::Like:
            return "LIKE";
        case ConditionOp::In:
            return "IN";
        case ConditionOp::NotIn:
            return "NOT IN";
        case ConditionOp::Exists:
            return "EXISTS";
        case ConditionOp::NotExists:
            return "NOT EXISTS";
    }
    return "=";
}

const char* traversalModeToString(TraversalMode mode) noexcept {
    switch (mode) {
        case TraversalMode::Direct:
            return "direct";
        case TraversalMode::Transitive:
            return "transitive";
        case TraversalMode::Inherited:
            return "inherited";
    }
    return "direct";
}

nlohmann::json resolveField(const nlohmann::json& row, std::string_view field) {
    if (!row.is_object())
        return nullptr;
    std::string key(field);
    if (auto it = row.find(key); it != row.end())
        return *it;

    auto meta = row.find("metadata");
    if (meta == row.end() || !meta->is_object())
        return nullptr;
    constexpr std::string_view prefix = "metadata.";
    if (key.rfind(prefix, 0) == 0)
        key = key.substr(prefix.size());
    if (auto it = meta->find(key); it != meta->end())
        return *it;
    return nullptr;
}

int compareValues(const nlohmann::json& a, const nlohmann::json& b) {
    int ra = typeRank(a);
    int rb = typeRank(b);
    if (ra != rb)
        return ra < rb ? -1 : 1;
    switch (ra) {
        case 0:
            return 0;
        case 1: {
            bool x = a.get<bool>();
            bool y = b.get<bool>();
            return x == y ? 0 : (x ? 1 : -1);
        }
        case 2: {
            double x = a.get<double>();
            double y = b.get<double>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        case 3:
            return a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>()) < 0
                       ? -1
                       : (a == b ? 0 : 1);
        default: {
            auto x = a.dump();
            auto y = b.dump();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
    }
}

bool likeMatch(std::string_view text, std::string_view pattern) {
    return likeMatchAt(text, 0, pattern, 0);
}

bool Condition::matches(const nlohmann::json& row) const {
    auto actual = resolveField(row, field);
    switch (op) {
        case ConditionOp::Exists:
            return !actual.is_null();
        case ConditionOp::NotExists:
            return actual.is_null();
        case ConditionOp::Equal:
            return looselyEqual(actual, value);
        case ConditionOp::NotEqual:
            return !looselyEqual(actual, value);
        case ConditionOp::Like:
            return actual.is_string() && value.is_string() &&
                   likeMatch(actual.get_ref<const std::string&>(),
                             value.get_ref<const std::string&>());
        case ConditionOp::In:
        case ConditionOp::NotIn: {
            bool found = false;
            if (value.is_array()) {
                found = std::any_of(value.begin(), value.end(), [&](const nlohmann::json& v) {
                    return looselyEqual(actual, v);
                });
            }
            return op == ConditionOp::In ? found : !found;
        }
        case ConditionOp::Greater:
        case ConditionOp::Less:
        case ConditionOp::GreaterEqual:
        case ConditionOp::LessEqual: {
            // Ordering only makes sense between values of the same kind.
            if (actual.is_null() || typeRank(actual) != typeRank(value))
                return false;
            int c = compareValues(actual, value);
            if (op == ConditionOp::Greater)
                return c > 0;
            if (op == ConditionOp::Less)
                return c < 0;
            if (op == ConditionOp::GreaterEqual)
                return c >= 0;
            return c <= 0;
        }
    }
    return false;
}

bool QueryPlan::matches(const nlohmann::json& row) const {
    if (conditions.empty())
        return true;
    return std::any_of(conditions.begin(), conditions.end(), [&](const ConditionGroup& group) {
        return std::all_of(group.begin(), group.end(),
                           [&](const Condition& c) { return c.matches(row); });
    });
}

nlohmann::json QueryPlan::toJson() const {
    nlohmann::json j;
    j["dialect"] = dialectToString(dialect);
    j["nodeTypes"] = nodeTypes;

    auto groups = nlohmann::json::array();
    for (const auto& group : conditions) {
        auto g = nlohmann::json::array();
        for (const auto& c : group) {
            g.push_back({{"field", c.field}, {"op", conditionOpToString(c.op)}, {"value", c.value}});
        }
        groups.push_back(std::move(g));
    }
    j["conditions"] = std::move(groups);

    if (traversal) {
        j["traversal"] = {
            {"from", traversal->from},
            {"edgeType", traversal->edgeType},
            {"direction", traversal->direction == graph::EdgeDirection::Out ? "out" : "in"},
            {"depth", traversal->depth ? nlohmann::json(*traversal->depth) : nlohmann::json()},
            {"mode", traversalModeToString(traversal->mode)}};
    } else {
        j["traversal"] = nullptr;
    }

    auto fields = nlohmann::json::array();
    for (const auto& p : projections)
        fields.push_back({{"field", p.field}, {"as", p.outputName()}});
    j["projections"] = std::move(fields);

    j["orderBy"] = orderBy ? nlohmann::json{{"field", orderBy->field},
                                            {"descending", orderBy->descending}}
                           : nlohmann::json();
    j["limit"] = limit ? nlohmann::json(*limit) : nlohmann::json();
    j["offset"] = offset;
    return j;
}

std::string QueryPlan::cacheKey() const {
    auto j = toJson();
    j.erase("dialect");
    return j.dump();
}

} // namespace deplink::query
