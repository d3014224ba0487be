#include <deque>
#include <set>
#include <deplink/inference/edge_type_registry.h>

namespace deplink::inference {

namespace {

EdgeTypeDefinition def(std::string type, std::string description,
                       std::optional<std::string> parent, bool transitive, bool inheritable,
                       int priority) {
    return EdgeTypeDefinition{std::move(type), std::move(description), std::move(parent),
                              transitive,      inheritable,            priority};
}

} // namespace

EdgeTypeRegistry EdgeTypeRegistry::withDefaults() {
    EdgeTypeRegistry registry;
    // Structure
    registry.add(def("contains", "Container holds member", std::nullopt, true, true, 0));
    registry.add(def("declares", "Scope declares symbol", "contains", false, true, 0));
    registry.add(def("belongs_to", "Member belongs to container", std::nullopt, true, false, 0));
    // Dependencies
    registry.add(def("depends_on", "Generic dependency", std::nullopt, true, false, 0));
    registry.add(def("imports", "Imports module or symbol", "depends_on", false, false, 5));
    registry.add(def("exports_to", "Exports symbol to module", std::nullopt, false, false, 0));
    // Code relations
    registry.add(def("calls", "Calls function or method", "depends_on", false, false, 5));
    registry.add(def("references", "References symbol", "depends_on", false, false, 5));
    registry.add(def("extends", "Extends class or interface", "depends_on", false, true, 5));
    registry.add(def("implements", "Implements interface", "depends_on", false, true, 5));
    registry.add(def("uses", "Uses symbol", "depends_on", false, false, 5));
    registry.add(def("instantiates", "Creates instance of class", "depends_on", false, false, 5));
    // Types
    registry.add(def("has_type", "Declared type of symbol", std::nullopt, false, false, 0));
    registry.add(def("returns", "Return type", std::nullopt, false, false, 0));
    registry.add(def("throws", "Thrown type", std::nullopt, false, false, 0));
    // Assignment and access
    registry.add(def("assigns_to", "Assignment to variable or property", std::nullopt, false,
                     false, 0));
    registry.add(def("accesses", "Accesses property or variable", "depends_on", false, false, 5));
    // Inheritance and override
    registry.add(def("overrides", "Method overrides parent method", std::nullopt, false, false, 0));
    registry.add(def("shadows", "Variable shadows outer variable", std::nullopt, false, false, 0));
    registry.add(def("annotated_with", "Decorated or annotated with", std::nullopt, false, false,
                     0));
    // Extended
    registry.add(def("imports_library", "Imports external package", "imports", false, false, 6));
    registry.add(def("imports_file", "Imports local file", "imports", false, false, 6));
    registry.add(def("aliasOf", "Import alias of symbol", "references", false, false, 5));
    return registry;
}

void EdgeTypeRegistry::add(EdgeTypeDefinition definition) {
    auto key = definition.type;
    definitions_.insert_or_assign(std::move(key), std::move(definition));
}

std::optional<EdgeTypeDefinition> EdgeTypeRegistry::get(std::string_view type) const {
    auto it = definitions_.find(type);
    if (it == definitions_.end())
        return std::nullopt;
    return it->second;
}

std::vector<EdgeTypeDefinition> EdgeTypeRegistry::all() const {
    std::vector<EdgeTypeDefinition> out;
    out.reserve(definitions_.size());
    for (const auto& [type, definition] : definitions_)
        out.push_back(definition);
    return out;
}

bool EdgeTypeRegistry::contains(std::string_view type) const {
    return definitions_.find(type) != definitions_.end();
}

std::vector<std::string> EdgeTypeRegistry::childTypes(std::string_view parentType) const {
    std::vector<std::string> out;
    for (const auto& [type, definition] : definitions_) {
        if (definition.parentType && *definition.parentType == parentType)
            out.push_back(type);
    }
    return out;
}

std::vector<std::string> EdgeTypeRegistry::expandWithDescendants(std::string_view type) const {
    std::vector<std::string> out{std::string(type)};
    std::set<std::string, std::less<>> seen{std::string(type)};
    std::deque<std::string> queue{std::string(type)};
    while (!queue.empty()) {
        auto current = std::move(queue.front());
        queue.pop_front();
        for (auto& child : childTypes(current)) {
            if (seen.insert(child).second) {
                out.push_back(child);
                queue.push_back(std::move(child));
            }
        }
    }
    return out;
}

std::vector<std::string> EdgeTypeRegistry::hierarchyPath(std::string_view type) const {
    std::vector<std::string> path{std::string(type)};
    std::set<std::string, std::less<>> seen{std::string(type)};
    auto current = get(type);
    while (current && current->parentType) {
        const auto& parent = *current->parentType;
        path.push_back(parent);
        if (!seen.insert(parent).second)
            break;
        current = get(parent);
    }
    return path;
}

EdgeTypeRegistry::HierarchyCheck EdgeTypeRegistry::validateHierarchy() const {
    HierarchyCheck check;
    for (const auto& [type, definition] : definitions_) {
        if (!definition.parentType)
            continue;
        if (!contains(*definition.parentType)) {
            check.errors.push_back(type + ": parent type '" + *definition.parentType +
                                   "' does not exist");
        }
        auto path = hierarchyPath(type);
        std::set<std::string> seen;
        for (const auto& node : path) {
            if (!seen.insert(node).second) {
                check.errors.push_back(type + ": circular hierarchy detected");
                break;
            }
        }
    }
    check.valid = check.errors.empty();
    return check;
}

} // namespace deplink::inference
