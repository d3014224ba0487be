#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deplink::inference {

struct EdgeTypeDefinition {
    std::string type;
    std::string description;
    std::optional<std::string> parentType;
    bool isTransitive = false;
    bool isInheritable = false;
    int priority = 0;
};

/**
 * Catalogue of edge types and their parent/child hierarchy. Each engine owns
 * its own copy; there is no process-wide registry.
 */
class EdgeTypeRegistry {
public:
    EdgeTypeRegistry() = default;

    /// Registry preloaded with the core and extended edge types.
    static EdgeTypeRegistry withDefaults();

    // Replaces an existing definition of the same type.
    void add(EdgeTypeDefinition definition);

    std::optional<EdgeTypeDefinition> get(std::string_view type) const;
    std::vector<EdgeTypeDefinition> all() const;
    bool contains(std::string_view type) const;

    /// Direct children of parentType.
    std::vector<std::string> childTypes(std::string_view parentType) const;

    /// parentType plus every descendant type, breadth first.
    std::vector<std::string> expandWithDescendants(std::string_view type) const;

    /// type, parent, grandparent, ... Stops on a repeated type.
    std::vector<std::string> hierarchyPath(std::string_view type) const;

    struct HierarchyCheck {
        bool valid = true;
        std::vector<std::string> errors;
    };
    HierarchyCheck validateHierarchy() const;

private:
    std::map<std::string, EdgeTypeDefinition, std::less<>> definitions_;
};

} // namespace deplink::inference
