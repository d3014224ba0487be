#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deplink::graph {

/**
 * Closed set of node kinds that may appear in the type slot of an address.
 *
 * Structural kinds describe code symbols, document kinds describe markdown
 * structure and relational kinds describe nodes that stand for a relation
 * (tags, "parsed-by" markers, ...). Unknown marks a symbol that was referenced
 * but never resolved by extraction.
 */
enum class NodeType {
    Class,
    Interface,
    Function,
    Method,
    Property,
    Variable,
    Type,
    Enum,
    Namespace,
    Heading,
    Section,
    Paragraph,
    Tag,
    ParsedBy,
    DefinedIn,
    Extends,
    Implements,
    UsedBy,
    Unknown
};

const char* nodeTypeToString(NodeType type) noexcept;

// Exact match on the canonical spelling; structural and document kinds also
// accept their lower-case form.
std::optional<NodeType> nodeTypeFromString(std::string_view text) noexcept;

const std::vector<NodeType>& allNodeTypes();

struct ParsedAddress {
    std::string projectName;
    std::string filePath;
    std::string nodeType;
    std::string symbolName;
    bool isValid = false;
    std::vector<std::string> errors;

    std::optional<NodeType> type() const noexcept { return nodeTypeFromString(nodeType); }
};

struct AddressValidation {
    bool isValid = false;
    std::vector<std::string> errors;
};

/**
 * Encoder/decoder for the symbolic address format
 *
 *     <projectName>/<filePath>#<NodeType>:<SymbolName>
 *
 * e.g. "myproj/src/foo.ts#Function:bar". All functions are pure. Parsing never
 * throws; callers branch on ParsedAddress::isValid.
 */
class AddressCodec {
public:
    static std::string create(std::string_view projectName, std::string_view filePath,
                              NodeType nodeType, std::string_view symbolName);

    static ParsedAddress parse(std::string_view address);

    static AddressValidation validate(std::string_view address);

    /// Re-serializes a valid address after path normalization. Invalid input is
    /// returned with separators normalized only.
    static std::string normalize(std::string_view address);

    /// Structural equality of the four fields. Two invalid addresses never compare equal.
    static bool compare(std::string_view a, std::string_view b);

    /// True when both addresses are valid and name symbols of the same file.
    static bool areRelated(std::string_view a, std::string_view b);

    static std::optional<std::string> extractProjectName(std::string_view address);
    static std::optional<std::string> extractFilePath(std::string_view address);
    static std::optional<std::string> extractSymbolName(std::string_view address);
    static std::optional<NodeType> extractNodeType(std::string_view address);

    static std::string normalizePath(std::string_view path);
};

} // namespace deplink::graph
