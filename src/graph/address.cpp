#include <algorithm>
#include <array>
#include <deplink/graph/address.h>

namespace deplink::graph {

namespace {

struct NodeTypeName {
    NodeType type;
    const char* canonical;
    const char* lower; // nullptr when the canonical form is already lower-case
};

constexpr std::array<NodeTypeName, 19> kNodeTypeNames{{
    {NodeType::Class, "Class", "class"},
    {NodeType::Interface, "Interface", "interface"},
    {NodeType::Function, "Function", "function"},
    {NodeType::Method, "Method", "method"},
    {NodeType::Property, "Property", "property"},
    {NodeType::Variable, "Variable", "variable"},
    {NodeType::Type, "Type", "type"},
    {NodeType::Enum, "Enum", "enum"},
    {NodeType::Namespace, "Namespace", "namespace"},
    {NodeType::Heading, "Heading", "heading"},
    {NodeType::Section, "Section", "section"},
    {NodeType::Paragraph, "Paragraph", "paragraph"},
    {NodeType::Tag, "tag", nullptr},
    {NodeType::ParsedBy, "parsed-by", nullptr},
    {NodeType::DefinedIn, "defined-in", nullptr},
    {NodeType::Extends, "extends", nullptr},
    {NodeType::Implements, "implements", nullptr},
    {NodeType::UsedBy, "used-by", nullptr},
    {NodeType::Unknown, "Unknown", "unknown"},
}};

// Splits "<project>/<file>#<Type>:<Symbol>" in one pass. The project ends at
// the first '/'. The file path takes the last '#' that still leaves a
// non-empty type, a ':' and a non-empty symbol; the type ends at the first ':'
// after that '#'. Line breaks are never part of an address.
bool splitAddress(std::string_view address, ParsedAddress& out) {
    if (address.find_first_of("\r\n") != std::string_view::npos)
        return false;
    auto slash = address.find('/');
    if (slash == std::string_view::npos || slash == 0)
        return false;
    std::string_view rest = address.substr(slash + 1);

    auto colon = std::string_view::npos;
    for (size_t i = rest.size(); i-- > 1;) {
        if (rest[i] == '#' && colon != std::string_view::npos && colon > i + 1 &&
            colon + 1 < rest.size()) {
            out.projectName = std::string(address.substr(0, slash));
            out.filePath = std::string(rest.substr(0, i));
            out.nodeType = std::string(rest.substr(i + 1, colon - i - 1));
            out.symbolName = std::string(rest.substr(colon + 1));
            return true;
        }
        if (rest[i] == ':')
            colon = i;
    }
    return false;
}

} // namespace

const char* nodeTypeToString(NodeType type) noexcept {
    for (const auto& entry : kNodeTypeNames) {
        if (entry.type == type)
            return entry.canonical;
    }
    return "Unknown";
}

std::optional<NodeType> nodeTypeFromString(std::string_view text) noexcept {
    for (const auto& entry : kNodeTypeNames) {
        if (text == entry.canonical || (entry.lower && text == entry.lower))
            return entry.type;
    }
    return std::nullopt;
}

const std::vector<NodeType>& allNodeTypes() {
    static const std::vector<NodeType> types = [] {
        std::vector<NodeType> v;
        v.reserve(kNodeTypeNames.size());
        for (const auto& entry : kNodeTypeNames)
            v.push_back(entry.type);
        return v;
    }();
    return types;
}

std::string AddressCodec::normalizePath(std::string_view path) {
    std::string out(path);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

std::string AddressCodec::create(std::string_view projectName, std::string_view filePath,
                                 NodeType nodeType, std::string_view symbolName) {
    std::string out;
    out.reserve(projectName.size() + filePath.size() + symbolName.size() + 16);
    out.append(projectName);
    out.push_back('/');
    out.append(normalizePath(filePath));
    out.push_back('#');
    out.append(nodeTypeToString(nodeType));
    out.push_back(':');
    out.append(symbolName);
    return out;
}

ParsedAddress AddressCodec::parse(std::string_view address) {
    ParsedAddress parsed;
    if (address.empty()) {
        parsed.errors.emplace_back("Address is empty");
        return parsed;
    }

    const std::string normalized = normalizePath(address);
    if (!splitAddress(normalized, parsed)) {
        parsed.errors.emplace_back("Address does not match <project>/<file>#<Type>:<Symbol>: " +
                                   normalized);
        // An empty symbol is the most common near miss; report it explicitly.
        if (!normalized.empty() && normalized.back() == ':')
            parsed.errors.emplace_back("Symbol name is empty");
        return parsed;
    }

    if (!nodeTypeFromString(parsed.nodeType)) {
        parsed.errors.emplace_back("Unrecognized node type: " + parsed.nodeType);
    }
    if (parsed.symbolName.empty()) {
        parsed.errors.emplace_back("Symbol name is empty");
    }
    parsed.isValid = parsed.errors.empty();
    return parsed;
}

AddressValidation AddressCodec::validate(std::string_view address) {
    auto parsed = parse(address);
    return AddressValidation{parsed.isValid, std::move(parsed.errors)};
}

std::string AddressCodec::normalize(std::string_view address) {
    auto parsed = parse(address);
    if (!parsed.isValid)
        return normalizePath(address);
    // Round through the enum so lower-case structural spellings become canonical.
    return create(parsed.projectName, parsed.filePath, *parsed.type(), parsed.symbolName);
}

bool AddressCodec::compare(std::string_view a, std::string_view b) {
    auto lhs = parse(a);
    auto rhs = parse(b);
    if (!lhs.isValid || !rhs.isValid)
        return false;
    return lhs.projectName == rhs.projectName && lhs.filePath == rhs.filePath &&
           lhs.type() == rhs.type() && lhs.symbolName == rhs.symbolName;
}

bool AddressCodec::areRelated(std::string_view a, std::string_view b) {
    auto lhs = parse(a);
    auto rhs = parse(b);
    return lhs.isValid && rhs.isValid && lhs.projectName == rhs.projectName &&
           lhs.filePath == rhs.filePath;
}

std::optional<std::string> AddressCodec::extractProjectName(std::string_view address) {
    auto parsed = parse(address);
    if (!parsed.isValid)
        return std::nullopt;
    return std::move(parsed.projectName);
}

std::optional<std::string> AddressCodec::extractFilePath(std::string_view address) {
    auto parsed = parse(address);
    if (!parsed.isValid)
        return std::nullopt;
    return std::move(parsed.filePath);
}

std::optional<std::string> AddressCodec::extractSymbolName(std::string_view address) {
    auto parsed = parse(address);
    if (!parsed.isValid)
        return std::nullopt;
    return std::move(parsed.symbolName);
}

std::optional<NodeType> AddressCodec::extractNodeType(std::string_view address) {
    auto parsed = parse(address);
    if (!parsed.isValid)
        return std::nullopt;
    return parsed.type();
}

} // namespace deplink::graph
