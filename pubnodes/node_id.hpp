#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pubnodes {

enum class IdentifierType { numeric, string, guid, opaque };

// The part of a node id following the namespace, e.g. `i=1001` or `s=Temp`.
struct Identifier {
    IdentifierType type = IdentifierType::numeric;
    std::string value;

    // Throws error::invalid_node_id
    static Identifier parse(std::string_view);

    std::string to_string() const;

    bool operator==(const Identifier&) const = default;
};

// `[ns=<index>;]<identifier>`
struct NodeId {
    uint16_t namespace_index = 0;
    Identifier identifier;

    // Throws error::invalid_node_id
    static NodeId parse(std::string_view);

    std::string to_string() const;

    bool operator==(const NodeId&) const = default;
};

// `nsu=<namespace uri>;<identifier>`
//
// The namespace index of an expanded id is only known once a session to the
// server is established and its namespace table has been retrieved.
struct ExpandedNodeId {
    std::string namespace_uri;
    Identifier identifier;

    // Throws error::invalid_node_id
    static ExpandedNodeId parse(std::string_view);

    std::string to_string() const;

    bool operator==(const ExpandedNodeId&) const = default;
};

/**
 * Normalized form of a configured node identifier.
 *
 * Configuration files name nodes in three notations: a `NodeId` string
 * (`ns=2;i=1001`), an `ExpandedNodeId` string (`nsu=http://x;s=Temp`) in the
 * `Id` member, or an `ExpandedNodeId` string in the separate `ExpandedNodeId`
 * member. All of them end up here, tagged with the kind which was used. The
 * text as written in the file is kept for round-tripping on export.
 */
class CanonicalNodeId {
public:
    enum class Kind { numeric, expanded };

    CanonicalNodeId(NodeId, std::string original_id);
    CanonicalNodeId(ExpandedNodeId, std::string original_id);

    /**
     * Resolve the identifier of one configured node.
     *
     * @param id          Value of the `Id` (or legacy `NodeId`) member
     * @param expanded_id Value of the `ExpandedNodeId` member, if present
     *
     * A non-empty `expanded_id` takes precedence and is parsed as an expanded
     * id. Otherwise `id` is parsed as an expanded id if it starts with `nsu=`
     * and as a numeric one if it doesn't.
     *
     * Throws error::invalid_node_id
     */
    static CanonicalNodeId parse(
        std::string_view id,
        std::optional<std::string_view> expanded_id = std::nullopt
    );

    Kind kind() const {
        return std::holds_alternative<NodeId>(_value) ? Kind::numeric : Kind::expanded;
    }

    const NodeId* node_id() const { return std::get_if<NodeId>(&_value); }
    const ExpandedNodeId* expanded_node_id() const { return std::get_if<ExpandedNodeId>(&_value); }

    const std::string& original_id() const { return _original_id; }

    std::string to_string() const;

    // True if both name the same node, regardless of how it was spelled.
    bool same_node(const CanonicalNodeId& other) const {
        return _value == other._value;
    }

    bool operator==(const CanonicalNodeId&) const = default;

private:
    std::variant<NodeId, ExpandedNodeId> _value;
    std::string _original_id;
};

std::ostream& operator<<(std::ostream&, IdentifierType);
std::ostream& operator<<(std::ostream&, const Identifier&);
std::ostream& operator<<(std::ostream&, const NodeId&);
std::ostream& operator<<(std::ostream&, const ExpandedNodeId&);
std::ostream& operator<<(std::ostream&, const CanonicalNodeId&);
std::ostream& operator<<(std::ostream&, CanonicalNodeId::Kind);

} // namespace pubnodes
