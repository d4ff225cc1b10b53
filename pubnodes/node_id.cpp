#include <pubnodes/node_id.hpp>
#include <pubnodes/error.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ostream>

namespace pubnodes {

using boost::algorithm::starts_with;

[[noreturn]]
static void invalid(std::string_view text, std::string_view reason) {
    std::string msg = "\"";
    msg.append(text).append("\": ").append(reason);
    throw_error(error::invalid_node_id, std::move(msg));
}

template<class UInt>
static std::optional<UInt> parse_uint(std::string_view s) {
    if (s.empty()) return std::nullopt;
    UInt value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || end != s.data() + s.size()) return std::nullopt;
    return value;
}

static bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// 8-4-4-4-12 hex digits
static bool is_guid(std::string_view s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        }
        else if (!is_hex(s[i])) {
            return false;
        }
    }
    return true;
}

static bool is_base64(std::string_view s) {
    if (s.empty() || s.size() % 4 != 0) return false;
    auto data_end = s.find_last_not_of('=');
    if (data_end == std::string_view::npos || s.size() - data_end - 1 > 2) return false;
    return std::all_of(s.begin(), s.begin() + data_end + 1, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
    });
}

//--------------------------------------------------------------------
/* static */
Identifier Identifier::parse(std::string_view s) {
    if (s.size() < 2 || s[1] != '=') {
        invalid(s, "expected one of i=, s=, g=, b=");
    }

    auto value = s.substr(2);

    switch (s[0]) {
        case 'i':
            if (!parse_uint<uint32_t>(value)) invalid(s, "numeric identifier out of range");
            return Identifier{IdentifierType::numeric, std::string(value)};
        case 's':
            if (value.empty()) invalid(s, "empty string identifier");
            return Identifier{IdentifierType::string, std::string(value)};
        case 'g':
            if (!is_guid(value)) invalid(s, "malformed GUID identifier");
            return Identifier{IdentifierType::guid, std::string(value)};
        case 'b':
            if (!is_base64(value)) invalid(s, "malformed opaque identifier");
            return Identifier{IdentifierType::opaque, std::string(value)};
        default:
            invalid(s, "unknown identifier type");
    }
}

std::string Identifier::to_string() const {
    char prefix = 'i';
    switch (type) {
        case IdentifierType::numeric: prefix = 'i'; break;
        case IdentifierType::string:  prefix = 's'; break;
        case IdentifierType::guid:    prefix = 'g'; break;
        case IdentifierType::opaque:  prefix = 'b'; break;
    }
    std::string result{prefix, '='};
    result += value;
    return result;
}

//--------------------------------------------------------------------
/* static */
NodeId NodeId::parse(std::string_view s) {
    NodeId result;

    if (starts_with(s, "ns=")) {
        auto semi = s.find(';');
        if (semi == std::string_view::npos) invalid(s, "missing ';' after namespace index");
        auto index = parse_uint<uint16_t>(s.substr(3, semi - 3));
        if (!index) invalid(s, "bad namespace index");
        result.namespace_index = *index;
        result.identifier = Identifier::parse(s.substr(semi + 1));
    }
    else {
        result.identifier = Identifier::parse(s);
    }

    return result;
}

std::string NodeId::to_string() const {
    if (namespace_index == 0) return identifier.to_string();
    return "ns=" + std::to_string(namespace_index) + ";" + identifier.to_string();
}

//--------------------------------------------------------------------
/* static */
ExpandedNodeId ExpandedNodeId::parse(std::string_view s) {
    if (!starts_with(s, "nsu=")) invalid(s, "expected nsu= prefix");

    auto semi = s.find(';');
    if (semi == std::string_view::npos) invalid(s, "missing ';' after namespace URI");

    auto uri = s.substr(4, semi - 4);
    if (uri.empty()) invalid(s, "empty namespace URI");

    return ExpandedNodeId{std::string(uri), Identifier::parse(s.substr(semi + 1))};
}

std::string ExpandedNodeId::to_string() const {
    return "nsu=" + namespace_uri + ";" + identifier.to_string();
}

//--------------------------------------------------------------------
CanonicalNodeId::CanonicalNodeId(NodeId id, std::string original_id) :
    _value(std::move(id)),
    _original_id(std::move(original_id))
{}

CanonicalNodeId::CanonicalNodeId(ExpandedNodeId id, std::string original_id) :
    _value(std::move(id)),
    _original_id(std::move(original_id))
{}

/* static */
CanonicalNodeId CanonicalNodeId::parse(
    std::string_view id,
    std::optional<std::string_view> expanded_id
) {
    if (expanded_id && !expanded_id->empty()) {
        return CanonicalNodeId(ExpandedNodeId::parse(*expanded_id), std::string(*expanded_id));
    }

    if (starts_with(id, "nsu=")) {
        return CanonicalNodeId(ExpandedNodeId::parse(id), std::string(id));
    }

    return CanonicalNodeId(NodeId::parse(id), std::string(id));
}

std::string CanonicalNodeId::to_string() const {
    return std::visit([](const auto& id) { return id.to_string(); }, _value);
}

//--------------------------------------------------------------------
std::ostream& operator<<(std::ostream& os, IdentifierType type) {
    switch (type) {
        case IdentifierType::numeric: return os << "numeric";
        case IdentifierType::string:  return os << "string";
        case IdentifierType::guid:    return os << "guid";
        case IdentifierType::opaque:  return os << "opaque";
    }
    return os << "???";
}

std::ostream& operator<<(std::ostream& os, const Identifier& id) {
    return os << id.to_string();
}

std::ostream& operator<<(std::ostream& os, const NodeId& id) {
    return os << id.to_string();
}

std::ostream& operator<<(std::ostream& os, const ExpandedNodeId& id) {
    return os << id.to_string();
}

std::ostream& operator<<(std::ostream& os, const CanonicalNodeId& id) {
    return os << id.to_string();
}

std::ostream& operator<<(std::ostream& os, CanonicalNodeId::Kind kind) {
    switch (kind) {
        case CanonicalNodeId::Kind::numeric:  return os << "numeric";
        case CanonicalNodeId::Kind::expanded: return os << "expanded";
    }
    return os << "???";
}

} // namespace pubnodes
