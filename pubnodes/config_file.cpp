#include <pubnodes/config_file.hpp>
#include <pubnodes/error.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/json.hpp>
#include <boost/json/src.hpp>

#include <limits>
#include <ostream>
#include <sstream>

namespace pubnodes {

namespace json = boost::json;
using boost::algorithm::iequals;

namespace member {
    constexpr std::string_view endpoint_url          = "EndpointUrl";
    constexpr std::string_view use_security          = "UseSecurity";
    constexpr std::string_view authentication_mode   = "OpcAuthenticationMode";
    constexpr std::string_view auth_username         = "EncryptedAuthUsername";
    constexpr std::string_view auth_password         = "EncryptedAuthPassword";
    constexpr std::string_view node_id               = "NodeId";
    constexpr std::string_view node_id_identifier    = "Identifier";
    constexpr std::string_view opc_nodes             = "OpcNodes";
    constexpr std::string_view id                    = "Id";
    constexpr std::string_view expanded_node_id      = "ExpandedNodeId";
    constexpr std::string_view publishing_interval   = "OpcPublishingInterval";
    constexpr std::string_view sampling_interval     = "OpcSamplingInterval";
    constexpr std::string_view display_name          = "DisplayName";
    constexpr std::string_view heartbeat_interval    = "HeartbeatInterval";
    constexpr std::string_view skip_first            = "SkipFirst";
} // namespace member

//--------------------------------------------------------------------
std::string_view to_string(AuthenticationMode mode) {
    switch (mode) {
        case AuthenticationMode::anonymous:         return "Anonymous";
        case AuthenticationMode::username_password: return "UsernamePassword";
        case AuthenticationMode::certificate:       return "Certificate";
    }
    return "???";
}

std::optional<AuthenticationMode> parse_authentication_mode(std::string_view s) {
    for (auto mode : { AuthenticationMode::anonymous,
                       AuthenticationMode::username_password,
                       AuthenticationMode::certificate }) {
        if (iequals(s, to_string(mode))) return mode;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, AuthenticationMode mode) {
    return os << to_string(mode);
}

//--------------------------------------------------------------------
// Reading helpers. Member names are matched case-insensitively and a `null`
// member counts as absent.

static const json::value* find_member(const json::object& obj, std::string_view name) {
    for (const auto& kv : obj) {
        std::string_view key(kv.key().data(), kv.key().size());
        if (iequals(key, name)) {
            if (kv.value().is_null()) return nullptr;
            return &kv.value();
        }
    }
    return nullptr;
}

static const json::object& expect_object(const json::value& v, std::string_view what) {
    if (!v.is_object()) {
        throw_error(error::parse, std::string(what) + " must be a JSON object");
    }
    return v.get_object();
}

static std::string read_string(const json::value& v, std::string_view name) {
    if (!v.is_string()) {
        throw_error(error::parse, std::string(name) + " must be a string");
    }
    const json::string& s = v.get_string();
    return std::string(s.data(), s.size());
}

static int read_int(const json::value& v, std::string_view name) {
    if (!v.is_number()) {
        throw_error(error::parse, std::string(name) + " must be a number");
    }
    boost::system::error_code ec;
    auto n = v.to_number<int64_t>(ec);
    if (ec || n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw_error(error::parse, std::string(name) + " is not a valid integer");
    }
    return static_cast<int>(n);
}

static bool read_bool(const json::value& v, std::string_view name) {
    if (!v.is_bool()) {
        throw_error(error::parse, std::string(name) + " must be a boolean");
    }
    return v.get_bool();
}

static std::optional<std::string> opt_string(const json::object& obj, std::string_view name) {
    auto v = find_member(obj, name);
    if (!v) return std::nullopt;
    return read_string(*v, name);
}

static std::optional<int> opt_int(const json::object& obj, std::string_view name) {
    auto v = find_member(obj, name);
    if (!v) return std::nullopt;
    return read_int(*v, name);
}

static std::optional<bool> opt_bool(const json::object& obj, std::string_view name) {
    auto v = find_member(obj, name);
    if (!v) return std::nullopt;
    return read_bool(*v, name);
}

//--------------------------------------------------------------------
void tag_invoke(json::value_from_tag, json::value& jv, AuthenticationMode mode) {
    auto s = to_string(mode);
    jv = json::string(s.data(), s.size());
}

AuthenticationMode tag_invoke(json::value_to_tag<AuthenticationMode>, const json::value& jv) {
    // Older writers stored the enum as its integral value.
    if (jv.is_number()) {
        switch (read_int(jv, member::authentication_mode)) {
            case 0: return AuthenticationMode::anonymous;
            case 1: return AuthenticationMode::username_password;
            case 2: return AuthenticationMode::certificate;
            default: break;
        }
        throw_error(error::parse, "unknown authentication mode");
    }

    auto s = read_string(jv, member::authentication_mode);
    auto mode = parse_authentication_mode(s);
    if (!mode) {
        throw_error(error::parse, "unknown authentication mode \"" + s + "\"");
    }
    return *mode;
}

//--------------------------------------------------------------------
static json::string to_json_string(std::string_view s) {
    return json::string(s.data(), s.size());
}

static void put(json::object& obj, std::string_view name, json::value v) {
    obj[to_json_string(name)] = std::move(v);
}

void tag_invoke(json::value_from_tag, json::value& jv, const OpcNodeOnEndpoint& node) {
    json::object obj;
    put(obj, member::id, to_json_string(node.id));
    if (node.expanded_id)         put(obj, member::expanded_node_id, to_json_string(*node.expanded_id));
    if (node.publishing_interval) put(obj, member::publishing_interval, *node.publishing_interval);
    if (node.sampling_interval)   put(obj, member::sampling_interval, *node.sampling_interval);
    if (node.display_name)        put(obj, member::display_name, to_json_string(*node.display_name));
    if (node.heartbeat_interval)  put(obj, member::heartbeat_interval, *node.heartbeat_interval);
    if (node.skip_first)          put(obj, member::skip_first, *node.skip_first);
    jv = std::move(obj);
}

OpcNodeOnEndpoint tag_invoke(json::value_to_tag<OpcNodeOnEndpoint>, const json::value& jv) {
    const auto& obj = expect_object(jv, "OpcNodes entry");

    OpcNodeOnEndpoint node;
    // A missing Id surfaces later as an unresolvable node, not as a broken file.
    node.id                  = opt_string(obj, member::id).value_or("");
    node.expanded_id         = opt_string(obj, member::expanded_node_id);
    node.publishing_interval = opt_int(obj, member::publishing_interval);
    node.sampling_interval   = opt_int(obj, member::sampling_interval);
    node.display_name        = opt_string(obj, member::display_name);
    node.heartbeat_interval  = opt_int(obj, member::heartbeat_interval);
    node.skip_first          = opt_bool(obj, member::skip_first);
    return node;
}

//--------------------------------------------------------------------
static void put_connection(
    json::object& obj,
    const std::string& endpoint_url,
    std::optional<bool> use_security,
    std::optional<AuthenticationMode> mode,
    const std::optional<EncryptedCredential>& credential
) {
    put(obj, member::endpoint_url, to_json_string(endpoint_url));
    if (use_security) put(obj, member::use_security, *use_security);
    if (mode)         put(obj, member::authentication_mode, json::value_from(*mode));
    if (credential) {
        put(obj, member::auth_username, to_json_string(credential->username));
        put(obj, member::auth_password, to_json_string(credential->password));
    }
}

void tag_invoke(json::value_from_tag, json::value& jv, const ConfigFileEntry& entry) {
    json::object obj;
    put_connection(obj, entry.endpoint_url, entry.use_security,
            entry.authentication_mode, entry.encrypted_credential);
    put(obj, member::opc_nodes, json::value_from(entry.opc_nodes));
    jv = std::move(obj);
}

void tag_invoke(json::value_from_tag, json::value& jv, const ConfigFileEntryLegacy& entry) {
    json::object obj;
    put_connection(obj, entry.endpoint_url, entry.use_security,
            entry.authentication_mode, entry.encrypted_credential);
    if (entry.node_id) {
        json::object node_id;
        put(node_id, member::node_id_identifier, to_json_string(*entry.node_id));
        put(obj, member::node_id, std::move(node_id));
    }
    if (entry.opc_nodes) {
        put(obj, member::opc_nodes, json::value_from(*entry.opc_nodes));
    }
    jv = std::move(obj);
}

ConfigFileEntryLegacy tag_invoke(json::value_to_tag<ConfigFileEntryLegacy>, const json::value& jv) {
    const auto& obj = expect_object(jv, "Configuration entry");

    ConfigFileEntryLegacy entry;

    auto url = opt_string(obj, member::endpoint_url);
    if (!url || url->find("://") == std::string::npos) {
        throw_error(error::parse, "EndpointUrl missing or not a URL");
    }
    entry.endpoint_url = std::move(*url);
    entry.use_security = opt_bool(obj, member::use_security);

    if (auto mode = find_member(obj, member::authentication_mode)) {
        entry.authentication_mode = json::value_to<AuthenticationMode>(*mode);
    }

    auto username = opt_string(obj, member::auth_username);
    auto password = opt_string(obj, member::auth_password);
    if (username || password) {
        entry.encrypted_credential = EncryptedCredential{
            username.value_or(""), password.value_or("")
        };
    }

    if (auto node_id = find_member(obj, member::node_id)) {
        if (node_id->is_object()) {
            entry.node_id = opt_string(node_id->get_object(), member::node_id_identifier);
            if (!entry.node_id) {
                throw_error(error::parse, "NodeId without Identifier");
            }
        } else {
            entry.node_id = read_string(*node_id, member::node_id);
        }
    }

    if (auto nodes = find_member(obj, member::opc_nodes)) {
        if (!nodes->is_array()) {
            throw_error(error::parse, "OpcNodes must be an array");
        }
        entry.opc_nodes = json::value_to<std::vector<OpcNodeOnEndpoint>>(*nodes);
    }

    if (entry.node_id.has_value() == entry.opc_nodes.has_value()) {
        throw_error(error::parse,
                "Entry for " + entry.endpoint_url + " needs exactly one of NodeId or OpcNodes");
    }

    return entry;
}

//--------------------------------------------------------------------
std::vector<ConfigFileEntryLegacy> parse_config_file(std::string_view content) {
    if (content.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return {};
    }

    json::value root;

    try {
        root = json::parse(json::string_view(content.data(), content.size()));
    }
    catch (const boost::system::system_error& e) {
        throw_error(error::parse, std::string("Malformed JSON: ") + e.what());
    }

    if (root.is_null()) return {};

    if (!root.is_array()) {
        throw_error(error::parse, "Top level element must be an array");
    }

    return json::value_to<std::vector<ConfigFileEntryLegacy>>(root);
}

template<class Entries>
static std::string serialize_entries(const Entries& entries) {
    std::ostringstream ss;
    pretty_print(ss, json::value_from(entries));
    ss << "\n";
    return ss.str();
}

std::string serialize_config_file(const std::vector<ConfigFileEntry>& entries) {
    return serialize_entries(entries);
}

std::string serialize_config_file(const std::vector<ConfigFileEntryLegacy>& entries) {
    return serialize_entries(entries);
}

//--------------------------------------------------------------------
static void pretty_print(std::ostream& os, const json::value& jv, std::string& indent) {
    switch (jv.kind()) {
        case json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty()) { os << "{}"; break; }
            os << "{\n";
            indent.append(2, ' ');
            for (auto i = obj.begin(); i != obj.end(); ++i) {
                if (i != obj.begin()) os << ",\n";
                os << indent << json::serialize(json::string(i->key())) << ": ";
                pretty_print(os, i->value(), indent);
            }
            indent.resize(indent.size() - 2);
            os << "\n" << indent << "}";
            break;
        }
        case json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty()) { os << "[]"; break; }
            os << "[\n";
            indent.append(2, ' ');
            for (auto i = arr.begin(); i != arr.end(); ++i) {
                if (i != arr.begin()) os << ",\n";
                os << indent;
                pretty_print(os, *i, indent);
            }
            indent.resize(indent.size() - 2);
            os << "\n" << indent << "]";
            break;
        }
        default:
            os << json::serialize(jv);
    }
}

void pretty_print(std::ostream& os, const json::value& jv) {
    std::string indent;
    pretty_print(os, jv, indent);
}

} // namespace pubnodes
