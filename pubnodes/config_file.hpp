#pragma once

#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Data model of the published nodes configuration file.
//
// Two schemas exist. The grouped one (`ConfigFileEntry`) has one record per
// endpoint with all of its nodes. The legacy one (`ConfigFileEntryLegacy`) is
// read for backward compatibility; each record carries either a single bare
// `NodeId` or an `OpcNodes` list. A grouped file is also a valid legacy file,
// so files are always read through the legacy model.

namespace pubnodes {

enum class AuthenticationMode { anonymous, username_password, certificate };

std::string_view to_string(AuthenticationMode);
std::optional<AuthenticationMode> parse_authentication_mode(std::string_view);
std::ostream& operator<<(std::ostream&, AuthenticationMode);

// Opaque to this library, decryption happens in the protocol client.
struct EncryptedCredential {
    std::string username;
    std::string password;

    bool operator==(const EncryptedCredential&) const = default;
};

struct OpcNodeOnEndpoint {
    std::string id;
    std::optional<std::string> expanded_id;
    std::optional<int> publishing_interval;
    std::optional<int> sampling_interval;
    std::optional<std::string> display_name;
    std::optional<int> heartbeat_interval;
    std::optional<bool> skip_first;

    bool operator==(const OpcNodeOnEndpoint&) const = default;
};

struct ConfigFileEntry {
    std::string endpoint_url;
    bool use_security = true;
    AuthenticationMode authentication_mode = AuthenticationMode::anonymous;
    std::optional<EncryptedCredential> encrypted_credential;
    std::vector<OpcNodeOnEndpoint> opc_nodes;

    bool operator==(const ConfigFileEntry&) const = default;
};

// Connection fields are optional here: records produced by the legacy export
// carry only the endpoint and the node id.
struct ConfigFileEntryLegacy {
    std::string endpoint_url;
    std::optional<bool> use_security;
    std::optional<AuthenticationMode> authentication_mode;
    std::optional<EncryptedCredential> encrypted_credential;
    std::optional<std::string> node_id;
    std::optional<std::vector<OpcNodeOnEndpoint>> opc_nodes;

    bool operator==(const ConfigFileEntryLegacy&) const = default;
};

/**
 * Parse the content of a configuration file.
 *
 * Member names are matched case-insensitively. Empty content and a JSON
 * `null` are read as an empty configuration.
 *
 * Throws error::parse on malformed JSON and on schema violations.
 */
std::vector<ConfigFileEntryLegacy> parse_config_file(std::string_view content);

// Indented JSON in the grouped schema.
std::string serialize_config_file(const std::vector<ConfigFileEntry>&);

// Indented JSON in the legacy schema.
std::string serialize_config_file(const std::vector<ConfigFileEntryLegacy>&);

void pretty_print(std::ostream&, const boost::json::value&);

// -------------------------------------
// Boost.JSON conversions
void tag_invoke(boost::json::value_from_tag, boost::json::value&, AuthenticationMode);
void tag_invoke(boost::json::value_from_tag, boost::json::value&, const OpcNodeOnEndpoint&);
void tag_invoke(boost::json::value_from_tag, boost::json::value&, const ConfigFileEntry&);
void tag_invoke(boost::json::value_from_tag, boost::json::value&, const ConfigFileEntryLegacy&);

AuthenticationMode tag_invoke(boost::json::value_to_tag<AuthenticationMode>, const boost::json::value&);
OpcNodeOnEndpoint tag_invoke(boost::json::value_to_tag<OpcNodeOnEndpoint>, const boost::json::value&);
ConfigFileEntryLegacy tag_invoke(boost::json::value_to_tag<ConfigFileEntryLegacy>, const boost::json::value&);

} // namespace pubnodes
