#define BOOST_TEST_MODULE ConfigFile
#include <boost/test/included/unit_test.hpp>

#include <pubnodes/config_file.hpp>
#include <pubnodes/error.hpp>
#include "test_utils.hpp"

#include <boost/json.hpp>

using namespace pubnodes;

static bool is_parse_error(const boost::system::system_error& e) {
    return e.code() == error::parse;
}

BOOST_AUTO_TEST_CASE(test_grouped_entry) {
    auto entries = parse_config_file(R"([
        {
            "EndpointUrl": "opc.tcp://plc1:4840",
            "UseSecurity": false,
            "OpcAuthenticationMode": "UsernamePassword",
            "EncryptedAuthUsername": "dXNlcg==",
            "EncryptedAuthPassword": "cGFzcw==",
            "OpcNodes": [
                { "Id": "ns=2;i=1001", "OpcPublishingInterval": 1000, "OpcSamplingInterval": 250 },
                { "Id": "i=2258", "ExpandedNodeId": "nsu=http://opcfoundation.org/UA/;i=2258",
                  "DisplayName": "CurrentTime", "HeartbeatInterval": 30, "SkipFirst": true }
            ]
        }
    ])");

    BOOST_REQUIRE_EQUAL(entries.size(), 1u);

    const auto& entry = entries[0];
    BOOST_TEST(entry.endpoint_url == "opc.tcp://plc1:4840");
    BOOST_TEST(entry.use_security == std::optional<bool>(false));
    BOOST_TEST(entry.authentication_mode == std::optional<AuthenticationMode>(AuthenticationMode::username_password));
    BOOST_REQUIRE(entry.encrypted_credential);
    BOOST_TEST(entry.encrypted_credential->username == "dXNlcg==");
    BOOST_TEST(entry.encrypted_credential->password == "cGFzcw==");
    BOOST_TEST(!entry.node_id);
    BOOST_REQUIRE(entry.opc_nodes);
    BOOST_REQUIRE_EQUAL(entry.opc_nodes->size(), 2u);

    const auto& n0 = (*entry.opc_nodes)[0];
    BOOST_TEST(n0.id == "ns=2;i=1001");
    BOOST_TEST(n0.publishing_interval == std::optional<int>(1000));
    BOOST_TEST(n0.sampling_interval == std::optional<int>(250));
    BOOST_TEST(!n0.display_name);
    BOOST_TEST(!n0.skip_first);

    const auto& n1 = (*entry.opc_nodes)[1];
    BOOST_TEST(n1.expanded_id == std::optional<std::string>("nsu=http://opcfoundation.org/UA/;i=2258"));
    BOOST_TEST(!n1.publishing_interval);
    BOOST_TEST(n1.display_name == std::optional<std::string>("CurrentTime"));
    BOOST_TEST(n1.heartbeat_interval == std::optional<int>(30));
    BOOST_TEST(n1.skip_first == std::optional<bool>(true));
}

BOOST_AUTO_TEST_CASE(test_legacy_entry) {
    auto entries = parse_config_file(R"([
        { "EndpointUrl": "opc.tcp://plc1:4840", "NodeId": { "Identifier": "ns=2;i=1001" } },
        { "EndpointUrl": "opc.tcp://plc2:4840", "NodeId": "i=2258" }
    ])");

    BOOST_REQUIRE_EQUAL(entries.size(), 2u);
    BOOST_TEST(entries[0].node_id == std::optional<std::string>("ns=2;i=1001"));
    BOOST_TEST(!entries[0].use_security);
    BOOST_TEST(!entries[0].authentication_mode);
    BOOST_TEST(!entries[0].encrypted_credential);
    BOOST_TEST(!entries[0].opc_nodes);
    BOOST_TEST(entries[1].node_id == std::optional<std::string>("i=2258"));
}

BOOST_AUTO_TEST_CASE(test_case_insensitive_members) {
    auto entries = parse_config_file(R"([
        { "endpointUrl": "opc.tcp://plc1:4840", "useSecurity": false,
          "opcAuthenticationMode": "certificate",
          "opcNodes": [ { "id": "i=1", "opcPublishingInterval": 500 } ] }
    ])");

    BOOST_REQUIRE_EQUAL(entries.size(), 1u);
    BOOST_TEST(entries[0].use_security == std::optional<bool>(false));
    BOOST_TEST(entries[0].authentication_mode == std::optional<AuthenticationMode>(AuthenticationMode::certificate));
    BOOST_TEST((*entries[0].opc_nodes)[0].publishing_interval == std::optional<int>(500));
}

BOOST_AUTO_TEST_CASE(test_numeric_authentication_mode) {
    auto entries = parse_config_file(R"([
        { "EndpointUrl": "opc.tcp://plc1:4840", "OpcAuthenticationMode": 1,
          "EncryptedAuthUsername": "u", "EncryptedAuthPassword": "p", "NodeId": "i=1" }
    ])");

    BOOST_TEST(entries[0].authentication_mode == std::optional<AuthenticationMode>(AuthenticationMode::username_password));
}

BOOST_AUTO_TEST_CASE(test_null_member_is_absent) {
    auto entries = parse_config_file(R"([
        { "EndpointUrl": "opc.tcp://plc1:4840", "NodeId": null,
          "OpcNodes": [ { "Id": "i=1", "DisplayName": null } ] }
    ])");

    BOOST_TEST(!entries[0].node_id);
    BOOST_TEST(!(*entries[0].opc_nodes)[0].display_name);
}

BOOST_AUTO_TEST_CASE(test_empty_content) {
    BOOST_TEST(parse_config_file("").empty());
    BOOST_TEST(parse_config_file("  \n").empty());
    BOOST_TEST(parse_config_file("null").empty());
    BOOST_TEST(parse_config_file("[]").empty());
}

BOOST_AUTO_TEST_CASE(test_schema_violations) {
    for (auto bad : {
            "{",
            "{}",
            R"([ 42 ])",
            R"([ { "NodeId": "i=1" } ])",
            R"([ { "EndpointUrl": "plc1", "NodeId": "i=1" } ])",
            R"([ { "EndpointUrl": "opc.tcp://plc1:4840" } ])",
            R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "NodeId": "i=1", "OpcNodes": [] } ])",
            R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "OpcNodes": {} } ])",
            R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "UseSecurity": "yes", "NodeId": "i=1" } ])",
            R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "OpcAuthenticationMode": "Kerberos", "NodeId": "i=1" } ])",
            R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "OpcNodes": [ { "Id": "i=1", "OpcSamplingInterval": 1e12 } ] } ])",
            R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "NodeId": { "Id": "i=1" } } ])",
        }) {
        BOOST_TEST_CONTEXT("content: " << bad) {
            BOOST_CHECK_EXCEPTION(parse_config_file(bad), boost::system::system_error, is_parse_error);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_serialize_omits_absent_fields) {
    ConfigFileEntry entry;
    entry.endpoint_url = "opc.tcp://plc1:4840";
    entry.opc_nodes.push_back(OpcNodeOnEndpoint{ "ns=2;i=1001", {}, 1000, {}, {}, {}, {} });

    auto json = serialize_config_file(std::vector<ConfigFileEntry>{entry});

    BOOST_TEST(json.find("\"OpcPublishingInterval\": 1000") != std::string::npos);
    BOOST_TEST(json.find("OpcSamplingInterval") == std::string::npos);
    BOOST_TEST(json.find("DisplayName") == std::string::npos);
    BOOST_TEST(json.find("EncryptedAuthUsername") == std::string::npos);
    BOOST_TEST(json.find("null") == std::string::npos);
    BOOST_TEST(json.find("\"OpcAuthenticationMode\": \"Anonymous\"") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_grouped_output_reads_back) {
    ConfigFileEntry entry;
    entry.endpoint_url = "opc.tcp://plc1:4840";
    entry.use_security = false;
    entry.authentication_mode = AuthenticationMode::username_password;
    entry.encrypted_credential = EncryptedCredential{"u", "p"};
    entry.opc_nodes.push_back(OpcNodeOnEndpoint{ "ns=2;i=1001", {}, 1000, 100, "Temp", 10, false });
    entry.opc_nodes.push_back(OpcNodeOnEndpoint{ "nsu=http://x;s=Level", {}, {}, {}, {}, {}, {} });

    auto entries = parse_config_file(serialize_config_file(std::vector<ConfigFileEntry>{entry}));

    BOOST_REQUIRE_EQUAL(entries.size(), 1u);
    BOOST_TEST(entries[0].endpoint_url == entry.endpoint_url);
    BOOST_TEST(entries[0].use_security == std::optional<bool>(entry.use_security));
    BOOST_TEST(entries[0].authentication_mode == std::optional<AuthenticationMode>(entry.authentication_mode));
    BOOST_TEST((entries[0].encrypted_credential == entry.encrypted_credential));
    BOOST_REQUIRE(entries[0].opc_nodes);
    BOOST_TEST((*entries[0].opc_nodes == entry.opc_nodes));
}

BOOST_AUTO_TEST_CASE(test_legacy_record_without_connection_fields) {
    ConfigFileEntryLegacy entry;
    entry.endpoint_url = "opc.tcp://plc1:4840";
    entry.node_id = "ns=2;i=1001";

    auto json = serialize_config_file(std::vector<ConfigFileEntryLegacy>{entry});

    BOOST_TEST(json.find("\"EndpointUrl\": \"opc.tcp://plc1:4840\"") != std::string::npos);
    BOOST_TEST(json.find("\"Identifier\": \"ns=2;i=1001\"") != std::string::npos);
    BOOST_TEST(json.find("UseSecurity") == std::string::npos);
    BOOST_TEST(json.find("OpcAuthenticationMode") == std::string::npos);
    BOOST_TEST(json.find("EncryptedAuth") == std::string::npos);

    // Reading it back applies the connection defaults
    auto nodes = tests::nodes_from(json);
    BOOST_REQUIRE_EQUAL(nodes.size(), 1u);
    BOOST_TEST(nodes[0].use_security);
    BOOST_TEST(nodes[0].authentication_mode == AuthenticationMode::anonymous);
}

BOOST_AUTO_TEST_CASE(test_pretty_print) {
    std::ostringstream os;
    pretty_print(os, boost::json::parse(R"({"a":[1,{"b":true}],"c":{}})"));

    BOOST_TEST(os.str() ==
            "{\n"
            "  \"a\": [\n"
            "    1,\n"
            "    {\n"
            "      \"b\": true\n"
            "    }\n"
            "  ],\n"
            "  \"c\": {}\n"
            "}");
}
