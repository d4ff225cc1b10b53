#define BOOST_TEST_MODULE Persistence
#include <boost/test/included/unit_test.hpp>

#include <pubnodes/error.hpp>
#include <pubnodes/node_configuration.hpp>
#include <pubnodes/nodes_file.hpp>
#include <pubnodes/persister.hpp>
#include "test_utils.hpp"

using namespace pubnodes;
using tests::Env;
using tests::read_file;
using tests::write_file;

namespace fs = boost::filesystem;

tests::MainTestDir main_test_dir("persistence");

static const std::string two_nodes = R"([
    { "EndpointUrl": "opc.tcp://plc1:4840", "OpcNodes": [
        { "Id": "ns=2;i=1", "OpcPublishingInterval": 1000 },
        { "Id": "nsu=http://x;s=Temp", "OpcSamplingInterval": 100 }
    ] }
])";

BOOST_AUTO_TEST_CASE(test_load_missing_file) {
    Env env;
    NodesFile file(main_test_dir.subdir("load_missing") / "publishednodes.json");

    BOOST_TEST(file.load(env.captured.log).empty());
    BOOST_TEST(env.captured.contains("does not exist"));

    NodeConfiguration config(env.state);
    config.init(file);
    BOOST_TEST(config.number_of_sessions_configured() == 0u);
}

BOOST_AUTO_TEST_CASE(test_load) {
    Env env;
    auto path = main_test_dir.subdir("load") / "publishednodes.json";
    write_file(path, two_nodes);

    NodesFile file(path);
    auto nodes = file.load(env.captured.log);

    BOOST_REQUIRE_EQUAL(nodes.size(), 2u);
    BOOST_TEST(nodes[0].endpoint_url == "opc.tcp://plc1:4840");
    BOOST_TEST(nodes[0].publishing_interval == std::optional<int>(1000));
    BOOST_REQUIRE(nodes[1].node_id);
    BOOST_TEST(nodes[1].node_id->kind() == CanonicalNodeId::Kind::expanded);
    BOOST_TEST(nodes[1].sampling_interval == std::optional<int>(100));
    BOOST_TEST(env.captured.contains("There are 2 nodes to publish."));
}

BOOST_AUTO_TEST_CASE(test_load_unparsable_is_fatal) {
    Env env;
    auto path = main_test_dir.subdir("unparsable") / "publishednodes.json";
    write_file(path, "[ { \"EndpointUrl\": ");

    NodesFile file(path);
    NodeConfiguration config(env.state);

    BOOST_CHECK_EXCEPTION(config.init(file), boost::system::system_error,
            [](const auto& e) { return e.code() == error::parse; });
    BOOST_TEST(env.captured.contains("Fatal: "));
}

BOOST_AUTO_TEST_CASE(test_init_build_failure) {
    Env env;
    auto path = main_test_dir.subdir("build_failure") / "publishednodes.json";
    write_file(path, R"([ { "EndpointUrl": "opc.tcp://plc1:4840",
                            "OpcAuthenticationMode": "UsernamePassword", "NodeId": "i=1" } ])");

    NodesFile file(path);
    NodeConfiguration config(env.state);

    BOOST_CHECK_EXCEPTION(config.init(file), boost::system::system_error,
            [](const auto& e) { return e.code() == error::build; });
}

BOOST_AUTO_TEST_CASE(test_write_replaces_content) {
    auto dir = main_test_dir.subdir("write");
    auto path = dir / "publishednodes.json";
    write_file(path, "old");

    NodesFile file(path);
    file.write("new content");

    BOOST_TEST(read_file(path) == "new content");
    BOOST_TEST(!fs::exists(dir / "publishednodes.json.tmp"));
}

BOOST_AUTO_TEST_CASE(test_write_failure) {
    NodesFile file(main_test_dir.subdir("write_failure") / "missing" / "publishednodes.json");

    BOOST_CHECK_EXCEPTION(file.write("x"), boost::system::system_error,
            [](const auto& e) { return e.code() == error::io; });
}

//--------------------------------------------------------------------
BOOST_AUTO_TEST_CASE(test_persist_is_idempotent) {
    Env env;
    auto path = main_test_dir.subdir("idempotent") / "publishednodes.json";
    write_file(path, two_nodes);

    NodesFile file(path);
    NodeConfiguration config(env.state);
    config.init(file);

    Persister persister(config, file, env.captured.log);

    BOOST_TEST(persister.persist());
    BOOST_TEST(persister.last_persisted_version() == 2u);
    BOOST_REQUIRE(fs::exists(path));

    // Nothing changed, nothing is written
    fs::remove(path);
    BOOST_TEST(persister.persist());
    BOOST_TEST(!fs::exists(path));
}

BOOST_AUTO_TEST_CASE(test_persist_after_change) {
    Env env;
    auto path = main_test_dir.subdir("after_change") / "publishednodes.json";
    write_file(path, two_nodes);

    NodesFile file(path);
    NodeConfiguration config(env.state);
    config.init(file);

    // The file was just loaded, so it is current
    Persister persister(config, file, env.captured.log, env.state.version());
    fs::remove(path);
    BOOST_TEST(persister.persist());
    BOOST_TEST(!fs::exists(path));

    auto node = tests::nodes_from(R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "NodeId": "ns=2;i=3" } ])").at(0);
    BOOST_REQUIRE(config.publish_node(node));
    BOOST_REQUIRE(config.unpublish_node("opc.tcp://plc1:4840", CanonicalNodeId::parse("ns=2;i=1")));

    BOOST_TEST(persister.persist());
    BOOST_TEST(persister.last_persisted_version() == 3u);

    // Nodes waiting for removal are still written
    auto written = tests::nodes_from(read_file(path));
    BOOST_REQUIRE_EQUAL(written.size(), 3u);
    BOOST_TEST(written[0].original_id == "ns=2;i=1");
    BOOST_TEST(written[1].original_id == "nsu=http://x;s=Temp");
    BOOST_TEST(written[1].sampling_interval == std::optional<int>(100));
    BOOST_TEST(written[2].original_id == "ns=2;i=3");
}

BOOST_AUTO_TEST_CASE(test_persist_retries_after_failure) {
    Env env;
    NodeConfiguration config(env.state);
    BOOST_REQUIRE(config.create_publishing_data(tests::nodes_from(two_nodes)));

    auto dir = main_test_dir.subdir("retry") / "not-yet";
    NodesFile file(dir / "publishednodes.json");
    Persister persister(config, file, env.captured.log);

    BOOST_TEST(!persister.persist());
    BOOST_TEST(persister.last_persisted_version() == 0u);
    BOOST_TEST(env.captured.contains("Error: Update of the node configuration file"));

    fs::create_directories(dir);

    BOOST_TEST(persister.persist());
    BOOST_TEST(persister.last_persisted_version() == 2u);
    BOOST_TEST(tests::nodes_from(read_file(file.path())).size() == 2u);
}

BOOST_AUTO_TEST_CASE(test_persisted_file_loads_back) {
    auto path = main_test_dir.subdir("loads_back") / "publishednodes.json";
    write_file(path, R"([
        { "EndpointUrl": "opc.tcp://plc1:4840", "NodeId": { "Identifier": "ns=2;i=1" } },
        { "EndpointUrl": "opc.tcp://plc1:4840", "OpcNodes": [ { "Id": "ns=2;i=2", "DisplayName": "Two" } ] }
    ])");

    Env env1;
    NodesFile file(path);
    NodeConfiguration config1(env1.state);
    config1.init(file);

    Persister persister(config1, file, env1.captured.log);
    BOOST_REQUIRE(persister.persist());

    Env env2;
    NodeConfiguration config2(env2.state);
    config2.init(file);

    auto s1 = config1.export_configuration(std::nullopt, true);
    auto s2 = config2.export_configuration(std::nullopt, true);
    BOOST_REQUIRE(s1);
    BOOST_REQUIRE(s2);
    BOOST_TEST((s1->entries == s2->entries));
    BOOST_TEST(s2->entries.size() == 1u);
}

BOOST_AUTO_TEST_CASE(test_removed_nodes_are_not_written_back) {
    Env env;
    auto path = main_test_dir.subdir("removed") / "publishednodes.json";
    write_file(path, two_nodes);

    NodesFile file(path);
    NodeConfiguration config(env.state);
    config.init(file);

    auto node = tests::nodes_from(R"([ { "EndpointUrl": "opc.tcp://plc1:4840", "NodeId": "ns=2;i=3" } ])").at(0);
    BOOST_REQUIRE(config.publish_node(node));
    BOOST_REQUIRE(config.unpublish_node("opc.tcp://plc1:4840", CanonicalNodeId::parse("ns=2;i=3")));
    BOOST_REQUIRE(config.set_item_state("opc.tcp://plc1:4840", CanonicalNodeId::parse("ns=2;i=3"),
                MonitoredItem::State::removed));

    Persister persister(config, file, env.captured.log);
    BOOST_REQUIRE(persister.persist());

    auto written = tests::nodes_from(read_file(path));
    BOOST_REQUIRE_EQUAL(written.size(), 2u);
    BOOST_TEST(written[0].original_id == "ns=2;i=1");
    BOOST_TEST(written[1].original_id == "nsu=http://x;s=Temp");

    // Restarting from the file doesn't bring the node back
    Env env2;
    NodeConfiguration reloaded(env2.state);
    reloaded.init(file);
    BOOST_TEST(reloaded.number_of_monitored_items_configured() == 2u);
}
