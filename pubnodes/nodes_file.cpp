#include <pubnodes/nodes_file.hpp>
#include <pubnodes/error.hpp>
#include <pubnodes/log.hpp>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <sstream>

namespace pubnodes {

namespace fs = boost::filesystem;
namespace sys = boost::system;

static std::optional<CanonicalNodeId> resolve(
    std::string_view id,
    std::optional<std::string_view> expanded_id = std::nullopt
) {
    try {
        return CanonicalNodeId::parse(id, expanded_id);
    }
    catch (const sys::system_error& e) {
        if (e.code() != error::invalid_node_id) throw;
        return std::nullopt;
    }
}

std::vector<FlatNodeConfig> flatten(const std::vector<ConfigFileEntryLegacy>& entries) {
    std::vector<FlatNodeConfig> result;

    for (const auto& entry : entries) {
        FlatNodeConfig base;
        base.endpoint_url = entry.endpoint_url;
        base.use_security = entry.use_security.value_or(true);
        base.authentication_mode = entry.authentication_mode.value_or(AuthenticationMode::anonymous);
        base.encrypted_credential = entry.encrypted_credential;

        if (entry.node_id) {
            // Bare node with endpoint level defaults only
            FlatNodeConfig node = base;
            node.original_id = *entry.node_id;
            node.node_id = resolve(*entry.node_id);
            result.push_back(std::move(node));
            continue;
        }

        if (!entry.opc_nodes) continue;

        for (const auto& opc_node : *entry.opc_nodes) {
            FlatNodeConfig node = base;

            std::optional<std::string_view> expanded_id;
            if (opc_node.expanded_id && !opc_node.expanded_id->empty()) {
                expanded_id = *opc_node.expanded_id;
                node.original_id = *opc_node.expanded_id;
            } else {
                node.original_id = opc_node.id;
            }

            node.node_id = resolve(opc_node.id, expanded_id);
            node.publishing_interval = opc_node.publishing_interval;
            node.sampling_interval = opc_node.sampling_interval;
            node.display_name = opc_node.display_name;
            node.heartbeat_interval = opc_node.heartbeat_interval;
            node.skip_first = opc_node.skip_first;

            result.push_back(std::move(node));
        }
    }

    return result;
}

//--------------------------------------------------------------------
NodesFile::NodesFile(fs::path path) :
    _path(std::move(path))
{}

std::optional<std::string> NodesFile::read() {
    std::scoped_lock lock(_mutex);

    if (!fs::exists(_path)) return std::nullopt;

    fs::ifstream ifs(_path, fs::ifstream::binary);
    if (!ifs.is_open()) {
        throw_error(error::io, "Could not open file " + _path.string());
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();

    if (ifs.bad()) {
        throw_error(error::io, "Could not read file " + _path.string());
    }

    return buffer.str();
}

std::vector<FlatNodeConfig> NodesFile::load(Log& log) {
    log.info("The name of the configuration file for published nodes is: ", _path.string());

    auto content = read();

    if (!content) {
        log.info("The node configuration file '", _path.string(), "' does not exist. "
                 "Continue and wait for remote configuration requests.");
        return {};
    }

    log.info("Attempting to load node configuration from: ", _path.string());

    auto entries = parse_config_file(*content);
    log.info("Loaded ", entries.size(), " config file entry/entries.");

    auto nodes = flatten(entries);
    log.info("There are ", nodes.size(), " nodes to publish.");

    return nodes;
}

void NodesFile::write(std::string_view content) {
    std::scoped_lock lock(_mutex);

    fs::path tmp_path = _path;
    tmp_path += ".tmp";

    {
        fs::ofstream ofs(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw_error(error::io, "Could not open file " + tmp_path.string());
        }

        ofs.write(content.data(), content.size());
        ofs.flush();

        if (!ofs) {
            ofs.close();
            sys::error_code ignored;
            fs::remove(tmp_path, ignored);
            throw_error(error::io, "Could not write file " + tmp_path.string());
        }
    }

    sys::error_code ec;
    fs::rename(tmp_path, _path, ec);

    if (ec) {
        sys::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw_error(error::io, "Could not replace " + _path.string() + ": " + ec.message());
    }
}

} // namespace pubnodes
