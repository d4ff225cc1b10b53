#include <pubnodes/persister.hpp>
#include <pubnodes/config_file.hpp>
#include <pubnodes/log.hpp>
#include <pubnodes/nodes_file.hpp>

namespace pubnodes {

Persister::Persister(NodeConfiguration& config, NodesFile& file, Log& log, Version initial_version) :
    _config(config),
    _file(file),
    _log(log),
    _last_persisted(initial_version)
{}

bool Persister::persist() {
    if (_config.state().version() == last_persisted_version()) {
        return true;
    }

    auto snapshot = _config.export_configuration(std::nullopt, true);

    if (!snapshot) {
        _log.error("Update of the node configuration file failed: could not export the configuration");
        return false;
    }

    std::string content;

    try {
        content = serialize_config_file(snapshot->entries);
    }
    catch (const std::exception& e) {
        _log.error("Update of the node configuration file failed: ", e.what());
        return false;
    }

    std::scoped_lock lock(_write_mutex);

    // Someone else already wrote this or a newer version.
    if (snapshot->version <= last_persisted_version()) {
        return true;
    }

    try {
        _file.write(content);
    }
    catch (const boost::system::system_error& e) {
        _log.error("Update of the node configuration file ", _file.path(), " failed: ", e.what());
        return false;
    }

    _last_persisted.store(snapshot->version, std::memory_order_release);
    _log.debug("Node configuration version ", snapshot->version, " written to ", _file.path());

    return true;
}

} // namespace pubnodes
