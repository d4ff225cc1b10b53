#pragma once

#include <pubnodes/config_file.hpp>
#include <pubnodes/node_id.hpp>

#include <boost/filesystem/path.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pubnodes {

class Log;

/**
 * One node to publish, as found in the configuration file.
 *
 * Optional fields are carried exactly as configured, defaults are applied
 * when the monitored item is created.
 */
struct FlatNodeConfig {
    // Empty if `original_id` is in none of the supported notations
    std::optional<CanonicalNodeId> node_id;
    std::string original_id;
    std::string endpoint_url;
    bool use_security = true;
    std::optional<int> publishing_interval;
    std::optional<int> sampling_interval;
    std::optional<std::string> display_name;
    std::optional<int> heartbeat_interval;
    std::optional<bool> skip_first;
    AuthenticationMode authentication_mode = AuthenticationMode::anonymous;
    std::optional<EncryptedCredential> encrypted_credential;
};

// Turn file entries into a flat node list, preserving file order.
std::vector<FlatNodeConfig> flatten(const std::vector<ConfigFileEntryLegacy>&);

/**
 * The published nodes configuration file.
 *
 * Reads and writes of the file are serialized by a lock of its own which is
 * never held together with the node configuration locks.
 */
class NodesFile {
public:
    explicit NodesFile(boost::filesystem::path path);

    NodesFile(const NodesFile&) = delete;
    NodesFile& operator=(const NodesFile&) = delete;

    const boost::filesystem::path& path() const { return _path; }

    /**
     * Read the file and flatten its entries.
     *
     * A missing file yields an empty list.
     *
     * Throws error::parse if the content can't be parsed and error::io if the
     * file exists but can't be read.
     */
    std::vector<FlatNodeConfig> load(Log&);

    /**
     * Replace the whole file content.
     *
     * The content goes to a temporary file next to the target which is then
     * renamed over it, so readers see either the old or the new content.
     *
     * Throws error::io
     */
    void write(std::string_view content);

private:
    std::optional<std::string> read();

private:
    const boost::filesystem::path _path;
    std::mutex _mutex;
};

} // namespace pubnodes
