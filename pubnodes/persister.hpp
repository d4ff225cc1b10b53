#pragma once

#include <pubnodes/node_configuration.hpp>

#include <atomic>
#include <mutex>

namespace pubnodes {

class Log;
class NodesFile;

/**
 * Writes the node configuration back to the configuration file whenever it
 * changed since the last successful write.
 *
 * Concurrent calls to `persist` are fine: the file is written at most once
 * per version and never with an older version than one already written.
 */
class Persister {
public:
    using Version = NodeConfiguration::Version;

    Persister(NodeConfiguration&, NodesFile&, Log&, Version initial_version = 0);

    Persister(const Persister&) = delete;
    Persister& operator=(const Persister&) = delete;

    // Returns false if the export or the write failed. The next call retries.
    bool persist();

    Version last_persisted_version() const {
        return _last_persisted.load(std::memory_order_acquire);
    }

private:
    NodeConfiguration& _config;
    NodesFile& _file;
    Log& _log;
    std::mutex _write_mutex;
    std::atomic<Version> _last_persisted;
};

} // namespace pubnodes
