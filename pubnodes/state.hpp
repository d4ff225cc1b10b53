#pragma once

#include <pubnodes/log.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace pubnodes {

// Values applied to monitored items whose configuration leaves a field out.
// Fields taking a default are not written back on export.
struct Defaults {
    int sampling_interval = 1000;
    int heartbeat_interval = 0;
    bool skip_first = false;
    std::string display_name;
};

/**
 * Process wide state shared by all node configuration components.
 *
 * The node configuration version is incremented once for every monitored item
 * added to a subscription. It never decreases, so comparing it with the value
 * recorded when the configuration file was last written tells whether the
 * file is stale.
 */
class State {
public:
    using Version = uint64_t;

    explicit State(Log& log, Defaults defaults = {}) :
        _log(log),
        _defaults(std::move(defaults))
    {}

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    Log& log() const { return _log; }

    const Defaults& defaults() const { return _defaults; }

    Version version() const {
        return _version.load(std::memory_order_acquire);
    }

    // Returns the new version.
    Version increment_version() {
        return _version.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

private:
    Log& _log;
    const Defaults _defaults;
    std::atomic<Version> _version{0};
};

} // namespace pubnodes
