#pragma once

#include <pubnodes/config_file.hpp>
#include <pubnodes/error.hpp>
#include <pubnodes/nodes_file.hpp>
#include <pubnodes/session.hpp>
#include <pubnodes/state.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pubnodes {

/**
 * Live session -> subscription -> monitored item hierarchy built from the
 * published nodes configuration.
 *
 * Locks, in acquisition order:
 *
 *   * structure lock: shape of the hierarchy. Held by everything adding
 *     sessions, subscriptions or items and by the exports.
 *   * session list lock: the session sequence. Shared by readers, exclusive
 *     when a session is appended. Sessions are never removed, so a
 *     `SessionHandle` stays valid for the lifetime of the object.
 *   * session lock (see `Session::Lock`): one session at a time.
 *
 * The configuration file has its own lock (see `NodesFile`) which is never
 * taken while any of the above is held.
 */
class NodeConfiguration {
public:
    using Version = State::Version;
    using SessionHandle = size_t;

    struct Snapshot {
        std::vector<ConfigFileEntry> entries;
        // Node configuration version the entries correspond to
        Version version = 0;
    };

    struct LegacySnapshot {
        std::vector<ConfigFileEntryLegacy> entries;
        Version version = 0;
    };

    explicit NodeConfiguration(State&);

    NodeConfiguration(const NodeConfiguration&) = delete;
    NodeConfiguration& operator=(const NodeConfiguration&) = delete;

    /**
     * Load the configuration file and create the hierarchy from it.
     *
     * Throws error::parse, error::io or error::build. The process can't
     * continue with a partially loaded configuration.
     */
    void init(NodesFile&);

    /**
     * Group nodes by endpoint into sessions and by publishing interval into
     * subscriptions, creating one monitored item per node.
     *
     * Nodes with an unresolved identifier are skipped. Any other failure
     * (e.g. missing credential) aborts and returns false; sessions completed
     * before the failure stay in place.
     */
    bool create_publishing_data(const std::vector<FlatNodeConfig>&);

    size_t number_of_sessions_configured() const;
    size_t number_of_sessions_connected() const;
    size_t number_of_subscriptions_configured() const;
    size_t number_of_subscriptions_connected() const;
    size_t number_of_monitored_items_configured() const;
    size_t number_of_monitored_items_monitored() const;
    size_t number_of_monitored_items_to_remove() const;

    /**
     * Published nodes in the grouped file schema, one entry per session.
     *
     * Fields which took a default value are omitted.
     *
     * @param endpoint_url       Only export this endpoint if set
     * @param include_removal_requested
     *                           Include items waiting to be removed
     *
     * Returns nothing if the export failed.
     */
    std::optional<Snapshot> export_configuration(
        const std::optional<std::string>& endpoint_url,
        bool include_removal_requested
    ) const;

    /**
     * Published nodes in the legacy file schema, one entry per item with a
     * numeric node id.
     *
     * Items configured with an expanded node id are converted through the
     * session's namespace table, and left out if the session isn't connected.
     * Items waiting to be removed are never included.
     */
    std::optional<LegacySnapshot> export_node_ids(
        const std::optional<std::string>& endpoint_url
    ) const;

    /**
     * Add one node at runtime.
     *
     * Returns false if the node is already published on the endpoint.
     * Throws error::invalid_node_id or error::missing_credential.
     */
    bool publish_node(const FlatNodeConfig&);

    // Mark all matching items for removal. Returns false if none matched.
    bool unpublish_node(std::string_view endpoint_url, const CanonicalNodeId&);

    // Connectivity report from the protocol client.
    bool update_session_state(
        std::string_view endpoint_url,
        Session::State,
        std::vector<std::string> namespace_table = {}
    );

    // Item lifecycle report from the protocol client. A report of `removed`
    // goes to the item waiting for removal, any other report to the item
    // currently published.
    bool set_item_state(
        std::string_view endpoint_url,
        const CanonicalNodeId&,
        MonitoredItem::State
    );

    std::optional<SessionHandle> find_session(std::string_view endpoint_url) const;

    // Call `f(const Session::Lock&)` with the session locked.
    // Throws error::not_found for an unknown handle.
    template<class F>
    auto with_session(SessionHandle handle, F&& f) const {
        auto lock = session_at(handle).lock();
        return f(std::as_const(lock));
    }

    State& state() const { return _state; }

private:
    Session& session_at(SessionHandle) const;

    Session* find_session_unlocked(std::string_view endpoint_url) const;

    bool add_item(Session::Lock&, const FlatNodeConfig&);

    template<class F>
    void for_each_session(F&& f) const {
        std::shared_lock sessions(_sessions_mutex);
        for (const auto& session : _sessions) {
            auto lock = session->lock();
            f(lock);
        }
    }

private:
    State& _state;

    mutable std::mutex _structure_mutex;
    mutable std::shared_mutex _sessions_mutex;
    std::vector<std::unique_ptr<Session>> _sessions;
};

} // namespace pubnodes
