#pragma once

#include <pubnodes/config_file.hpp>
#include <pubnodes/node_id.hpp>

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pubnodes {

class NodeConfiguration;
struct Defaults;
struct FlatNodeConfig;

bool same_endpoint(std::string_view a, std::string_view b);

// A configurable value together with where it came from. Explicit values were
// present in the configuration, the others are process defaults and are left
// out on export.
template<class T>
struct Setting {
    T value{};
    bool is_explicit = false;

    static Setting from(const std::optional<T>& configured, const T& default_value) {
        if (configured) return Setting{*configured, true};
        return Setting{default_value, false};
    }

    std::optional<T> explicit_value() const {
        if (!is_explicit) return std::nullopt;
        return value;
    }
};

struct MonitoredItem {
    enum class State { configured, monitored, removal_requested, removed };

    MonitoredItem(CanonicalNodeId, std::string endpoint_url, const FlatNodeConfig&, const Defaults&);

    CanonicalNodeId::Kind kind() const { return node_id.kind(); }

    CanonicalNodeId node_id;
    // Url of the owning session
    std::string endpoint_url;
    Setting<int> sampling_interval;
    Setting<std::string> display_name;
    Setting<int> heartbeat_interval;
    Setting<bool> skip_first;
    State state = State::configured;
};

struct Subscription {
    // Unset means the protocol layer's default publishing interval.
    std::optional<int> publishing_interval;
    std::vector<MonitoredItem> items;
};

/**
 * Connection to one endpoint and the subscriptions created on it.
 *
 * Connection settings are fixed at construction. Everything else (the
 * subscription list, item states, connectivity and the server's namespace
 * table) is only reachable through a `Session::Lock`.
 *
 * Lock order: node configuration structure lock, then session list lock,
 * then at most one session lock. A session lock is never held while
 * acquiring any of the other two.
 */
class Session {
public:
    enum class State { disconnected, connecting, connected };

    /**
     * Access to the mutable part of one session, held for as long as the
     * token lives.
     *
     * Collaborators only ever see a const token. Changing the shape of the
     * session (subscriptions and items) is reserved to `NodeConfiguration`,
     * which does it under the structure lock and accounts for it in the
     * version counter.
     */
    class Lock {
    public:
        Lock(Lock&&) = default;
        Lock& operator=(Lock&&) = default;

        const Session& session() const { return *_session; }

        State state() const { return _session->_state; }

        // Index of `namespace_uri` in the server namespace table. Empty when
        // not connected.
        std::optional<uint16_t> namespace_index(std::string_view namespace_uri) const;

        const std::vector<Subscription>& subscriptions() const { return _session->_subscriptions; }

        template<class F>
        void for_each_item(F&& f) const {
            for (const auto& subscription : _session->_subscriptions) {
                for (const auto& item : subscription.items) {
                    f(subscription, item);
                }
            }
        }

    private:
        friend class Session;
        friend class NodeConfiguration;

        explicit Lock(Session& session) :
            _session(&session),
            _lock(session._mutex)
        {}

        // Called on behalf of the protocol client. The namespace table is
        // dropped unless the session is connected.
        void set_state(State, std::vector<std::string> namespace_table = {});

        std::vector<Subscription>& subscriptions() { return _session->_subscriptions; }

        // Subscription for the publishing interval, created if needed.
        Subscription& subscription_for(std::optional<int> publishing_interval);

        // First item naming the node whose state is one of `states`.
        MonitoredItem* find_item(const CanonicalNodeId&, std::initializer_list<MonitoredItem::State> states);

        Session* _session;
        std::unique_lock<std::mutex> _lock;
    };

    Session(
        std::string endpoint_url,
        bool use_security,
        AuthenticationMode,
        std::optional<EncryptedCredential>
    );

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] Lock lock() { return Lock(*this); }

    const std::string& endpoint_url() const { return _endpoint_url; }
    bool use_security() const { return _use_security; }
    AuthenticationMode authentication_mode() const { return _authentication_mode; }
    const std::optional<EncryptedCredential>& encrypted_credential() const { return _encrypted_credential; }

private:
    const std::string _endpoint_url;
    const bool _use_security;
    const AuthenticationMode _authentication_mode;
    const std::optional<EncryptedCredential> _encrypted_credential;

    std::mutex _mutex;
    State _state = State::disconnected;
    std::vector<std::string> _namespace_table;
    std::vector<Subscription> _subscriptions;
};

std::ostream& operator<<(std::ostream&, MonitoredItem::State);
std::ostream& operator<<(std::ostream&, Session::State);

} // namespace pubnodes
