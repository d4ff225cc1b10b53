#include <pubnodes/session.hpp>
#include <pubnodes/nodes_file.hpp>
#include <pubnodes/state.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <limits>
#include <ostream>

namespace pubnodes {

bool same_endpoint(std::string_view a, std::string_view b) {
    return boost::algorithm::iequals(a, b);
}

MonitoredItem::MonitoredItem(
    CanonicalNodeId node_id_,
    std::string endpoint_url_,
    const FlatNodeConfig& config,
    const Defaults& defaults
) :
    node_id(std::move(node_id_)),
    endpoint_url(std::move(endpoint_url_)),
    sampling_interval(Setting<int>::from(config.sampling_interval, defaults.sampling_interval)),
    display_name(Setting<std::string>::from(config.display_name, defaults.display_name)),
    heartbeat_interval(Setting<int>::from(config.heartbeat_interval, defaults.heartbeat_interval)),
    skip_first(Setting<bool>::from(config.skip_first, defaults.skip_first))
{}

//--------------------------------------------------------------------
Session::Session(
    std::string endpoint_url,
    bool use_security,
    AuthenticationMode authentication_mode,
    std::optional<EncryptedCredential> encrypted_credential
) :
    _endpoint_url(std::move(endpoint_url)),
    _use_security(use_security),
    _authentication_mode(authentication_mode),
    _encrypted_credential(std::move(encrypted_credential))
{}

void Session::Lock::set_state(State state, std::vector<std::string> namespace_table) {
    _session->_state = state;

    if (state == State::connected) {
        _session->_namespace_table = std::move(namespace_table);
    } else {
        _session->_namespace_table.clear();
    }
}

std::optional<uint16_t> Session::Lock::namespace_index(std::string_view namespace_uri) const {
    if (_session->_state != State::connected) return std::nullopt;

    const auto& table = _session->_namespace_table;
    auto i = std::find(table.begin(), table.end(), namespace_uri);

    if (i == table.end()) return std::nullopt;

    auto index = std::distance(table.begin(), i);
    if (index > std::numeric_limits<uint16_t>::max()) return std::nullopt;

    return static_cast<uint16_t>(index);
}

Subscription& Session::Lock::subscription_for(std::optional<int> publishing_interval) {
    auto& subscriptions = _session->_subscriptions;

    auto i = std::find_if(subscriptions.begin(), subscriptions.end(),
            [&](const Subscription& s) { return s.publishing_interval == publishing_interval; });

    if (i != subscriptions.end()) return *i;

    subscriptions.push_back(Subscription{publishing_interval, {}});
    return subscriptions.back();
}

MonitoredItem* Session::Lock::find_item(
    const CanonicalNodeId& node_id,
    std::initializer_list<MonitoredItem::State> states
) {
    for (auto& subscription : _session->_subscriptions) {
        for (auto& item : subscription.items) {
            if (!item.node_id.same_node(node_id)) continue;
            if (std::find(states.begin(), states.end(), item.state) == states.end()) continue;
            return &item;
        }
    }
    return nullptr;
}

//--------------------------------------------------------------------
std::ostream& operator<<(std::ostream& os, MonitoredItem::State state) {
    using S = MonitoredItem::State;
    switch (state) {
        case S::configured:        return os << "Configured";
        case S::monitored:         return os << "Monitored";
        case S::removal_requested: return os << "RemovalRequested";
        case S::removed:           return os << "Removed";
    }
    return os << "???";
}

std::ostream& operator<<(std::ostream& os, Session::State state) {
    using S = Session::State;
    switch (state) {
        case S::disconnected: return os << "Disconnected";
        case S::connecting:   return os << "Connecting";
        case S::connected:    return os << "Connected";
    }
    return os << "???";
}

} // namespace pubnodes
