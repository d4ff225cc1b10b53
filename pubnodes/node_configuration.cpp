#include <pubnodes/node_configuration.hpp>

#include <algorithm>

namespace pubnodes {

namespace sys = boost::system;

NodeConfiguration::NodeConfiguration(State& state) :
    _state(state)
{}

void NodeConfiguration::init(NodesFile& file) {
    auto& log = _state.log();

    std::vector<FlatNodeConfig> nodes;

    try {
        nodes = file.load(log);
    }
    catch (const sys::system_error& e) {
        log.fatal("Loading of the node configuration file failed. "
                  "Does the file exist and has correct syntax? ", e.what());
        throw;
    }

    if (!create_publishing_data(nodes)) {
        throw_error(error::build, "Error while creating node configuration data structures");
    }
}

//--------------------------------------------------------------------
static bool same_connection(const FlatNodeConfig& a, const FlatNodeConfig& b) {
    return a.use_security == b.use_security
        && a.authentication_mode == b.authentication_mode
        && a.encrypted_credential == b.encrypted_credential;
}

static bool same_connection(const FlatNodeConfig& node, const Session& session) {
    return node.use_security == session.use_security()
        && node.authentication_mode == session.authentication_mode()
        && node.encrypted_credential == session.encrypted_credential();
}

static void check_credential(const FlatNodeConfig& node) {
    if (node.authentication_mode == AuthenticationMode::username_password
            && !node.encrypted_credential) {
        throw_error(error::missing_credential,
                "Could not retrieve credentials to authenticate to " + node.endpoint_url
                + ". Please check the EncryptedAuthUsername and EncryptedAuthPassword settings.");
    }
}

static std::unique_ptr<Session> make_session(const FlatNodeConfig& node) {
    check_credential(node);

    std::optional<EncryptedCredential> credential;
    if (node.authentication_mode == AuthenticationMode::username_password) {
        credential = node.encrypted_credential;
    }

    return std::make_unique<Session>(
            node.endpoint_url,
            node.use_security,
            node.authentication_mode,
            std::move(credential));
}

Session* NodeConfiguration::find_session_unlocked(std::string_view endpoint_url) const {
    for (const auto& session : _sessions) {
        if (same_endpoint(session->endpoint_url(), endpoint_url)) return session.get();
    }
    return nullptr;
}

bool NodeConfiguration::add_item(Session::Lock& lock, const FlatNodeConfig& node) {
    auto& log = _state.log();

    if (!node.node_id) {
        log.warning("Node ", node.original_id, " has an invalid format. Skipping...");
        return false;
    }

    bool published = false;
    lock.for_each_item([&](const Subscription&, const MonitoredItem& item) {
        if (!item.node_id.same_node(*node.node_id)) return;
        if (item.state == MonitoredItem::State::removal_requested) return;
        if (item.state == MonitoredItem::State::removed) return;
        published = true;
    });

    if (published) {
        log.warning("Node ", node.original_id, " is already published on ",
                lock.session().endpoint_url(), ". Skipping...");
        return false;
    }

    auto& subscription = lock.subscription_for(node.publishing_interval);

    subscription.items.emplace_back(
            *node.node_id,
            lock.session().endpoint_url(),
            node,
            _state.defaults());

    _state.increment_version();
    return true;
}

bool NodeConfiguration::create_publishing_data(const std::vector<FlatNodeConfig>& nodes) {
    auto& log = _state.log();

    std::scoped_lock structure(_structure_mutex);
    std::unique_lock sessions(_sessions_mutex);

    try {
        // Distinct endpoints in order of first appearance
        std::vector<const FlatNodeConfig*> firsts;
        for (const auto& node : nodes) {
            auto seen = std::any_of(firsts.begin(), firsts.end(), [&](auto f) {
                return same_endpoint(f->endpoint_url, node.endpoint_url);
            });
            if (!seen) firsts.push_back(&node);
        }

        for (auto first : firsts) {
            std::vector<const FlatNodeConfig*> group;
            for (const auto& node : nodes) {
                if (!same_endpoint(node.endpoint_url, first->endpoint_url)) continue;
                if (!same_connection(node, *first)) {
                    log.warning("Node ", node.original_id, " on ", node.endpoint_url,
                            " has connection settings differing from the first node "
                            "of that endpoint. Using the settings of the first node.");
                }
                group.push_back(&node);
            }

            std::unique_ptr<Session> new_session;
            Session* session = find_session_unlocked(first->endpoint_url);

            if (!session) {
                new_session = make_session(*first);
                session = new_session.get();
            }

            // Distinct publishing intervals in order of first appearance. An
            // unset interval forms its own group.
            std::vector<std::optional<int>> intervals;
            for (auto node : group) {
                if (std::find(intervals.begin(), intervals.end(), node->publishing_interval) == intervals.end()) {
                    intervals.push_back(node->publishing_interval);
                }
            }

            {
                auto lock = session->lock();

                for (const auto& interval : intervals) {
                    lock.subscription_for(interval);

                    for (auto node : group) {
                        if (node->publishing_interval != interval) continue;
                        add_item(lock, *node);
                    }
                }
            }

            if (new_session) {
                _sessions.push_back(std::move(new_session));
            }
        }
    }
    catch (const std::exception& e) {
        log.fatal("Creation of the internal OPC data management structures failed: ", e.what());
        return false;
    }

    return true;
}

//--------------------------------------------------------------------
size_t NodeConfiguration::number_of_sessions_configured() const {
    std::shared_lock sessions(_sessions_mutex);
    return _sessions.size();
}

size_t NodeConfiguration::number_of_sessions_connected() const {
    size_t result = 0;
    for_each_session([&](const Session::Lock& lock) {
        if (lock.state() == Session::State::connected) ++result;
    });
    return result;
}

size_t NodeConfiguration::number_of_subscriptions_configured() const {
    size_t result = 0;
    for_each_session([&](const Session::Lock& lock) {
        result += lock.subscriptions().size();
    });
    return result;
}

size_t NodeConfiguration::number_of_subscriptions_connected() const {
    size_t result = 0;
    for_each_session([&](const Session::Lock& lock) {
        if (lock.state() != Session::State::connected) return;
        result += lock.subscriptions().size();
    });
    return result;
}

size_t NodeConfiguration::number_of_monitored_items_configured() const {
    size_t result = 0;
    for_each_session([&](const Session::Lock& lock) {
        lock.for_each_item([&](auto&, const MonitoredItem& item) {
            if (item.state != MonitoredItem::State::removed) ++result;
        });
    });
    return result;
}

size_t NodeConfiguration::number_of_monitored_items_monitored() const {
    size_t result = 0;
    for_each_session([&](const Session::Lock& lock) {
        if (lock.state() != Session::State::connected) return;
        lock.for_each_item([&](auto&, const MonitoredItem& item) {
            if (item.state == MonitoredItem::State::monitored) ++result;
        });
    });
    return result;
}

size_t NodeConfiguration::number_of_monitored_items_to_remove() const {
    size_t result = 0;
    for_each_session([&](const Session::Lock& lock) {
        lock.for_each_item([&](auto&, const MonitoredItem& item) {
            if (item.state == MonitoredItem::State::removal_requested) ++result;
        });
    });
    return result;
}

//--------------------------------------------------------------------
static bool matches(const std::optional<std::string>& filter, const Session& session) {
    return !filter || same_endpoint(*filter, session.endpoint_url());
}

std::optional<NodeConfiguration::Snapshot>
NodeConfiguration::export_configuration(
    const std::optional<std::string>& endpoint_url,
    bool include_removal_requested
) const try {
    Snapshot snapshot;

    std::scoped_lock structure(_structure_mutex);

    // Items are only added with the structure lock held, so this is exactly
    // the version of what gets exported.
    snapshot.version = _state.version();

    for_each_session([&](const Session::Lock& lock) {
        const auto& session = lock.session();
        if (!matches(endpoint_url, session)) return;

        ConfigFileEntry entry;
        entry.endpoint_url = session.endpoint_url();
        entry.use_security = session.use_security();
        entry.authentication_mode = session.authentication_mode();
        entry.encrypted_credential = session.encrypted_credential();

        lock.for_each_item([&](const Subscription& subscription, const MonitoredItem& item) {
            if (item.state == MonitoredItem::State::removed) return;
            if (item.state == MonitoredItem::State::removal_requested && !include_removal_requested) {
                return;
            }

            OpcNodeOnEndpoint node;
            node.id = item.node_id.original_id();
            node.publishing_interval = subscription.publishing_interval;
            node.sampling_interval = item.sampling_interval.explicit_value();
            node.display_name = item.display_name.explicit_value();
            node.heartbeat_interval = item.heartbeat_interval.explicit_value();
            node.skip_first = item.skip_first.explicit_value();
            entry.opc_nodes.push_back(std::move(node));
        });

        snapshot.entries.push_back(std::move(entry));
    });

    return snapshot;
}
catch (const std::exception& e) {
    _state.log().error("Reading configuration file entries failed: ", e.what());
    return std::nullopt;
}

std::optional<NodeConfiguration::LegacySnapshot>
NodeConfiguration::export_node_ids(const std::optional<std::string>& endpoint_url) const try {
    auto& log = _state.log();

    LegacySnapshot snapshot;

    std::scoped_lock structure(_structure_mutex);

    snapshot.version = _state.version();

    for_each_session([&](const Session::Lock& lock) {
        const auto& session = lock.session();
        if (!matches(endpoint_url, session)) return;

        lock.for_each_item([&](const Subscription&, const MonitoredItem& item) {
            if (item.state == MonitoredItem::State::removal_requested) return;
            if (item.state == MonitoredItem::State::removed) return;

            std::string node_id;

            if (item.kind() == CanonicalNodeId::Kind::numeric) {
                node_id = item.node_id.node_id()->to_string();
            }
            else {
                auto expanded = item.node_id.expanded_node_id();
                auto index = lock.namespace_index(expanded->namespace_uri);

                if (!index) {
                    log.debug("Node ", item.node_id, " on ", session.endpoint_url(),
                            " has no namespace index (session ", lock.state(), "). Skipping...");
                    return;
                }

                node_id = NodeId{*index, expanded->identifier}.to_string();
            }

            ConfigFileEntryLegacy entry;
            entry.endpoint_url = session.endpoint_url();
            entry.node_id = std::move(node_id);
            snapshot.entries.push_back(std::move(entry));
        });
    });

    return snapshot;
}
catch (const std::exception& e) {
    _state.log().error("Creation of configuration file entries failed: ", e.what());
    return std::nullopt;
}

//--------------------------------------------------------------------
bool NodeConfiguration::publish_node(const FlatNodeConfig& node) {
    if (!node.node_id) {
        throw_error(error::invalid_node_id, "\"" + node.original_id + "\" is not a valid node id");
    }

    std::scoped_lock structure(_structure_mutex);
    std::unique_lock sessions(_sessions_mutex);

    std::unique_ptr<Session> new_session;
    Session* session = find_session_unlocked(node.endpoint_url);

    if (!session) {
        new_session = make_session(node);
        session = new_session.get();
    }
    else if (!same_connection(node, *session)) {
        _state.log().warning("Connection settings for ", node.original_id,
                " differ from the existing session to ", session->endpoint_url(),
                ". Using the session's settings.");
    }

    bool added = false;
    {
        auto lock = session->lock();
        added = add_item(lock, node);
    }

    if (new_session && added) {
        _sessions.push_back(std::move(new_session));
    }

    return added;
}

bool NodeConfiguration::unpublish_node(std::string_view endpoint_url, const CanonicalNodeId& node_id) {
    std::scoped_lock structure(_structure_mutex);
    std::shared_lock sessions(_sessions_mutex);

    Session* session = find_session_unlocked(endpoint_url);
    if (!session) return false;

    bool marked = false;
    auto lock = session->lock();

    for (auto& subscription : lock.subscriptions()) {
        for (auto& item : subscription.items) {
            if (!item.node_id.same_node(node_id)) continue;
            if (item.state == MonitoredItem::State::removal_requested
                    || item.state == MonitoredItem::State::removed) continue;
            item.state = MonitoredItem::State::removal_requested;
            marked = true;
        }
    }

    return marked;
}

//--------------------------------------------------------------------
Session& NodeConfiguration::session_at(SessionHandle handle) const {
    std::shared_lock sessions(_sessions_mutex);
    if (handle >= _sessions.size()) {
        throw_error(error::not_found, "No session with handle " + std::to_string(handle));
    }
    return *_sessions[handle];
}

std::optional<NodeConfiguration::SessionHandle>
NodeConfiguration::find_session(std::string_view endpoint_url) const {
    std::shared_lock sessions(_sessions_mutex);
    for (size_t i = 0; i < _sessions.size(); ++i) {
        if (same_endpoint(_sessions[i]->endpoint_url(), endpoint_url)) return i;
    }
    return std::nullopt;
}

bool NodeConfiguration::update_session_state(
    std::string_view endpoint_url,
    Session::State state,
    std::vector<std::string> namespace_table
) {
    auto handle = find_session(endpoint_url);
    if (!handle) return false;

    auto lock = session_at(*handle).lock();
    lock.set_state(state, std::move(namespace_table));

    return true;
}

bool NodeConfiguration::set_item_state(
    std::string_view endpoint_url,
    const CanonicalNodeId& node_id,
    MonitoredItem::State state
) {
    using S = MonitoredItem::State;

    auto handle = find_session(endpoint_url);
    if (!handle) return false;

    auto lock = session_at(*handle).lock();

    MonitoredItem* item = nullptr;

    if (state == S::removed) {
        item = lock.find_item(node_id, {S::removal_requested});
    }

    if (!item) {
        item = lock.find_item(node_id, {S::configured, S::monitored});
    }

    if (!item) return false;

    item->state = state;
    return true;
}

} // namespace pubnodes
