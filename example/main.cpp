#include <pubnodes.hpp>

#include <boost/filesystem/path.hpp>

#include <iostream>

namespace fs = boost::filesystem;

using namespace std;
using namespace pubnodes;

static void print_counts(ostream& os, const NodeConfiguration& config) {
    os << "Sessions:         " << config.number_of_sessions_connected()
       << "/" << config.number_of_sessions_configured() << " connected\n"
       << "Subscriptions:    " << config.number_of_subscriptions_connected()
       << "/" << config.number_of_subscriptions_configured() << " connected\n"
       << "Monitored items:  " << config.number_of_monitored_items_monitored()
       << "/" << config.number_of_monitored_items_configured() << " monitored, "
       << config.number_of_monitored_items_to_remove() << " to remove\n"
       << "Version:          " << config.state().version() << "\n";
}

static bool print_export(ostream& os, const NodeConfiguration& config, const Options& options) {
    optional<string> endpoint;
    if (options.endpoint) endpoint = *options.endpoint;

    if (*options.export_format == ExportFormat::legacy) {
        auto snapshot = config.export_node_ids(endpoint);
        if (!snapshot) return false;
        os << serialize_config_file(snapshot->entries) << "\n";
    } else {
        auto snapshot = config.export_configuration(endpoint, options.include_removal);
        if (!snapshot) return false;
        os << serialize_config_file(snapshot->entries) << "\n";
    }

    return true;
}

int main(int argc, char* argv[]) {
    Options options;

    try {
        options.parse(argc, argv);

        if (options.help) {
            options.write_help(cout);
            return 0;
        }
    }
    catch (const std::exception& e) {
        cerr << "Failed to parse options:\n";
        cerr << e.what() << "\n\n";
        options.write_help(cerr);
        return 1;
    }

    options.apply_environment();

    Log log(cerr, options.log_level);
    State state(log, options.defaults());
    NodesFile file(options.nodes_file);
    NodeConfiguration config(state);

    try {
        config.init(file);
    }
    catch (const boost::system::system_error& e) {
        cerr << "Failed to load " << file.path() << ": " << e.what() << "\n";
        return 1;
    }

    print_counts(cout, config);

    int exit_code = 0;

    if (options.export_format && !print_export(cout, config, options)) {
        exit_code = 2;
    }

    if (options.persist_to) {
        NodesFile target(*options.persist_to);
        Persister persister(config, target, log);

        if (!persister.persist()) exit_code = 2;
    }

    return exit_code;
}
