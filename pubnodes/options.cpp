#include <pubnodes/options.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace pubnodes {

using namespace boost::program_options;

std::istream& operator>>(std::istream& is, ExportFormat& format)
{
    std::string str;
    is >> str;

    if (boost::algorithm::iequals(str, "grouped")) {
        format = ExportFormat::grouped;
    } else if (boost::algorithm::iequals(str, "legacy")) {
        format = ExportFormat::legacy;
    } else {
        is.setstate(std::ios::failbit);
    }

    return is;
}

std::ostream& operator<<(std::ostream& os, ExportFormat format)
{
    switch (format) {
        case ExportFormat::grouped: return os << "grouped";
        case ExportFormat::legacy:  return os << "legacy";
    }
    return os << "???";
}

Options::Options() :
    help(false),
    nodes_file("publishednodes.json"),
    sampling_interval(1000),
    heartbeat_interval(0),
    skip_first(false),
    log_level(LogLevel::info),
    include_removal(false),
    log_level_name("info"),
    description("Options")
{
    description.add_options()
        ( "help,h", bool_switch(&help), "produce this help")

        ( "nodes-file,f", value(&nodes_file)->default_value(nodes_file),
          "published nodes configuration file")

        ( "sampling-interval", value(&sampling_interval)->default_value(sampling_interval),
          "default sampling interval in milliseconds")

        ( "heartbeat-interval", value(&heartbeat_interval)->default_value(heartbeat_interval),
          "default heartbeat interval in seconds, 0 disables heartbeats")

        ( "skip-first", bool_switch(&skip_first),
          "skip the first notification of monitored items by default")

        ( "log-level", value(&log_level_name)->default_value(log_level_name),
          "debug, info, warning, error or fatal")

        ( "export", value(&export_format), "print the configuration, grouped or legacy")

        ( "endpoint", value(&endpoint), "only export this endpoint")

        ( "include-removal", bool_switch(&include_removal),
          "include items waiting to be removed in the grouped export")

        ( "persist-to", value(&persist_to), "write the grouped configuration to this file")

        ;
}

void Options::parse(unsigned argc, const char* const* argv)
{
    variables_map vars;
    store(parse_command_line(argc, argv, description), vars);
    notify(vars);

    auto level = parse_log_level(log_level_name);

    if (!level) {
        throw std::runtime_error("Invalid log level: " + log_level_name);
    }

    log_level = *level;
}

void Options::apply_environment()
{
    auto path = std::getenv(nodes_file_env);

    if (path && *path) {
        nodes_file = path;
    }
}

void Options::write_help(std::ostream& os)
{
    os << description;
}

Defaults Options::defaults() const
{
    Defaults d;
    d.sampling_interval = sampling_interval;
    d.heartbeat_interval = heartbeat_interval;
    d.skip_first = skip_first;
    return d;
}

} // namespace pubnodes
