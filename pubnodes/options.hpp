#pragma once

#include <pubnodes/log.hpp>
#include <pubnodes/state.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <iosfwd>
#include <string>

namespace pubnodes {

enum class ExportFormat { grouped, legacy };

std::istream& operator>>(std::istream&, ExportFormat&);
std::ostream& operator<<(std::ostream&, ExportFormat);

class Options {
public:
    // Overrides the nodes file path when set and non-empty.
    static constexpr const char* nodes_file_env = "_GW_PNFP";

    Options();

    void parse(unsigned argc, const char* const* argv);

    // Apply environment overrides. Call once, after `parse`.
    void apply_environment();

    void write_help(std::ostream&);

    Defaults defaults() const;

    bool help;

    boost::filesystem::path nodes_file;

    int sampling_interval;
    int heartbeat_interval;
    bool skip_first;
    LogLevel log_level;

    boost::optional<ExportFormat> export_format;
    boost::optional<std::string> endpoint;
    bool include_removal;
    boost::optional<boost::filesystem::path> persist_to;

private:
    std::string log_level_name;
    boost::program_options::options_description description;
};

} // namespace pubnodes
