#include <pubnodes/log.hpp>

#include <boost/algorithm/string/predicate.hpp>

namespace pubnodes {

std::ostream& operator<<(std::ostream& os, LogLevel level) {
    switch (level) {
        case LogLevel::debug:   return os << "Debug";
        case LogLevel::info:    return os << "Info";
        case LogLevel::warning: return os << "Warning";
        case LogLevel::error:   return os << "Error";
        case LogLevel::fatal:   return os << "Fatal";
    }
    return os << "???";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
    using boost::algorithm::iequals;
    if (iequals(s, "debug"))   return LogLevel::debug;
    if (iequals(s, "info"))    return LogLevel::info;
    if (iequals(s, "warning")) return LogLevel::warning;
    if (iequals(s, "error"))   return LogLevel::error;
    if (iequals(s, "fatal"))   return LogLevel::fatal;
    return std::nullopt;
}

} // namespace pubnodes
