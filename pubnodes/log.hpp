#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string_view>

namespace pubnodes {

enum class LogLevel { debug, info, warning, error, fatal };

std::ostream& operator<<(std::ostream&, LogLevel);

std::optional<LogLevel> parse_log_level(std::string_view);

// Line oriented logger shared by all components. Lines from concurrent
// callers are never interleaved.
class Log {
public:
    explicit Log(std::ostream& os = std::cerr, LogLevel min_level = LogLevel::info)
        : _os(&os), _min_level(min_level) {}

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    void set_min_level(LogLevel level) { _min_level.store(level, std::memory_order_relaxed); }

    bool enabled(LogLevel level) const { return level >= _min_level.load(std::memory_order_relaxed); }

    template<class... Args>
    void write(LogLevel level, const Args&... args) {
        if (!enabled(level)) return;
        std::ostringstream line;
        line << level << ": ";
        (line << ... << args);
        line << "\n";
        std::scoped_lock lock(_mutex);
        *_os << line.str() << std::flush;
    }

    template<class... Args> void debug(const Args&... args)   { write(LogLevel::debug, args...); }
    template<class... Args> void info(const Args&... args)    { write(LogLevel::info, args...); }
    template<class... Args> void warning(const Args&... args) { write(LogLevel::warning, args...); }
    template<class... Args> void error(const Args&... args)   { write(LogLevel::error, args...); }
    template<class... Args> void fatal(const Args&... args)   { write(LogLevel::fatal, args...); }

private:
    std::mutex _mutex;
    std::ostream* _os;
    std::atomic<LogLevel> _min_level;
};

} // namespace pubnodes
