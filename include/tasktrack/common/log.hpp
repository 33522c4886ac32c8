#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace tasktrack::log {

    enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

    std::string_view levelName(Level level) noexcept;

    /// Accepts "trace", "debug", "info", "warn"/"warning", "error", "off" in either case.
    /// Anything else maps to Info.
    Level parseLevel(std::string_view name) noexcept;

    void setLevel(Level level) noexcept;
    Level level() noexcept;
    bool isEnabled(Level level) noexcept;

    /// Redirect output. Passing nullptr restores std::clog.
    /// The stream must outlive every later log call.
    void setSink(std::ostream *sink) noexcept;

    /// Writes "<timestamp> [LEVEL] <component>: <message>"
    void write(Level level, std::string_view component, std::string_view message);

    inline void trace(std::string_view component, std::string_view message) { write(Level::Trace, component, message); }
    inline void debug(std::string_view component, std::string_view message) { write(Level::Debug, component, message); }
    inline void info(std::string_view component, std::string_view message) { write(Level::Info, component, message); }
    inline void warn(std::string_view component, std::string_view message) { write(Level::Warn, component, message); }
    inline void error(std::string_view component, std::string_view message) { write(Level::Error, component, message); }

    /// Build a message from streamable parts, e.g. log::concat("deleted ", n, " tasks")
    template <typename... Args> std::string concat(const Args &...args) {
        std::ostringstream oss;
        (oss << ... << args);
        return oss.str();
    }

} // namespace tasktrack::log
