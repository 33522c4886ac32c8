#include <tasktrack/common/clock.hpp>
#include <tasktrack/common/log.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace tasktrack::log {

    namespace {

        struct LogState {
            std::atomic<Level> level{Level::Info};
            std::ostream *sink = nullptr;
            std::mutex mutex;
        };

        LogState &state() {
            static LogState instance;
            return instance;
        }

        bool equalsIgnoreCase(std::string_view a, std::string_view b) {
            if (a.size() != b.size())
                return false;
            for (size_t i = 0; i < a.size(); ++i) {
                char ca = a[i];
                char cb = b[i];
                if (ca >= 'A' && ca <= 'Z')
                    ca = static_cast<char>(ca - 'A' + 'a');
                if (cb >= 'A' && cb <= 'Z')
                    cb = static_cast<char>(cb - 'A' + 'a');
                if (ca != cb)
                    return false;
            }
            return true;
        }

    } // namespace

    std::string_view levelName(Level level) noexcept {
        switch (level) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    Level parseLevel(std::string_view name) noexcept {
        if (equalsIgnoreCase(name, "trace"))
            return Level::Trace;
        if (equalsIgnoreCase(name, "debug"))
            return Level::Debug;
        if (equalsIgnoreCase(name, "info"))
            return Level::Info;
        if (equalsIgnoreCase(name, "warn") || equalsIgnoreCase(name, "warning"))
            return Level::Warn;
        if (equalsIgnoreCase(name, "error"))
            return Level::Error;
        if (equalsIgnoreCase(name, "off"))
            return Level::Off;
        return Level::Info;
    }

    void setLevel(Level level) noexcept { state().level.store(level); }

    Level level() noexcept { return state().level.load(); }

    bool isEnabled(Level lvl) noexcept {
        auto current = state().level.load();
        return current != Level::Off && lvl != Level::Off && lvl >= current;
    }

    void setSink(std::ostream *sink) noexcept {
        std::lock_guard<std::mutex> lock(state().mutex);
        state().sink = sink;
    }

    void write(Level lvl, std::string_view component, std::string_view message) {
        if (!isEnabled(lvl))
            return;

        std::string line = nowIso8601();
        line += " [";
        line += levelName(lvl);
        line += "] ";
        line += component;
        line += ": ";
        line += message;
        line += '\n';

        std::lock_guard<std::mutex> lock(state().mutex);
        std::ostream &out = state().sink ? *state().sink : std::clog;
        out << line;
        out.flush();
    }

} // namespace tasktrack::log
