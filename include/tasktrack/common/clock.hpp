#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <string>

namespace tasktrack {

    /// Current Unix timestamp in seconds
    inline int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Format a time point as fixed-width UTC ISO-8601 with microseconds
    /// e.g. "2025-03-14T09:26:53.589793Z". Lexical order matches chronological order.
    inline std::string formatIso8601(std::chrono::system_clock::time_point tp) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
        int64_t secs = micros / 1000000;
        int64_t frac = micros % 1000000;
        if (frac < 0) {
            frac += 1000000;
            secs -= 1;
        }

        std::time_t t = static_cast<std::time_t>(secs);
        std::tm tm{};
        gmtime_r(&t, &tm);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                      tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(frac));
        return std::string(buf);
    }

    inline std::string nowIso8601() { return formatIso8601(std::chrono::system_clock::now()); }

} // namespace tasktrack
