#pragma once

#include <array>
#include <datapod/datapod.hpp>
#include <string>
#include <string_view>

#include <tasktrack/common/error.hpp>

namespace tasktrack::model {

    /// Task lifecycle state. Any transition between two values is allowed.
    enum class TaskStatus { Backlog = 0, InProgress = 1, Review = 2, Complete = 3 };

    inline constexpr std::array<TaskStatus, 4> allTaskStatuses() {
        return {TaskStatus::Backlog, TaskStatus::InProgress, TaskStatus::Review, TaskStatus::Complete};
    }

    inline constexpr bool isValid(TaskStatus status) {
        auto raw = static_cast<int>(status);
        return raw >= static_cast<int>(TaskStatus::Backlog) && raw <= static_cast<int>(TaskStatus::Complete);
    }

    /// Persisted text form
    inline constexpr std::string_view toString(TaskStatus status) {
        switch (status) {
        case TaskStatus::Backlog:
            return "backlog";
        case TaskStatus::InProgress:
            return "in_progress";
        case TaskStatus::Review:
            return "review";
        case TaskStatus::Complete:
            return "complete";
        }
        return "";
    }

    inline dp::Result<TaskStatus, dp::Error> parseTaskStatus(std::string_view text) {
        for (auto status : allTaskStatuses()) {
            if (toString(status) == text)
                return dp::Result<TaskStatus, dp::Error>::ok(status);
        }
        return dp::Result<TaskStatus, dp::Error>::err(
            validation_failed("Invalid status. Must be one of: backlog, in_progress, review, complete"));
    }

    /// Count of tasks per status. All four keys are always reported.
    struct TaskStats {
        std::array<int64_t, 4> counts{};

        int64_t &operator[](TaskStatus status) { return counts[static_cast<size_t>(status)]; }
        int64_t operator[](TaskStatus status) const { return counts[static_cast<size_t>(status)]; }

        int64_t total() const { return counts[0] + counts[1] + counts[2] + counts[3]; }

        std::string toJson() const {
            std::string json = "{";
            bool first = true;
            for (auto status : allTaskStatuses()) {
                if (!first)
                    json += ",";
                first = false;
                json += "\"";
                json += toString(status);
                json += "\":" + std::to_string((*this)[status]);
            }
            json += "}";
            return json;
        }

        bool operator==(const TaskStats &other) const { return counts == other.counts; }
    };

} // namespace tasktrack::model
