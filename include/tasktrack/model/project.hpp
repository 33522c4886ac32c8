#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include <tasktrack/common/text.hpp>
#include <tasktrack/model/status.hpp>
#include <tasktrack/model/task.hpp>

namespace tasktrack::model {

    struct Project {
        std::string id;
        std::string name;
        std::string description;
        std::string created_at;
        std::string updated_at;

        std::string toJson() const {
            std::string json = "{";
            json += "\"id\":" + jsonQuote(id) + ",";
            json += "\"name\":" + jsonQuote(name) + ",";
            json += "\"description\":" + jsonQuote(description) + ",";
            json += "\"created_at\":" + jsonQuote(created_at) + ",";
            json += "\"updated_at\":" + jsonQuote(updated_at);
            json += "}";
            return json;
        }
    };

    /// Listing view: a project plus the number of tasks it owns
    struct ProjectSummary {
        std::string id;
        std::string name;
        std::string description;
        std::string created_at;
        std::string updated_at;
        int64_t task_count = 0;

        std::string toJson() const {
            std::string json = "{";
            json += "\"id\":" + jsonQuote(id) + ",";
            json += "\"name\":" + jsonQuote(name) + ",";
            json += "\"description\":" + jsonQuote(description) + ",";
            json += "\"task_count\":" + std::to_string(task_count) + ",";
            json += "\"created_at\":" + jsonQuote(created_at) + ",";
            json += "\"updated_at\":" + jsonQuote(updated_at);
            json += "}";
            return json;
        }
    };

    /// Full view: a project, its tasks (newest first) and per-status counts
    struct ProjectDetails {
        std::string id;
        std::string name;
        std::string description;
        std::string created_at;
        std::string updated_at;
        std::vector<Task> tasks;
        TaskStats task_stats;

        std::string toJson() const {
            std::string json = "{";
            json += "\"id\":" + jsonQuote(id) + ",";
            json += "\"name\":" + jsonQuote(name) + ",";
            json += "\"description\":" + jsonQuote(description) + ",";
            json += "\"created_at\":" + jsonQuote(created_at) + ",";
            json += "\"updated_at\":" + jsonQuote(updated_at) + ",";
            json += "\"tasks\":[";
            for (size_t i = 0; i < tasks.size(); ++i) {
                if (i > 0)
                    json += ",";
                json += tasks[i].toJson();
            }
            json += "],";
            json += "\"task_stats\":" + task_stats.toJson();
            json += "}";
            return json;
        }
    };

    /// Aggregate figures across all projects
    struct ProjectStats {
        int64_t total_projects = 0;
        int64_t total_tasks = 0;
        int64_t projects_with_tasks = 0;
        int64_t empty_projects = 0;
        double average_tasks_per_project = 0.0;

        std::string toJson() const {
            char avg[32];
            std::snprintf(avg, sizeof(avg), "%.2f", average_tasks_per_project);
            std::string json = "{";
            json += "\"total_projects\":" + std::to_string(total_projects) + ",";
            json += "\"total_tasks\":" + std::to_string(total_tasks) + ",";
            json += "\"projects_with_tasks\":" + std::to_string(projects_with_tasks) + ",";
            json += "\"empty_projects\":" + std::to_string(empty_projects) + ",";
            json += "\"average_tasks_per_project\":" + std::string(avg);
            json += "}";
            return json;
        }
    };

} // namespace tasktrack::model
