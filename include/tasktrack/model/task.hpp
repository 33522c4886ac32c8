#pragma once

#include <string>

#include <tasktrack/common/text.hpp>
#include <tasktrack/model/status.hpp>

namespace tasktrack::model {

    /// A unit of work owned by exactly one project
    struct Task {
        std::string id;
        std::string project_id;
        std::string description;
        std::string category;
        TaskStatus status = TaskStatus::Backlog;
        std::string created_at;
        std::string updated_at;

        std::string toJson() const {
            std::string json = "{";
            json += "\"id\":" + jsonQuote(id) + ",";
            json += "\"project_id\":" + jsonQuote(project_id) + ",";
            json += "\"description\":" + jsonQuote(description) + ",";
            json += "\"category\":" + jsonQuote(category) + ",";
            json += "\"status\":" + jsonQuote(toString(status)) + ",";
            json += "\"created_at\":" + jsonQuote(created_at) + ",";
            json += "\"updated_at\":" + jsonQuote(updated_at);
            json += "}";
            return json;
        }
    };

} // namespace tasktrack::model
