#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace tasktrack {

    // ===========================================
    // Tasktrack error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_VALIDATION = 100;
    constexpr dp::u32 ERR_PROJECT_NOT_FOUND = 101;
    constexpr dp::u32 ERR_TASK_NOT_FOUND = 102;
    constexpr dp::u32 ERR_STORE_NOT_OPEN = 103;
    constexpr dp::u32 ERR_STORAGE = 104;
    constexpr dp::u32 ERR_CORRUPT_ROW = 105;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error validation_failed(const dp::String &msg = "Validation failed") {
        return dp::Error{ERR_VALIDATION, msg};
    }

    inline dp::Error project_not_found(const std::string &project_id) {
        std::string msg = "Project with ID " + project_id + " not found";
        return dp::Error{ERR_PROJECT_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error task_not_found(const std::string &task_id) {
        std::string msg = "Task with ID " + task_id + " not found";
        return dp::Error{ERR_TASK_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error store_not_open(const dp::String &msg = "Store not open") {
        return dp::Error{ERR_STORE_NOT_OPEN, msg};
    }

    inline dp::Error storage_failed(const dp::String &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE, msg};
    }

    inline dp::Error corrupt_row(const dp::String &msg = "Stored row is invalid") {
        return dp::Error{ERR_CORRUPT_ROW, msg};
    }

    // ===========================================
    // Classification for callers mapping errors onto their protocol
    // ===========================================

    inline bool isValidationError(const dp::Error &err) { return err.code == ERR_VALIDATION; }

    inline bool isNotFound(const dp::Error &err) {
        return err.code == ERR_PROJECT_NOT_FOUND || err.code == ERR_TASK_NOT_FOUND;
    }

    inline std::string errorMessage(const dp::Error &err) { return std::string(err.message.c_str()); }

} // namespace tasktrack
