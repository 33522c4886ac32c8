#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <string>
#include <vector>

#include <tasktrack/model/project.hpp>
#include <tasktrack/model/status.hpp>
#include <tasktrack/model/task.hpp>
#include <tasktrack/storage/sqlite_store.hpp>

namespace tasktrack::tracker {

    // ===========================================
    // Schema for the projects/tasks table pair
    // ===========================================

    class TrackerSchema : public storage::ISchemaExtension {
      public:
        static constexpr int32_t VERSION = 1;

        int32_t getSchemaVersion() const override { return VERSION; }

        std::vector<std::string> getCreateTableStatements() const override {
            return {
                R"(CREATE TABLE IF NOT EXISTS projects (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL,
                    description TEXT,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                ))",
                R"(CREATE TABLE IF NOT EXISTS tasks (
                    id TEXT PRIMARY KEY,
                    project_id TEXT NOT NULL,
                    description TEXT NOT NULL,
                    category TEXT NOT NULL,
                    status TEXT NOT NULL CHECK (status IN ('backlog', 'in_progress', 'review', 'complete')),
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL,
                    FOREIGN KEY (project_id) REFERENCES projects (id) ON DELETE CASCADE
                ))",
            };
        }

        std::vector<std::string> getCreateIndexStatements() const override {
            return {
                "CREATE INDEX IF NOT EXISTS idx_tasks_project ON tasks(project_id)",
                "CREATE INDEX IF NOT EXISTS idx_projects_updated_at ON projects(updated_at)",
            };
        }
    };

    // ===========================================
    // ProjectStore - transactional project/task operations
    // ===========================================

    /// Owns the project/task invariants on top of an open SqliteStore.
    /// Every multi-row write runs in one immediate transaction; a failed step
    /// rolls the whole operation back. Calls are serialized per instance.
    class ProjectStore {
      public:
        /// The SqliteStore must stay open for the lifetime of this object
        explicit ProjectStore(storage::SqliteStore &store);

        ProjectStore(const ProjectStore &) = delete;
        ProjectStore &operator=(const ProjectStore &) = delete;

        /// Install the schema (idempotent)
        dp::Result<void, dp::Error> initialize();

        // ===========================================
        // Projects
        // ===========================================

        /// All projects, most recently active first, each with its task count
        dp::Result<std::vector<model::ProjectSummary>, dp::Error> listProjects();

        /// @param name Must contain a non-whitespace character; stored trimmed
        /// @param description Free text, may be empty
        dp::Result<model::Project, dp::Error> createProject(const std::string &name,
                                                            const std::string &description = "");

        /// Project with its tasks (newest first) and per-status counts
        dp::Result<model::ProjectDetails, dp::Error> getProject(const std::string &project_id);

        /// Deletes the project and all of its tasks
        /// @return false if no project had that id
        dp::Result<bool, dp::Error> deleteProject(const std::string &project_id);

        // ===========================================
        // Tasks
        // ===========================================

        /// New backlog task; bumps the parent's updated_at in the same transaction
        dp::Result<model::Task, dp::Error> createTask(const std::string &project_id, const std::string &description,
                                                      const std::string &category);

        dp::Result<model::Task, dp::Error> getTask(const std::string &task_id);

        dp::Result<model::Task, dp::Error> updateTaskStatus(const std::string &task_id, model::TaskStatus status);

        /// Parses `status` first; unrecognized text fails before any row is read
        dp::Result<model::Task, dp::Error> updateTaskStatus(const std::string &task_id, const std::string &status);

        /// @return false if no task had that id (nothing is modified)
        dp::Result<bool, dp::Error> deleteTask(const std::string &task_id);

        // ===========================================
        // Statistics
        // ===========================================

        /// Recomputed from listProjects() on every call
        dp::Result<model::ProjectStats, dp::Error> getStats();

      private:
        storage::SqliteStore &store_;
        std::mutex mutex_;

        dp::Result<std::vector<model::ProjectSummary>, dp::Error> listProjectsLocked();
        dp::Result<model::Task, dp::Error> getTaskLocked(const std::string &task_id);
        dp::Result<std::string, dp::Error> taskProjectLocked(const std::string &task_id);
        dp::Result<void, dp::Error> touchProject(const std::string &project_id, const std::string &now);
    };

} // namespace tasktrack::tracker
