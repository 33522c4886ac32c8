#include <tasktrack/tracker/project_store.hpp>

#include <cmath>
#include <cstdlib>
#include <optional>

#include <tasktrack/common/clock.hpp>
#include <tasktrack/common/error.hpp>
#include <tasktrack/common/id.hpp>
#include <tasktrack/common/log.hpp>
#include <tasktrack/common/text.hpp>

namespace tasktrack::tracker {

    using model::Project;
    using model::ProjectDetails;
    using model::ProjectStats;
    using model::ProjectSummary;
    using model::Task;
    using model::TaskStatus;
    using storage::Row;
    using TxMode = storage::SqliteStore::TxGuard::Mode;

    namespace {

        constexpr const char *COMPONENT = "tracker";

        constexpr const char *TASK_COLUMNS = "id, project_id, description, category, status, created_at, updated_at";

        dp::Result<Task, dp::Error> taskFromRow(const Row &row) {
            if (row.size() < 7)
                return dp::Result<Task, dp::Error>::err(corrupt_row("Task row has too few columns"));

            auto status = model::parseTaskStatus(row[4]);
            if (!status.is_ok()) {
                std::string msg = "Task " + row[0] + " has unknown status '" + row[4] + "'";
                return dp::Result<Task, dp::Error>::err(corrupt_row(dp::String(msg.c_str())));
            }

            Task task;
            task.id = row[0];
            task.project_id = row[1];
            task.description = row[2];
            task.category = row[3];
            task.status = status.value();
            task.created_at = row[5];
            task.updated_at = row[6];
            return dp::Result<Task, dp::Error>::ok(task);
        }

        dp::Result<void, dp::Error> beginFailed(storage::SqliteStore &store) {
            if (!store.isOpen())
                return dp::Result<void, dp::Error>::err(store_not_open());
            std::string msg = "Failed to begin transaction: " + store.lastErrorMessage();
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(msg.c_str())));
        }

        double roundTo2(double value) { return std::round(value * 100.0) / 100.0; }

    } // namespace

    ProjectStore::ProjectStore(storage::SqliteStore &store) : store_(store) {}

    dp::Result<void, dp::Error> ProjectStore::initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_.isOpen())
            return dp::Result<void, dp::Error>::err(store_not_open());

        auto applied = store_.applySchema(TrackerSchema{});
        if (!applied.is_ok()) {
            log::error(COMPONENT, log::concat("schema installation failed: ", errorMessage(applied.error())));
            return applied;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Projects
    // ===========================================

    dp::Result<std::vector<ProjectSummary>, dp::Error> ProjectStore::listProjects() {
        std::lock_guard<std::mutex> lock(mutex_);
        return listProjectsLocked();
    }

    dp::Result<std::vector<ProjectSummary>, dp::Error> ProjectStore::listProjectsLocked() {
        std::vector<ProjectSummary> projects;
        bool bad_count = false;

        auto queried = store_.executeQuery(
            "SELECT p.id, p.name, p.description, p.created_at, p.updated_at, COUNT(t.id) "
            "FROM projects p LEFT JOIN tasks t ON p.id = t.project_id "
            "GROUP BY p.id "
            "ORDER BY p.updated_at DESC, p.rowid DESC",
            {}, [&](const Row &row) {
                ProjectSummary summary;
                summary.id = row[0];
                summary.name = row[1];
                summary.description = row[2];
                summary.created_at = row[3];
                summary.updated_at = row[4];
                char *end = nullptr;
                summary.task_count = std::strtoll(row[5].c_str(), &end, 10);
                if (end == row[5].c_str())
                    bad_count = true;
                projects.push_back(std::move(summary));
            });

        if (!queried.is_ok())
            return dp::Result<std::vector<ProjectSummary>, dp::Error>::err(queried.error());
        if (bad_count)
            return dp::Result<std::vector<ProjectSummary>, dp::Error>::err(corrupt_row("Unreadable task count"));

        return dp::Result<std::vector<ProjectSummary>, dp::Error>::ok(std::move(projects));
    }

    dp::Result<Project, dp::Error> ProjectStore::createProject(const std::string &name, const std::string &description) {
        if (isBlank(name))
            return dp::Result<Project, dp::Error>::err(validation_failed("Project name cannot be empty"));
        std::string trimmed = trim(name);

        std::lock_guard<std::mutex> lock(mutex_);

        auto id = generateId();
        if (!id.is_ok())
            return dp::Result<Project, dp::Error>::err(id.error());

        Project project;
        project.id = id.value();
        project.name = trimmed;
        project.description = description;
        project.created_at = nowIso8601();
        project.updated_at = project.created_at;

        auto inserted = store_.executeUpdate(
            "INSERT INTO projects (id, name, description, created_at, updated_at) VALUES (?, ?, ?, ?, ?)",
            {project.id, project.name, project.description, project.created_at, project.updated_at});
        if (!inserted.is_ok())
            return dp::Result<Project, dp::Error>::err(inserted.error());

        log::debug(COMPONENT, log::concat("created project ", project.id));
        return dp::Result<Project, dp::Error>::ok(project);
    }

    dp::Result<ProjectDetails, dp::Error> ProjectStore::getProject(const std::string &project_id) {
        std::lock_guard<std::mutex> lock(mutex_);

        // Both reads see the same snapshot
        auto tx = store_.beginTransaction(TxMode::Deferred);
        if (!tx->isActive())
            return dp::Result<ProjectDetails, dp::Error>::err(beginFailed(store_).error());

        ProjectDetails details;
        bool found = false;
        auto project_query =
            store_.executeQuery("SELECT id, name, description, created_at, updated_at FROM projects WHERE id = ?",
                                {project_id}, [&](const Row &row) {
                                    details.id = row[0];
                                    details.name = row[1];
                                    details.description = row[2];
                                    details.created_at = row[3];
                                    details.updated_at = row[4];
                                    found = true;
                                });
        if (!project_query.is_ok())
            return dp::Result<ProjectDetails, dp::Error>::err(project_query.error());
        if (!found)
            return dp::Result<ProjectDetails, dp::Error>::err(project_not_found(project_id));

        std::optional<dp::Error> decode_error;
        auto task_query = store_.executeQuery(std::string("SELECT ") + TASK_COLUMNS +
                                                  " FROM tasks WHERE project_id = ? ORDER BY created_at DESC, rowid DESC",
                                              {project_id}, [&](const Row &row) {
                                                  if (decode_error)
                                                      return;
                                                  auto task = taskFromRow(row);
                                                  if (!task.is_ok()) {
                                                      decode_error = task.error();
                                                      return;
                                                  }
                                                  details.task_stats[task.value().status] += 1;
                                                  details.tasks.push_back(task.value());
                                              });
        if (!task_query.is_ok())
            return dp::Result<ProjectDetails, dp::Error>::err(task_query.error());
        if (decode_error)
            return dp::Result<ProjectDetails, dp::Error>::err(*decode_error);

        auto committed = tx->commit();
        if (!committed.is_ok())
            return dp::Result<ProjectDetails, dp::Error>::err(committed.error());

        return dp::Result<ProjectDetails, dp::Error>::ok(std::move(details));
    }

    dp::Result<bool, dp::Error> ProjectStore::deleteProject(const std::string &project_id) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto tx = store_.beginTransaction(TxMode::Immediate);
        if (!tx->isActive())
            return dp::Result<bool, dp::Error>::err(beginFailed(store_).error());

        // Explicit child delete keeps the cascade intact even on a connection
        // opened without foreign key enforcement
        auto tasks_deleted = store_.executeUpdate("DELETE FROM tasks WHERE project_id = ?", {project_id});
        if (!tasks_deleted.is_ok())
            return dp::Result<bool, dp::Error>::err(tasks_deleted.error());

        auto project_deleted = store_.executeUpdate("DELETE FROM projects WHERE id = ?", {project_id});
        if (!project_deleted.is_ok())
            return dp::Result<bool, dp::Error>::err(project_deleted.error());

        if (project_deleted.value() == 0) {
            // Nothing to delete; tasks_deleted is necessarily 0 as well
            tx->rollback();
            return dp::Result<bool, dp::Error>::ok(false);
        }

        auto committed = tx->commit();
        if (!committed.is_ok())
            return dp::Result<bool, dp::Error>::err(committed.error());

        log::debug(COMPONENT,
                   log::concat("deleted project ", project_id, " with ", tasks_deleted.value(), " tasks"));
        return dp::Result<bool, dp::Error>::ok(true);
    }

    // ===========================================
    // Tasks
    // ===========================================

    dp::Result<void, dp::Error> ProjectStore::touchProject(const std::string &project_id, const std::string &now) {
        // MAX keeps updated_at monotonic if the wall clock steps backwards
        auto touched =
            store_.executeUpdate("UPDATE projects SET updated_at = MAX(updated_at, ?) WHERE id = ?", {now, project_id});
        if (!touched.is_ok())
            return dp::Result<void, dp::Error>::err(touched.error());
        if (touched.value() != 1)
            return dp::Result<void, dp::Error>::err(project_not_found(project_id));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Task, dp::Error> ProjectStore::createTask(const std::string &project_id, const std::string &description,
                                                         const std::string &category) {
        if (isBlank(description))
            return dp::Result<Task, dp::Error>::err(validation_failed("Task description cannot be empty"));
        if (isBlank(category))
            return dp::Result<Task, dp::Error>::err(validation_failed("Task category cannot be empty"));

        std::string clean_description = trim(description);
        std::string clean_category = trim(category);

        std::lock_guard<std::mutex> lock(mutex_);

        auto tx = store_.beginTransaction(TxMode::Immediate);
        if (!tx->isActive())
            return dp::Result<Task, dp::Error>::err(beginFailed(store_).error());

        bool exists = false;
        auto probe = store_.executeQuery("SELECT 1 FROM projects WHERE id = ?", {project_id},
                                         [&](const Row &) { exists = true; });
        if (!probe.is_ok())
            return dp::Result<Task, dp::Error>::err(probe.error());
        if (!exists)
            return dp::Result<Task, dp::Error>::err(project_not_found(project_id));

        auto id = generateId();
        if (!id.is_ok())
            return dp::Result<Task, dp::Error>::err(id.error());

        Task task;
        task.id = id.value();
        task.project_id = project_id;
        task.description = clean_description;
        task.category = clean_category;
        task.status = TaskStatus::Backlog;
        task.created_at = nowIso8601();
        task.updated_at = task.created_at;

        auto inserted = store_.executeUpdate(
            std::string("INSERT INTO tasks (") + TASK_COLUMNS + ") VALUES (?, ?, ?, ?, ?, ?, ?)",
            {task.id, task.project_id, task.description, task.category, std::string(model::toString(task.status)),
             task.created_at, task.updated_at});
        if (!inserted.is_ok())
            return dp::Result<Task, dp::Error>::err(inserted.error());

        auto touched = touchProject(project_id, task.created_at);
        if (!touched.is_ok())
            return dp::Result<Task, dp::Error>::err(touched.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return dp::Result<Task, dp::Error>::err(committed.error());

        log::debug(COMPONENT, log::concat("created task ", task.id, " in project ", project_id));
        return dp::Result<Task, dp::Error>::ok(task);
    }

    dp::Result<Task, dp::Error> ProjectStore::getTask(const std::string &task_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return getTaskLocked(task_id);
    }

    dp::Result<Task, dp::Error> ProjectStore::getTaskLocked(const std::string &task_id) {
        std::vector<Row> rows;
        auto queried = store_.executeQuery(std::string("SELECT ") + TASK_COLUMNS + " FROM tasks WHERE id = ?",
                                           {task_id}, [&](const Row &row) { rows.push_back(row); });
        if (!queried.is_ok())
            return dp::Result<Task, dp::Error>::err(queried.error());
        if (rows.empty())
            return dp::Result<Task, dp::Error>::err(task_not_found(task_id));
        return taskFromRow(rows.front());
    }

    dp::Result<std::string, dp::Error> ProjectStore::taskProjectLocked(const std::string &task_id) {
        // Owner lookup only; the stored status is not decoded
        std::string project_id;
        bool found = false;
        auto queried = store_.executeQuery("SELECT project_id FROM tasks WHERE id = ?", {task_id}, [&](const Row &row) {
            project_id = row[0];
            found = true;
        });
        if (!queried.is_ok())
            return dp::Result<std::string, dp::Error>::err(queried.error());
        if (!found)
            return dp::Result<std::string, dp::Error>::err(task_not_found(task_id));
        return dp::Result<std::string, dp::Error>::ok(project_id);
    }

    dp::Result<Task, dp::Error> ProjectStore::updateTaskStatus(const std::string &task_id, TaskStatus status) {
        if (!model::isValid(status)) {
            return dp::Result<Task, dp::Error>::err(
                validation_failed("Invalid status. Must be one of: backlog, in_progress, review, complete"));
        }

        std::lock_guard<std::mutex> lock(mutex_);

        auto tx = store_.beginTransaction(TxMode::Immediate);
        if (!tx->isActive())
            return dp::Result<Task, dp::Error>::err(beginFailed(store_).error());

        auto owner = taskProjectLocked(task_id);
        if (!owner.is_ok())
            return dp::Result<Task, dp::Error>::err(owner.error());

        const std::string now = nowIso8601();
        auto updated = store_.executeUpdate("UPDATE tasks SET status = ?, updated_at = ? WHERE id = ?",
                                            {std::string(model::toString(status)), now, task_id});
        if (!updated.is_ok())
            return dp::Result<Task, dp::Error>::err(updated.error());

        auto touched = touchProject(owner.value(), now);
        if (!touched.is_ok())
            return dp::Result<Task, dp::Error>::err(touched.error());

        auto reread = getTaskLocked(task_id);
        if (!reread.is_ok())
            return reread;

        auto committed = tx->commit();
        if (!committed.is_ok())
            return dp::Result<Task, dp::Error>::err(committed.error());

        log::debug(COMPONENT, log::concat("task ", task_id, " -> ", model::toString(status)));
        return reread;
    }

    dp::Result<Task, dp::Error> ProjectStore::updateTaskStatus(const std::string &task_id, const std::string &status) {
        auto parsed = model::parseTaskStatus(status);
        if (!parsed.is_ok())
            return dp::Result<Task, dp::Error>::err(parsed.error());
        return updateTaskStatus(task_id, parsed.value());
    }

    dp::Result<bool, dp::Error> ProjectStore::deleteTask(const std::string &task_id) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto tx = store_.beginTransaction(TxMode::Immediate);
        if (!tx->isActive())
            return dp::Result<bool, dp::Error>::err(beginFailed(store_).error());

        auto owner = taskProjectLocked(task_id);
        if (!owner.is_ok()) {
            if (owner.error().code == ERR_TASK_NOT_FOUND)
                return dp::Result<bool, dp::Error>::ok(false);
            return dp::Result<bool, dp::Error>::err(owner.error());
        }

        auto deleted = store_.executeUpdate("DELETE FROM tasks WHERE id = ?", {task_id});
        if (!deleted.is_ok())
            return dp::Result<bool, dp::Error>::err(deleted.error());

        auto touched = touchProject(owner.value(), nowIso8601());
        if (!touched.is_ok())
            return dp::Result<bool, dp::Error>::err(touched.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return dp::Result<bool, dp::Error>::err(committed.error());

        log::debug(COMPONENT, log::concat("deleted task ", task_id));
        return dp::Result<bool, dp::Error>::ok(true);
    }

    // ===========================================
    // Statistics
    // ===========================================

    dp::Result<ProjectStats, dp::Error> ProjectStore::getStats() {
        std::lock_guard<std::mutex> lock(mutex_);

        auto listed = listProjectsLocked();
        if (!listed.is_ok())
            return dp::Result<ProjectStats, dp::Error>::err(listed.error());

        ProjectStats stats;
        for (const auto &project : listed.value()) {
            stats.total_projects += 1;
            stats.total_tasks += project.task_count;
            if (project.task_count > 0)
                stats.projects_with_tasks += 1;
            else
                stats.empty_projects += 1;
        }

        if (stats.total_projects > 0) {
            stats.average_tasks_per_project =
                roundTo2(static_cast<double>(stats.total_tasks) / static_cast<double>(stats.total_projects));
        }

        return dp::Result<ProjectStats, dp::Error>::ok(stats);
    }

} // namespace tasktrack::tracker
