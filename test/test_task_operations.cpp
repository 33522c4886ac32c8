#include <doctest/doctest.h>

#include "scratch_db.hpp"

#include <chrono>
#include <thread>

#include <tasktrack/common/error.hpp>
#include <tasktrack/common/id.hpp>

using namespace tasktrack;
using namespace tasktrack::model;
using namespace std::chrono_literals;

namespace {

    std::string projectUpdatedAt(tracker::ProjectStore &projects, const std::string &id) {
        auto r = projects.getProject(id);
        return r.is_ok() ? r.value().updated_at : std::string();
    }

} // namespace

// ===========================================
// Creating tasks
// ===========================================

TEST_CASE("Create task") {
    TrackerDB db("test_create_task");
    REQUIRE(db.opened);

    auto project = db.projects.createProject("Parent");
    REQUIRE(project.is_ok());
    const std::string pid = project.value().id;

    SUBCASE("New task starts in backlog") {
        auto r = db.projects.createTask(pid, "Design homepage mockup", "ux");
        REQUIRE(r.is_ok());
        const auto &t = r.value();
        CHECK(isWellFormedId(t.id));
        CHECK(t.project_id == pid);
        CHECK(t.description == "Design homepage mockup");
        CHECK(t.category == "ux");
        CHECK(t.status == TaskStatus::Backlog);
        CHECK(t.created_at == t.updated_at);
    }

    SUBCASE("Parent updated_at moves with the task") {
        std::this_thread::sleep_for(2ms);
        auto r = db.projects.createTask(pid, "Bump", "x");
        REQUIRE(r.is_ok());
        CHECK(projectUpdatedAt(db.projects, pid) == r.value().created_at);
        CHECK(projectUpdatedAt(db.projects, pid) > project.value().updated_at);
    }

    SUBCASE("Fields are stored trimmed") {
        auto r = db.projects.createTask(pid, "  Write tests \n", "\tqa ");
        REQUIRE(r.is_ok());
        auto fetched = db.projects.getTask(r.value().id);
        REQUIRE(fetched.is_ok());
        CHECK(fetched.value().description == "Write tests");
        CHECK(fetched.value().category == "qa");
    }

    SUBCASE("Blank description or category is rejected") {
        auto no_desc = db.projects.createTask(pid, "  ", "ux");
        REQUIRE_FALSE(no_desc.is_ok());
        CHECK(no_desc.error().code == ERR_VALIDATION);

        auto no_cat = db.projects.createTask(pid, "Something", "");
        REQUIRE_FALSE(no_cat.is_ok());
        CHECK(no_cat.error().code == ERR_VALIDATION);

        CHECK(db.count("tasks") == 0);
        CHECK(projectUpdatedAt(db.projects, pid) == project.value().updated_at);
    }

    SUBCASE("Unknown project is NotFound and creates no row") {
        auto r = db.projects.createTask("no-such-project", "Orphan", "x");
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ERR_PROJECT_NOT_FOUND);
        CHECK(db.count("tasks") == 0);
    }

    SUBCASE("Validation runs before the project lookup") {
        auto r = db.projects.createTask("no-such-project", "", "x");
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ERR_VALIDATION);
    }
}

// ===========================================
// Status updates
// ===========================================

TEST_CASE("Update task status") {
    TrackerDB db("test_update_status");
    REQUIRE(db.opened);

    auto project = db.projects.createProject("Parent");
    REQUIRE(project.is_ok());
    auto task = db.projects.createTask(project.value().id, "Move me", "x");
    auto bystander = db.projects.createTask(project.value().id, "Leave me", "x");
    REQUIRE(task.is_ok());
    REQUIRE(bystander.is_ok());

    SUBCASE("Any transition is allowed") {
        for (auto status : {TaskStatus::Complete, TaskStatus::Backlog, TaskStatus::Review, TaskStatus::InProgress}) {
            auto r = db.projects.updateTaskStatus(task.value().id, status);
            REQUIRE(r.is_ok());
            CHECK(r.value().status == status);
        }
    }

    SUBCASE("Timestamps move forward and the parent follows") {
        std::this_thread::sleep_for(2ms);
        auto r = db.projects.updateTaskStatus(task.value().id, "in_progress");
        REQUIRE(r.is_ok());
        CHECK(r.value().status == TaskStatus::InProgress);
        CHECK(r.value().created_at == task.value().created_at);
        CHECK(r.value().updated_at > task.value().updated_at);
        CHECK(projectUpdatedAt(db.projects, project.value().id) == r.value().updated_at);
    }

    SUBCASE("Setting the same status still refreshes updated_at") {
        std::this_thread::sleep_for(2ms);
        auto r = db.projects.updateTaskStatus(task.value().id, TaskStatus::Backlog);
        REQUIRE(r.is_ok());
        CHECK(r.value().updated_at > task.value().updated_at);
    }

    SUBCASE("Other tasks are untouched") {
        REQUIRE(db.projects.updateTaskStatus(task.value().id, TaskStatus::Complete).is_ok());
        auto other = db.projects.getTask(bystander.value().id);
        REQUIRE(other.is_ok());
        CHECK(other.value().status == TaskStatus::Backlog);
        CHECK(other.value().updated_at == bystander.value().updated_at);
    }

    SUBCASE("Unknown status text leaves the task unchanged") {
        const std::string before = projectUpdatedAt(db.projects, project.value().id);
        auto r = db.projects.updateTaskStatus(task.value().id, "done");
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ERR_VALIDATION);

        auto fetched = db.projects.getTask(task.value().id);
        REQUIRE(fetched.is_ok());
        CHECK(fetched.value().status == TaskStatus::Backlog);
        CHECK(fetched.value().updated_at == task.value().updated_at);
        CHECK(projectUpdatedAt(db.projects, project.value().id) == before);
    }

    SUBCASE("Out-of-range enum is a validation error") {
        auto r = db.projects.updateTaskStatus(task.value().id, static_cast<TaskStatus>(9));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ERR_VALIDATION);
    }

    SUBCASE("Unknown task is NotFound") {
        auto r = db.projects.updateTaskStatus("missing-task", TaskStatus::Review);
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ERR_TASK_NOT_FOUND);
        CHECK(errorMessage(r.error()) == "Task with ID missing-task not found");
    }

    SUBCASE("Invalid text wins over an unknown task") {
        auto r = db.projects.updateTaskStatus("missing-task", "finished");
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ERR_VALIDATION);
    }
}

// ===========================================
// Deleting tasks
// ===========================================

TEST_CASE("Delete task") {
    TrackerDB db("test_delete_task");
    REQUIRE(db.opened);

    auto project = db.projects.createProject("Parent");
    REQUIRE(project.is_ok());
    auto task = db.projects.createTask(project.value().id, "Remove me", "x");
    REQUIRE(task.is_ok());

    SUBCASE("Removes the row and bumps the parent") {
        const std::string before = projectUpdatedAt(db.projects, project.value().id);
        std::this_thread::sleep_for(2ms);

        auto r = db.projects.deleteTask(task.value().id);
        REQUIRE(r.is_ok());
        CHECK(r.value());
        CHECK(db.count("tasks") == 0);
        CHECK(projectUpdatedAt(db.projects, project.value().id) > before);

        auto gone = db.projects.getTask(task.value().id);
        REQUIRE_FALSE(gone.is_ok());
        CHECK(gone.error().code == ERR_TASK_NOT_FOUND);
    }

    SUBCASE("Unknown id returns false and touches nothing") {
        const std::string before = projectUpdatedAt(db.projects, project.value().id);
        std::this_thread::sleep_for(2ms);

        auto r = db.projects.deleteTask("missing");
        REQUIRE(r.is_ok());
        CHECK_FALSE(r.value());
        CHECK(db.count("tasks") == 1);
        CHECK(projectUpdatedAt(db.projects, project.value().id) == before);
    }
}

// ===========================================
// Integrity
// ===========================================

TEST_CASE("Referential integrity") {
    TrackerDB db("test_integrity");
    REQUIRE(db.opened);

    SUBCASE("Foreign keys reject orphan rows written directly") {
        auto r = db.store.executeUpdate("INSERT INTO tasks (id, project_id, description, category, status, "
                                        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?)",
                                        {"t", "ghost", "d", "c", "backlog", "x", "x"});
        CHECK_FALSE(r.is_ok());
        CHECK(db.count("tasks") == 0);
    }

    SUBCASE("Status column rejects unknown values") {
        auto p = db.projects.createProject("Checked");
        REQUIRE(p.is_ok());
        auto r = db.store.executeUpdate("INSERT INTO tasks (id, project_id, description, category, status, "
                                        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?)",
                                        {"t", p.value().id, "d", "c", "done", "x", "x"});
        CHECK_FALSE(r.is_ok());
    }

    SUBCASE("A failed step rolls back the whole write") {
        auto p = db.projects.createProject("Atomic");
        REQUIRE(p.is_ok());

        // A trigger that aborts the parent bump makes the task insert the only completed step
        REQUIRE(db.store
                    .executeSql("CREATE TRIGGER block_bump BEFORE UPDATE OF updated_at ON projects "
                                "BEGIN SELECT RAISE(ABORT, 'blocked'); END")
                    .is_ok());

        auto r = db.projects.createTask(p.value().id, "Never lands", "x");
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ERR_STORAGE);
        CHECK(db.count("tasks") == 0);

        REQUIRE(db.store.executeSql("DROP TRIGGER block_bump").is_ok());
        CHECK(db.projects.createTask(p.value().id, "Lands", "x").is_ok());
        CHECK(db.count("tasks") == 1);
    }
}

TEST_CASE("Corrupt rows surface as errors") {
    ScratchDB db("test_corrupt_rows");
    REQUIRE(db.store.open(db.path).is_ok());

    // A database created before the status constraint existed
    REQUIRE(db.store
                .executeSql("CREATE TABLE projects (id TEXT PRIMARY KEY, name TEXT NOT NULL, description TEXT, "
                            "created_at TEXT NOT NULL, updated_at TEXT NOT NULL);"
                            "CREATE TABLE tasks (id TEXT PRIMARY KEY, project_id TEXT NOT NULL, "
                            "description TEXT NOT NULL, category TEXT NOT NULL, status TEXT NOT NULL, "
                            "created_at TEXT NOT NULL, updated_at TEXT NOT NULL);"
                            "INSERT INTO projects VALUES ('p', 'Legacy', '', 'a', 'a');"
                            "INSERT INTO tasks VALUES ('t', 'p', 'Old', 'misc', 'done', 'a', 'a');")
                .is_ok());

    tracker::ProjectStore projects(db.store);

    SUBCASE("Reads report the bad row") {
        auto details = projects.getProject("p");
        REQUIRE_FALSE(details.is_ok());
        CHECK(details.error().code == ERR_CORRUPT_ROW);

        auto task = projects.getTask("t");
        REQUIRE_FALSE(task.is_ok());
        CHECK(task.error().code == ERR_CORRUPT_ROW);

        // Listing does not decode tasks, so it still works
        auto listed = projects.listProjects();
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 1);
        CHECK(listed.value()[0].task_count == 1);
    }

    SUBCASE("Setting a valid status repairs the row") {
        auto repaired = projects.updateTaskStatus("t", TaskStatus::Complete);
        REQUIRE(repaired.is_ok());
        CHECK(repaired.value().status == TaskStatus::Complete);
        CHECK(repaired.value().project_id == "p");

        auto details = projects.getProject("p");
        REQUIRE(details.is_ok());
        REQUIRE(details.value().tasks.size() == 1);
        CHECK(details.value().task_stats[TaskStatus::Complete] == 1);

        auto removed = projects.deleteTask("t");
        REQUIRE(removed.is_ok());
        CHECK(removed.value());
    }

    SUBCASE("The row can be deleted without repair") {
        auto removed = projects.deleteTask("t");
        REQUIRE(removed.is_ok());
        CHECK(removed.value());
        CHECK(db.count("tasks") == 0);

        auto details = projects.getProject("p");
        REQUIRE(details.is_ok());
        CHECK(details.value().tasks.empty());
    }
}
