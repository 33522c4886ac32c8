#include <doctest/doctest.h>

#include "scratch_db.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <tasktrack.hpp>

using namespace tasktrack;
using namespace tasktrack::model;
using namespace std::chrono_literals;

TEST_SUITE("End-to-end") {

    TEST_CASE("Project lifecycle walkthrough") {
        TrackerDB db("test_e2e_walkthrough");
        REQUIRE(db.opened);

        auto web = db.projects.createProject("Web Redesign", "Complete website overhaul");
        std::this_thread::sleep_for(2ms);
        auto mobile = db.projects.createProject("Mobile App", "New mobile application");
        REQUIRE(web.is_ok());
        REQUIRE(mobile.is_ok());

        std::this_thread::sleep_for(2ms);
        auto design = db.projects.createTask(web.value().id, "Design homepage mockup", "ux");
        std::this_thread::sleep_for(2ms);
        auto nav = db.projects.createTask(web.value().id, "Implement responsive navigation", "frontend");
        std::this_thread::sleep_for(2ms);
        auto tests = db.projects.createTask(web.value().id, "Write unit tests", "testing");
        REQUIRE(design.is_ok());
        REQUIRE(nav.is_ok());
        REQUIRE(tests.is_ok());

        // Web Redesign saw the latest activity
        auto listed = db.projects.listProjects();
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 2);
        CHECK(listed.value()[0].name == "Web Redesign");
        CHECK(listed.value()[0].task_count == 3);
        CHECK(listed.value()[1].task_count == 0);

        REQUIRE(db.projects.updateTaskStatus(design.value().id, TaskStatus::InProgress).is_ok());
        REQUIRE(db.projects.updateTaskStatus(nav.value().id, "review").is_ok());
        CHECK_FALSE(db.projects.updateTaskStatus(nav.value().id, "done").is_ok());

        auto details = db.projects.getProject(web.value().id);
        REQUIRE(details.is_ok());
        CHECK(details.value().tasks.size() == 3);
        CHECK(details.value().tasks[0].description == "Write unit tests");
        CHECK(details.value().task_stats.toJson() == R"({"backlog":1,"in_progress":1,"review":1,"complete":0})");

        auto removed = db.projects.deleteTask(tests.value().id);
        REQUIRE(removed.is_ok());
        CHECK(removed.value());

        auto dropped = db.projects.deleteProject(mobile.value().id);
        REQUIRE(dropped.is_ok());
        CHECK(dropped.value());

        auto remaining = db.projects.listProjects();
        REQUIRE(remaining.is_ok());
        REQUIRE(remaining.value().size() == 1);
        CHECK(remaining.value()[0].task_count == 2);

        auto stats = db.projects.getStats();
        REQUIRE(stats.is_ok());
        CHECK(stats.value().toJson() == R"({"total_projects":1,"total_tasks":2,"projects_with_tasks":1,)"
                                        R"("empty_projects":0,"average_tasks_per_project":2.00})");

        CHECK(db.store.quickCheck());
    }

    TEST_CASE("Data survives reopening the file") {
        ScratchDB db("test_e2e_reopen");
        std::string project_id;
        std::string task_id;

        {
            REQUIRE(db.store.open(db.path).is_ok());
            tracker::ProjectStore projects(db.store);
            REQUIRE(projects.initialize().is_ok());

            auto p = projects.createProject("Persistent", "Kept on disk");
            REQUIRE(p.is_ok());
            auto t = projects.createTask(p.value().id, "Survive restart", "ops");
            REQUIRE(t.is_ok());
            REQUIRE(projects.updateTaskStatus(t.value().id, TaskStatus::Complete).is_ok());

            project_id = p.value().id;
            task_id = t.value().id;
            db.store.close();
        }

        REQUIRE(db.store.open(db.path).is_ok());
        tracker::ProjectStore projects(db.store);
        REQUIRE(projects.initialize().is_ok());

        auto details = projects.getProject(project_id);
        REQUIRE(details.is_ok());
        CHECK(details.value().name == "Persistent");
        CHECK(details.value().description == "Kept on disk");
        REQUIRE(details.value().tasks.size() == 1);
        CHECK(details.value().tasks[0].id == task_id);
        CHECK(details.value().tasks[0].status == TaskStatus::Complete);
        CHECK(details.value().task_stats[TaskStatus::Complete] == 1);
    }

    TEST_CASE("Two stores on the same file see each other's writes") {
        ScratchDB db("test_e2e_shared");
        REQUIRE(db.store.open(db.path).is_ok());
        tracker::ProjectStore writer(db.store);
        REQUIRE(writer.initialize().is_ok());

        storage::SqliteStore second;
        REQUIRE(second.open(db.path).is_ok());
        tracker::ProjectStore reader(second);
        REQUIRE(reader.initialize().is_ok());

        auto p = writer.createProject("Shared");
        REQUIRE(p.is_ok());

        auto seen = reader.getProject(p.value().id);
        REQUIRE(seen.is_ok());
        CHECK(seen.value().name == "Shared");

        REQUIRE(reader.createTask(p.value().id, "From the other side", "sync").is_ok());
        auto listed = writer.listProjects();
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 1);
        CHECK(listed.value()[0].task_count == 1);

        second.close();
    }

    TEST_CASE("Concurrent writers on one store") {
        TrackerDB db("test_e2e_concurrent");
        REQUIRE(db.opened);

        auto p = db.projects.createProject("Busy");
        REQUIRE(p.is_ok());
        const std::string pid = p.value().id;

        constexpr int THREADS = 4;
        constexpr int PER_THREAD = 10;
        std::vector<std::thread> workers;
        std::atomic<int> failures{0};
        for (int i = 0; i < THREADS; ++i) {
            workers.emplace_back([&, i]() {
                for (int j = 0; j < PER_THREAD; ++j) {
                    auto t = db.projects.createTask(pid, "task " + std::to_string(i) + "-" + std::to_string(j), "load");
                    if (!t.is_ok())
                        failures++;
                }
            });
        }
        for (auto &w : workers)
            w.join();

        CHECK(failures.load() == 0);
        auto details = db.projects.getProject(pid);
        REQUIRE(details.is_ok());
        CHECK(details.value().tasks.size() == THREADS * PER_THREAD);
        CHECK(details.value().task_stats[TaskStatus::Backlog] == THREADS * PER_THREAD);
    }
}
