/**
 * Example: walking a project through its lifecycle
 *
 * Usage: tasktrack_demo [database path]
 *   The path falls back to $TASKTRACK_DB, then "projects.db".
 *   Log verbosity comes from $TASKTRACK_LOG_LEVEL (trace|debug|info|warn|error|off).
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include <tasktrack.hpp>

using namespace tasktrack;

namespace {

    void fail(const char *step, const dp::Error &err) {
        std::cerr << "   " << step << " failed: " << err.message.c_str() << std::endl;
    }

    void printProjects(tracker::ProjectStore &projects) {
        auto listed = projects.listProjects();
        if (!listed.is_ok()) {
            fail("listProjects", listed.error());
            return;
        }
        for (const auto &p : listed.value()) {
            std::cout << "   - " << p.name << ": " << p.task_count << " tasks" << std::endl;
        }
    }

} // namespace

int main(int argc, char *argv[]) {
    std::string db_path = "projects.db";
    if (argc > 1) {
        db_path = argv[1];
    } else if (const char *env = std::getenv("TASKTRACK_DB")) {
        db_path = env;
    }

    if (const char *level = std::getenv("TASKTRACK_LOG_LEVEL")) {
        log::setLevel(log::parseLevel(level));
    }

    std::cout << "=== Tasktrack Demo ===" << std::endl;
    std::cout << "Database: " << db_path << std::endl;

    storage::SqliteStore store;
    auto opened = store.open(db_path);
    if (!opened.is_ok()) {
        fail("open", opened.error());
        return 1;
    }

    tracker::ProjectStore projects(store);
    auto initialized = projects.initialize();
    if (!initialized.is_ok()) {
        fail("initialize", initialized.error());
        return 1;
    }

    std::cout << "\n1. Creating projects..." << std::endl;
    auto web = projects.createProject("Web Redesign", "Complete website overhaul");
    auto mobile = projects.createProject("Mobile App", "New mobile application");
    if (!web.is_ok() || !mobile.is_ok()) {
        fail("createProject", web.is_ok() ? mobile.error() : web.error());
        return 1;
    }
    std::cout << "   Created: " << web.value().name << " (ID: " << web.value().id << ")" << std::endl;
    std::cout << "   Created: " << mobile.value().name << " (ID: " << mobile.value().id << ")" << std::endl;

    std::cout << "\n2. Listing all projects..." << std::endl;
    printProjects(projects);

    std::cout << "\n3. Adding tasks to '" << web.value().name << "'..." << std::endl;
    auto design = projects.createTask(web.value().id, "Design homepage mockup", "ux");
    auto nav = projects.createTask(web.value().id, "Implement responsive navigation", "frontend");
    auto tests = projects.createTask(web.value().id, "Write unit tests", "testing");
    if (!design.is_ok() || !nav.is_ok() || !tests.is_ok()) {
        std::cerr << "   createTask failed" << std::endl;
        return 1;
    }
    for (const auto *task : {&design.value(), &nav.value(), &tests.value()}) {
        std::cout << "   Added: " << task->description << " [" << task->category << "]" << std::endl;
    }

    std::cout << "\n4. Updating task statuses..." << std::endl;
    auto moved = projects.updateTaskStatus(design.value().id, model::TaskStatus::InProgress);
    if (moved.is_ok())
        std::cout << "   '" << moved.value().description << "' -> " << model::toString(moved.value().status)
                  << std::endl;
    auto reviewed = projects.updateTaskStatus(nav.value().id, "review");
    if (reviewed.is_ok())
        std::cout << "   '" << reviewed.value().description << "' -> " << model::toString(reviewed.value().status)
                  << std::endl;

    auto rejected = projects.updateTaskStatus(nav.value().id, "done");
    if (!rejected.is_ok())
        std::cout << "   Rejected 'done': " << rejected.error().message.c_str() << std::endl;

    std::cout << "\n5. Getting project details..." << std::endl;
    auto details = projects.getProject(web.value().id);
    if (details.is_ok()) {
        const auto &d = details.value();
        std::cout << "   Project: " << d.name << std::endl;
        std::cout << "   Tasks: " << d.tasks.size() << std::endl;
        std::cout << "   Stats: " << d.task_stats.toJson() << std::endl;
        for (const auto &task : d.tasks) {
            std::cout << "     - [" << model::toString(task.status) << "] " << task.description << " ("
                      << task.category << ")" << std::endl;
        }
    } else {
        fail("getProject", details.error());
    }

    std::cout << "\n6. Deleting a task..." << std::endl;
    auto task_deleted = projects.deleteTask(tests.value().id);
    std::cout << "   Deleted task: " << (task_deleted.is_ok() && task_deleted.value() ? "yes" : "no") << std::endl;

    std::cout << "\n7. Deleting project '" << mobile.value().name << "'..." << std::endl;
    auto project_deleted = projects.deleteProject(mobile.value().id);
    std::cout << "   Deleted project: " << (project_deleted.is_ok() && project_deleted.value() ? "yes" : "no")
              << std::endl;

    std::cout << "\n8. Final project list..." << std::endl;
    printProjects(projects);

    std::cout << "\n9. Statistics..." << std::endl;
    auto stats = projects.getStats();
    if (stats.is_ok())
        std::cout << "   " << stats.value().toJson() << std::endl;

    std::cout << "\nIntegrity check: " << (store.quickCheck() ? "ok" : "FAILED") << std::endl;
    store.close();
    return 0;
}
