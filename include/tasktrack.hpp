#pragma once

// Tasktrack umbrella header
// Project/task store over SQLite

#include "tasktrack/common/clock.hpp"
#include "tasktrack/common/error.hpp"
#include "tasktrack/common/id.hpp"
#include "tasktrack/common/log.hpp"
#include "tasktrack/common/text.hpp"
#include "tasktrack/model/project.hpp"
#include "tasktrack/model/status.hpp"
#include "tasktrack/model/task.hpp"
#include "tasktrack/storage/sqlite_store.hpp"
#include "tasktrack/tracker/project_store.hpp"
