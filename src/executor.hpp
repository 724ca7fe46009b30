#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). parse_many() fans independent
// document parses out over it, each task writing only its own result slot.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace leptjson_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace leptjson_cpp::detail
