/**
 * @file task_graph_config.hpp
 */
#pragma once
#include "taskdag/common/common.hpp"
#include <spdlog/fwd.h>

namespace taskdag
{

/**
 * @brief Configuration for TaskGraph behavior.
 */
struct TaskGraphConfig
{
    /**
     * @brief Whether readiness queries require a validated graph.
     * @details If true, `get_ready_tasks()` and `get_blocked_tasks()` throw
     *          `TaskGraphError` with `NotValidated` until `validate()` has
     *          succeeded on the current structure.
     */
    bool require_validation{true};

    /**
     * @brief Logger for validation and query events.
     * @details Null means use `get_logger()`.
     */
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace taskdag
