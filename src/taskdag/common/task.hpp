/**
 * @file task.hpp
 */
#pragma once
#include "taskdag/common/common.hpp"

namespace taskdag
{

/**
 * @brief Type alias for task identifiers.
 *
 * @details
 * Tasks are referenced by their string id. Dependency edges name the id of
 * the prerequisite task, never its position in the collection.
 */
using TaskId = std::string;

/**
 * @brief One unit of work and its prerequisite edges.
 *
 * @details
 * `Task` is a plain record. It does not enforce anything by itself; all
 * cross-record invariants (unique ids, resolvable dependencies, no cycles)
 * belong to `TaskGraph`.
 *
 * @par Dependencies
 * `depends` is stored as a sequence but has set semantics. Order carries no
 * meaning and repeated ids count once.
 */
struct Task
{
    /// Non-empty identifier, unique within a graph.
    TaskId id;

    /// Human-readable label.
    std::string title;

    /// Set by the collaborator that executes the task.
    bool completed{false};

    /// Ids of the tasks that must be completed before this one is ready.
    std::vector<TaskId> depends;

    /// Optional group tag, see `compile_parallel_groups()`.
    std::optional<std::uint32_t> parallel_group;
};

/**
 * @brief An incomplete task together with the dependencies holding it back.
 */
struct BlockedTask
{
    const Task* task{nullptr};

    /// Dependency ids that are missing or not yet completed, in `depends` order.
    std::vector<TaskId> unsatisfied;
};

} // namespace taskdag
