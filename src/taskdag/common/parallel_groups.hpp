/**
 * @file parallel_groups.hpp
 * @brief Group-tag queries and their translation into dependency edges.
 */
#pragma once
#include "taskdag/common/common.hpp"
#include "taskdag/common/task_graph.hpp"

namespace taskdag
{

/**
 * @brief Get every task tagged with the given group, in insertion order.
 */
std::vector<const Task*> tasks_by_group(const TaskGraph& graph, std::uint32_t group);

/**
 * @brief Get the incomplete tasks tagged with the given group, in insertion order.
 */
std::vector<const Task*> incomplete_tasks_by_group(const TaskGraph& graph, std::uint32_t group);

/**
 * @brief Get the lowest group number among incomplete grouped tasks.
 * @return The group, or nullopt if no incomplete task carries a group tag.
 */
std::optional<std::uint32_t> next_parallel_group(const TaskGraph& graph);

/**
 * @brief Turn group tags into explicit chain dependencies.
 *
 * @details
 * Groups run in ascending order: every task in group `g` gains a dependency
 * on each task of the nearest lower group present in the graph. Gaps in the
 * numbering are skipped, so groups {1, 3} chain 1 before 3.
 *
 * - Ungrouped tasks are left as they are.
 * - Existing `depends` entries are kept, and an edge already present is not
 *   added twice.
 * - Group tags are preserved on the copied tasks.
 *
 * @param graph The source graph. It is not modified.
 * @return A new graph with the same configuration, not yet validated.
 */
TaskGraph compile_parallel_groups(const TaskGraph& graph);

} // namespace taskdag
