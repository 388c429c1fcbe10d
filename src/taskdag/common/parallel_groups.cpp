/**
 * @file parallel_groups.cpp
 */
#include "taskdag/common/parallel_groups.hpp"

#include <algorithm>
#include <iterator>
#include <map>

namespace taskdag
{

std::vector<const Task*> tasks_by_group(const TaskGraph& graph, std::uint32_t group)
{
    std::vector<const Task*> result;
    for (const auto& task : graph.tasks())
    {
        if (task.parallel_group == group)
        {
            result.push_back(&task);
        }
    }
    return result;
}

std::vector<const Task*> incomplete_tasks_by_group(const TaskGraph& graph, std::uint32_t group)
{
    std::vector<const Task*> result;
    for (const auto& task : graph.tasks())
    {
        if (!task.completed && task.parallel_group == group)
        {
            result.push_back(&task);
        }
    }
    return result;
}

std::optional<std::uint32_t> next_parallel_group(const TaskGraph& graph)
{
    std::optional<std::uint32_t> lowest;
    for (const auto& task : graph.tasks())
    {
        if (task.completed || !task.parallel_group)
        {
            continue;
        }
        if (!lowest || *task.parallel_group < *lowest)
        {
            lowest = task.parallel_group;
        }
    }
    return lowest;
}

TaskGraph compile_parallel_groups(const TaskGraph& graph)
{
    // Group number -> member ids, ordered by group
    std::map<std::uint32_t, std::vector<TaskId>> members;
    for (const auto& task : graph.tasks())
    {
        if (task.parallel_group)
        {
            members[*task.parallel_group].push_back(task.id);
        }
    }

    TaskGraph compiled(graph.config());
    for (Task task : graph.tasks())
    {
        if (task.parallel_group)
        {
            auto it = members.find(*task.parallel_group);
            if (it != members.begin())
            {
                const auto& previous = std::prev(it)->second;
                for (const auto& dep : previous)
                {
                    if (std::find(task.depends.begin(), task.depends.end(), dep) ==
                        task.depends.end())
                    {
                        task.depends.push_back(dep);
                    }
                }
            }
        }
        compiled.add_task(std::move(task));
    }
    return compiled;
}

} // namespace taskdag
