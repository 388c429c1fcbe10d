#include "taskdag/common/logging.hpp"
#include "taskdag/common/task_graph.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace taskdag;

namespace
{

TaskGraph make_sample_graph()
{
    std::vector<Task> tasks;
    tasks.push_back(Task{"init", "Initialize project", true, {}, std::nullopt});
    tasks.push_back(Task{"config", "Set up configuration", false, {"init"}, std::nullopt});
    tasks.push_back(Task{"schema", "Define storage schema", false, {"init"}, std::nullopt});
    tasks.push_back(Task{"api", "Implement API", false, {"config", "schema"}, std::nullopt});
    tasks.push_back(Task{"docs", "Write documentation", false, {}, std::nullopt});
    return TaskGraph(std::move(tasks));
}

/// Drain the graph the way a sequential scheduler would.
void run_to_completion(TaskGraph& graph)
{
    auto log = get_logger();
    size_t round = 0;
    while (graph.remaining_tasks() > 0)
    {
        auto ready = graph.get_ready_tasks();
        if (ready.empty())
        {
            for (const auto& blocked : graph.get_blocked_tasks())
            {
                SPDLOG_LOGGER_ERROR(log, "'{}' is still waiting on {} task(s)",
                           blocked.task->id, blocked.unsatisfied.size());
            }
            throw std::runtime_error("no ready tasks but work remains");
        }

        ++round;
        std::vector<TaskId> ids;
        for (const Task* task : ready)
        {
            ids.push_back(task->id);
        }
        for (const auto& id : ids)
        {
            SPDLOG_LOGGER_INFO(log, "round {}: running '{}'", round, id);
            graph.set_completed(id);
        }
        SPDLOG_LOGGER_INFO(log, "progress: {}/{} completed", graph.completed_tasks(), graph.total_tasks());
    }
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== taskdag ======\n" << std::flush;

        TaskGraph graph = make_sample_graph();
        graph.validate();

        std::cout << "Execution order:";
        for (const Task* task : graph.topological_order())
        {
            std::cout << " " << task->id;
        }
        std::cout << "\n" << std::flush;

        run_to_completion(graph);

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
