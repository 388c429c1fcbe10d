/**
 * @file task_graph_query_tests.cpp
 * @brief Unit tests for the readiness, blockage and progress queries of TaskGraph
 */
#include <gtest/gtest.h>
#include "taskdag/common/task_graph.hpp"
#include "task_graph_test_helpers.hpp"

using namespace taskdag;
using namespace taskdag_test;

// ============================================================================
// Ready tasks
// ============================================================================

TEST(TaskGraphQueryTests, Ready_ChainAdvancesAsTasksComplete)
{
    std::vector<Task> tasks{
        make_task("A", {}, true),
        make_task("B", {"A"}),
        make_task("C", {"B"}),
        make_task("D"),
    };
    TaskGraph graph(tasks);
    graph.validate();

    EXPECT_EQ(ids_of(graph.get_ready_tasks()), (std::vector<std::string>{"B", "D"}));

    graph.set_completed("B");
    EXPECT_EQ(ids_of(graph.get_ready_tasks()), (std::vector<std::string>{"C", "D"}));
}

TEST(TaskGraphQueryTests, Ready_TaskWithoutDependenciesIsReadyUntilCompleted)
{
    std::vector<Task> tasks{make_task("solo")};
    TaskGraph graph(tasks);
    graph.validate();

    EXPECT_EQ(ids_of(graph.get_ready_tasks()), (std::vector<std::string>{"solo"}));

    graph.set_completed("solo");
    EXPECT_TRUE(graph.get_ready_tasks().empty());
}

TEST(TaskGraphQueryTests, Ready_RequiresAllDependencies)
{
    std::vector<Task> tasks{
        make_task("a", {}, true),
        make_task("b"),
        make_task("c", {"a", "b"}),
    };
    TaskGraph graph(tasks);
    graph.validate();

    EXPECT_EQ(ids_of(graph.get_ready_tasks()), (std::vector<std::string>{"b"}));
}

TEST(TaskGraphQueryTests, Ready_FollowsInsertionOrder)
{
    std::vector<Task> tasks{
        make_task("z"),
        make_task("m"),
        make_task("a"),
    };
    TaskGraph graph(tasks);
    graph.validate();

    EXPECT_EQ(ids_of(graph.get_ready_tasks()), (std::vector<std::string>{"z", "m", "a"}));
}

TEST(TaskGraphQueryTests, Ready_IsIdempotent)
{
    std::vector<Task> tasks{
        make_task("a"),
        make_task("b", {"a"}),
        make_task("c"),
    };
    TaskGraph graph(tasks);
    graph.validate();

    EXPECT_EQ(graph.get_ready_tasks(), graph.get_ready_tasks());
}

// ============================================================================
// Blocked tasks
// ============================================================================

TEST(TaskGraphQueryTests, Blocked_ListsUnsatisfiedDependencies)
{
    std::vector<Task> tasks{
        make_task("A"),
        make_task("B", {"A"}),
        make_task("C", {"A", "B"}),
    };
    TaskGraph graph(tasks);
    graph.validate();

    auto blocked = graph.get_blocked_tasks();
    ASSERT_EQ(blocked.size(), 2u);

    EXPECT_EQ(blocked[0].task->id, "B");
    EXPECT_EQ(blocked[0].unsatisfied, (std::vector<std::string>{"A"}));

    EXPECT_EQ(blocked[1].task->id, "C");
    ASSERT_EQ(blocked[1].unsatisfied.size(), 2u);
    EXPECT_EQ(blocked[1].unsatisfied, (std::vector<std::string>{"A", "B"}));
}

TEST(TaskGraphQueryTests, Blocked_ShrinksAsDependenciesComplete)
{
    std::vector<Task> tasks{
        make_task("A"),
        make_task("B", {"A"}),
        make_task("C", {"A", "B"}),
    };
    TaskGraph graph(tasks);
    graph.validate();

    graph.set_completed("A");
    auto blocked = graph.get_blocked_tasks();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].task->id, "C");
    EXPECT_EQ(blocked[0].unsatisfied, (std::vector<std::string>{"B"}));
}

TEST(TaskGraphQueryTests, Blocked_ExcludesCompletedAndReadyTasks)
{
    std::vector<Task> tasks{
        make_task("done", {}, true),
        make_task("ready", {"done"}),
        make_task("waiting", {"ready"}),
        make_task("finished_early", {"ready"}, true),
    };
    TaskGraph graph(tasks);
    graph.validate();

    auto blocked = graph.get_blocked_tasks();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].task->id, "waiting");
}

TEST(TaskGraphQueryTests, Blocked_RepeatedDependencyListedOnce)
{
    std::vector<Task> tasks{
        make_task("a"),
        make_task("b", {"a", "a"}),
    };
    TaskGraph graph(tasks);
    graph.validate();

    auto blocked = graph.get_blocked_tasks();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].unsatisfied, (std::vector<std::string>{"a"}));
}

TEST(TaskGraphQueryTests, Blocked_IsIdempotent)
{
    std::vector<Task> tasks{
        make_task("a"),
        make_task("b", {"a"}),
        make_task("c", {"a", "b"}),
    };
    TaskGraph graph(tasks);
    graph.validate();

    auto first = graph.get_blocked_tasks();
    auto second = graph.get_blocked_tasks();
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_EQ(first[i].task, second[i].task);
        EXPECT_EQ(first[i].unsatisfied, second[i].unsatisfied);
    }
}

TEST(TaskGraphQueryTests, Blocked_MissingDependencyCountsAsUnsatisfied)
{
    // With the guard disabled the query must stay defensive about references.
    TaskGraphConfig config;
    config.require_validation = false;
    std::vector<Task> tasks{make_task("a", {"ghost"})};
    TaskGraph graph(tasks, config);

    auto blocked = graph.get_blocked_tasks();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].unsatisfied, (std::vector<std::string>{"ghost"}));
    EXPECT_TRUE(graph.get_ready_tasks().empty());
}

TEST(TaskGraphQueryTests, ReadyAndBlockedPartitionIncompleteTasks)
{
    std::vector<Task> tasks{
        make_task("a", {}, true),
        make_task("b", {"a"}),
        make_task("c", {"b"}),
        make_task("d"),
        make_task("e", {"c", "d"}),
    };
    TaskGraph graph(tasks);
    graph.validate();

    EXPECT_EQ(graph.get_ready_tasks().size() + graph.get_blocked_tasks().size(),
              graph.remaining_tasks());
}

// ============================================================================
// Validation guard
// ============================================================================

TEST(TaskGraphQueryTests, Guard_QueriesRequireValidation)
{
    std::vector<Task> tasks{make_task("a")};
    TaskGraph graph(tasks);

    try
    {
        graph.get_ready_tasks();
        FAIL() << "Expected TaskGraphError";
    }
    catch (const TaskGraphError& e)
    {
        EXPECT_EQ(e.code(), TaskGraphErrorCode::NotValidated);
    }
    EXPECT_THROW(graph.get_blocked_tasks(), TaskGraphError);
}

TEST(TaskGraphQueryTests, Guard_QueriesRejectedAfterFailedValidation)
{
    std::vector<Task> tasks{make_task("a", {"b"}), make_task("b", {"a"})};
    TaskGraph graph(tasks);
    EXPECT_THROW(graph.validate(), TaskGraphError);

    EXPECT_THROW(graph.get_ready_tasks(), TaskGraphError);
}

TEST(TaskGraphQueryTests, Guard_QueriesRejectedAfterStructuralChange)
{
    std::vector<Task> tasks{make_task("a")};
    TaskGraph graph(tasks);
    graph.validate();
    EXPECT_NO_THROW(graph.get_ready_tasks());

    graph.add_task(make_task("b", {"a"}));
    EXPECT_THROW(graph.get_ready_tasks(), TaskGraphError);
}

TEST(TaskGraphQueryTests, Guard_CanBeDisabled)
{
    TaskGraphConfig config;
    config.require_validation = false;
    std::vector<Task> tasks{make_task("a"), make_task("b", {"a"})};
    TaskGraph graph(tasks, config);

    EXPECT_EQ(ids_of(graph.get_ready_tasks()), (std::vector<std::string>{"a"}));
}

// ============================================================================
// Lookup and progress views
// ============================================================================

TEST(TaskGraphQueryTests, GetTaskById)
{
    std::vector<Task> tasks{make_task("a"), make_task("b", {"a"})};
    TaskGraph graph(tasks);

    const Task* b = graph.get_task_by_id("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->title, "Task b");
    EXPECT_EQ(b->depends, (std::vector<std::string>{"a"}));

    EXPECT_EQ(graph.get_task_by_id("missing"), nullptr);
}

TEST(TaskGraphQueryTests, ProgressCounts)
{
    std::vector<Task> tasks{
        make_task("Task 1", {}, true),
        make_task("Task 2"),
        make_task("Task 3", {}, true),
        make_task("Task 4"),
    };
    TaskGraph graph(tasks);

    EXPECT_EQ(graph.total_tasks(), 4u);
    EXPECT_EQ(graph.completed_tasks(), 2u);
    EXPECT_EQ(graph.remaining_tasks(), 2u);
}

TEST(TaskGraphQueryTests, FilteredViewsKeepInsertionOrder)
{
    std::vector<Task> tasks{
        make_task("1", {}, true),
        make_task("2"),
        make_task("3"),
        make_task("4", {}, true),
    };
    TaskGraph graph(tasks);

    EXPECT_EQ(ids_of(graph.incomplete_tasks()), (std::vector<std::string>{"2", "3"}));
    EXPECT_EQ(ids_of(graph.completed_task_list()), (std::vector<std::string>{"1", "4"}));
}

TEST(TaskGraphQueryTests, EmptyGraphViews)
{
    TaskGraph graph;
    graph.validate();

    EXPECT_EQ(graph.total_tasks(), 0u);
    EXPECT_EQ(graph.remaining_tasks(), 0u);
    EXPECT_TRUE(graph.get_ready_tasks().empty());
    EXPECT_TRUE(graph.get_blocked_tasks().empty());
    EXPECT_TRUE(graph.incomplete_tasks().empty());
}

// ============================================================================
// Scheduling loop
// ============================================================================

TEST(TaskGraphQueryTests, DrainingReadySetCompletesEveryTaskInDependencyOrder)
{
    std::vector<Task> tasks{
        make_task("api", {"config", "schema"}),
        make_task("config", {"init"}),
        make_task("schema", {"init"}),
        make_task("init"),
        make_task("docs"),
    };
    TaskGraph graph(tasks);
    graph.validate();

    std::vector<std::string> executed;
    size_t rounds = 0;
    while (graph.remaining_tasks() > 0)
    {
        auto ready = ids_of(graph.get_ready_tasks());
        ASSERT_FALSE(ready.empty());
        for (const auto& id : ready)
        {
            executed.push_back(id);
            graph.set_completed(id);
        }
        ++rounds;
        ASSERT_LE(rounds, tasks.size());
    }

    EXPECT_EQ(rounds, 3u);
    for (const auto& task : tasks)
    {
        for (const auto& dep : task.depends)
        {
            EXPECT_LT(position_of(executed, dep), position_of(executed, task.id));
        }
    }
}
