/**
 * @file task_graph_exceptions.hpp
 */
#pragma once
#include "taskdag/common/common.hpp"
#include "taskdag/common/task.hpp"

namespace taskdag
{

/**
 * @brief Error codes for TaskGraph operations.
 */
enum class TaskGraphErrorCode
{
    EmptyIdentifier,
    DuplicateIdentifier,
    DanglingDependency,
    CyclicDependency,
    NotValidated,
    TaskNotFound
};

/**
 * @brief Get a stable name for an error code, for logs and messages.
 */
const char* to_string(TaskGraphErrorCode code) noexcept;

/**
 * @brief Exception class for TaskGraph errors.
 *
 * @details
 * `TaskGraphError` is thrown by `TaskGraph::validate()` and
 * `TaskGraph::topological_order()` when the task list is malformed, and by
 * the readiness queries when they are called on a graph that has not been
 * validated. Besides the message, it carries the ids needed to locate the
 * problem:
 * - `task_id()`: the duplicated id, the task owning a dangling reference,
 *   or the unknown id passed to a lookup.
 * - `dependency_id()`: the missing id of a dangling reference.
 * - `involved_tasks()`: the tasks on a cycle, in cycle order.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class TaskGraphError : public std::exception
{
public:
    /**
     * @brief Construct a TaskGraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    TaskGraphError(TaskGraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    TaskGraphError(TaskGraphErrorCode code,
                   std::string message,
                   TaskId task_id,
                   TaskId dependency_id = {},
                   std::vector<TaskId> involved_tasks = {})
        : m_code(code)
        , m_message(std::move(message))
        , m_task_id(std::move(task_id))
        , m_dependency_id(std::move(dependency_id))
        , m_involved_tasks(std::move(involved_tasks))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    TaskGraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

    const TaskId& task_id() const noexcept
    {
        return m_task_id;
    }

    const TaskId& dependency_id() const noexcept
    {
        return m_dependency_id;
    }

    const std::vector<TaskId>& involved_tasks() const noexcept
    {
        return m_involved_tasks;
    }

private:
    TaskGraphErrorCode m_code;
    std::string m_message;
    TaskId m_task_id;
    TaskId m_dependency_id;
    std::vector<TaskId> m_involved_tasks;
};

} // namespace taskdag
