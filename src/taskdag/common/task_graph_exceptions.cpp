/**
 * @file task_graph_exceptions.cpp
 */
#include "taskdag/common/task_graph_exceptions.hpp"

namespace taskdag
{

const char* to_string(TaskGraphErrorCode code) noexcept
{
    switch (code)
    {
    case TaskGraphErrorCode::EmptyIdentifier:
        return "EmptyIdentifier";
    case TaskGraphErrorCode::DuplicateIdentifier:
        return "DuplicateIdentifier";
    case TaskGraphErrorCode::DanglingDependency:
        return "DanglingDependency";
    case TaskGraphErrorCode::CyclicDependency:
        return "CyclicDependency";
    case TaskGraphErrorCode::NotValidated:
        return "NotValidated";
    case TaskGraphErrorCode::TaskNotFound:
        return "TaskNotFound";
    }
    return "Unknown";
}

} // namespace taskdag
