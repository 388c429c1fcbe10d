/**
 * @file task_graph.cpp
 */
#include "taskdag/common/task_graph.hpp"
#include "taskdag/common/logging.hpp"

#include <limits>
#include <queue>

namespace taskdag
{

// ============================================================================
// Constructors
// ============================================================================

TaskGraph::TaskGraph(TaskGraphConfig config)
    : TaskGraph(std::vector<Task>{}, std::move(config))
{
}

TaskGraph::TaskGraph(std::vector<Task> tasks, TaskGraphConfig config)
    : m_tasks(std::move(tasks))
    , m_config(std::move(config))
    , m_log(m_config.logger ? m_config.logger : get_logger())
{
}

// ============================================================================
// Construction and mutation
// ============================================================================

void TaskGraph::add_task(Task task)
{
    m_tasks.push_back(std::move(task));
    m_validated = false;
}

void TaskGraph::set_completed(const TaskId& id, bool completed)
{
    for (auto& task : m_tasks)
    {
        if (task.id == id)
        {
            task.completed = completed;
            return;
        }
    }
    throw TaskGraphError(
        TaskGraphErrorCode::TaskNotFound,
        "task '" + id + "' not found",
        id);
}

const std::vector<Task>& TaskGraph::tasks() const noexcept
{
    return m_tasks;
}

const TaskGraphConfig& TaskGraph::config() const noexcept
{
    return m_config;
}

// ============================================================================
// Edge index and Kahn elimination
// ============================================================================

std::unordered_map<TaskId, size_t> TaskGraph::build_id_index() const
{
    std::unordered_map<TaskId, size_t> id_index;
    id_index.reserve(m_tasks.size());
    for (size_t i = 0; i < m_tasks.size(); ++i)
    {
        // First occurrence wins
        id_index.emplace(m_tasks[i].id, i);
    }
    return id_index;
}

TaskGraph::EdgeIndex TaskGraph::build_edge_index(
    const std::unordered_map<TaskId, size_t>& id_index) const
{
    const size_t n = m_tasks.size();
    EdgeIndex edges;
    edges.dependents.resize(n);
    edges.prerequisites.resize(n);

    for (size_t i = 0; i < n; ++i)
    {
        std::unordered_set<size_t> seen;
        for (const auto& dep : m_tasks[i].depends)
        {
            auto it = id_index.find(dep);
            if (it == id_index.end())
            {
                continue;
            }
            // Repeated entries count once
            if (seen.insert(it->second).second)
            {
                edges.prerequisites[i].push_back(it->second);
                edges.dependents[it->second].push_back(i);
            }
        }
    }
    return edges;
}

TaskGraph::KahnResult TaskGraph::run_kahn(const EdgeIndex& edges) const
{
    const size_t n = m_tasks.size();
    KahnResult result;
    result.in_degree.resize(n, 0);
    result.order.reserve(n);

    for (size_t i = 0; i < n; ++i)
    {
        result.in_degree[i] = edges.prerequisites[i].size();
    }

    // FIFO seeded in insertion order keeps the order reproducible.
    std::queue<size_t> ready;
    for (size_t i = 0; i < n; ++i)
    {
        if (result.in_degree[i] == 0)
        {
            ready.push(i);
        }
    }

    while (!ready.empty())
    {
        size_t i = ready.front();
        ready.pop();
        result.order.push_back(i);

        for (size_t dependent : edges.dependents[i])
        {
            --result.in_degree[dependent];
            if (result.in_degree[dependent] == 0)
            {
                ready.push(dependent);
            }
        }
    }
    return result;
}

std::vector<size_t> TaskGraph::find_cycle(const EdgeIndex& edges, const KahnResult& kahn) const
{
    constexpr size_t npos = std::numeric_limits<size_t>::max();
    const size_t n = m_tasks.size();

    size_t current = npos;
    for (size_t i = 0; i < n; ++i)
    {
        if (kahn.in_degree[i] > 0)
        {
            current = i;
            break;
        }
    }
    if (current == npos)
    {
        return {};
    }

    // Every leftover task still has a leftover prerequisite, so the walk
    // cannot leave the leftover set and must eventually revisit a task.
    std::vector<size_t> position(n, npos);
    std::vector<size_t> path;
    while (position[current] == npos)
    {
        position[current] = path.size();
        path.push_back(current);

        size_t next = npos;
        for (size_t prereq : edges.prerequisites[current])
        {
            if (kahn.in_degree[prereq] > 0)
            {
                next = prereq;
                break;
            }
        }
        if (next == npos)
        {
            return {};
        }
        current = next;
    }
    return std::vector<size_t>(path.begin() + static_cast<std::ptrdiff_t>(position[current]),
                               path.end());
}

std::vector<size_t> TaskGraph::trim_to_cycles(const EdgeIndex& edges,
                                              const KahnResult& kahn) const
{
    const size_t n = m_tasks.size();
    std::vector<bool> remaining(n, false);
    std::vector<size_t> out_degree(n, 0);

    for (size_t i = 0; i < n; ++i)
    {
        remaining[i] = kahn.in_degree[i] > 0;
    }
    for (size_t i = 0; i < n; ++i)
    {
        if (!remaining[i])
        {
            continue;
        }
        for (size_t dependent : edges.dependents[i])
        {
            if (remaining[dependent])
            {
                ++out_degree[i];
            }
        }
    }

    // Reverse elimination: peel off leftovers that nothing leftover depends on.
    std::queue<size_t> sinks;
    for (size_t i = 0; i < n; ++i)
    {
        if (remaining[i] && out_degree[i] == 0)
        {
            sinks.push(i);
        }
    }
    while (!sinks.empty())
    {
        size_t i = sinks.front();
        sinks.pop();
        remaining[i] = false;

        for (size_t prereq : edges.prerequisites[i])
        {
            if (remaining[prereq])
            {
                --out_degree[prereq];
                if (out_degree[prereq] == 0)
                {
                    sinks.push(prereq);
                }
            }
        }
    }

    std::vector<size_t> result;
    for (size_t i = 0; i < n; ++i)
    {
        if (remaining[i])
        {
            result.push_back(i);
        }
    }
    return result;
}

std::string TaskGraph::describe_cycle(const std::vector<size_t>& cycle) const
{
    // Reads as "depends on": a -> b -> a means a depends on b, b depends on a.
    std::string text;
    for (size_t idx : cycle)
    {
        text += m_tasks[idx].id;
        text += " -> ";
    }
    if (!cycle.empty())
    {
        text += m_tasks[cycle.front()].id;
    }
    return text;
}

// ============================================================================
// Validation
// ============================================================================

void TaskGraph::check_identifiers() const
{
    std::unordered_set<TaskId> seen;
    seen.reserve(m_tasks.size());
    for (size_t i = 0; i < m_tasks.size(); ++i)
    {
        const auto& id = m_tasks[i].id;
        if (id.empty())
        {
            throw TaskGraphError(
                TaskGraphErrorCode::EmptyIdentifier,
                "task at position " + std::to_string(i) + " has an empty id",
                id);
        }
        if (!seen.insert(id).second)
        {
            throw TaskGraphError(
                TaskGraphErrorCode::DuplicateIdentifier,
                "duplicate task id '" + id + "'",
                id);
        }
    }
}

void TaskGraph::check_references(const std::unordered_map<TaskId, size_t>& id_index) const
{
    for (const auto& task : m_tasks)
    {
        for (const auto& dep : task.depends)
        {
            if (id_index.find(dep) == id_index.end())
            {
                throw TaskGraphError(
                    TaskGraphErrorCode::DanglingDependency,
                    "task '" + task.id + "' depends on non-existent task '" + dep + "'",
                    task.id,
                    dep);
            }
        }
    }
}

TaskGraph::KahnResult TaskGraph::check_acyclic(const EdgeIndex& edges) const
{
    KahnResult kahn = run_kahn(edges);
    if (kahn.order.size() < m_tasks.size())
    {
        std::vector<size_t> cycle = find_cycle(edges, kahn);
        std::vector<TaskId> cycle_ids;
        cycle_ids.reserve(cycle.size());
        for (size_t idx : cycle)
        {
            cycle_ids.push_back(m_tasks[idx].id);
        }
        TaskId first = cycle_ids.empty() ? TaskId{} : cycle_ids.front();
        throw TaskGraphError(
            TaskGraphErrorCode::CyclicDependency,
            "circular dependency detected: " + describe_cycle(cycle),
            std::move(first),
            {},
            std::move(cycle_ids));
    }
    return kahn;
}

TaskGraph::KahnResult TaskGraph::check_structure() const
{
    // Cheapest first: ids, then references, then the cycle check.
    check_identifiers();
    auto id_index = build_id_index();
    check_references(id_index);
    return check_acyclic(build_edge_index(id_index));
}

void TaskGraph::validate()
{
    m_validated = false;
    try
    {
        check_structure();
    }
    catch (const TaskGraphError& e)
    {
        SPDLOG_LOGGER_WARN(m_log, "Task graph validation failed ({}): {}",
                           to_string(e.code()), e.what());
        throw;
    }
    m_validated = true;
    SPDLOG_LOGGER_DEBUG(m_log, "Task graph validated: {} tasks", m_tasks.size());
}

bool TaskGraph::is_validated() const noexcept
{
    return m_validated;
}

std::shared_ptr<TaskGraphDiagnostics> TaskGraph::get_diagnostics() const
{
    auto diagnostics = std::make_shared<TaskGraphDiagnostics>();

    // =========================================================================
    // Phase 1: Identifiers
    // =========================================================================

    std::unordered_set<TaskId> seen;
    std::unordered_set<TaskId> reported_duplicates;
    for (size_t i = 0; i < m_tasks.size(); ++i)
    {
        const auto& id = m_tasks[i].id;
        if (id.empty())
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::EmptyIdentifier;
            item.message = "task at position " + std::to_string(i) + " has an empty id";
            diagnostics->m_errors.push_back(std::move(item));
            continue;
        }
        if (!seen.insert(id).second && reported_duplicates.insert(id).second)
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::DuplicateIdentifier;
            item.message = "duplicate task id '" + id + "'";
            item.involved_tasks.push_back(id);
            diagnostics->m_errors.push_back(std::move(item));
        }
    }

    // =========================================================================
    // Phase 2: References and repeated entries
    // =========================================================================

    auto id_index = build_id_index();
    for (const auto& task : m_tasks)
    {
        std::unordered_map<TaskId, size_t> occurrences;
        for (const auto& dep : task.depends)
        {
            size_t count = ++occurrences[dep];
            if (count == 1 && id_index.find(dep) == id_index.end())
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::DanglingDependency;
                item.message =
                    "task '" + task.id + "' depends on non-existent task '" + dep + "'";
                item.involved_tasks.push_back(task.id);
                item.involved_dependencies.push_back(dep);
                diagnostics->m_errors.push_back(std::move(item));
            }
            else if (count == 2)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Warning;
                item.category = DiagnosticCategory::RedundantDependency;
                item.message = "task '" + task.id + "' lists dependency '" + dep +
                               "' more than once";
                item.involved_tasks.push_back(task.id);
                item.involved_dependencies.push_back(dep);
                diagnostics->m_warnings.push_back(std::move(item));
            }
        }
    }

    // =========================================================================
    // Phase 3: Cycle detection using Kahn's algorithm
    // =========================================================================

    if (diagnostics->m_errors.empty())
    {
        EdgeIndex edges = build_edge_index(id_index);
        KahnResult kahn = run_kahn(edges);
        if (kahn.order.size() < m_tasks.size())
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::Cycle;
            item.message =
                "circular dependency detected: " + describe_cycle(find_cycle(edges, kahn));
            for (size_t idx : trim_to_cycles(edges, kahn))
            {
                item.involved_tasks.push_back(m_tasks[idx].id);
            }
            diagnostics->m_errors.push_back(std::move(item));
        }
    }

    SPDLOG_LOGGER_DEBUG(m_log, "Task graph diagnostics: {} errors, {} warnings",
                        diagnostics->m_errors.size(), diagnostics->m_warnings.size());
    return diagnostics;
}

// ============================================================================
// Queries
// ============================================================================

void TaskGraph::require_validated(const char* operation) const
{
    if (m_config.require_validation && !m_validated)
    {
        SPDLOG_LOGGER_ERROR(m_log, "{} called on a task graph that has not been validated",
                            operation);
        throw TaskGraphError(
            TaskGraphErrorCode::NotValidated,
            std::string(operation) + " called on a task graph that has not been validated");
    }
}

const Task* TaskGraph::get_task_by_id(const TaskId& id) const
{
    for (const auto& task : m_tasks)
    {
        if (task.id == id)
        {
            return &task;
        }
    }
    return nullptr;
}

std::vector<const Task*> TaskGraph::get_ready_tasks() const
{
    require_validated("get_ready_tasks");

    auto id_index = build_id_index();
    std::vector<const Task*> result;
    for (const auto& task : m_tasks)
    {
        if (task.completed)
        {
            continue;
        }
        bool ready = true;
        for (const auto& dep : task.depends)
        {
            auto it = id_index.find(dep);
            if (it == id_index.end() || !m_tasks[it->second].completed)
            {
                ready = false;
                break;
            }
        }
        if (ready)
        {
            result.push_back(&task);
        }
    }
    return result;
}

std::vector<BlockedTask> TaskGraph::get_blocked_tasks() const
{
    require_validated("get_blocked_tasks");

    auto id_index = build_id_index();
    std::vector<BlockedTask> result;
    for (const auto& task : m_tasks)
    {
        if (task.completed)
        {
            continue;
        }
        BlockedTask blocked;
        std::unordered_set<TaskId> listed;
        for (const auto& dep : task.depends)
        {
            auto it = id_index.find(dep);
            // A missing dependency counts as unsatisfied
            bool satisfied = it != id_index.end() && m_tasks[it->second].completed;
            if (!satisfied && listed.insert(dep).second)
            {
                blocked.unsatisfied.push_back(dep);
            }
        }
        if (!blocked.unsatisfied.empty())
        {
            blocked.task = &task;
            result.push_back(std::move(blocked));
        }
    }
    return result;
}

std::vector<const Task*> TaskGraph::topological_order() const
{
    KahnResult kahn = check_structure();

    std::vector<const Task*> result;
    result.reserve(kahn.order.size());
    for (size_t idx : kahn.order)
    {
        result.push_back(&m_tasks[idx]);
    }
    return result;
}

size_t TaskGraph::total_tasks() const noexcept
{
    return m_tasks.size();
}

size_t TaskGraph::completed_tasks() const noexcept
{
    size_t count = 0;
    for (const auto& task : m_tasks)
    {
        if (task.completed)
        {
            ++count;
        }
    }
    return count;
}

size_t TaskGraph::remaining_tasks() const noexcept
{
    return m_tasks.size() - completed_tasks();
}

std::vector<const Task*> TaskGraph::incomplete_tasks() const
{
    std::vector<const Task*> result;
    for (const auto& task : m_tasks)
    {
        if (!task.completed)
        {
            result.push_back(&task);
        }
    }
    return result;
}

std::vector<const Task*> TaskGraph::completed_task_list() const
{
    std::vector<const Task*> result;
    for (const auto& task : m_tasks)
    {
        if (task.completed)
        {
            result.push_back(&task);
        }
    }
    return result;
}

} // namespace taskdag
