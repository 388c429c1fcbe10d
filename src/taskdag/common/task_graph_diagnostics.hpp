/**
 * @file task_graph_diagnostics.hpp
 */
#pragma once
#include "taskdag/common/common.hpp"
#include "taskdag/common/task.hpp"

namespace taskdag
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Harmless irregularity; the graph is still usable.
    Error     ///< The graph must not be scheduled.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    EmptyIdentifier,      ///< A task has an empty id.
    DuplicateIdentifier,  ///< Two or more tasks share an id.
    DanglingDependency,   ///< A dependency names an id absent from the graph.
    Cycle,                ///< The dependency relation contains a cycle.
    RedundantDependency   ///< A task lists the same dependency more than once.
};

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Task ids involved in this issue. For a cycle, in cycle order.
    std::vector<TaskId> involved_tasks;

    /// Dependency ids involved in this issue (dangling or repeated entries).
    std::vector<TaskId> involved_dependencies;
};

// ============================================================================
// TaskGraphDiagnostics
// ============================================================================

/**
 * @brief Every problem found in a TaskGraph, without short-circuiting.
 *
 * @details
 * Produced by `TaskGraph::get_diagnostics()`. Where `validate()` stops at the
 * first failure, diagnostics keep going so that a whole task file can be
 * reported on at once.
 *
 * @par Cycle check
 * The cycle check is skipped while duplicate-id or dangling-dependency errors
 * are present, because the edge set is not well defined in that case.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class TaskGraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the graph would pass validation.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    // Allow TaskGraph to populate diagnostics
    friend class TaskGraph;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace taskdag
