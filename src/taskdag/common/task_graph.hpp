/**
 * @file task_graph.hpp
 */
#pragma once
#include "taskdag/common/common.hpp"
#include "taskdag/common/task.hpp"
#include "taskdag/common/task_graph_config.hpp"
#include "taskdag/common/task_graph_diagnostics.hpp"
#include "taskdag/common/task_graph_exceptions.hpp"

namespace taskdag
{

/**
 * @brief An ordered collection of tasks with dependency validation and queries.
 *
 * @details
 * `TaskGraph` holds the tasks of one load cycle in the order the source
 * presented them, checks that they form a well-formed dependency graph, and
 * answers the questions a scheduler asks: what can run now, what is waiting
 * and on what, and in which order everything could run.
 *
 * @par Lifecycle
 * 1. Construct from a list of tasks, or add them with `add_task()`.
 * 2. Call `validate()`. It throws `TaskGraphError` on the first problem.
 * 3. Query `get_ready_tasks()` / `get_blocked_tasks()`, flip completion with
 *    `set_completed()`, query again.
 *
 * Adding a task resets the validated state. Completion flips do not: they
 * cannot break uniqueness, references or acyclicity.
 *
 * @par Edge direction
 * Each `depends` entry is an edge from the dependency to the dependent.
 * In-degree is the number of distinct prerequisites of a task.
 *
 * @par Pointer stability
 * Query results hold pointers into the graph's task storage. They stay valid
 * until the next `add_task()` or until the graph is destroyed or moved from.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class TaskGraph
{
public:
    explicit TaskGraph(TaskGraphConfig config = {});

    /**
     * @brief Construct a graph holding the given tasks, not yet validated.
     */
    explicit TaskGraph(std::vector<Task> tasks, TaskGraphConfig config = {});

    // -------------------------------------------------------------------------
    // Construction and mutation
    // -------------------------------------------------------------------------

    /**
     * @brief Append a task. Clears the validated state.
     */
    void add_task(Task task);

    /**
     * @brief Set the completion flag of a task.
     * @param id Id of the task to update.
     * @param completed New flag value.
     * @throw TaskGraphError with `TaskNotFound` if no task has that id.
     * @note This is the only mutation that keeps the graph validated.
     */
    void set_completed(const TaskId& id, bool completed = true);

    const std::vector<Task>& tasks() const noexcept;

    const TaskGraphConfig& config() const noexcept;

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    /**
     * @brief Check uniqueness, referential integrity and acyclicity, in that order.
     * @throw TaskGraphError with the code of the first failing check:
     *        `EmptyIdentifier` or `DuplicateIdentifier` (naming the id),
     *        `DanglingDependency` (naming the task and the missing id), or
     *        `CyclicDependency` (naming the tasks on one cycle).
     * @note On success the graph is marked validated until the next `add_task()`.
     */
    void validate();

    /**
     * @brief Check whether `validate()` has succeeded since the last structural change.
     */
    bool is_validated() const noexcept;

    /**
     * @brief Collect every structural problem without throwing.
     * @return Shared pointer to the diagnostics object.
     * @note Does not change the validated state.
     */
    std::shared_ptr<TaskGraphDiagnostics> get_diagnostics() const;

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Find a task by exact id match.
     * @return Pointer to the task, or nullptr if there is none.
     */
    const Task* get_task_by_id(const TaskId& id) const;

    /**
     * @brief Get the incomplete tasks whose dependencies are all completed.
     * @return Tasks in insertion order.
     * @throw TaskGraphError with `NotValidated` if validation is required and
     *        the graph is not validated.
     */
    std::vector<const Task*> get_ready_tasks() const;

    /**
     * @brief Get the incomplete tasks with at least one unsatisfied dependency.
     * @return Blocked tasks in insertion order, each with the dependency ids that
     *         are missing or not completed.
     * @throw TaskGraphError with `NotValidated` if validation is required and
     *        the graph is not validated.
     */
    std::vector<BlockedTask> get_blocked_tasks() const;

    /**
     * @brief Get all tasks ordered so that every dependency precedes its dependents.
     * @return All tasks, completed or not, in Kahn removal order. Ties are broken
     *         by insertion order, so the result is stable for a given input.
     * @throw TaskGraphError with the same codes as `validate()`.
     * @note Does not require, and does not record, prior validation.
     */
    std::vector<const Task*> topological_order() const;

    size_t total_tasks() const noexcept;
    size_t completed_tasks() const noexcept;
    size_t remaining_tasks() const noexcept;

    /// Incomplete tasks, in insertion order.
    std::vector<const Task*> incomplete_tasks() const;

    /// Completed tasks, in insertion order.
    std::vector<const Task*> completed_task_list() const;

private:
    /**
     * @brief Index-based view of the dependency edges.
     * @details Built only from graphs with unique ids. Entries naming an
     *          unknown id are skipped.
     */
    struct EdgeIndex
    {
        /// Dependents of each task, by task index.
        std::vector<std::vector<size_t>> dependents;

        /// Distinct resolvable prerequisites of each task, by task index.
        std::vector<std::vector<size_t>> prerequisites;
    };

    /// Outcome of Kahn elimination.
    struct KahnResult
    {
        /// Task indices in removal order.
        std::vector<size_t> order;

        /// Remaining in-degree of each task; nonzero means not removed.
        std::vector<size_t> in_degree;
    };

    std::unordered_map<TaskId, size_t> build_id_index() const;
    EdgeIndex build_edge_index(const std::unordered_map<TaskId, size_t>& id_index) const;
    KahnResult run_kahn(const EdgeIndex& edges) const;

    /// Walk prerequisites among the tasks Kahn could not remove until one repeats.
    std::vector<size_t> find_cycle(const EdgeIndex& edges, const KahnResult& kahn) const;

    /// Drop leftover tasks that only hang off a cycle without being on one.
    std::vector<size_t> trim_to_cycles(const EdgeIndex& edges, const KahnResult& kahn) const;

    std::string describe_cycle(const std::vector<size_t>& cycle) const;

    void check_identifiers() const;
    void check_references(const std::unordered_map<TaskId, size_t>& id_index) const;
    KahnResult check_acyclic(const EdgeIndex& edges) const;

    /// Run all three checks; return the elimination used for the cycle check.
    KahnResult check_structure() const;

    void require_validated(const char* operation) const;

    std::vector<Task> m_tasks;
    TaskGraphConfig m_config;
    std::shared_ptr<spdlog::logger> m_log;
    bool m_validated{false};
};

} // namespace taskdag
