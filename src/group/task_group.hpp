/**
 * @file task_group.hpp
 * @brief Bounded-time concurrent execution of a batch of tasks.
 * @author DeadlineGroup contributors
 *
 * A TaskGroup runs every task on its own thread, races them against one
 * group deadline and delivers a single GroupOutcome per execution.
 *
 * | timeout | collect | behaviour                                         |
 * |---------|---------|---------------------------------------------------|
 * |   > 0   |   yes   | wait up to timeout, collect on-time results       |
 * |   > 0   |   no    | wait up to timeout, results discarded             |
 * |    0    |   no    | dispatch and return immediately                   |
 * |    0    |   yes   | rejected: CollectWithoutDeadline                  |
 *
 * Tasks that miss the deadline keep running; their late result goes to
 * ITimeoutAware::on_timeout when the task implements it. Collected results
 * are in delivery order, not submission order.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "group/concepts.hpp"
#include "group/options.hpp"
#include "group/task.hpp"

#include <concepts>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace deadline_group {

/**
 * @brief Terminal result of one execution.
 *
 * `error` is set only for validation failures; task errors travel inside
 * each TaskResult.
 */
struct GroupOutcome {
    std::vector<TaskResult> results;
    std::optional<Error> error;
};

class TaskGroup {
public:
    TaskGroup(GroupName name, std::vector<Option> options);

    template <typename... Opts>
        requires (std::convertible_to<Opts, Option> && ...)
    explicit TaskGroup(GroupName name, Opts&&... options)
        : TaskGroup(std::move(name), std::vector<Option>{Option(std::forward<Opts>(options))...}) {}

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // ── Task registration (thread-safe, idle groups only) ──

    void add_task(std::shared_ptr<ITask> task);
    void add_tasks(std::vector<std::shared_ptr<ITask>> tasks);

    template <TaskImplementation T, typename... Args>
    void emplace_task(Args&&... args) {
        add_task(std::make_shared<T>(std::forward<Args>(args)...));
    }

    template <TaskCallable F>
    void add_task_func(F&& fn) {
        add_task(std::make_shared<FunctionTask>(TaskFn(std::forward<F>(fn))));
    }

    template <TaskCallable F, TimeoutCallable G>
    void add_task_func(F&& fn, G&& on_timeout) {
        add_task(std::make_shared<FunctionTimeoutTask>(TaskFn(std::forward<F>(fn)),
                                                       TimeoutFn(std::forward<G>(on_timeout))));
    }

    /// Clear the task list and the parent linkage so the group can be reused.
    void reset();

    /// Replace the parent stop token used by subsequent executions.
    void set_parent(std::stop_token parent);

    // ── Execution ──

    /**
     * @brief Run all tasks; returns without blocking.
     *
     * The future is satisfied exactly once. Validation failures are set on
     * it before any worker starts. Do not start a second execution of the
     * same group until the first outcome has been received.
     */
    [[nodiscard]] std::future<GroupOutcome> execute_async();

    /// Blocking form of execute_async(); errors only on validation failure.
    [[nodiscard]] Result<std::vector<TaskResult>> execute();

    // ── Observers ──

    [[nodiscard]] const GroupName& name() const noexcept { return name_; }
    [[nodiscard]] const GroupOptions& options() const noexcept { return options_; }
    [[nodiscard]] size_t task_count() const;

private:
    [[nodiscard]] std::optional<Error> validate_locked() const;

    const GroupName name_;
    const GroupOptions options_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ITask>> tasks_;
    std::stop_token parent_;
};

}  // namespace deadline_group
