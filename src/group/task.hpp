/**
 * @file task.hpp
 * @brief Task abstraction and the optional timeout capability.
 * @author DeadlineGroup contributors
 *
 * A task is any ITask. It may additionally implement ITimeoutAware; the
 * engine discovers that with a dynamic capability check when the task
 * misses the group deadline, so plain tasks need no no-op handler.
 */

#pragma once

#include "core/result.hpp"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace deadline_group {

/**
 * @brief The (value, error) pair produced by one task invocation.
 *
 * Both halves may be set at once; a task decides what its error means.
 */
struct TaskResult {
    std::any value;
    std::optional<Error> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    /// Typed access to the value; nullptr when empty or of another type.
    template <typename T>
    [[nodiscard]] const T* value_as() const noexcept {
        return std::any_cast<T>(&value);
    }

    static TaskResult success(std::any v) { return TaskResult{std::move(v), std::nullopt}; }

    static TaskResult failure(std::string message, std::any v = {}) {
        return TaskResult{std::move(v), Error{ErrorCode::TaskFailed, std::move(message)}};
    }
};

// ─────────────────────────────────────────────
// ITask / ITimeoutAware
// ─────────────────────────────────────────────

class ITask {
public:
    virtual ~ITask() = default;

    /// May block arbitrarily; exceptions are caught by the worker boundary.
    virtual TaskResult execute() = 0;
};

class ITimeoutAware {
public:
    virtual ~ITimeoutAware() = default;

    /**
     * @brief Called on the task's worker thread when its result arrived
     *        after the group deadline fired.
     *
     * Receives the task's own value and error. The result cannot be
     * re-inserted into the group outcome.
     */
    virtual void on_timeout(const std::any& value, const std::optional<Error>& error) = 0;
};

// ─────────────────────────────────────────────
// Callable adapters
// ─────────────────────────────────────────────

using TaskFn = std::function<TaskResult()>;
using TimeoutFn = std::function<void(const std::any&, const std::optional<Error>&)>;

/**
 * @brief Adapts a plain callable into a task without timeout handling.
 */
class FunctionTask : public ITask {
public:
    explicit FunctionTask(TaskFn fn) : fn_(std::move(fn)) {}

    TaskResult execute() override { return fn_(); }

private:
    TaskFn fn_;
};

/**
 * @brief Adapts a callable pair into a timeout-aware task.
 */
class FunctionTimeoutTask : public ITask, public ITimeoutAware {
public:
    FunctionTimeoutTask(TaskFn fn, TimeoutFn on_timeout)
        : fn_(std::move(fn)), on_timeout_(std::move(on_timeout)) {}

    TaskResult execute() override { return fn_(); }

    void on_timeout(const std::any& value, const std::optional<Error>& error) override {
        if (on_timeout_) on_timeout_(value, error);
    }

private:
    TaskFn fn_;
    TimeoutFn on_timeout_;
};

/// Returns the timeout capability of @p task, or nullptr when absent.
[[nodiscard]] inline ITimeoutAware* timeout_capability(ITask& task) noexcept {
    return dynamic_cast<ITimeoutAware*>(&task);
}

}  // namespace deadline_group
