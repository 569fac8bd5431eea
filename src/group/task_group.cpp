/**
 * @file task_group.cpp
 * @brief TaskGroup execution engine: workers, supervisor and delivery.
 * @author DeadlineGroup contributors
 */

#include "group/task_group.hpp"
#include "group/deadline.hpp"
#include "group/result_channel.hpp"

#include <condition_variable>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <typeinfo>

namespace deadline_group {

namespace {

/**
 * @brief Per-execution state, co-owned by the supervisor and every worker.
 *
 * Workers may outlive both the outcome and the TaskGroup itself, so nothing
 * here refers back to the group.
 */
struct RunState {
    RunState(GroupName group_name, size_t task_count, const GroupOptions& options,
             std::stop_token parent)
        : name(std::move(group_name))
        , logger(options.logger)
        , collect(options.collect_results)
        , channel(task_count)
        , deadline(options.timeout, std::move(parent))
        , pending(task_count) {}

    const GroupName name;
    const std::shared_ptr<Logger> logger;
    const bool collect;

    ResultChannel<TaskResult> channel;
    DeadlineSignal deadline;

    std::mutex mutex;
    std::condition_variable_any done_cv;
    size_t pending;

    void worker_done() {
        {
            std::lock_guard lock(mutex);
            --pending;
        }
        done_cv.notify_all();
    }
};

/// Signals worker completion on scope exit, including after a caught exception.
class CompletionGuard {
public:
    explicit CompletionGuard(RunState& run) : run_(run) {}
    ~CompletionGuard() { run_.worker_done(); }

    CompletionGuard(const CompletionGuard&) = delete;
    CompletionGuard& operator=(const CompletionGuard&) = delete;

private:
    RunState& run_;
};

void log_task_exception(RunState& run, TaskIndex index, std::string_view stage,
                        std::string_view type, std::string_view what) {
    run.logger->error("task run error",
                      Error{ErrorCode::TaskException, std::string{what}},
                      {{"group", run.name},
                       {"index", std::to_string(index)},
                       {"stage", std::string{stage}},
                       {"exception", std::string{type}}});
}

/**
 * @brief Body of one worker thread.
 *
 * Runs the task, then either delivers its result or, once the deadline
 * has fired, routes it to the task's timeout handler.
 *
 * An escaping exception is logged with the exception type and what() only.
 * There is no `stack` field: C++20 has no portable way to capture the
 * thrower's stack.
 */
void run_worker(const std::shared_ptr<RunState>& run,
                const std::shared_ptr<ITask>& task,
                TaskIndex index) {
    CompletionGuard guard(*run);

    std::optional<TaskResult> produced;
    try {
        produced = task->execute();
    } catch (const std::exception& e) {
        log_task_exception(*run, index, "execute", typeid(e).name(), e.what());
    } catch (...) {
        log_task_exception(*run, index, "execute", "unknown", "non-standard exception");
    }
    if (!produced) return;

    auto status = run->channel.send_before(*produced, run->deadline);
    if (status == SendStatus::Delivered) return;

    auto* timeout_aware = timeout_capability(*task);
    if (timeout_aware == nullptr) return;

    try {
        timeout_aware->on_timeout(produced->value, produced->error);
    } catch (const std::exception& e) {
        log_task_exception(*run, index, "on_timeout", typeid(e).name(), e.what());
    } catch (...) {
        log_task_exception(*run, index, "on_timeout", "unknown", "non-standard exception");
    }
}

/// Waits for all workers or the deadline, then drains and delivers.
void run_supervisor(const std::shared_ptr<RunState>& run, std::promise<GroupOutcome> promise) {
    bool all_completed = false;
    {
        std::unique_lock lock(run->mutex);
        all_completed = run->deadline.wait(lock, run->done_cv,
                                           [&run] { return run->pending == 0; });
    }
    auto phase = all_completed ? ExecutionPhase::AllCompleted : ExecutionPhase::DeadlineExpired;

    // From here on every delivery attempt takes the timeout path.
    run->deadline.fire();
    auto drained = run->channel.close_and_drain();

    GroupOutcome outcome;
    if (run->collect) {
        outcome.results = std::move(drained);
    }

    run->logger->debug("group delivered",
                       {{"group", run->name},
                        {"phase", std::string{to_string(phase)}},
                        {"results", std::to_string(outcome.results.size())}});
    promise.set_value(std::move(outcome));
}

}  // namespace

// ── TaskGroup ────────────────────────────────

TaskGroup::TaskGroup(GroupName name, std::vector<Option> options)
    : name_(std::move(name))
    , options_(resolve_options(options))
    , parent_(options_.parent) {}

void TaskGroup::add_task(std::shared_ptr<ITask> task) {
    if (!task) {
        options_.logger->warn("ignoring null task", {{"group", name_}});
        return;
    }
    std::lock_guard lock(mutex_);
    tasks_.push_back(std::move(task));
}

void TaskGroup::add_tasks(std::vector<std::shared_ptr<ITask>> tasks) {
    for (auto& task : tasks) {
        add_task(std::move(task));
    }
}

void TaskGroup::reset() {
    std::lock_guard lock(mutex_);
    tasks_.clear();
    parent_ = std::stop_token{};
}

void TaskGroup::set_parent(std::stop_token parent) {
    std::lock_guard lock(mutex_);
    parent_ = std::move(parent);
}

size_t TaskGroup::task_count() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

std::optional<Error> TaskGroup::validate_locked() const {
    if (tasks_.empty()) {
        return Error{ErrorCode::EmptyTaskSet, "no tasks to execute"};
    }
    if (options_.collect_results && !options_.has_deadline()) {
        return Error{ErrorCode::CollectWithoutDeadline, "no timeout set for result collection"};
    }
    return std::nullopt;
}

std::future<GroupOutcome> TaskGroup::execute_async() {
    std::lock_guard lock(mutex_);

    std::promise<GroupOutcome> promise;
    auto future = promise.get_future();

    if (auto err = validate_locked()) {
        promise.set_value(GroupOutcome{{}, std::move(err)});
        return future;
    }

    auto run = std::make_shared<RunState>(name_, tasks_.size(), options_, parent_);
    options_.logger->debug("group dispatched",
                           {{"group", name_},
                            {"tasks", std::to_string(tasks_.size())},
                            {"timeout_ms", std::to_string(options_.timeout.count())}});

    for (TaskIndex i = 0; i < tasks_.size(); ++i) {
        try {
            std::thread([run, task = tasks_[i], i] { run_worker(run, task, i); }).detach();
        } catch (const std::system_error& e) {
            log_task_exception(*run, i, "spawn", "std::system_error", e.what());
            run->worker_done();
        }
    }

    // Without a deadline the run is fire-and-forget.
    if (!options_.has_deadline()) {
        run->deadline.fire();
    }

    auto shared_promise = std::make_shared<std::promise<GroupOutcome>>(std::move(promise));
    try {
        std::thread([run, shared_promise] {
            run_supervisor(run, std::move(*shared_promise));
        }).detach();
    } catch (const std::system_error& e) {
        options_.logger->error("supervisor spawn failed, delivering inline",
                               Error{ErrorCode::TaskException, e.what()},
                               {{"group", name_}});
        run->deadline.fire();
        run_supervisor(run, std::move(*shared_promise));
    }

    return future;
}

Result<std::vector<TaskResult>> TaskGroup::execute() {
    auto outcome = execute_async().get();
    if (outcome.error) {
        return std::move(*outcome.error);
    }
    return std::move(outcome.results);
}

}  // namespace deadline_group
