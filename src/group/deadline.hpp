/**
 * @file deadline.hpp
 * @brief One-way deadline signal shared by a group run and its workers.
 * @author DeadlineGroup contributors
 *
 * Built on std::stop_source. The signal fires when any of these happens:
 * the configured duration elapses, the parent stop token is triggered, or
 * fire() is called. Once fired it never resets.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>

namespace deadline_group {

class DeadlineSignal {
public:
    /// @param timeout  zero or negative means "no deadline" (manual only).
    /// @param parent   fires this signal too; may be a default token.
    explicit DeadlineSignal(Duration timeout, std::stop_token parent = {});

    DeadlineSignal(const DeadlineSignal&) = delete;
    DeadlineSignal& operator=(const DeadlineSignal&) = delete;

    /// Fire the signal now. Idempotent.
    void fire() noexcept;

    /**
     * @brief True once the signal has fired.
     *
     * A deadline that has passed but was not yet observed is fired here,
     * so callers never see "not expired" after the deadline instant.
     */
    [[nodiscard]] bool expired() noexcept;

    [[nodiscard]] std::stop_token token() const noexcept { return source_.get_token(); }
    [[nodiscard]] std::optional<SteadyTime> deadline() const noexcept { return deadline_; }
    [[nodiscard]] bool has_deadline() const noexcept { return deadline_.has_value(); }

    /**
     * @brief Block until @p pred holds or the signal fires.
     *
     * Wakes at the deadline instant by itself and fires the signal then.
     * @return pred() at wake-up.
     */
    template <typename Pred>
    bool wait(std::unique_lock<std::mutex>& lock, std::condition_variable_any& cv, Pred pred) {
        auto stop = source_.get_token();
        bool satisfied = deadline_
            ? cv.wait_until(lock, stop, *deadline_, pred)
            : cv.wait(lock, stop, pred);
        if (!satisfied) fire();
        return satisfied;
    }

private:
    std::stop_source source_;
    std::optional<SteadyTime> deadline_;
    std::optional<std::stop_callback<std::function<void()>>> parent_link_;
};

}  // namespace deadline_group
