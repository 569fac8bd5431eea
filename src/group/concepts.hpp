/**
 * @file concepts.hpp
 * @brief Concepts constraining what can be added to a TaskGroup.
 * @author DeadlineGroup contributors
 */

#pragma once

#include "group/task.hpp"

#include <any>
#include <concepts>
#include <optional>
#include <type_traits>

namespace deadline_group {

/**
 * @concept TaskCallable
 * @brief A nullary callable whose return converts to TaskResult.
 */
template <typename F>
concept TaskCallable = std::invocable<F&> &&
    std::convertible_to<std::invoke_result_t<F&>, TaskResult>;

/**
 * @concept TimeoutCallable
 * @brief A callable accepting a late task's (value, error) pair.
 */
template <typename F>
concept TimeoutCallable = std::invocable<F&, const std::any&, const std::optional<Error>&>;

/**
 * @concept TaskImplementation
 * @brief A concrete task type, optionally also timeout-aware.
 */
template <typename T>
concept TaskImplementation = std::derived_from<T, ITask> && !std::is_abstract_v<T>;

}  // namespace deadline_group
