/**
 * @file options.hpp
 * @brief Group options and the functions that set them.
 * @author DeadlineGroup contributors
 *
 * Options are applied in call order onto a default GroupOptions; a later
 * option overrides an earlier one for the same field. Nothing is validated
 * here: the collect/deadline coupling is checked when the group executes.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <vector>

namespace deadline_group {

struct GroupOptions {
    Duration timeout{0};                  ///< 0 = no deadline
    bool collect_results{false};
    std::stop_token parent;               ///< Default token = no parent
    std::shared_ptr<Logger> logger;       ///< Never null after resolve_options()

    [[nodiscard]] bool has_deadline() const noexcept { return timeout > Duration::zero(); }
};

using Option = std::function<void(GroupOptions&)>;

/// Sets the group deadline. Sub-millisecond durations round up.
template <typename Rep, typename Period>
Option with_timeout(std::chrono::duration<Rep, Period> timeout) {
    auto rounded = std::chrono::ceil<Duration>(timeout);
    return [rounded](GroupOptions& o) { o.timeout = rounded; };
}

Option with_collect_results(bool enabled = true);
Option with_parent(std::stop_token parent);

/// Overrides the default stdout logger; nullptr restores the default.
Option with_logger(std::shared_ptr<Logger> logger);

/// Defaults first, then each option in order.
[[nodiscard]] GroupOptions resolve_options(const std::vector<Option>& options);

/// Build a logger from the [logging] section.
[[nodiscard]] std::shared_ptr<Logger> make_logger(const LoggingConfig& config,
                                                  const std::string& file_prefix = "deadline_group");

/**
 * @brief Translate a loaded Config into options.
 *
 * The returned options can be followed by programmatic ones, which then win.
 */
[[nodiscard]] std::vector<Option> options_from_config(const Config& config,
                                                      std::shared_ptr<Logger> logger = nullptr);

}  // namespace deadline_group
