/**
 * @file options.cpp
 * @brief Option functions and config-to-options translation.
 * @author DeadlineGroup contributors
 */

#include "group/options.hpp"
#include "telemetry/json_sink.hpp"

namespace deadline_group {

Option with_collect_results(bool enabled) {
    return [enabled](GroupOptions& o) { o.collect_results = enabled; };
}

Option with_parent(std::stop_token parent) {
    return [parent = std::move(parent)](GroupOptions& o) { o.parent = parent; };
}

Option with_logger(std::shared_ptr<Logger> logger) {
    return [logger = std::move(logger)](GroupOptions& o) { o.logger = logger; };
}

GroupOptions resolve_options(const std::vector<Option>& options) {
    GroupOptions resolved;
    for (const auto& apply : options) {
        if (apply) apply(resolved);
    }
    if (!resolved.logger) {
        resolved.logger = make_default_logger();
    }
    return resolved;
}

std::shared_ptr<Logger> make_logger(const LoggingConfig& config, const std::string& file_prefix) {
    auto level = parse_log_level(config.level).value_or(LogLevel::Info);

    std::unique_ptr<ILogSink> sink;
    if (config.sink == "null") {
        sink = std::make_unique<NullSink>();
    } else if (config.sink == "file") {
        sink = std::make_unique<JsonFileSink>(config.log_dir, file_prefix,
                                              config.max_file_size_mb, config.rotate_count);
    } else {
        sink = std::make_unique<StdoutSink>();
    }
    return std::make_shared<Logger>(std::move(sink), level);
}

std::vector<Option> options_from_config(const Config& config, std::shared_ptr<Logger> logger) {
    std::vector<Option> options;
    options.push_back(with_timeout(Duration{config.group.timeout_ms}));
    options.push_back(with_collect_results(config.group.collect_results));
    if (!logger) {
        logger = make_logger(config.logging, config.group.name);
    }
    options.push_back(with_logger(std::move(logger)));
    return options;
}

}  // namespace deadline_group
