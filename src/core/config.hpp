/**
 * @file config.hpp
 * @brief Group and logging configuration with TOML deserialization.
 * @author DeadlineGroup contributors
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace deadline_group {

struct GroupConfig {
    std::string name = "default";
    int64_t timeout_ms = 0;             ///< 0 = no deadline
    bool collect_results = false;
};

struct LoggingConfig {
    std::string level = "info";         ///< "debug", "info", "warn", "error"
    std::string sink = "stdout";        ///< "stdout", "null", "file"
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration file contents.
 */
struct Config {
    GroupConfig group;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Unknown level or sink names, a
 * negative timeout and out-of-range rotation settings are rejected with
 * ErrorCode::ConfigInvalid.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace deadline_group
