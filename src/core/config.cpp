/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author DeadlineGroup contributors
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <string>

namespace deadline_group {

namespace {

constexpr int64_t kMaxFileSizeMb = 1024 * 1024;  // 1 TiB
constexpr int64_t kMaxRotateCount = 1000;

Result<Config> validate(Config config) {
    if (config.group.timeout_ms < 0) {
        return Error{ErrorCode::ConfigInvalid,
                     "group.timeout_ms must be >= 0, got " +
                         std::to_string(config.group.timeout_ms)};
    }
    if (!parse_log_level(config.logging.level)) {
        return Error{ErrorCode::ConfigInvalid,
                     "Unknown logging.level: " + config.logging.level};
    }
    const auto& sink = config.logging.sink;
    if (sink != "stdout" && sink != "null" && sink != "file") {
        return Error{ErrorCode::ConfigInvalid, "Unknown logging.sink: " + sink};
    }
    return config;
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [group]
    if (auto group = tbl["group"]; group.is_table()) {
        config.group.name = group["name"].value_or(std::string{"default"});
        config.group.timeout_ms = group["timeout_ms"].value_or(int64_t{0});
        config.group.collect_results = group["collect_results"].value_or(false);
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        config.logging.level = logging["level"].value_or(std::string{"info"});
        config.logging.sink = logging["sink"].value_or(std::string{"stdout"});
        config.logging.log_dir = logging["log_dir"].value_or(std::string{"./logs"});

        auto max_file_size_mb = logging["max_file_size_mb"].value_or(int64_t{50});
        if (max_file_size_mb < 0 || max_file_size_mb > kMaxFileSizeMb) {
            return Error{ErrorCode::ConfigInvalid,
                         "logging.max_file_size_mb must be in [0, " +
                             std::to_string(kMaxFileSizeMb) + "], got " +
                             std::to_string(max_file_size_mb)};
        }
        config.logging.max_file_size_mb = static_cast<uint32_t>(max_file_size_mb);

        auto rotate_count = logging["rotate_count"].value_or(int64_t{5});
        if (rotate_count < 0 || rotate_count > kMaxRotateCount) {
            return Error{ErrorCode::ConfigInvalid,
                         "logging.rotate_count must be in [0, " +
                             std::to_string(kMaxRotateCount) + "], got " +
                             std::to_string(rotate_count)};
        }
        config.logging.rotate_count = static_cast<uint32_t>(rotate_count);
    }

    return validate(std::move(config));
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigNotFound,
                     "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigParse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigParse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace deadline_group
