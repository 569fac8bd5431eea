/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps and JSON fields.
 * @author DeadlineGroup contributors
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace deadline_group {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string json_escape(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += hex.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message, const LogFields& fields) {
    log(LogLevel::Debug, message, fields);
}

void Logger::info(std::string_view message, const LogFields& fields) {
    log(LogLevel::Info, message, fields);
}

void Logger::warn(std::string_view message, const LogFields& fields) {
    log(LogLevel::Warn, message, fields);
}

void Logger::error(std::string_view message, const LogFields& fields) {
    log(LogLevel::Error, message, fields);
}

void Logger::error(std::string_view message, const Error& err, const LogFields& fields) {
    LogFields all;
    all.reserve(fields.size() + 2);
    all.emplace_back("error", err.message);
    all.emplace_back("error_code", std::string{to_string(err.code)});
    all.insert(all.end(), fields.begin(), fields.end());
    log(LogLevel::Error, message, all);
}

void Logger::log(LogLevel level, std::string_view message, const LogFields& fields) {
    if (level < min_level_.load(std::memory_order_relaxed)) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")"
        << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << R"(Z",)"
        << R"("msg":")" << json_escape(message) << '"';
    for (const auto& [key, value] : fields) {
        oss << R"(,")" << json_escape(key) << R"(":")" << json_escape(value) << '"';
    }
    oss << '}';

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_.store(level); }
LogLevel Logger::level() const noexcept { return min_level_.load(); }

std::shared_ptr<Logger> make_default_logger() {
    return std::make_shared<Logger>(std::make_unique<StdoutSink>(), LogLevel::Info);
}

}  // namespace deadline_group
