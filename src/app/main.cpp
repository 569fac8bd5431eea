/**
 * @file main.cpp
 * @brief deadline_group_demo entry point.
 * @author DeadlineGroup contributors
 *
 * Runs a batch of sleeping tasks under one deadline and prints the outcome:
 *   Config → Logger → TaskGroup → execute_async → outcome
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "group/options.hpp"
#include "group/task_group.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <exception>
#include <iostream>
#include <ostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

using namespace deadline_group;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path;
    size_t tasks = 5;
    int64_t max_sleep_ms = 2000;
    std::optional<int64_t> timeout_ms;
    bool collect = false;
    bool nested = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: deadline_group_demo [OPTIONS]\n"
        << "  --config <path>        TOML configuration file\n"
        << "  --tasks <n>            Number of tasks (default: 5)\n"
        << "  --max-sleep-ms <ms>    Longest task sleep (default: 2000)\n"
        << "  --timeout-ms <ms>      Group deadline, overrides the config\n"
        << "  --collect              Collect results of on-time tasks\n"
        << "  --nested               Each task runs a sub-group\n"
        << "  --help, -h             Show this help message\n";
}

/// Throws std::invalid_argument / std::out_of_range on malformed numbers.
CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--tasks" && i + 1 < argc) {
            args.tasks = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--max-sleep-ms" && i + 1 < argc) {
            args.max_sleep_ms = std::stoll(argv[++i]);
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            args.timeout_ms = std::stoll(argv[++i]);
        } else if (arg == "--collect") {
            args.collect = true;
        } else if (arg == "--nested") {
            args.nested = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            std::exit(0);
        }
    }
    return args;
}

/**
 * @brief Sleeps, then returns its name. Reports late completion.
 */
class SleepTask : public ITask, public ITimeoutAware {
public:
    SleepTask(std::string name, Duration sleep, bool nested, std::shared_ptr<Logger> logger)
        : name_(std::move(name)), sleep_(sleep), nested_(nested), logger_(std::move(logger)) {}

    TaskResult execute() override {
        std::this_thread::sleep_for(sleep_);
        if (!nested_) {
            return TaskResult::success(name_);
        }

        TaskGroup sub(name_ + "_sub", with_timeout(sleep_ + Duration{1}),
                      with_collect_results(), with_logger(logger_));
        sub.emplace_task<SleepTask>(name_ + "_sub_fast", Duration{0}, false, logger_);
        sub.emplace_task<SleepTask>(name_ + "_sub_slow", sleep_ * 5, false, logger_);
        auto results = sub.execute();
        if (!results) {
            return TaskResult::failure(results.error().message);
        }
        return TaskResult::success(results->size());
    }

    void on_timeout(const std::any& /*value*/, const std::optional<Error>& error) override {
        logger_->info("task finished after deadline",
                      {{"task", name_},
                       {"error", error ? error->message : std::string{"none"}}});
    }

private:
    std::string name_;
    Duration sleep_;
    bool nested_;
    std::shared_ptr<Logger> logger_;
};

std::string describe(const TaskResult& result) {
    if (auto* name = result.value_as<std::string>()) return *name;
    if (auto* count = result.value_as<size_t>()) return std::to_string(*count) + " sub-results";
    return result.ok() ? "<empty>" : "error: " + result.error->message;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << '\n';
        print_usage(std::cerr);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Config config = default_config();
    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << '\n';
            return 1;
        }
        config = std::move(*loaded);
    }

    auto logger = make_logger(config.logging, config.group.name);
    std::stop_source interrupt;

    auto options = options_from_config(config, logger);
    options.push_back(with_parent(interrupt.get_token()));
    if (args.timeout_ms) options.push_back(with_timeout(Duration{*args.timeout_ms}));
    if (args.collect) options.push_back(with_collect_results());

    TaskGroup group(config.group.name, std::move(options));
    for (size_t i = 0; i < args.tasks; ++i) {
        auto sleep = args.tasks > 1
            ? Duration{args.max_sleep_ms * static_cast<int64_t>(i)
                       / static_cast<int64_t>(args.tasks - 1)}
            : Duration{args.max_sleep_ms};
        group.emplace_task<SleepTask>("task" + std::to_string(i), sleep, args.nested, logger);
    }

    logger->info("demo started",
                 {{"group", group.name()},
                  {"tasks", std::to_string(args.tasks)},
                  {"timeout_ms", std::to_string(group.options().timeout.count())}});

    auto future = group.execute_async();
    while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (g_shutdown_requested) {
            interrupt.request_stop();
        }
    }

    auto outcome = future.get();
    if (outcome.error) {
        std::cerr << "Execution rejected: " << outcome.error->message << '\n';
        return 2;
    }

    std::cout << "Collected " << outcome.results.size() << " of " << args.tasks
              << " results\n";
    for (const auto& result : outcome.results) {
        std::cout << "  " << describe(result) << '\n';
    }

    // Late tasks are still sleeping; give their timeout handlers a chance to report.
    if (!g_shutdown_requested && group.options().has_deadline()) {
        std::this_thread::sleep_for(Duration{args.max_sleep_ms * (args.nested ? 6 : 1)});
    }
    logger->flush();
    return 0;
}
