/**
 * @file main.cpp
 * @brief jobguard daemon entry point.
 *
 * Wires all modules into the scheduling pipeline:
 *   Config → Environment → Logger → JobService (Gate, Runner, Pool, History, Health, Loop)
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "service/job_service.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace jobguard;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool once = false;
};

void print_usage() {
    std::cout << "Usage: jobguardd [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>   Log output directory (default: stdout)\n"
              << "  --once             Run every job once, wait, and exit\n"
              << "  --help, -h         Show this help message\n"
              << "\n"
              << "Environment overrides for the [limits] defaults:\n"
              << "  JOB_TIMEOUT, JOB_RLIMIT_AS_MB, JOB_RLIMIT_CPU_SECONDS, RUN_JOB_CONCURRENCY\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (!telemetry.log_dir.empty()) {
        return std::make_unique<JsonFileSink>(telemetry.log_dir, "jobguard",
                                              telemetry.max_file_size_mb,
                                              telemetry.rotate_count);
    }
    return std::make_unique<StdoutSink>();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply environment and CLI overrides
    apply_environment(config);
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        config.warnings.push_back("telemetry.log_level: unknown level '"
                                  + config.telemetry.log_level + "', using info");
    }

    // ── Initialize Service ───────────────────
    auto warnings = config.warnings;
    auto status_interval = std::chrono::seconds{config.scheduler.status_interval_s};
    auto log_sink = make_log_sink(config.telemetry);

    JobService service(JobService::Options{
        .config = std::move(config),
        .log_sink = std::move(log_sink),
        .log_level = level.value_or(LogLevel::Info),
        .extra_jobs = {},
    });
    auto& logger = service.logger();

    logger.info("jobguard starting...");
    logger.info("Config: " + args.config_path.string()
                + (config_result ? std::string{} : std::string{" (not loaded, using defaults)"}));
    for (const auto& w : warnings) logger.warn(w);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── One-shot mode ────────────────────────
    if (args.once) {
        auto records = service.run_all_once();
        size_t failures = 0;
        for (const auto& r : records) {
            if (r.outcome != RunOutcome::Success) ++failures;
        }
        logger.info("One-shot run complete: " + std::to_string(records.size()) + " runs, "
                    + std::to_string(failures) + " not successful");
        logger.info(service.status_line());
        logger.flush();
        return failures == 0 ? 0 : 1;
    }

    // ── Main Loop ────────────────────────────
    if (auto started = service.start(); !started) {
        logger.error("Could not start job service: " + started.error().message);
        return 1;
    }
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    auto next_status = std::chrono::steady_clock::now() + status_interval;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (status_interval.count() > 0 && std::chrono::steady_clock::now() >= next_status) {
            logger.info("Status: " + service.status_line());
            next_status += status_interval;
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Waiting for in-flight runs...");
    service.stop();
    logger.info("jobguard stopped.");
    logger.flush();
    return 0;
}
