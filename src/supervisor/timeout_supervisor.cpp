/**
 * @file timeout_supervisor.cpp
 * @brief TimeoutSupervisor implementation.
 */

#include "supervisor/timeout_supervisor.hpp"

#include <csignal>
#include <cstdio>
#include <string>

namespace jobguard {

namespace {

std::string format_seconds(Duration d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3fs", static_cast<double>(d.count()) / 1000.0);
    return buf;
}

}  // anonymous namespace

TimeoutSupervisor::TimeoutSupervisor(ProcessHandle& process, SteadyTime admitted_at,
                                     Duration timeout, Duration grace, JobName job,
                                     Logger& logger)
    : process_(process),
      deadline_(admitted_at + timeout),
      timeout_(timeout),
      grace_(grace),
      job_(std::move(job)),
      logger_(logger) {
    if (timeout_.count() > 0) {
        timer_ = std::jthread([this](std::stop_token stop) { watch(stop); });
    }
}

TimeoutSupervisor::~TimeoutSupervisor() {
    disarm();
}

void TimeoutSupervisor::disarm() {
    if (timer_.joinable()) {
        timer_.request_stop();
        timer_.join();
    }
}

void TimeoutSupervisor::watch(std::stop_token stop) {
    std::unique_lock lock(mutex_);

    cv_.wait_until(lock, stop, deadline_, [] { return false; });
    if (stop.stop_requested()) return;

    if (!process_.signal_group(SIGTERM)) {
        return;  // exited on its own at the deadline
    }
    fired_ = true;
    logger_.warn("Job " + job_ + " exceeded timeout of " + format_seconds(timeout_)
                 + ", sent SIGTERM to worker " + std::to_string(process_.pid()));

    cv_.wait_until(lock, stop, SteadyTime::clock::now() + grace_, [] { return false; });
    if (stop.stop_requested()) return;

    if (process_.signal_group(SIGKILL)) {
        escalated_ = true;
        logger_.warn("Job " + job_ + " still running " + format_seconds(grace_)
                     + " after SIGTERM, sent SIGKILL to worker " + std::to_string(process_.pid()));
    }
}

}  // namespace jobguard
