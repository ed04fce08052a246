/**
 * @file job_service.cpp
 * @brief JobService implementation.
 */

#include "service/job_service.hpp"

#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace jobguard {

namespace {

std::map<JobName, JobDefinitionPtr> build_jobs(const Config& config,
                                               std::vector<JobDefinition>& extra,
                                               Logger& logger) {
    std::map<JobName, JobDefinitionPtr> jobs;

    auto add = [&](JobDefinition def) {
        auto name = def.name;
        if (jobs.contains(name)) {
            logger.warn("Duplicate job '" + name + "' ignored");
            return;
        }
        jobs.emplace(name, std::make_shared<const JobDefinition>(std::move(def)));
    };

    for (const auto& jc : config.jobs) {
        std::vector<std::string> warnings;
        auto def = make_job_definition(jc, config.limits, warnings);
        for (const auto& w : warnings) logger.warn(w);
        if (!def) {
            logger.error("Skipping job: " + def.error().message);
            continue;
        }
        add(std::move(def).value());
    }
    for (auto& def : extra) {
        add(std::move(def));
    }
    return jobs;
}

size_t wanted_threads(const Config& config, const std::map<JobName, JobDefinitionPtr>& jobs) {
    size_t total = 0;
    for (const auto& [name, job] : jobs) total += job->policy.concurrency;
    return std::max<size_t>({total, config.scheduler.worker_threads, 1});
}

/// Admitted runs beyond the pool size wait in its queue and count as backlog.
size_t pool_size(const Config& config, const std::map<JobName, JobDefinitionPtr>& jobs) {
    return std::min<size_t>(wanted_threads(config, jobs), kMaxWorkerThreads);
}

std::vector<JobDefinitionPtr> job_list(const std::map<JobName, JobDefinitionPtr>& jobs) {
    std::vector<JobDefinitionPtr> list;
    list.reserve(jobs.size());
    for (const auto& [name, job] : jobs) list.push_back(job);
    return list;
}

HistoryOptions history_options(const Config& config) {
    return HistoryOptions{
        .retention_count = config.history.retention_count,
        .retention_age = std::chrono::hours{config.history.retention_hours},
    };
}

std::unique_ptr<ILogSink> history_sink(const Config& config) {
    if (config.history.path.empty()) return nullptr;
    return JsonFileSink::for_file(config.history.path, config.telemetry.max_file_size_mb,
                                  config.telemetry.rotate_count);
}

}  // anonymous namespace

JobService::JobService(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level)
    , jobs_(build_jobs(config_, opts.extra_jobs, logger_))
    , history_(history_options(config_), history_sink(config_))
    , runner_(RunnerOptions{.kill_grace = Duration{config_.scheduler.kill_grace_ms}},
              gate_, history_, health_, logger_)
    , retries_([this](const JobDefinitionPtr& job, uint32_t attempt) { submit(job, attempt); },
               logger_)
    , pool_(pool_size(config_, jobs_))
    , loop_(job_list(jobs_), *this, logger_, Duration{config_.scheduler.tick_interval_ms}) {
    for (const auto& [name, job] : jobs_) {
        gate_.configure(name, job->policy.concurrency);
        health_.register_job(name);
    }
    register_probes();

    if (auto wanted = wanted_threads(config_, jobs_); wanted > pool_.thread_count()) {
        logger_.warn("Job concurrency limits add up to " + std::to_string(wanted)
                     + " runs; worker pool capped at " + std::to_string(pool_.thread_count())
                     + " threads, further admitted runs queue as backlog");
    }
}

JobService::~JobService() {
    // The retry timer calls back into submit(), which needs pool_.
    retries_.close();
    stop();
}

Result<void> JobService::start() {
    if (running_.exchange(true)) {
        return Error{"Already running", ErrorCode::State};
    }

    logger_.info("Job service starting: " + std::to_string(jobs_.size()) + " jobs, "
                 + std::to_string(pool_.thread_count()) + " worker threads");
    for (const auto& [name, job] : jobs_) {
        const auto& p = job->policy;
        logger_.info("Job " + name + ": schedule '" + job->schedule.expression() + "'"
                     + ", timeout " + std::to_string(p.timeout.count()) + "ms"
                     + ", as " + std::to_string(p.address_space_mb) + "MB"
                     + ", cpu " + std::to_string(p.cpu_seconds) + "s"
                     + ", concurrency " + std::to_string(p.concurrency));
    }

    loop_.start();
    logger_.info("Job service started successfully");
    return Result<void>{};
}

void JobService::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Job service shutting down...");
    loop_.stop();
    retries_.close();
    pool_.drain();
    history_.flush();
    logger_.info("Job service stopped");
    logger_.flush();
}

TriggerResult JobService::trigger(const JobName& job) {
    auto it = jobs_.find(job);
    if (it == jobs_.end()) {
        health_.record_request(true);
        logger_.warn("Trigger for unknown job '" + job + "'");
        return TriggerResult::UnknownJob;
    }
    health_.record_request(false);
    return submit(it->second);
}

void JobService::dispatch(const JobDefinitionPtr& job) {
    submit(job);
}

TriggerResult JobService::submit(const JobDefinitionPtr& job, uint32_t attempt) {
    auto ticket = runner_.admit(*job, attempt);
    if (!ticket) {
        return TriggerResult::Skipped;
    }

    health_.record_queued(job->name);

    // std::function needs a copyable callable; the permit is move-only.
    auto shared = std::make_shared<RunTicket>(std::move(*ticket));
    auto task = [this, job, shared] {
        try {
            maybe_retry(job, runner_.execute(*job, std::move(*shared)));
        } catch (const std::exception& e) {
            logger_.error("Job " + job->name + ": run aborted: " + e.what());
        }
    };

    try {
        pool_.submit(std::move(task));
    } catch (const std::exception& e) {
        logger_.warn("Job " + job->name + ": worker pool unavailable (" + e.what()
                     + "), running inline");
        maybe_retry(job, runner_.execute(*job, std::move(*shared)));
    }
    return TriggerResult::Admitted;
}

void JobService::maybe_retry(const JobDefinitionPtr& job, const RunRecord& record) {
    if (record.outcome != RunOutcome::Failed && record.outcome != RunOutcome::TimedOut) return;

    const auto& retry = job->retry;
    if (record.attempt >= retry.max_retries) {
        if (retry.enabled()) {
            logger_.warn("Job " + job->name + ": giving up after " + std::to_string(record.attempt)
                         + " retries");
        }
        return;
    }

    uint32_t next = record.attempt + 1;
    auto delay = retry.delay_for(next);
    if (retries_.schedule(job, next, delay)) {
        health_.record_retry(job->name);
        logger_.info("Job " + job->name + ": retry " + std::to_string(next) + " of "
                     + std::to_string(retry.max_retries) + " in "
                     + std::to_string(delay.count()) + "ms");
    }
}

std::vector<RunRecord> JobService::run_all_once() {
    RunId baseline = JobRunner::last_run_id();
    for (const auto& [name, job] : jobs_) {
        submit(job);
    }
    drain();

    std::vector<RunRecord> out;
    for (auto& record : history_.records()) {
        if (record.run_id > baseline) out.push_back(std::move(record));
    }
    std::sort(out.begin(), out.end(),
              [](const RunRecord& a, const RunRecord& b) { return a.run_id < b.run_id; });
    return out;
}

void JobService::drain() {
    // A finished run may queue a retry, and a fired retry queues a run.
    pool_.drain();
    while (retries_.pending() > 0) {
        retries_.wait_idle();
        pool_.drain();
    }
}

std::vector<JobDefinitionPtr> JobService::jobs() const {
    return job_list(jobs_);
}

std::string JobService::status_line() const {
    auto h = health_.check();
    auto m = health_.metrics();

    std::ostringstream oss;
    oss << "status=" << to_string(h.status);
    if (h.reason) oss << " (" << *h.reason << ")";
    oss << " requests=" << m.requests_total << " errors=" << m.errors_total;
    for (const auto& [name, c] : m.jobs) {
        oss << " | " << name
            << " ok=" << c.succeeded
            << " failed=" << c.failed
            << " timed_out=" << c.timed_out
            << " skipped=" << c.skipped
            << " retries=" << c.retries
            << " running=" << c.running
            << " backlog=" << c.backlog;
        if (c.last_outcome) {
            oss << " last=" << to_string(*c.last_outcome);
            if (c.last_reason != ReasonCode::None) oss << "/" << to_string(c.last_reason);
        }
    }
    return oss.str();
}

void JobService::register_probes() {
    for (const auto& path : config_.health.critical_paths) {
        health_.add_probe("path:" + path.string(), true,
                          [path] { return probe_writable_path(path); });
    }
    for (const auto& path : config_.health.optional_paths) {
        health_.add_probe("path:" + path.string(), false,
                          [path] { return probe_writable_path(path); });
    }
    if (!config_.history.path.empty()) {
        auto dir = config_.history.path.parent_path();
        if (dir.empty()) dir = ".";
        health_.add_probe("history", true, [dir] { return probe_writable_path(dir); });
    }
}

}  // namespace jobguard
