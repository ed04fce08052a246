/**
 * @file run_history.cpp
 * @brief RunHistory implementation.
 */

#include "history/run_history.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace jobguard {

RunHistory::RunHistory(HistoryOptions options, std::unique_ptr<ILogSink> sink)
    : options_(options), sink_(std::move(sink)) {}

void RunHistory::append(RunRecord record) {
    std::lock_guard lock(mutex_);
    if (sink_) {
        sink_->write(to_json(record));
        sink_->flush();
    }
    records_.push_back(std::move(record));
    prune_locked(std::chrono::system_clock::now());
}

std::vector<RunRecord> RunHistory::records() const {
    std::lock_guard lock(mutex_);
    return {records_.begin(), records_.end()};
}

std::vector<RunRecord> RunHistory::records_for(const JobName& job) const {
    std::vector<RunRecord> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& r : records_) {
            if (r.job_name == job) out.push_back(r);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const RunRecord& a, const RunRecord& b) { return a.run_id < b.run_id; });
    return out;
}

std::optional<RunRecord> RunHistory::last(const JobName& job) const {
    std::lock_guard lock(mutex_);
    const RunRecord* best = nullptr;
    for (const auto& r : records_) {
        if (r.job_name == job && (best == nullptr || r.run_id > best->run_id)) best = &r;
    }
    if (best == nullptr) return std::nullopt;
    return *best;
}

size_t RunHistory::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

size_t RunHistory::prune(Timestamp now) {
    std::lock_guard lock(mutex_);
    return prune_locked(now);
}

void RunHistory::flush() {
    std::lock_guard lock(mutex_);
    if (sink_) sink_->flush();
}

size_t RunHistory::prune_locked(Timestamp now) {
    size_t removed = 0;

    if (options_.retention_age.count() > 0) {
        auto cutoff = now - options_.retention_age;
        auto old_end = records_.end();
        auto it = std::remove_if(records_.begin(), old_end,
                                 [cutoff](const RunRecord& r) { return r.finished_at < cutoff; });
        removed += static_cast<size_t>(std::distance(it, old_end));
        records_.erase(it, old_end);
    }

    if (options_.retention_count > 0) {
        while (records_.size() > options_.retention_count) {
            records_.pop_front();
            ++removed;
        }
    }
    return removed;
}

std::string to_json(const RunRecord& record) {
    std::ostringstream oss;
    oss << R"({"run_id":)" << record.run_id
        << R"(,"job":")" << json_escape(record.job_name) << "\""
        << R"(,"attempt":)" << record.attempt
        << R"(,"started_at":")" << format_timestamp(record.started_at) << "\""
        << R"(,"finished_at":")" << format_timestamp(record.finished_at) << "\""
        << R"(,"duration_ms":)" << record.duration().count()
        << R"(,"outcome":")" << to_string(record.outcome) << "\""
        << R"(,"reason":")" << to_string(record.reason) << "\"";
    if (record.error_summary) {
        oss << R"(,"error":")" << json_escape(*record.error_summary) << "\"";
    }
    if (record.worker_pid > 0) {
        oss << R"(,"pid":)" << record.worker_pid;
    }
    if (record.exit_code) {
        oss << R"(,"exit_code":)" << *record.exit_code;
    }
    if (record.term_signal) {
        oss << R"(,"signal":)" << *record.term_signal;
    }
    oss << "}";
    return oss.str();
}

}  // namespace jobguard
