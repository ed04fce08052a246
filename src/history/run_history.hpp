/**
 * @file run_history.hpp
 * @brief Append-only, bounded store of finalized RunRecords.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jobguard {

struct HistoryOptions {
    size_t retention_count{500};                ///< 0 = no count bound
    std::chrono::hours retention_age{720};      ///< 0 = no age bound
};

/**
 * @brief Thread-safe run history.
 *
 * Records are kept in the order they were finalized. Each append prunes
 * by count and by age (finished_at). When a sink is given, every record
 * is also written to it as one NDJSON line; pruning never touches the sink.
 */
class RunHistory {
public:
    explicit RunHistory(HistoryOptions options = {}, std::unique_ptr<ILogSink> sink = nullptr);

    void append(RunRecord record);

    [[nodiscard]] std::vector<RunRecord> records() const;

    /// Records of @p job, ordered by run_id.
    [[nodiscard]] std::vector<RunRecord> records_for(const JobName& job) const;

    /// Most recently admitted finalized run of @p job.
    [[nodiscard]] std::optional<RunRecord> last(const JobName& job) const;

    [[nodiscard]] size_t size() const;

    /// Drop records finished before @p now minus the retention age.
    size_t prune(Timestamp now);

    void flush();

private:
    size_t prune_locked(Timestamp now);

    HistoryOptions options_;
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex mutex_;
    std::deque<RunRecord> records_;
};

/// One-line JSON rendering of a record.
[[nodiscard]] std::string to_json(const RunRecord& record);

}  // namespace jobguard
