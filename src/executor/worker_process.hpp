/**
 * @file worker_process.hpp
 * @brief Isolated worker processes: spawn, signal, reap.
 *
 * Every run executes in its own process group so that a forced
 * termination also reaches anything the job forked. The child reports
 * set-up problems and job-logic exceptions back to the parent over a
 * close-on-exec pipe as fixed-size ChildReport records.
 *
 * Between fork() and exec the child only makes async-signal-safe calls.
 * Callable jobs are the exception: the callable itself runs in the child
 * and must not touch locks owned by other parent threads (the logger in
 * particular).
 */

#pragma once

#include "core/result.hpp"
#include "limits/resource_limiter.hpp"
#include "scheduler/job.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace jobguard {

// ─────────────────────────────────────────────
// Child exit statuses
// ─────────────────────────────────────────────

inline constexpr int kExitCallableFailed = 1;
inline constexpr int kExitJobException = 70;
inline constexpr int kExitOutOfMemory = 71;
inline constexpr int kExitSpawnFailed = 127;

// ─────────────────────────────────────────────
// Child → parent report pipe
// ─────────────────────────────────────────────

enum class ChildReportKind : uint8_t {
    LimitFailed,        ///< setrlimit() failed; the job still ran
    ExecFailed,         ///< chdir() or exec failed; the job never ran
    Exception,          ///< job logic threw
    OutOfMemory         ///< job logic threw std::bad_alloc
};

struct ChildReport {
    ChildReportKind kind{ChildReportKind::Exception};
    LimitResource resource{LimitResource::None};
    int32_t error{0};               ///< errno, where meaningful
    char message[200]{};            ///< NUL-terminated, truncated

    [[nodiscard]] std::string describe() const;
};

// ─────────────────────────────────────────────
// Exit information
// ─────────────────────────────────────────────

struct WorkerExit {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::chrono::microseconds cpu_time{0};  ///< user + system
    long max_rss_kb{0};
    std::vector<ChildReport> reports;

    [[nodiscard]] const ChildReport* find(ChildReportKind kind) const noexcept;
};

// ─────────────────────────────────────────────
// ProcessHandle
// ─────────────────────────────────────────────

/**
 * @brief Owns one spawned worker and the parent ends of its pipes.
 *
 * signal_group() and wait() may be called from different threads.
 * wait() observes the exit without reaping first, marks the handle as
 * exited under the lock, and only then reaps; signal_group() checks that
 * mark under the same lock, so a signal never reaches a recycled pid.
 */
class ProcessHandle {
public:
    ProcessHandle(pid_t pid, int report_fd, int stdout_fd, int stderr_fd);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const noexcept { return stderr_fd_; }

    /**
     * @brief Send @p signal to the worker's process group.
     * @return false if the worker has already exited.
     */
    bool signal_group(int signal);

    /// Block until the worker exits, then reap it. Call at most once.
    [[nodiscard]] Result<WorkerExit> wait();

    [[nodiscard]] bool exited() const;

private:
    std::vector<ChildReport> read_reports();

    pid_t pid_;
    int report_fd_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex mutex_;
    bool exited_{false};
    bool reaped_{false};
};

/**
 * @brief Fork a worker that runs @p logic under @p limits.
 *
 * The worker gets /dev/null as stdin and pipes as stdout/stderr.
 */
[[nodiscard]] Result<std::unique_ptr<ProcessHandle>> spawn_worker(const JobLogic& logic,
                                                                  const LimitPlan& limits);

}  // namespace jobguard
