/**
 * @file output_capture.hpp
 * @brief Forwards a worker's stdout/stderr to the log line by line.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace jobguard {

/**
 * @brief Reads both output pipes of one worker on a dedicated jthread.
 *
 * stdout lines are logged at info, stderr lines at warn. The last
 * @c tail_lines stderr lines are kept for the run's error summary.
 * The pipe descriptors are borrowed; the ProcessHandle owns them.
 */
class OutputCapture {
public:
    static constexpr size_t MAX_LINE_BYTES = 4096;

    OutputCapture(int stdout_fd, int stderr_fd, JobName job, Logger& logger,
                  size_t tail_lines = 20);
    ~OutputCapture();

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    /**
     * @brief Wait for end-of-file on both pipes, at most @p linger, then stop.
     *
     * Called after the worker has been reaped. A grandchild that keeps a
     * pipe open is cut off once @p linger elapses.
     */
    void finish(Duration linger = Duration{250});

    [[nodiscard]] std::vector<std::string> stderr_tail() const;
    [[nodiscard]] std::optional<std::string> last_stderr_line() const;

private:
    struct Stream {
        int fd;
        bool is_stderr;
        std::string partial;
    };

    void pump(std::stop_token stop);
    bool drain(Stream& stream);
    void emit(Stream& stream, std::string line);

    JobName job_;
    Logger& logger_;
    size_t tail_lines_;

    Stream out_;
    Stream err_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    bool done_{false};
    std::deque<std::string> tail_;

    std::jthread thread_;
};

}  // namespace jobguard
