/**
 * @file output_capture.cpp
 * @brief OutputCapture implementation using poll().
 */

#include "executor/output_capture.hpp"

#include <cerrno>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace jobguard {

namespace {

constexpr int kPollIntervalMs = 50;

}  // anonymous namespace

OutputCapture::OutputCapture(int stdout_fd, int stderr_fd, JobName job, Logger& logger,
                             size_t tail_lines)
    : job_(std::move(job)),
      logger_(logger),
      tail_lines_(tail_lines),
      out_{stdout_fd, false, {}},
      err_{stderr_fd, true, {}} {
    thread_ = std::jthread([this](std::stop_token stop) { pump(stop); });
}

OutputCapture::~OutputCapture() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void OutputCapture::finish(Duration linger) {
    {
        std::unique_lock lock(mutex_);
        done_cv_.wait_for(lock, linger, [this] { return done_; });
    }
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

std::vector<std::string> OutputCapture::stderr_tail() const {
    std::lock_guard lock(mutex_);
    return {tail_.begin(), tail_.end()};
}

std::optional<std::string> OutputCapture::last_stderr_line() const {
    std::lock_guard lock(mutex_);
    if (tail_.empty()) return std::nullopt;
    return tail_.back();
}

void OutputCapture::pump(std::stop_token stop) {
    bool out_open = out_.fd >= 0;
    bool err_open = err_.fd >= 0;

    while ((out_open || err_open) && !stop.stop_requested()) {
        pollfd fds[2]{};
        fds[0].fd = out_open ? out_.fd : -1;
        fds[0].events = POLLIN;
        fds[1].fd = err_open ? err_.fd : -1;
        fds[1].events = POLLIN;

        int ready = ::poll(fds, 2, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_.warn("Job " + job_ + ": output capture poll failed, output dropped");
            break;
        }
        if (ready == 0) continue;

        if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) out_open = drain(out_);
        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) err_open = drain(err_);
    }

    // Last pass for anything written just before the stop request.
    if (out_open) drain(out_);
    if (err_open) drain(err_);
    for (Stream* s : {&out_, &err_}) {
        if (!s->partial.empty()) emit(*s, std::move(s->partial));
        s->partial.clear();
    }

    {
        std::lock_guard lock(mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

/// Read what is available. Returns false on end-of-file.
bool OutputCapture::drain(Stream& stream) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(stream.fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
        if (n == 0) return false;

        for (ssize_t i = 0; i < n; ++i) {
            char c = buf[i];
            if (c == '\n') {
                emit(stream, std::move(stream.partial));
                stream.partial.clear();
            } else if (c != '\r') {
                stream.partial.push_back(c);
                if (stream.partial.size() >= MAX_LINE_BYTES) {
                    emit(stream, std::move(stream.partial));
                    stream.partial.clear();
                }
            }
        }
    }
}

void OutputCapture::emit(Stream& stream, std::string line) {
    if (stream.is_stderr) {
        logger_.warn("Job " + job_ + " stderr: " + line);
        std::lock_guard lock(mutex_);
        if (line.empty()) return;
        tail_.push_back(std::move(line));
        while (tail_.size() > tail_lines_) tail_.pop_front();
    } else {
        logger_.info("Job " + job_ + " stdout: " + line);
    }
}

}  // namespace jobguard
