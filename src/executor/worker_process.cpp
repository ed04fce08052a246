/**
 * @file worker_process.cpp
 * @brief fork/exec worker processes with a report pipe and group signalling.
 */

#include "executor/worker_process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace jobguard {

namespace {

// ── Child side (async-signal-safe up to exec) ──

struct ChildContext {
    const LimitPlan* limits{nullptr};
    int report_fd{-1};
    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
    const char* working_dir{nullptr};
    char* const* argv{nullptr};
    char* const* envp{nullptr};
    const JobCallable* callable{nullptr};
};

void append(char* dst, size_t cap, size_t& pos, const char* src) noexcept {
    while (src != nullptr && *src != '\0' && pos + 1 < cap) {
        dst[pos++] = *src++;
    }
    dst[pos] = '\0';
}

void write_report(int fd, const ChildReport& report) noexcept {
    const auto* bytes = reinterpret_cast<const char*>(&report);
    size_t sent = 0;
    while (sent < sizeof(report)) {
        ssize_t n = ::write(fd, bytes + sent, sizeof(report) - sent);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

void report(int fd, ChildReportKind kind, int err, const char* what, const char* detail = nullptr) noexcept {
    ChildReport r;
    r.kind = kind;
    r.error = err;
    size_t pos = 0;
    append(r.message, sizeof(r.message), pos, what);
    if (detail != nullptr) {
        append(r.message, sizeof(r.message), pos, " ");
        append(r.message, sizeof(r.message), pos, detail);
    }
    write_report(fd, r);
}

void reset_signals() noexcept {
    sigset_t empty;
    ::sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE, SIGCHLD}) {
        ::signal(sig, SIG_DFL);
    }
}

[[noreturn]] void run_callable(const ChildContext& ctx) {
    int status = kExitCallableFailed;
    try {
        status = (*ctx.callable)() ? 0 : kExitCallableFailed;
    } catch (const std::bad_alloc& e) {
        ChildReport r;
        r.kind = ChildReportKind::OutOfMemory;
        size_t pos = 0;
        append(r.message, sizeof(r.message), pos, e.what());
        write_report(ctx.report_fd, r);
        status = kExitOutOfMemory;
    } catch (const std::exception& e) {
        report(ctx.report_fd, ChildReportKind::Exception, 0, e.what());
        status = kExitJobException;
    } catch (...) {
        report(ctx.report_fd, ChildReportKind::Exception, 0, "non-standard exception");
        status = kExitJobException;
    }
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
    ::_exit(status);
}

[[noreturn]] void run_child(const ChildContext& ctx) noexcept {
    ::setpgid(0, 0);
    reset_signals();

    ::dup2(ctx.stdin_fd, STDIN_FILENO);
    ::dup2(ctx.stdout_fd, STDOUT_FILENO);
    ::dup2(ctx.stderr_fd, STDERR_FILENO);

    // Best effort: a ceiling that cannot be set is reported, the job still runs.
    auto failure = ResourceLimiter::apply(*ctx.limits);
    if (failure.failed()) {
        ChildReport r;
        r.kind = ChildReportKind::LimitFailed;
        r.resource = failure.resource;
        r.error = failure.error;
        write_report(ctx.report_fd, r);
    }

    if (ctx.working_dir != nullptr && ::chdir(ctx.working_dir) != 0) {
        report(ctx.report_fd, ChildReportKind::ExecFailed, errno, "chdir", ctx.working_dir);
        ::_exit(kExitSpawnFailed);
    }

    if (ctx.callable != nullptr) {
        run_callable(ctx);
    }

    ::execvpe(ctx.argv[0], ctx.argv, ctx.envp);
    report(ctx.report_fd, ChildReportKind::ExecFailed, errno, "exec", ctx.argv[0]);
    ::_exit(kExitSpawnFailed);
}

// ── Parent side ──

std::string_view env_key(std::string_view entry) {
    return entry.substr(0, entry.find('='));
}

std::vector<std::string> build_environment(const std::vector<std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string_view entry{*e};
        bool overridden = std::any_of(extra.begin(), extra.end(), [&](const std::string& x) {
            return env_key(x) == env_key(entry);
        });
        if (!overridden) env.emplace_back(entry);
    }
    env.insert(env.end(), extra.begin(), extra.end());
    return env;
}

std::vector<char*> to_pointers(std::vector<std::string>& strings) {
    std::vector<char*> ptrs;
    ptrs.reserve(strings.size() + 1);
    for (auto& s : strings) ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
    return ptrs;
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Both ends of the pipes the worker needs, closed on scope exit unless released.
struct PipeSet {
    int report[2]{-1, -1};
    int out[2]{-1, -1};
    int err[2]{-1, -1};
    int null_fd{-1};

    PipeSet() = default;
    PipeSet(const PipeSet&) = delete;
    PipeSet& operator=(const PipeSet&) = delete;

    ~PipeSet() {
        for (int* fd : {&report[0], &report[1], &out[0], &out[1], &err[0], &err[1], &null_fd}) {
            close_fd(*fd);
        }
    }

    Result<void> open() {
        if (::pipe2(report, O_CLOEXEC | O_NONBLOCK) != 0) return system_error("pipe", errno);
        if (::pipe2(out, O_CLOEXEC) != 0) return system_error("pipe", errno);
        if (::pipe2(err, O_CLOEXEC) != 0) return system_error("pipe", errno);
        null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd < 0) return system_error("open /dev/null", errno);
        for (int fd : {out[0], err[0]}) {
            int flags = ::fcntl(fd, F_GETFL);
            if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
                return system_error("fcntl", errno);
            }
        }
        return {};
    }
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// ChildReport / WorkerExit
// ─────────────────────────────────────────────

std::string ChildReport::describe() const {
    std::string text{message};
    switch (kind) {
        case ChildReportKind::LimitFailed:
            return std::string{"failed to apply "} + to_string(resource) + ": " + std::strerror(error);
        case ChildReportKind::ExecFailed:
            return text + ": " + std::strerror(error);
        case ChildReportKind::Exception:
            return text;
        case ChildReportKind::OutOfMemory:
            return "out of memory (" + text + ")";
    }
    return text;
}

const ChildReport* WorkerExit::find(ChildReportKind kind) const noexcept {
    auto it = std::find_if(reports.begin(), reports.end(),
                           [kind](const ChildReport& r) { return r.kind == kind; });
    return it == reports.end() ? nullptr : &*it;
}

// ─────────────────────────────────────────────
// ProcessHandle
// ─────────────────────────────────────────────

ProcessHandle::ProcessHandle(pid_t pid, int report_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), report_fd_(report_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ProcessHandle::~ProcessHandle() {
    bool reaped = false;
    {
        std::lock_guard lock(mutex_);
        reaped = reaped_;
    }
    if (!reaped) {
        signal_group(SIGKILL);
        // Nothing to report to from a destructor; the child is reaped either way.
        static_cast<void>(wait());
    }
    close_fd(report_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

bool ProcessHandle::signal_group(int signal) {
    std::lock_guard lock(mutex_);
    if (exited_) return false;
    if (::kill(-pid_, signal) != 0 && errno == ESRCH) {
        // Group not formed yet; the child itself still exists.
        ::kill(pid_, signal);
    }
    return true;
}

bool ProcessHandle::exited() const {
    std::lock_guard lock(mutex_);
    return exited_;
}

Result<WorkerExit> ProcessHandle::wait() {
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) return system_error("waitid", errno);
    }

    {
        std::lock_guard lock(mutex_);
        exited_ = true;
    }

    int status = 0;
    rusage usage{};
    while (::wait4(pid_, &status, 0, &usage) < 0) {
        if (errno != EINTR) return system_error("wait4", errno);
    }

    {
        std::lock_guard lock(mutex_);
        reaped_ = true;
    }

    WorkerExit result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    using std::chrono::microseconds;
    using std::chrono::seconds;
    result.cpu_time = seconds{usage.ru_utime.tv_sec} + microseconds{usage.ru_utime.tv_usec}
                    + seconds{usage.ru_stime.tv_sec} + microseconds{usage.ru_stime.tv_usec};
    result.max_rss_kb = usage.ru_maxrss;
    result.reports = read_reports();
    return result;
}

std::vector<ChildReport> ProcessHandle::read_reports() {
    std::vector<ChildReport> reports;
    if (report_fd_ < 0) return reports;

    ChildReport r;
    for (;;) {
        ssize_t n = ::read(report_fd_, &r, sizeof(r));
        if (n < 0 && errno == EINTR) continue;
        if (n != static_cast<ssize_t>(sizeof(r))) break;
        r.message[sizeof(r.message) - 1] = '\0';
        reports.push_back(r);
    }
    return reports;
}

// ─────────────────────────────────────────────
// spawn_worker
// ─────────────────────────────────────────────

Result<std::unique_ptr<ProcessHandle>> spawn_worker(const JobLogic& logic, const LimitPlan& limits) {
    static_assert(std::is_trivially_copyable_v<ChildReport>);

    PipeSet pipes;
    if (auto opened = pipes.open(); !opened) {
        return opened.error();
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;

    ChildContext ctx;
    ctx.limits = &limits;
    ctx.report_fd = pipes.report[1];
    ctx.stdin_fd = pipes.null_fd;
    ctx.stdout_fd = pipes.out[1];
    ctx.stderr_fd = pipes.err[1];

    if (const auto* command = std::get_if<CommandSpec>(&logic)) {
        if (command->argv.empty()) {
            return Error{"empty command line", ErrorCode::Config};
        }
        argv_storage = command->argv;
        env_storage = build_environment(command->extra_env);
        argv = to_pointers(argv_storage);
        envp = to_pointers(env_storage);
        ctx.argv = argv.data();
        ctx.envp = envp.data();
        if (!command->working_dir.empty()) ctx.working_dir = command->working_dir.c_str();
    } else {
        const auto& callable = std::get<JobCallable>(logic);
        if (!callable) {
            return Error{"empty job callable", ErrorCode::Config};
        }
        ctx.callable = &callable;
    }

    // Flush buffered parent output so the child does not repeat it.
    std::fflush(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return system_error("fork", errno);
    }
    if (pid == 0) {
        run_child(ctx);
    }

    // Both sides call setpgid; whichever runs second fails harmlessly.
    ::setpgid(pid, pid);

    close_fd(pipes.report[1]);
    close_fd(pipes.out[1]);
    close_fd(pipes.err[1]);
    close_fd(pipes.null_fd);

    return std::make_unique<ProcessHandle>(pid, std::exchange(pipes.report[0], -1),
                                           std::exchange(pipes.out[0], -1),
                                           std::exchange(pipes.err[0], -1));
}

}  // namespace jobguard
