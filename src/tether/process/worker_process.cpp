// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/process/worker_process.hpp>
#include <tether/process/error.hpp>
#include <tether/core/config.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace tether::process {

namespace {

constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{20};

// RAII for the posix_spawn attribute objects
struct SpawnSetup {
    posix_spawn_file_actions_t actions{};
    posix_spawnattr_t attr{};
    bool actions_ok{false};
    bool attr_ok{false};

    SpawnSetup() noexcept {
        actions_ok = posix_spawn_file_actions_init(&actions) == 0;
        attr_ok = posix_spawnattr_init(&attr) == 0;
    }

    ~SpawnSetup() {
        if (actions_ok) posix_spawn_file_actions_destroy(&actions);
        if (attr_ok) posix_spawnattr_destroy(&attr);
    }

    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

} // namespace

WorkerProcess::WorkerProcess(pid_t pid, int out_fd) noexcept
    : pid_(pid)
    , out_fd_(out_fd) {}

WorkerProcess::~WorkerProcess() {
    if (!exited_) {
        terminate(core::TERMINATE_GRACE);
    }
    if (out_fd_ >= 0) {
        ::close(out_fd_);
    }
}

std::expected<std::unique_ptr<WorkerProcess>, std::error_code>
WorkerProcess::spawn(const EngineCommand& cmd) noexcept {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        spdlog::error("pipe2 failed: {}", std::strerror(errno));
        return std::unexpected(make_error_code(ProcessErrc::pipe_failed));
    }

    SpawnSetup setup;
    if (!setup.actions_ok || !setup.attr_ok) {
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(make_error_code(ProcessErrc::spawn_failed));
    }

    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDERR_FILENO);

    // Own process group so termination reaches helpers the engine may start;
    // default dispositions so an ignored SIGTERM in this process does not leak in.
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setflags(&setup.attr,
        POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&setup.attr, 0);
    posix_spawnattr_setsigmask(&setup.attr, &empty_mask);
    posix_spawnattr_setsigdefault(&setup.attr, &defaults);

    std::vector<char*> argv;
    argv.reserve(cmd.args.size() + 2);
    argv.push_back(const_cast<char*>(cmd.executable.c_str()));
    for (const auto& arg : cmd.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawn(&pid, cmd.executable.c_str(), &setup.actions, &setup.attr,
                           argv.data(), environ);
    ::close(fds[1]);

    if (rc != 0) {
        ::close(fds[0]);
        spdlog::error("posix_spawn {} failed: {}", cmd.executable, std::strerror(rc));
        if (rc == ENOENT || rc == EACCES || rc == ENOEXEC) {
            return std::unexpected(make_error_code(ProcessErrc::executable_not_found));
        }
        return std::unexpected(make_error_code(ProcessErrc::spawn_failed));
    }

    int flags = ::fcntl(fds[0], F_GETFL);
    if (flags < 0 || ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK) != 0) {
        spdlog::warn("pid {}: could not make output pipe non-blocking", pid);
    }

    spdlog::debug("spawned pid {}: {}", pid, cmd.to_string());
    return std::unique_ptr<WorkerProcess>(new WorkerProcess(pid, fds[0]));
}

WorkerStatus WorkerProcess::poll() noexcept {
    if (!exited_) {
        int wstatus = 0;
        pid_t r = ::waitpid(pid_, &wstatus, WNOHANG);
        if (r == 0) {
            return WorkerStatus::alive;
        }
        if (r == pid_) {
            record_exit(wstatus);
        } else if (errno != EINTR) {
            // ECHILD: somebody else reaped it, the exit status is lost
            spdlog::warn("waitpid({}) failed: {}", pid_, std::strerror(errno));
            exited_ = true;
            exit_code_ = -1;
        } else {
            return WorkerStatus::alive;
        }
    }
    return exit_code_ == 0 ? WorkerStatus::exited_ok : WorkerStatus::exited_error;
}

TerminateOutcome WorkerProcess::terminate(std::chrono::milliseconds grace) noexcept {
    if (poll() != WorkerStatus::alive) {
        return TerminateOutcome::already_exited;
    }

    signal_group(SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (poll() != WorkerStatus::alive) {
            return TerminateOutcome::graceful;
        }
        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
    if (poll() != WorkerStatus::alive) {
        return TerminateOutcome::graceful;
    }

    spdlog::warn("pid {} ignored SIGTERM for {} ms, killing", pid_, grace.count());
    signal_group(SIGKILL);

    int wstatus = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &wstatus, 0);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        record_exit(wstatus);
    } else {
        spdlog::error("waitpid({}) after SIGKILL failed: {}", pid_, std::strerror(errno));
        exited_ = true;
        exit_code_ = 128 + SIGKILL;
    }
    return TerminateOutcome::forced;
}

std::size_t WorkerProcess::read_output(std::string& out) noexcept {
    if (out_fd_ < 0) {
        return 0;
    }

    std::size_t total = 0;
    char buf[core::READ_CHUNK_SIZE];
    while (true) {
        ssize_t n = ::read(out_fd_, buf, sizeof(buf));
        if (n > 0) {
            try {
                out.append(buf, static_cast<std::size_t>(n));
            } catch (const std::bad_alloc&) {
                break;
            }
            total += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // 0 = EOF, EAGAIN = drained for now
        break;
    }
    return total;
}

void WorkerProcess::record_exit(int wstatus) noexcept {
    exited_ = true;
    if (WIFEXITED(wstatus)) {
        exit_code_ = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        exit_code_ = 128 + WTERMSIG(wstatus);
    } else {
        exit_code_ = -1;
    }
}

void WorkerProcess::signal_group(int sig) noexcept {
    if (::kill(-pid_, sig) == 0) {
        return;
    }
    // The group may be gone while the leader is still a zombie
    if (::kill(pid_, sig) != 0 && errno != ESRCH) {
        spdlog::warn("kill({}, {}) failed: {}", pid_, sig, std::strerror(errno));
    }
}

} // namespace tether::process
