// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/process/engine_command.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <system_error>
#include <sys/types.h>

namespace tether::process {

enum class WorkerStatus : std::uint8_t {
    alive,
    exited_ok,
    exited_error
};

enum class TerminateOutcome : std::uint8_t {
    already_exited,  // Nothing to do
    graceful,        // Exited within the grace period after SIGTERM
    forced           // Needed SIGKILL
};

// One running engine process.
// Not thread-safe; the owning task serializes access.
class WorkerProcess {
public:
    // Launch in a new process group with stdout+stderr on a non-blocking pipe
    [[nodiscard]] static std::expected<std::unique_ptr<WorkerProcess>, std::error_code>
    spawn(const EngineCommand& cmd) noexcept;

    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;
    WorkerProcess(WorkerProcess&&) = delete;
    WorkerProcess& operator=(WorkerProcess&&) = delete;

    // Non-blocking; reaps the process on first observation of its exit
    [[nodiscard]] WorkerStatus poll() noexcept;

    // Exit code once exited; 128 + signal number for a signal death
    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }

    // SIGTERM, wait up to grace, then SIGKILL. Files are left untouched.
    TerminateOutcome terminate(std::chrono::milliseconds grace) noexcept;

    // Append whatever output is available without blocking
    std::size_t read_output(std::string& out) noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    WorkerProcess(pid_t pid, int out_fd) noexcept;

    void record_exit(int wstatus) noexcept;
    void signal_group(int sig) noexcept;

    pid_t pid_{-1};
    int out_fd_{-1};
    bool exited_{false};
    int exit_code_{0};
};

} // namespace tether::process
