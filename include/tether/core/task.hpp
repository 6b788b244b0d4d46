// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/config.hpp>
#include <tether/core/progress.hpp>
#include <tether/core/task_log.hpp>
#include <tether/core/task_store.hpp>
#include <tether/process/worker_process.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace tether::core {

// Consistent view of one task for display
struct TaskSnapshot {
    TaskId id{0};
    TaskStatus status{TaskStatus::queued};
    ProgressSnapshot progress;
    std::string url;
    std::string output_path;
    std::optional<int> worker_pid;   // Set only while an engine process is alive
};

// Shared manager state a task needs. Outlives every task.
struct TaskContext {
    const ManagerConfig& config;
    TaskLogStore& log;
    const TaskStore* store{nullptr};   // Null when nothing is persisted
};

// State machine for one download.
//
// Every public member takes the task's mutex, so a user command and a
// monitor tick on the same task never interleave. Spawning and terminating
// the engine happen under that mutex; nothing else blocks on it.
class Task {
public:
    Task(TaskId id, TaskConfig config, TaskContext ctx);

    // Rebuild from a persisted record. A task recorded as running lost its
    // engine with the previous manager process and comes back paused.
    Task(const TaskRecord& record, TaskContext ctx);

    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Queued/Stopped/Failed -> Running; Paused -> Running (as resume)
    [[nodiscard]] std::error_code start() noexcept;

    // Running -> Paused; Queued -> Stopped
    [[nodiscard]] std::error_code pause() noexcept;

    // Paused -> Running, continuing from the checkpoint
    [[nodiscard]] std::error_code resume() noexcept;

    // Running/Paused/Queued -> Stopped
    [[nodiscard]] std::error_code stop() noexcept;

    // Terminate any engine and retire the task for removal.
    // Later commands on this object report unknown_task.
    [[nodiscard]] std::error_code retire() noexcept;

    // Pause without user intent (manager shutdown); no-op unless running
    void suspend(std::string_view reason) noexcept;

    // Replace the configuration; rejected while running
    [[nodiscard]] std::error_code edit(TaskConfig config) noexcept;

    // Monitor step: read progress, detect engine exit
    void tick() noexcept;

    // Same, but skips the step when a command holds the task
    bool try_tick() noexcept;

    [[nodiscard]] TaskSnapshot snapshot() const;
    [[nodiscard]] TaskConfig config() const;
    [[nodiscard]] TaskStatus status() const noexcept;
    [[nodiscard]] TaskId id() const noexcept { return id_; }

private:
    [[nodiscard]] std::error_code launch_locked(bool continue_download) noexcept;
    void halt_locked() noexcept;
    void tick_locked() noexcept;
    void collect_output_locked() noexcept;
    void finish_run_locked() noexcept;
    void seed_from_checkpoint_locked() noexcept;
    void apply_stop_policy_locked() noexcept;
    void transition_locked(TaskStatus to, std::string_view reason) noexcept;
    void log_locked(LogKind kind, std::string message) noexcept;
    void persist_locked() noexcept;
    [[nodiscard]] TaskRecord record_locked() const;

    const TaskId id_;
    TaskContext ctx_;

    mutable std::mutex mutex_;
    TaskConfig config_;
    TaskStatus status_{TaskStatus::queued};
    ProgressSnapshot progress_;
    std::unique_ptr<process::WorkerProcess> worker_;   // Non-null only while running
    ProgressSampler sampler_;
    std::deque<std::string> output_tail_;
    std::chrono::steady_clock::time_point last_progress_note_;
    bool retired_{false};
};

} // namespace tether::core
