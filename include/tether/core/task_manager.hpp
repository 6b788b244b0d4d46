// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/config.hpp>
#include <tether/core/task.hpp>
#include <tether/core/task_log.hpp>
#include <tether/core/task_store.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <system_error>
#include <thread>
#include <vector>

namespace tether::core {

enum class Command : std::uint8_t {
    start,
    pause,
    resume,
    stop,
    remove
};

[[nodiscard]] std::string_view to_string(Command cmd) noexcept;

// Fill in derived defaults and reject unusable task options
[[nodiscard]] std::error_code normalize_task_config(TaskConfig& config) noexcept;

// Owns all tasks and the background monitor.
//
// Lock discipline: mutex_ guards the task map only (add/remove/lookup) and is
// never held while a task's own mutex is taken. Commands and monitor ticks
// for one task serialize on that task's mutex; different tasks proceed
// independently.
class TaskManager {
public:
    // Rehydrates from config.state_dir when set, then starts the monitor
    explicit TaskManager(ManagerConfig config = {});
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;
    TaskManager(TaskManager&&) = delete;
    TaskManager& operator=(TaskManager&&) = delete;

    // Register a queued task
    [[nodiscard]] std::expected<TaskId, std::error_code> add_task(TaskConfig config) noexcept;

    // Dispatch to the task state machine
    [[nodiscard]] std::error_code command(TaskId id, Command cmd) noexcept;

    [[nodiscard]] std::error_code start(TaskId id) noexcept { return command(id, Command::start); }
    [[nodiscard]] std::error_code pause(TaskId id) noexcept { return command(id, Command::pause); }
    [[nodiscard]] std::error_code resume(TaskId id) noexcept { return command(id, Command::resume); }
    [[nodiscard]] std::error_code stop(TaskId id) noexcept { return command(id, Command::stop); }
    [[nodiscard]] std::error_code remove(TaskId id) noexcept { return command(id, Command::remove); }

    // Replace a task's options while it is not running
    [[nodiscard]] std::error_code edit_task(TaskId id, TaskConfig config) noexcept;

    // Every task ordered by id, each read in a fully applied state.
    // Waits behind a command in progress, so up to terminate_grace while a
    // pause or stop escalates.
    [[nodiscard]] std::vector<TaskSnapshot> list_snapshot() const noexcept;

    [[nodiscard]] std::expected<TaskSnapshot, std::error_code> snapshot(TaskId id) const noexcept;
    [[nodiscard]] std::expected<TaskConfig, std::error_code> task_config(TaskId id) const noexcept;

    // Full history of a task
    [[nodiscard]] std::expected<std::vector<LogEntry>, std::error_code> read_log(TaskId id) const noexcept;

    // One synchronous monitor pass over all tasks
    void poll_once() noexcept;

    // Stop the monitor and pause running tasks so they resume next time
    void shutdown() noexcept;

    [[nodiscard]] const ManagerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::shared_ptr<Task> find(TaskId id) const noexcept;
    [[nodiscard]] std::vector<std::shared_ptr<Task>> all_tasks() const noexcept;
    [[nodiscard]] std::error_code remove_task(TaskId id) noexcept;
    [[nodiscard]] TaskContext context() noexcept;

    void rehydrate() noexcept;
    void monitor_loop(std::stop_token stoken) noexcept;

    const ManagerConfig config_;
    std::unique_ptr<TaskLogStore> log_;
    std::unique_ptr<TaskStore> store_;   // Null without a state directory

    std::map<TaskId, std::shared_ptr<Task>> tasks_;
    TaskId next_id_{1};
    mutable std::shared_mutex mutex_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    std::atomic<bool> shut_down_{false};
    std::jthread monitor_;
};

} // namespace tether::core
