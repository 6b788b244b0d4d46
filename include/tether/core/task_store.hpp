// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/config.hpp>
#include <tether/core/task_log.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace tether::core {

enum class TaskStatus : std::uint8_t {
    queued,     // Added, never started
    running,    // Engine process alive
    paused,     // Engine terminated, checkpoint kept, resumable
    stopped,    // Abandoned by the user
    completed,  // Engine exited 0
    failed      // Engine failed or could not be started
};

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::optional<TaskStatus> task_status_from_string(std::string_view s) noexcept;

// Persisted form of a task, enough to rebuild it after a restart
struct TaskRecord {
    TaskId id{0};
    TaskConfig config;
    TaskStatus status{TaskStatus::queued};
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
};

// One JSON file per task under <dir>/<id>.json
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path dir);

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // Write atomically (temp file + rename)
    [[nodiscard]] std::error_code save(const TaskRecord& record) const noexcept;

    // All readable records ordered by id; unreadable files are skipped
    [[nodiscard]] std::vector<TaskRecord> load_all() const noexcept;

    void remove(TaskId id) const noexcept;

    // Next id to hand out, so ids of removed tasks are not reused
    [[nodiscard]] std::error_code save_next_id(TaskId next) const noexcept;
    [[nodiscard]] TaskId load_next_id() const noexcept;

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    [[nodiscard]] std::filesystem::path file_for(TaskId id) const;

    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};

} // namespace tether::core
