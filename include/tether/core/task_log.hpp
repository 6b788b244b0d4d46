// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tether::core {

using TaskId = std::uint64_t;

enum class LogKind : std::uint8_t {
    transition,  // Status change
    error,       // Spawn failure, engine failure
    progress,    // Periodic progress note
    engine,      // Line printed by the engine
    info
};

[[nodiscard]] std::string_view to_string(LogKind kind) noexcept;
[[nodiscard]] std::optional<LogKind> log_kind_from_string(std::string_view s) noexcept;

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogKind kind{LogKind::info};
    std::string message;
};

// Per-task append-only history.
// With a directory, every entry is also appended to <dir>/<id>.jsonl so the
// history outlives the manager process.
class TaskLogStore {
public:
    TaskLogStore() = default;
    explicit TaskLogStore(std::filesystem::path dir);

    TaskLogStore(const TaskLogStore&) = delete;
    TaskLogStore& operator=(const TaskLogStore&) = delete;

    // Timestamps are strictly increasing per task
    LogEntry append(TaskId id, LogKind kind, std::string message) noexcept;

    // Full ordered history, loaded from disk on first access
    [[nodiscard]] std::vector<LogEntry> read(TaskId id) const noexcept;

    // Last n entries
    [[nodiscard]] std::vector<LogEntry> tail(TaskId id, std::size_t n) const noexcept;

    // Drop the history of a removed task, on disk too
    void erase(TaskId id) noexcept;

    [[nodiscard]] bool persistent() const noexcept { return !dir_.empty(); }

private:
    [[nodiscard]] std::filesystem::path file_for(TaskId id) const;

    // Caller holds mutex_
    std::vector<LogEntry>& history_locked(TaskId id) const;

    std::filesystem::path dir_;
    mutable std::map<TaskId, std::vector<LogEntry>> histories_;
    mutable std::mutex mutex_;
};

} // namespace tether::core
