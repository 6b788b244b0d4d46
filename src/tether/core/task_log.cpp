// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/task_log.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace tether::core {

namespace {

using Micros = std::chrono::microseconds;

std::int64_t to_micros(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<Micros>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_micros(std::int64_t us) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(Micros{us}));
}

} // namespace

std::string_view to_string(LogKind kind) noexcept {
    switch (kind) {
        case LogKind::transition: return "transition";
        case LogKind::error:      return "error";
        case LogKind::progress:   return "progress";
        case LogKind::engine:     return "engine";
        case LogKind::info:       return "info";
    }
    return "info";
}

std::optional<LogKind> log_kind_from_string(std::string_view s) noexcept {
    if (s == "transition") return LogKind::transition;
    if (s == "error") return LogKind::error;
    if (s == "progress") return LogKind::progress;
    if (s == "engine") return LogKind::engine;
    if (s == "info") return LogKind::info;
    return std::nullopt;
}

TaskLogStore::TaskLogStore(std::filesystem::path dir)
    : dir_(std::move(dir)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        spdlog::error("log directory {}: {}", dir_.string(), ec.message());
    }
}

std::filesystem::path TaskLogStore::file_for(TaskId id) const {
    return dir_ / (std::to_string(id) + ".jsonl");
}

std::vector<LogEntry>& TaskLogStore::history_locked(TaskId id) const {
    auto [it, inserted] = histories_.try_emplace(id);
    if (!inserted || dir_.empty()) {
        return it->second;
    }

    // First touch since startup: pick up what an earlier run wrote
    std::ifstream file(file_for(id));
    std::string line;
    std::size_t lineno = 0;
    while (file && std::getline(file, line)) {
        ++lineno;
        if (line.empty()) {
            continue;
        }
        try {
            auto j = nlohmann::json::parse(line);
            LogEntry entry;
            entry.timestamp = from_micros(j.at("ts").get<std::int64_t>());
            entry.kind = log_kind_from_string(j.at("kind").get<std::string>()).value_or(LogKind::info);
            entry.message = j.at("msg").get<std::string>();
            it->second.push_back(std::move(entry));
        } catch (const nlohmann::json::exception& e) {
            // A crash mid-write leaves a torn last line
            spdlog::warn("task {} log line {} skipped: {}", id, lineno, e.what());
        }
    }
    return it->second;
}

LogEntry TaskLogStore::append(TaskId id, LogKind kind, std::string message) noexcept {
    LogEntry entry{std::chrono::system_clock::now(), kind, std::move(message)};

    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& history = history_locked(id);

        // Stored precision is microseconds; keep memory and disk identical
        entry.timestamp = from_micros(to_micros(entry.timestamp));
        if (!history.empty() && entry.timestamp <= history.back().timestamp) {
            entry.timestamp = history.back().timestamp + Micros{1};
        }

        history.push_back(entry);

        if (!dir_.empty()) {
            nlohmann::json j;
            j["ts"] = to_micros(entry.timestamp);
            j["kind"] = std::string(to_string(kind));
            j["msg"] = entry.message;

            std::ofstream file(file_for(id), std::ios::app);
            file << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
            if (!file) {
                spdlog::warn("task {}: log entry not persisted", id);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("task {}: log append failed: {}", id, e.what());
    }

    return entry;
}

std::vector<LogEntry> TaskLogStore::read(TaskId id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_locked(id);
    } catch (const std::exception& e) {
        spdlog::error("task {}: log read failed: {}", id, e.what());
        return {};
    }
}

std::vector<LogEntry> TaskLogStore::tail(TaskId id, std::size_t n) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& history = history_locked(id);
        auto first = history.size() > n ? history.end() - static_cast<std::ptrdiff_t>(n) : history.begin();
        return {first, history.end()};
    } catch (const std::exception& e) {
        spdlog::error("task {}: log read failed: {}", id, e.what());
        return {};
    }
}

void TaskLogStore::erase(TaskId id) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        histories_.erase(id);
        if (!dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove(file_for(id), ec);
        }
    } catch (const std::exception& e) {
        spdlog::warn("task {}: log erase failed: {}", id, e.what());
    }
}

} // namespace tether::core
