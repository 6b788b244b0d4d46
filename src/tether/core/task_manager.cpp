// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/task_manager.hpp>
#include <tether/core/error.hpp>
#include <tether/core/url.hpp>
#include <tether/process/engine_command.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace tether::core {

std::string_view to_string(Command cmd) noexcept {
    switch (cmd) {
        case Command::start:  return "start";
        case Command::pause:  return "pause";
        case Command::resume: return "resume";
        case Command::stop:   return "stop";
        case Command::remove: return "remove";
    }
    return "start";
}

std::error_code normalize_task_config(TaskConfig& config) noexcept {
    try {
        auto url = Url::parse(config.url);
        if (!url) {
            return url.error();
        }

        if (config.output_dir.empty()) {
            config.output_dir = std::filesystem::current_path().string();
        }
        if (config.output_name.empty()) {
            config.output_name = url->filename();
        }
        if (config.output_name.find('/') != std::string::npos ||
            config.output_name == "." || config.output_name == "..") {
            return make_error_code(TaskErrc::invalid_config);
        }
        if (config.split == 0 || config.max_connections == 0) {
            return make_error_code(TaskErrc::invalid_config);
        }
        if (auto extra = process::split_arguments(config.extra_args); !extra) {
            return extra.error();
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(TaskErrc::invalid_config);
    }
}

//=============================================================================
// TaskManager
//=============================================================================

TaskManager::TaskManager(ManagerConfig config)
    : config_(std::move(config)) {
    if (config_.state_dir.empty()) {
        log_ = std::make_unique<TaskLogStore>();
    } else {
        std::filesystem::path root(config_.state_dir);
        log_ = std::make_unique<TaskLogStore>(root / "logs");
        store_ = std::make_unique<TaskStore>(root / "tasks");
        rehydrate();
    }

    monitor_ = std::jthread([this](std::stop_token stoken) {
        monitor_loop(stoken);
    });
}

TaskManager::~TaskManager() {
    shutdown();
}

TaskContext TaskManager::context() noexcept {
    return TaskContext{config_, *log_, store_.get()};
}

void TaskManager::rehydrate() noexcept {
    try {
        next_id_ = store_->load_next_id();
        for (const auto& record : store_->load_all()) {
            tasks_.emplace(record.id, std::make_shared<Task>(record, context()));
            next_id_ = std::max(next_id_, record.id + 1);
        }
        spdlog::info("restored {} task(s) from {}", tasks_.size(), config_.state_dir);
    } catch (const std::exception& e) {
        spdlog::error("restoring tasks from {} failed: {}", config_.state_dir, e.what());
    }
}

std::expected<TaskId, std::error_code> TaskManager::add_task(TaskConfig config) noexcept {
    if (auto ec = normalize_task_config(config)) {
        return std::unexpected(ec);
    }

    try {
        TaskId id;
        {
            std::unique_lock lock(mutex_);
            id = next_id_++;
            if (store_) {
                if (auto ec = store_->save_next_id(next_id_)) {
                    spdlog::warn("id counter not saved: {}", ec.message());
                }
            }
        }

        // Construction logs and persists; keep that off the map lock
        auto task = std::make_shared<Task>(id, std::move(config), context());
        {
            std::unique_lock lock(mutex_);
            tasks_.emplace(id, std::move(task));
        }
        return id;
    } catch (const std::exception& e) {
        spdlog::error("add_task failed: {}", e.what());
        return std::unexpected(make_error_code(TaskErrc::invalid_config));
    }
}

std::error_code TaskManager::command(TaskId id, Command cmd) noexcept {
    if (cmd == Command::remove) {
        return remove_task(id);
    }

    auto task = find(id);
    if (!task) {
        return make_error_code(TaskErrc::unknown_task);
    }

    std::error_code ec;
    switch (cmd) {
        case Command::start:  ec = task->start(); break;
        case Command::pause:  ec = task->pause(); break;
        case Command::resume: ec = task->resume(); break;
        case Command::stop:   ec = task->stop(); break;
        case Command::remove: break;
    }

    if (ec) {
        spdlog::debug("task {}: {} rejected: {}", id, to_string(cmd), ec.message());
    }
    return ec;
}

std::error_code TaskManager::remove_task(TaskId id) noexcept {
    auto task = find(id);
    if (!task) {
        return make_error_code(TaskErrc::unknown_task);
    }

    // Terminates a running engine before the task leaves the map
    if (auto ec = task->retire()) {
        return ec;
    }

    {
        std::unique_lock lock(mutex_);
        tasks_.erase(id);
    }
    log_->erase(id);
    if (store_) {
        store_->remove(id);
    }
    return {};
}

std::error_code TaskManager::edit_task(TaskId id, TaskConfig config) noexcept {
    auto task = find(id);
    if (!task) {
        return make_error_code(TaskErrc::unknown_task);
    }
    if (auto ec = normalize_task_config(config)) {
        return ec;
    }
    return task->edit(std::move(config));
}

std::vector<TaskSnapshot> TaskManager::list_snapshot() const noexcept {
    std::vector<TaskSnapshot> result;
    try {
        auto tasks = all_tasks();
        result.reserve(tasks.size());
        for (const auto& task : tasks) {
            result.push_back(task->snapshot());
        }
    } catch (const std::exception& e) {
        spdlog::error("list_snapshot failed: {}", e.what());
    }
    return result;
}

std::expected<TaskSnapshot, std::error_code> TaskManager::snapshot(TaskId id) const noexcept {
    auto task = find(id);
    if (!task) {
        return std::unexpected(make_error_code(TaskErrc::unknown_task));
    }
    try {
        return task->snapshot();
    } catch (const std::exception&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<TaskConfig, std::error_code> TaskManager::task_config(TaskId id) const noexcept {
    auto task = find(id);
    if (!task) {
        return std::unexpected(make_error_code(TaskErrc::unknown_task));
    }
    try {
        return task->config();
    } catch (const std::exception&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::vector<LogEntry>, std::error_code> TaskManager::read_log(TaskId id) const noexcept {
    if (!find(id)) {
        return std::unexpected(make_error_code(TaskErrc::unknown_task));
    }
    return log_->read(id);
}

void TaskManager::poll_once() noexcept {
    for (const auto& task : all_tasks()) {
        task->tick();
    }
}

void TaskManager::shutdown() noexcept {
    if (shut_down_.exchange(true)) {
        return;
    }

    if (monitor_.joinable()) {
        monitor_.request_stop();
        wake_.notify_all();
        monitor_.join();
    }

    for (const auto& task : all_tasks()) {
        task->suspend("paused: manager shutting down");
    }
}

std::shared_ptr<Task> TaskManager::find(TaskId id) const noexcept {
    std::shared_lock lock(mutex_);
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Task>> TaskManager::all_tasks() const noexcept {
    std::vector<std::shared_ptr<Task>> result;
    try {
        std::shared_lock lock(mutex_);
        result.reserve(tasks_.size());
        for (const auto& [id, task] : tasks_) {
            result.push_back(task);
        }
    } catch (const std::bad_alloc&) {
        spdlog::error("task list copy failed: out of memory");
    }
    return result;
}

void TaskManager::monitor_loop(std::stop_token stoken) noexcept {
    spdlog::debug("monitor started, interval {} ms", config_.sample_interval.count());

    while (!stoken.stop_requested()) {
        for (const auto& task : all_tasks()) {
            if (stoken.stop_requested()) {
                break;
            }
            // A task busy with a command is picked up next round
            task->try_tick();
        }

        std::unique_lock lock(wake_mutex_);
        wake_.wait_for(lock, stoken, config_.sample_interval, [] { return false; });
    }

    spdlog::debug("monitor stopped");
}

} // namespace tether::core
