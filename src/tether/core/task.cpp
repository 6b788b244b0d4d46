// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/task.hpp>
#include <tether/core/checkpoint.hpp>
#include <tether/core/error.hpp>
#include <tether/process/engine_command.hpp>
#include <spdlog/spdlog.h>
#include <format>

namespace tether::core {

namespace {

std::string describe(const ProgressSnapshot& p) {
    std::string text;
    if (p.total_bytes) {
        text = std::format("{:.1f}% {}/{} bytes", p.percent(), p.downloaded_bytes, *p.total_bytes);
    } else {
        text = std::format("{} bytes", p.downloaded_bytes);
    }
    if (p.speed_bps > 0) {
        text += std::format(", {} B/s", p.speed_bps);
    }
    if (p.eta_seconds) {
        text += std::format(", ETA {}s", *p.eta_seconds);
    }
    return text;
}

} // namespace

Task::Task(TaskId id, TaskConfig config, TaskContext ctx)
    : id_(id)
    , ctx_(ctx)
    , config_(std::move(config)) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_locked(LogKind::info, std::format("added {} -> {}", config_.url, config_.output_path()));
    persist_locked();
}

Task::Task(const TaskRecord& record, TaskContext ctx)
    : id_(record.id)
    , ctx_(ctx)
    , config_(record.config)
    , status_(record.status) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.downloaded_bytes = record.downloaded_bytes;
    progress_.total_bytes = record.total_bytes;

    if (status_ == TaskStatus::running) {
        transition_locked(TaskStatus::paused, "interrupted: manager restarted while the engine was running");
    }
    if (status_ == TaskStatus::paused || status_ == TaskStatus::stopped) {
        seed_from_checkpoint_locked();
    }
}

Task::~Task() {
    std::lock_guard<std::mutex> lock(mutex_);
    halt_locked();
}

std::error_code Task::start() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_) {
        return make_error_code(TaskErrc::unknown_task);
    }

    switch (status_) {
        case TaskStatus::running:
            log_locked(LogKind::info, "start rejected: already running");
            return make_error_code(TaskErrc::invalid_transition);
        case TaskStatus::completed:
            log_locked(LogKind::info, "start rejected: already completed");
            return make_error_code(TaskErrc::invalid_transition);
        case TaskStatus::paused:
            return launch_locked(true);
        case TaskStatus::queued:
        case TaskStatus::stopped:
        case TaskStatus::failed:
            break;
    }

    bool resumable = config_.allow_continue && CheckpointStore::exists(config_.output_path());
    if (resumable) {
        seed_from_checkpoint_locked();
    } else {
        progress_ = {};
    }
    return launch_locked(resumable);
}

std::error_code Task::pause() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_) {
        return make_error_code(TaskErrc::unknown_task);
    }

    switch (status_) {
        case TaskStatus::queued:
            transition_locked(TaskStatus::stopped, "paused before it was started");
            return {};
        case TaskStatus::running:
            halt_locked();
            transition_locked(TaskStatus::paused, "paused by user");
            return {};
        default:
            return make_error_code(TaskErrc::invalid_transition);
    }
}

std::error_code Task::resume() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_) {
        return make_error_code(TaskErrc::unknown_task);
    }
    if (status_ != TaskStatus::paused) {
        return make_error_code(TaskErrc::invalid_transition);
    }
    return launch_locked(true);
}

std::error_code Task::stop() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_) {
        return make_error_code(TaskErrc::unknown_task);
    }

    switch (status_) {
        case TaskStatus::queued:
            transition_locked(TaskStatus::stopped, "stopped before it was started");
            return {};
        case TaskStatus::running:
            halt_locked();
            apply_stop_policy_locked();
            transition_locked(TaskStatus::stopped, "stopped by user");
            return {};
        case TaskStatus::paused:
            apply_stop_policy_locked();
            transition_locked(TaskStatus::stopped, "stopped by user");
            return {};
        default:
            return make_error_code(TaskErrc::invalid_transition);
    }
}

std::error_code Task::retire() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_) {
        return make_error_code(TaskErrc::unknown_task);
    }

    halt_locked();
    if (ctx_.config.remove_deletes_checkpoint) {
        CheckpointStore::remove_checkpoint(config_.output_path());
    }
    spdlog::info("task {}: removed while {}", id_, to_string(status_));
    retired_ = true;
    return {};
}

void Task::suspend(std::string_view reason) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_ || status_ != TaskStatus::running) {
        return;
    }
    halt_locked();
    transition_locked(TaskStatus::paused, reason);
}

std::error_code Task::edit(TaskConfig config) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_) {
        return make_error_code(TaskErrc::unknown_task);
    }
    if (status_ == TaskStatus::running) {
        return make_error_code(TaskErrc::invalid_transition);
    }

    try {
        auto old_path = config_.output_path();
        config_ = std::move(config);
        auto new_path = config_.output_path();

        if (old_path != new_path && CheckpointStore::exists(old_path)) {
            log_locked(LogKind::info,
                       std::format("output moved from {}; the partial download there is not reused", old_path));
            progress_ = {};
        }
        log_locked(LogKind::info, std::format("configuration updated: {} -> {}", config_.url, new_path));
        persist_locked();
        return {};
    } catch (const std::exception&) {
        return make_error_code(TaskErrc::invalid_config);
    }
}

void Task::tick() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    tick_locked();
}

bool Task::try_tick() noexcept {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return false;
    }
    tick_locked();
    return true;
}

TaskSnapshot Task::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskSnapshot snap;
    snap.id = id_;
    snap.status = status_;
    snap.progress = progress_;
    snap.url = config_.url;
    snap.output_path = config_.output_path();
    if (worker_) {
        snap.worker_pid = static_cast<int>(worker_->pid());
    }
    return snap;
}

TaskConfig Task::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

TaskStatus Task::status() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

//=============================================================================
// Internals (mutex_ held)
//=============================================================================

std::error_code Task::launch_locked(bool continue_download) noexcept {
    const auto& engine = config_.engine_path.empty() ? ctx_.config.engine_path : config_.engine_path;

    std::error_code spawn_error;
    auto cmd = process::EngineCommand::build(config_, ctx_.config.engine_path, continue_download);
    if (cmd) {
        auto worker = process::WorkerProcess::spawn(*cmd);
        if (worker) {
            worker_ = std::move(*worker);
        } else {
            spawn_error = worker.error();
        }
    } else {
        spawn_error = cmd.error();
    }

    if (!worker_) {
        log_locked(LogKind::error,
                   std::format("failed to spawn engine '{}': {}", engine, spawn_error.message()));
        transition_locked(TaskStatus::failed, "engine could not be started");
        return make_error_code(TaskErrc::engine_spawn_failed);
    }

    if (continue_download) {
        sampler_.reset(progress_.downloaded_bytes, progress_.total_bytes);
    } else {
        sampler_.reset();
    }
    output_tail_.clear();
    last_progress_note_ = std::chrono::steady_clock::now();

    log_locked(LogKind::info, std::format("pid {}: {}", worker_->pid(), cmd->to_string()));
    transition_locked(TaskStatus::running,
                      continue_download ? "engine continuing from checkpoint" : "engine started");
    return {};
}

void Task::halt_locked() noexcept {
    if (!worker_) {
        return;
    }

    auto outcome = worker_->terminate(ctx_.config.terminate_grace);
    collect_output_locked();
    if (auto last = sampler_.flush()) {
        progress_ = *last;
    }
    if (outcome == process::TerminateOutcome::forced) {
        log_locked(LogKind::info, "engine ignored the stop request and was killed");
    }

    progress_.speed_bps = 0;
    progress_.eta_seconds.reset();
    worker_.reset();
}

void Task::tick_locked() noexcept {
    if (retired_ || status_ != TaskStatus::running || !worker_) {
        return;
    }

    collect_output_locked();

    if (worker_->poll() == process::WorkerStatus::alive) {
        auto now = std::chrono::steady_clock::now();
        if (now - last_progress_note_ >= ctx_.config.progress_log_interval) {
            last_progress_note_ = now;
            log_locked(LogKind::progress, describe(progress_));
        }
        return;
    }

    finish_run_locked();
}

void Task::collect_output_locked() noexcept {
    if (!worker_) {
        return;
    }

    if (auto snap = sampler_.sample(*worker_)) {
        progress_ = *snap;
    }

    for (auto& line : sampler_.drain_messages()) {
        try {
            output_tail_.push_back(line);
            while (output_tail_.size() > ctx_.config.output_tail_lines) {
                output_tail_.pop_front();
            }
        } catch (const std::bad_alloc&) {
            output_tail_.clear();
        }
        log_locked(LogKind::engine, std::move(line));
    }
}

void Task::finish_run_locked() noexcept {
    collect_output_locked();
    if (auto last = sampler_.flush()) {
        progress_ = *last;
    }

    const int code = worker_->exit_code();
    const bool ok = worker_->poll() == process::WorkerStatus::exited_ok;
    worker_.reset();

    progress_.speed_bps = 0;
    progress_.eta_seconds.reset();
    progress_.updated = std::chrono::system_clock::now();

    if (ok) {
        // Exit status is authoritative; the readout may lag the last bytes
        if (progress_.total_bytes) {
            progress_.downloaded_bytes = *progress_.total_bytes;
        }
        transition_locked(TaskStatus::completed, "engine exited 0");
        return;
    }

    std::string report = std::format("engine exited with code {} at {}", code, describe(progress_));
    if (!output_tail_.empty()) {
        report += "; last output:";
        for (const auto& line : output_tail_) {
            report += "\n  ";
            report += line;
        }
    }
    log_locked(LogKind::error, std::move(report));
    transition_locked(TaskStatus::failed, std::format("engine exit code {}", code));
}

void Task::seed_from_checkpoint_locked() noexcept {
    if (progress_.downloaded_bytes > 0) {
        return;
    }

    try {
        auto path = CheckpointStore::checkpoint_path(config_.output_path());
        auto info = CheckpointStore::inspect(path);
        if (!info) {
            spdlog::debug("task {}: checkpoint {} not inspected: {}", id_, path, info.error().message());
            return;
        }
        progress_.downloaded_bytes = info->completed_bytes;
        if (info->total_length > 0) {
            progress_.total_bytes = info->total_length;
        }
        progress_.updated = std::chrono::system_clock::now();
    } catch (const std::exception& e) {
        spdlog::debug("task {}: checkpoint not inspected: {}", id_, e.what());
    }
}

void Task::apply_stop_policy_locked() noexcept {
    if (ctx_.config.stop_policy != StopPolicy::discard_partial) {
        return;
    }
    try {
        CheckpointStore::remove_partial(config_.output_path());
        progress_ = {};
        log_locked(LogKind::info, "partial download discarded");
    } catch (const std::exception& e) {
        spdlog::warn("task {}: discarding partial download failed: {}", id_, e.what());
    }
}

void Task::transition_locked(TaskStatus to, std::string_view reason) noexcept {
    const auto from = status_;
    status_ = to;

    try {
        log_locked(LogKind::transition, std::format("{} -> {}: {}", to_string(from), to_string(to), reason));
    } catch (const std::exception&) {
        log_locked(LogKind::transition, std::string(to_string(to)));
    }

    if (to == TaskStatus::failed) {
        spdlog::warn("task {}: {} -> {} ({})", id_, to_string(from), to_string(to), reason);
    } else {
        spdlog::info("task {}: {} -> {} ({})", id_, to_string(from), to_string(to), reason);
    }
    persist_locked();
}

void Task::log_locked(LogKind kind, std::string message) noexcept {
    ctx_.log.append(id_, kind, std::move(message));
}

void Task::persist_locked() noexcept {
    if (!ctx_.store || retired_) {
        return;
    }
    try {
        if (auto ec = ctx_.store->save(record_locked())) {
            spdlog::warn("task {}: record not saved: {}", id_, ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::warn("task {}: record not saved: {}", id_, e.what());
    }
}

TaskRecord Task::record_locked() const {
    TaskRecord record;
    record.id = id_;
    record.config = config_;
    record.status = status_;
    record.downloaded_bytes = progress_.downloaded_bytes;
    record.total_bytes = progress_.total_bytes;
    return record;
}

} // namespace tether::core
