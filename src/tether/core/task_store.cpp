// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/task_store.hpp>
#include <tether/core/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace tether::core {

namespace {

nlohmann::json config_to_json(const TaskConfig& cfg) {
    nlohmann::json j;
    j["url"] = cfg.url;
    j["dir"] = cfg.output_dir;
    j["out"] = cfg.output_name;
    j["split"] = cfg.split;
    j["max_connections"] = cfg.max_connections;
    j["max_tries"] = cfg.max_tries;
    j["retry_wait"] = cfg.retry_wait_sec;
    j["max_download_limit"] = cfg.max_download_limit;
    j["max_upload_limit"] = cfg.max_upload_limit;
    j["referer"] = cfg.referer;
    j["user_agent"] = cfg.user_agent;
    j["headers"] = cfg.headers;
    j["continue"] = cfg.allow_continue;
    j["file_allocation"] = cfg.file_allocation;
    j["engine"] = cfg.engine_path;
    j["extra_args"] = cfg.extra_args;
    return j;
}

TaskConfig config_from_json(const nlohmann::json& j) {
    TaskConfig cfg;
    cfg.url = j.at("url").get<std::string>();
    cfg.output_dir = j.at("dir").get<std::string>();
    cfg.output_name = j.at("out").get<std::string>();
    cfg.split = j.value("split", cfg.split);
    cfg.max_connections = j.value("max_connections", cfg.max_connections);
    cfg.max_tries = j.value("max_tries", cfg.max_tries);
    cfg.retry_wait_sec = j.value("retry_wait", cfg.retry_wait_sec);
    cfg.max_download_limit = j.value("max_download_limit", cfg.max_download_limit);
    cfg.max_upload_limit = j.value("max_upload_limit", cfg.max_upload_limit);
    cfg.referer = j.value("referer", cfg.referer);
    cfg.user_agent = j.value("user_agent", cfg.user_agent);
    cfg.headers = j.value("headers", cfg.headers);
    cfg.allow_continue = j.value("continue", cfg.allow_continue);
    cfg.file_allocation = j.value("file_allocation", cfg.file_allocation);
    cfg.engine_path = j.value("engine", cfg.engine_path);
    cfg.extra_args = j.value("extra_args", cfg.extra_args);
    return cfg;
}

} // namespace

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::queued:    return "queued";
        case TaskStatus::running:   return "running";
        case TaskStatus::paused:    return "paused";
        case TaskStatus::stopped:   return "stopped";
        case TaskStatus::completed: return "completed";
        case TaskStatus::failed:    return "failed";
    }
    return "queued";
}

std::optional<TaskStatus> task_status_from_string(std::string_view s) noexcept {
    if (s == "queued") return TaskStatus::queued;
    if (s == "running") return TaskStatus::running;
    if (s == "paused") return TaskStatus::paused;
    if (s == "stopped") return TaskStatus::stopped;
    if (s == "completed") return TaskStatus::completed;
    if (s == "failed") return TaskStatus::failed;
    return std::nullopt;
}

TaskStore::TaskStore(std::filesystem::path dir)
    : dir_(std::move(dir)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        spdlog::error("task directory {}: {}", dir_.string(), ec.message());
    }
}

std::filesystem::path TaskStore::file_for(TaskId id) const {
    return dir_ / (std::to_string(id) + ".json");
}

std::error_code TaskStore::save(const TaskRecord& record) const noexcept {
    try {
        nlohmann::json j;
        j["id"] = record.id;
        j["status"] = std::string(to_string(record.status));
        j["downloaded"] = record.downloaded_bytes;
        if (record.total_bytes) {
            j["total"] = *record.total_bytes;
        } else {
            j["total"] = nullptr;
        }
        j["config"] = config_to_json(record.config);

        std::lock_guard<std::mutex> lock(mutex_);
        auto target = file_for(record.id);
        auto temp = target;
        temp += ".tmp";

        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(TaskErrc::store_failed);
            }
            file << j.dump(2) << '\n';
            if (!file) {
                return make_error_code(TaskErrc::store_failed);
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            return make_error_code(TaskErrc::store_failed);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("task {}: record not saved: {}", record.id, e.what());
        return make_error_code(TaskErrc::store_failed);
    }
}

std::vector<TaskRecord> TaskStore::load_all() const noexcept {
    std::vector<TaskRecord> records;

    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                continue;
            }

            try {
                std::ifstream file(entry.path());
                auto j = nlohmann::json::parse(file);

                TaskRecord record;
                record.id = j.at("id").get<TaskId>();
                auto status = task_status_from_string(j.at("status").get<std::string>());
                if (!status) {
                    spdlog::warn("{}: unknown status, skipped", entry.path().string());
                    continue;
                }
                record.status = *status;
                record.downloaded_bytes = j.value("downloaded", std::uint64_t{0});
                if (j.contains("total") && !j["total"].is_null()) {
                    record.total_bytes = j["total"].get<std::uint64_t>();
                }
                record.config = config_from_json(j.at("config"));
                records.push_back(std::move(record));
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("{}: unreadable task record: {}", entry.path().string(), e.what());
            }
        }
        if (ec) {
            spdlog::warn("task directory {}: {}", dir_.string(), ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::error("loading task records failed: {}", e.what());
    }

    std::sort(records.begin(), records.end(),
              [](const TaskRecord& a, const TaskRecord& b) { return a.id < b.id; });
    return records;
}

void TaskStore::remove(TaskId id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        std::filesystem::remove(file_for(id), ec);
        if (ec) {
            spdlog::warn("task {}: record not removed: {}", id, ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::warn("task {}: record not removed: {}", id, e.what());
    }
}

std::error_code TaskStore::save_next_id(TaskId next) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream file(dir_ / "next_id", std::ios::trunc);
        file << next << '\n';
        if (!file) {
            return make_error_code(TaskErrc::store_failed);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(TaskErrc::store_failed);
    }
}

TaskId TaskStore::load_next_id() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream file(dir_ / "next_id");
        TaskId next = 1;
        if (file >> next && next > 0) {
            return next;
        }
    } catch (const std::exception& e) {
        spdlog::warn("{}: next_id unreadable: {}", dir_.string(), e.what());
    }
    return 1;
}

} // namespace tether::core
