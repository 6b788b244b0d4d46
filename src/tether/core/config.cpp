// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/config.hpp>
#include <tether/core/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace tether::core {

namespace {

void read_task_defaults(const nlohmann::json& j, TaskConfig& cfg) {
    cfg.output_dir = j.value("dir", cfg.output_dir);
    cfg.split = j.value("split", cfg.split);
    cfg.max_connections = j.value("max_connections", cfg.max_connections);
    cfg.max_tries = j.value("max_tries", cfg.max_tries);
    cfg.retry_wait_sec = j.value("retry_wait", cfg.retry_wait_sec);
    cfg.max_download_limit = j.value("max_download_limit", cfg.max_download_limit);
    cfg.max_upload_limit = j.value("max_upload_limit", cfg.max_upload_limit);
    cfg.referer = j.value("referer", cfg.referer);
    cfg.user_agent = j.value("user_agent", cfg.user_agent);
    cfg.allow_continue = j.value("continue", cfg.allow_continue);
    cfg.file_allocation = j.value("file_allocation", cfg.file_allocation);
    cfg.extra_args = j.value("extra_args", cfg.extra_args);

    if (j.contains("headers") && j["headers"].is_array()) {
        cfg.headers.clear();
        for (const auto& h : j["headers"]) {
            cfg.headers.push_back(h.get<std::string>());
        }
    }
}

} // namespace

std::string TaskConfig::output_path() const {
    return (std::filesystem::path(output_dir) / output_name).string();
}

std::expected<ManagerConfig, std::error_code>
ManagerConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        }

        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }

        ManagerConfig cfg;
        cfg.engine_path = j.value("engine", cfg.engine_path);
        cfg.state_dir = j.value("state_dir", cfg.state_dir);
        cfg.sample_interval = std::chrono::milliseconds{
            j.value("sample_interval_ms", cfg.sample_interval.count())};
        cfg.terminate_grace = std::chrono::milliseconds{
            j.value("terminate_grace_ms", cfg.terminate_grace.count())};
        cfg.progress_log_interval = std::chrono::seconds{
            j.value("progress_log_interval_s", cfg.progress_log_interval.count())};
        cfg.remove_deletes_checkpoint = j.value("remove_deletes_checkpoint", cfg.remove_deletes_checkpoint);
        cfg.output_tail_lines = j.value("output_tail_lines", cfg.output_tail_lines);
        cfg.log_level = j.value("log_level", cfg.log_level);

        auto policy = j.value("stop_policy", std::string{"keep"});
        if (policy == "keep") {
            cfg.stop_policy = StopPolicy::keep_partial;
        } else if (policy == "discard") {
            cfg.stop_policy = StopPolicy::discard_partial;
        } else {
            spdlog::error("config {}: unknown stop_policy '{}'", path, policy);
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }

        if (cfg.sample_interval.count() <= 0 || cfg.terminate_grace.count() < 0) {
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }
        if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off") {
            spdlog::error("config {}: unknown log_level '{}'", path, cfg.log_level);
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }

        if (j.contains("defaults")) {
            read_task_defaults(j["defaults"], cfg.defaults);
        }

        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config {}: {}", path, e.what());
        return std::unexpected(make_error_code(TaskErrc::invalid_config));
    } catch (const std::exception& e) {
        spdlog::error("config {}: {}", path, e.what());
        return std::unexpected(make_error_code(TaskErrc::invalid_config));
    }
}

} // namespace tether::core
