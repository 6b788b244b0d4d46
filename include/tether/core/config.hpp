// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tether::core {

constexpr std::string_view DEFAULT_ENGINE = "aria2c";
constexpr std::string_view CHECKPOINT_SUFFIX = ".aria2";

constexpr std::uint32_t DEFAULT_SPLIT = 4;
constexpr std::uint32_t DEFAULT_MAX_CONNECTIONS = 16;
constexpr std::uint32_t DEFAULT_MAX_TRIES = 5;

constexpr std::chrono::milliseconds SAMPLE_INTERVAL{1000};
constexpr std::chrono::milliseconds TERMINATE_GRACE{3000};
constexpr std::chrono::seconds PROGRESS_LOG_INTERVAL{10};

constexpr std::size_t OUTPUT_TAIL_LINES = 20;     // Engine lines kept for failure reports
constexpr std::size_t READ_CHUNK_SIZE = 4096;

// Per-task download options. Frozen while the engine runs.
struct TaskConfig {
    std::string url;
    std::string output_dir;
    std::string output_name;          // Empty: derived from the URL

    std::uint32_t split{DEFAULT_SPLIT};
    std::uint32_t max_connections{DEFAULT_MAX_CONNECTIONS};
    std::uint32_t max_tries{DEFAULT_MAX_TRIES};
    std::uint32_t retry_wait_sec{0};  // 0 = engine default

    std::string max_download_limit;   // Engine rate syntax, e.g. "500K"
    std::string max_upload_limit;

    std::string referer;
    std::string user_agent;
    std::vector<std::string> headers;

    bool allow_continue{true};
    std::string file_allocation{"none"};

    std::string engine_path;          // Empty: manager default
    std::string extra_args;

    // <output_dir>/<output_name>
    [[nodiscard]] std::string output_path() const;
};

// What stop does to the checkpoint and partial output
enum class StopPolicy : std::uint8_t {
    keep_partial,    // Stopped tasks can be restarted where they left off
    discard_partial  // Stop deletes the checkpoint and the partial file
};

struct ManagerConfig {
    std::string engine_path{DEFAULT_ENGINE};
    std::string state_dir;            // Empty: nothing is persisted

    std::chrono::milliseconds sample_interval{SAMPLE_INTERVAL};
    std::chrono::milliseconds terminate_grace{TERMINATE_GRACE};
    std::chrono::seconds progress_log_interval{PROGRESS_LOG_INTERVAL};

    StopPolicy stop_policy{StopPolicy::keep_partial};
    bool remove_deletes_checkpoint{true};
    std::size_t output_tail_lines{OUTPUT_TAIL_LINES};

    std::string log_level{"info"};

    // Template for tasks added from the console
    TaskConfig defaults;

    // Load from a JSON file; missing keys keep their defaults
    [[nodiscard]] static std::expected<ManagerConfig, std::error_code>
    load(std::string_view path) noexcept;
};

} // namespace tether::core
