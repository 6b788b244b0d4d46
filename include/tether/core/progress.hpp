// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::process {
class WorkerProcess;
}

namespace tether::core {

// Point-in-time progress reading. Derived, never authoritative.
struct ProgressSnapshot {
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;   // Unknown until the engine learns it
    std::uint64_t speed_bps{0};
    std::optional<std::uint64_t> eta_seconds;
    std::uint32_t connections{0};
    std::chrono::system_clock::time_point updated;

    // 0..100, 0 when the total is unknown
    [[nodiscard]] double percent() const noexcept;
};

// "1.5MiB", "300KiB", "12B", "2G" -> bytes (1024 based)
[[nodiscard]] std::expected<std::uint64_t, std::error_code> parse_size(std::string_view text) noexcept;

// "1h2m3s", "45s" -> seconds
[[nodiscard]] std::expected<std::uint64_t, std::error_code> parse_duration(std::string_view text) noexcept;

// True for lines the engine uses for its console readout ("[#gid ...]")
[[nodiscard]] bool looks_like_readout(std::string_view line) noexcept;

// Parse one readout, e.g. "[#2089b0 400KiB/1.0MiB(39%) CN:1 DL:115KiB ETA:5s]".
// Fails with TaskErrc::progress_parse.
[[nodiscard]] std::expected<ProgressSnapshot, std::error_code> parse_readout(std::string_view line) noexcept;

// Turns the engine's output stream into snapshots and plain message lines.
// Best effort: malformed readouts are counted and dropped.
class ProgressSampler {
public:
    // Drain the worker's output. Returns the newest reading, or nullopt
    // when nothing parseable arrived since the last call.
    [[nodiscard]] std::optional<ProgressSnapshot> sample(process::WorkerProcess& worker) noexcept;

    // Same as sample() but on already-read text
    [[nodiscard]] std::optional<ProgressSnapshot> feed(std::string_view chunk) noexcept;

    // Consume a trailing line the engine left without a newline
    [[nodiscard]] std::optional<ProgressSnapshot> flush() noexcept;

    // Non-readout lines seen since the last call
    [[nodiscard]] std::vector<std::string> drain_messages() noexcept;

    // Start a new engine run: forget buffered text and the monotonic floor
    void reset() noexcept;

    // Start a run that continues earlier work. Readouts never report fewer
    // than floor_bytes, and a zero total keeps known_total.
    void reset(std::uint64_t floor_bytes, std::optional<std::uint64_t> known_total) noexcept;

    [[nodiscard]] std::uint64_t parse_errors() const noexcept { return parse_errors_; }

private:
    std::optional<ProgressSnapshot> consume_line(std::string_view line) noexcept;

    std::string pending_;                    // Incomplete trailing line
    std::vector<std::string> messages_;
    std::uint64_t floor_bytes_{0};           // Highest byte count seen this run
    std::optional<std::uint64_t> known_total_;
    std::uint64_t parse_errors_{0};
};

} // namespace tether::core
