// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>

namespace tether::cli {

namespace {

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

} // namespace

std::string render_bar(double percent, int width) {
    percent = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(std::round(width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string format_bytes(std::uint64_t bytes) {
    auto b = static_cast<double>(bytes);
    if (bytes >= TB) return std::format("{:.2f} TB", b / TB);
    if (bytes >= GB) return std::format("{:.2f} GB", b / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", b / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", b / KB);
    return std::format("{} B", bytes);
}

std::string format_speed(std::uint64_t bps) {
    auto b = static_cast<double>(bps);
    if (bps >= GB) return std::format("{:.1f} GB/s", b / GB);
    if (bps >= MB) return std::format("{:.1f} MB/s", b / MB);
    if (bps >= KB) return std::format("{:.1f} KB/s", b / KB);
    return std::format("{} B/s", bps);
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}h {:02}m {}s", hours, minutes, secs);
    }
    if (minutes > 0) {
        return std::format("{}m {}s", minutes, secs);
    }
    return std::format("{}s", secs);
}

std::string task_table_header() {
    return std::format("{:>4}  {:<9}  {:<32} {:>4}  {:<21}  {:>10}  {:>9}  {}",
                       "ID", "STATUS", "PROGRESS", "", "SIZE", "SPEED", "ETA", "FILE");
}

std::string format_task_row(const core::TaskSnapshot& task) {
    const auto& p = task.progress;

    std::string size = p.total_bytes
        ? format_bytes(p.downloaded_bytes) + "/" + format_bytes(*p.total_bytes)
        : format_bytes(p.downloaded_bytes);

    bool running = task.status == core::TaskStatus::running;
    std::string speed = running && p.speed_bps > 0 ? format_speed(p.speed_bps) : "-";
    std::string eta = running && p.eta_seconds ? format_time(*p.eta_seconds) : "-";

    return std::format("{:>4}  {:<9}  {} {:>3}%  {:<21}  {:>10}  {:>9}  {}",
                       task.id,
                       core::to_string(task.status),
                       render_bar(p.percent()),
                       static_cast<int>(p.percent()),
                       size,
                       speed,
                       eta,
                       std::filesystem::path(task.output_path).filename().string());
}

} // namespace tether::cli
