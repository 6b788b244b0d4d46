// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/task.hpp>
#include <cstdint>
#include <string>

namespace tether::cli {

// "[=====>     ]" for 0..100
[[nodiscard]] std::string render_bar(double percent, int width = 30);

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

// One table row: id, status, bar, sizes, speed, ETA, name
[[nodiscard]] std::string format_task_row(const core::TaskSnapshot& task);

// Column titles matching format_task_row
[[nodiscard]] std::string task_table_header();

} // namespace tether::cli
