// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/task_manager.hpp>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tether::cli {

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string config_file;
    std::string engine_path;
    std::string state_dir;
    std::string output_dir;
    std::uint32_t split{0};          // 0 = config default
    bool wait{false};                // Run the given URLs to the end, no console
    bool verbose{false};
    bool version{false};
    bool help{false};
    std::string error;               // Non-empty when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Build the manager configuration from the config file and overrides
[[nodiscard]] std::expected<core::ManagerConfig, std::error_code> make_config(const CliArgs& args) noexcept;

// Execute one console line. Returns false when the user asked to quit.
bool execute_line(core::TaskManager& manager, std::string_view line, std::ostream& out);

// Read-eval loop until "quit" or end of input
void run_console(core::TaskManager& manager, std::istream& in, std::ostream& out);

// Print the task table every interval until none of ids is running.
// Returns 0 when every one of them completed; other tasks are not judged.
[[nodiscard]] int wait_for_tasks(core::TaskManager& manager, const std::vector<core::TaskId>& ids,
                                 std::ostream& out);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace tether::cli
