// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/config.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tether::process {

// A fully resolved engine invocation
struct EngineCommand {
    std::string executable;          // Absolute or relative path that exists
    std::vector<std::string> args;   // Without argv[0]

    // Derive the aria2c argument set for a task.
    // continue_download adds -c so the engine picks up <output>.aria2.
    [[nodiscard]] static std::expected<EngineCommand, std::error_code>
    build(const core::TaskConfig& cfg, std::string_view default_engine, bool continue_download) noexcept;

    // Single line for logs
    [[nodiscard]] std::string to_string() const;
};

// Paths containing '/' are checked as-is, bare names are looked up on PATH
[[nodiscard]] std::expected<std::string, std::error_code>
resolve_executable(std::string_view name) noexcept;

// Shell-like word splitting with '...' and "..." quoting and backslash escapes
[[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
split_arguments(std::string_view text) noexcept;

} // namespace tether::process
