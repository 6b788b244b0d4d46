// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tether/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace tether::core {

// Just enough URL structure to validate a task source and name its output
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    // Original text, passed verbatim to the engine
    [[nodiscard]] const std::string& full() const noexcept { return str_; }

    // Last path segment, "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace tether::core
