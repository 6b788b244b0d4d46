// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace tether::process {

enum class ProcessErrc {
    success = 0,
    executable_not_found,
    spawn_failed,
    pipe_failed,
    signal_failed,
    wait_failed,
};

namespace detail {

struct ProcessErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tether::process";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ProcessErrc>(ev)) {
            case ProcessErrc::success:              return "Success";
            case ProcessErrc::executable_not_found: return "Executable not found";
            case ProcessErrc::spawn_failed:         return "Process spawn failed";
            case ProcessErrc::pipe_failed:          return "Output pipe setup failed";
            case ProcessErrc::signal_failed:        return "Signal delivery failed";
            case ProcessErrc::wait_failed:          return "Waiting for process failed";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ProcessErrcCategory& process_errc_category() noexcept {
    static detail::ProcessErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ProcessErrc e) noexcept {
    return {static_cast<int>(e), process_errc_category()};
}

} // namespace tether::process

namespace std {

template<>
struct is_error_code_enum<tether::process::ProcessErrc> : true_type {};

} // namespace std
