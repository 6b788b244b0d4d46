// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace tether::core {

enum class TaskErrc {
    success = 0,
    unknown_task,
    invalid_transition,
    engine_spawn_failed,
    worker_exited,
    progress_parse,
    invalid_url,
    invalid_config,
    checkpoint_unreadable,
    store_failed,
};

namespace detail {

struct TaskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tether::task";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TaskErrc>(ev)) {
            case TaskErrc::success:               return "Success";
            case TaskErrc::unknown_task:          return "Unknown task";
            case TaskErrc::invalid_transition:    return "Command not allowed in the current task state";
            case TaskErrc::engine_spawn_failed:   return "Download engine could not be started";
            case TaskErrc::worker_exited:         return "Download engine exited with an error";
            case TaskErrc::progress_parse:        return "Unparseable progress readout";
            case TaskErrc::invalid_url:           return "Invalid URL";
            case TaskErrc::invalid_config:        return "Invalid configuration";
            case TaskErrc::checkpoint_unreadable: return "Checkpoint file unreadable";
            case TaskErrc::store_failed:          return "Task store I/O failed";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TaskErrcCategory& task_errc_category() noexcept {
    static detail::TaskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TaskErrc e) noexcept {
    return {static_cast<int>(e), task_errc_category()};
}

} // namespace tether::core

namespace std {

template<>
struct is_error_code_enum<tether::core::TaskErrc> : true_type {};

} // namespace std
