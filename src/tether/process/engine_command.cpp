// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/process/engine_command.hpp>
#include <tether/process/error.hpp>
#include <tether/core/error.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace tether::process {

namespace {

bool is_executable_file(const std::string& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

} // namespace

std::expected<std::string, std::error_code>
resolve_executable(std::string_view name) noexcept {
    try {
        if (name.empty()) {
            return std::unexpected(make_error_code(ProcessErrc::executable_not_found));
        }

        std::string candidate(name);
        if (candidate.find('/') != std::string::npos) {
            if (is_executable_file(candidate)) {
                return candidate;
            }
            return std::unexpected(make_error_code(ProcessErrc::executable_not_found));
        }

        const char* path_env = std::getenv("PATH");
        std::string_view dirs = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

        while (true) {
            auto sep = dirs.find(':');
            auto dir = dirs.substr(0, sep);
            // An empty PATH entry means the current directory
            auto full = (std::filesystem::path(dir.empty() ? "." : std::string(dir)) / candidate).string();
            if (is_executable_file(full)) {
                return full;
            }
            if (sep == std::string_view::npos) {
                break;
            }
            dirs.remove_prefix(sep + 1);
        }

        return std::unexpected(make_error_code(ProcessErrc::executable_not_found));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ProcessErrc::executable_not_found));
    }
}

std::expected<std::vector<std::string>, std::error_code>
split_arguments(std::string_view text) noexcept {
    try {
        std::vector<std::string> words;
        std::string current;
        bool in_word = false;
        char quote = '\0';

        for (std::size_t i = 0; i < text.size(); ++i) {
            char c = text[i];

            if (quote == '\'') {
                if (c == '\'') {
                    quote = '\0';
                } else {
                    current += c;
                }
                continue;
            }

            if (quote == '"') {
                if (c == '"') {
                    quote = '\0';
                } else if (c == '\\' && i + 1 < text.size() &&
                           (text[i + 1] == '"' || text[i + 1] == '\\')) {
                    current += text[++i];
                } else {
                    current += c;
                }
                continue;
            }

            if (std::isspace(static_cast<unsigned char>(c))) {
                if (in_word) {
                    words.push_back(std::move(current));
                    current.clear();
                    in_word = false;
                }
                continue;
            }

            in_word = true;
            if (c == '\'' || c == '"') {
                quote = c;
            } else if (c == '\\') {
                if (i + 1 >= text.size()) {
                    return std::unexpected(make_error_code(core::TaskErrc::invalid_config));
                }
                current += text[++i];
            } else {
                current += c;
            }
        }

        if (quote != '\0') {
            return std::unexpected(make_error_code(core::TaskErrc::invalid_config));
        }
        if (in_word) {
            words.push_back(std::move(current));
        }
        return words;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(core::TaskErrc::invalid_config));
    }
}

std::expected<EngineCommand, std::error_code>
EngineCommand::build(const core::TaskConfig& cfg, std::string_view default_engine, bool continue_download) noexcept {
    try {
        auto exe = resolve_executable(cfg.engine_path.empty() ? default_engine : cfg.engine_path);
        if (!exe) {
            return std::unexpected(exe.error());
        }

        auto extra = split_arguments(cfg.extra_args);
        if (!extra) {
            return std::unexpected(extra.error());
        }

        EngineCommand cmd;
        cmd.executable = std::move(*exe);
        auto& args = cmd.args;

        if (continue_download) {
            args.emplace_back("-c");
        }
        args.push_back("--file-allocation=" + cfg.file_allocation);
        args.push_back("--split=" + std::to_string(cfg.split));
        args.push_back("--max-connection-per-server=" + std::to_string(cfg.max_connections));
        args.push_back("--max-tries=" + std::to_string(cfg.max_tries));
        if (cfg.retry_wait_sec > 0) {
            args.push_back("--retry-wait=" + std::to_string(cfg.retry_wait_sec));
        }
        if (!cfg.max_download_limit.empty()) {
            args.push_back("--max-download-limit=" + cfg.max_download_limit);
        }
        if (!cfg.max_upload_limit.empty()) {
            args.push_back("--max-upload-limit=" + cfg.max_upload_limit);
        }
        if (!cfg.referer.empty()) {
            args.push_back("--referer=" + cfg.referer);
        }
        if (!cfg.user_agent.empty()) {
            args.push_back("--user-agent=" + cfg.user_agent);
        }
        for (const auto& header : cfg.headers) {
            if (!header.empty()) {
                args.push_back("--header=" + header);
            }
        }

        // The engine keeps its control file at <dir>/<out>.aria2, so these two
        // must not change between pause and resume.
        args.emplace_back("--allow-overwrite=true");
        args.emplace_back("--auto-file-renaming=false");
        args.push_back("--dir=" + cfg.output_dir);
        args.push_back("--out=" + cfg.output_name);

        for (auto& word : *extra) {
            args.push_back(std::move(word));
        }
        args.push_back(cfg.url);

        return cmd;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ProcessErrc::spawn_failed));
    }
}

std::string EngineCommand::to_string() const {
    std::string line = executable;
    for (const auto& arg : args) {
        line += ' ';
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            line += '\'' + arg + '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

} // namespace tether::process
