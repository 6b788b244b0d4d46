// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/cli/commands.hpp>
#include <tether/cli/progress_bar.hpp>
#include <tether/core/error.hpp>
#include <tether/version.hpp>
#include <chrono>
#include <charconv>
#include <ctime>
#include <optional>
#include <iostream>
#include <sstream>
#include <thread>

namespace tether::cli {

namespace {

constexpr std::size_t DEFAULT_LOG_LINES = 30;

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::istringstream ss{std::string(line)};
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<std::uint64_t> parse_number(std::string_view s) noexcept {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

void print_table(core::TaskManager& manager, std::ostream& out) {
    auto tasks = manager.list_snapshot();
    if (tasks.empty()) {
        out << "No tasks\n";
        return;
    }
    out << task_table_header() << '\n';
    for (const auto& task : tasks) {
        out << format_task_row(task) << '\n';
    }
}

void print_log(core::TaskManager& manager, core::TaskId id, std::size_t lines, std::ostream& out) {
    auto log = manager.read_log(id);
    if (!log) {
        out << "Error: " << log.error().message() << '\n';
        return;
    }
    auto first = log->size() > lines ? log->end() - static_cast<std::ptrdiff_t>(lines) : log->begin();
    for (auto it = first; it != log->end(); ++it) {
        out << '[' << format_timestamp(it->timestamp) << "] "
            << core::to_string(it->kind) << ": " << it->message << '\n';
    }
}

void print_console_help(std::ostream& out) {
    out << "Commands:\n"
        << "  add <url> [file]      Queue a download\n"
        << "  start <id>            Start (or restart) a task\n"
        << "  pause <id>            Pause, keeping the partial download\n"
        << "  resume <id>           Continue a paused task\n"
        << "  stop <id>             Abandon a task\n"
        << "  remove <id>           Forget a task and its history\n"
        << "  list                  Show all tasks\n"
        << "  log <id> [lines]      Show a task's history\n"
        << "  quit                  Pause running tasks and exit\n";
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string& target) {
        if (i + 1 < argc) {
            target = argv[++i];
        } else {
            args.error = std::string("missing value for ") + argv[i];
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-w" || arg == "--wait") {
            args.wait = true;
        } else if (arg == "-c" || arg == "--config") {
            value_of(i, args.config_file);
        } else if (arg == "-e" || arg == "--engine") {
            value_of(i, args.engine_path);
        } else if (arg == "-s" || arg == "--state") {
            value_of(i, args.state_dir);
        } else if (arg == "-d" || arg == "--directory") {
            value_of(i, args.output_dir);
        } else if (arg == "-n" || arg == "--split") {
            std::string value;
            value_of(i, value);
            auto n = parse_number(value);
            if (!n || *n == 0 || *n > 1024) {
                args.error = "invalid split count: " + value;
            } else {
                args.split = static_cast<std::uint32_t>(*n);
            }
        } else if (arg.starts_with("-")) {
            args.error = "unknown option: " + arg;
        } else {
            args.urls.push_back(arg);
        }

        if (!args.error.empty()) {
            break;
        }
    }

    return args;
}

std::expected<core::ManagerConfig, std::error_code> make_config(const CliArgs& args) noexcept {
    core::ManagerConfig cfg;
    if (!args.config_file.empty()) {
        auto loaded = core::ManagerConfig::load(args.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        cfg = std::move(*loaded);
    }

    if (!args.engine_path.empty()) cfg.engine_path = args.engine_path;
    if (!args.state_dir.empty()) cfg.state_dir = args.state_dir;
    if (!args.output_dir.empty()) cfg.defaults.output_dir = args.output_dir;
    if (args.split > 0) {
        cfg.defaults.split = args.split;
    }
    if (args.verbose) cfg.log_level = "debug";
    return cfg;
}

//=============================================================================
// Console
//=============================================================================

bool execute_line(core::TaskManager& manager, std::string_view line, std::ostream& out) {
    auto words = split_words(line);
    if (words.empty()) {
        return true;
    }
    const auto& verb = words[0];

    if (verb == "quit" || verb == "exit") {
        return false;
    }
    if (verb == "help" || verb == "?") {
        print_console_help(out);
        return true;
    }
    if (verb == "list" || verb == "ls") {
        print_table(manager, out);
        return true;
    }

    if (verb == "add") {
        if (words.size() < 2) {
            out << "Usage: add <url> [file]\n";
            return true;
        }
        core::TaskConfig cfg = manager.config().defaults;
        cfg.url = words[1];
        if (words.size() > 2) {
            cfg.output_name = words[2];
        }
        auto id = manager.add_task(std::move(cfg));
        if (!id) {
            out << "Error: " << id.error().message() << '\n';
        } else {
            out << "Added task " << *id << '\n';
        }
        return true;
    }

    static const std::pair<std::string_view, core::Command> task_commands[] = {
        {"start", core::Command::start},
        {"pause", core::Command::pause},
        {"resume", core::Command::resume},
        {"stop", core::Command::stop},
        {"remove", core::Command::remove},
        {"rm", core::Command::remove},
    };

    if (verb == "log") {
        auto id = words.size() > 1 ? parse_number(words[1]) : std::nullopt;
        if (!id) {
            out << "Usage: log <id> [lines]\n";
            return true;
        }
        auto lines = words.size() > 2 ? parse_number(words[2]) : std::nullopt;
        print_log(manager, *id, lines.value_or(DEFAULT_LOG_LINES), out);
        return true;
    }

    for (const auto& [name, cmd] : task_commands) {
        if (verb != name) {
            continue;
        }
        auto id = words.size() > 1 ? parse_number(words[1]) : std::nullopt;
        if (!id) {
            out << "Usage: " << name << " <id>\n";
            return true;
        }

        auto ec = manager.command(*id, cmd);
        if (!ec) {
            out << "Task " << *id << ": " << core::to_string(cmd) << " ok\n";
        } else if (ec == core::TaskErrc::invalid_transition) {
            auto snap = manager.snapshot(*id);
            out << "Task " << *id << " cannot " << name
                << (snap ? std::string(" while ") + std::string(core::to_string(snap->status)) : std::string())
                << '\n';
        } else {
            out << "Task " << *id << ": " << ec.message() << '\n';
            if (ec == core::TaskErrc::engine_spawn_failed) {
                print_log(manager, *id, 3, out);
            }
        }
        return true;
    }

    out << "Unknown command '" << verb << "' (try help)\n";
    return true;
}

void run_console(core::TaskManager& manager, std::istream& in, std::ostream& out) {
    out << "Tether " << tether::version.to_string() << ", type help for commands\n";
    std::string line;
    while (true) {
        out << "> " << std::flush;
        if (!std::getline(in, line)) {
            out << '\n';
            break;
        }
        if (!execute_line(manager, line, out)) {
            break;
        }
    }
}

int wait_for_tasks(core::TaskManager& manager, const std::vector<core::TaskId>& ids, std::ostream& out) {
    while (true) {
        bool active = false;
        bool all_done = !ids.empty();
        for (auto id : ids) {
            auto snap = manager.snapshot(id);
            auto status = snap ? snap->status : core::TaskStatus::failed;
            active = active || status == core::TaskStatus::running;
            all_done = all_done && status == core::TaskStatus::completed;
        }

        print_table(manager, out);
        if (!active) {
            return all_done ? 0 : 1;
        }

        std::this_thread::sleep_for(manager.config().sample_interval);
        out << '\n';
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Tether " << tether::version.to_string() << " - supervises download engine processes\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] [URL]...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -c, --config <FILE>     JSON configuration file\n";
    std::cout << "  -e, --engine <PATH>     Download engine executable (default: aria2c)\n";
    std::cout << "  -s, --state <DIR>       Keep tasks and logs in DIR across restarts\n";
    std::cout << "  -d, --directory <DIR>   Save downloads to DIR\n";
    std::cout << "  -n, --split <N>         Connections per download (default: 4)\n";
    std::cout << "  -w, --wait              Download the given URLs and exit\n";
    std::cout << "\n";
    std::cout << "Without --wait an interactive console starts; URLs given on the\n";
    std::cout << "command line are queued and started first.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -s ~/.tether\n";
    std::cout << "  " << program_name << " -w -n 8 https://example.com/large.iso\n";
}

void print_version() noexcept {
    std::cout << "Tether " << tether::version.to_string() << std::endl;
    std::cout << "Built " << tether::BUILD_DATE << " with C++23, spdlog, nlohmann_json\n";
}

} // namespace tether::cli
