// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/cli/commands.hpp>
#include <tether/core/task_manager.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <exception>
#include <iostream>
#include <vector>

using namespace tether::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void tether_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(tether_terminate_handler);

    // Engine output arrives over a pipe; a closed console must not kill us
    std::signal(SIGPIPE, SIG_IGN);

    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    auto config = make_config(args);
    if (!config) {
        std::cerr << "Error: " << args.config_file << ": " << config.error().message() << std::endl;
        return 1;
    }

    // Diagnostics go to stderr so the console and task table stay readable
    spdlog::set_default_logger(spdlog::stderr_color_mt("tether"));
    spdlog::set_level(spdlog::level::from_str(config->log_level));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (args.wait && args.urls.empty()) {
        std::cerr << "Error: --wait needs at least one URL" << std::endl;
        return 1;
    }

    tether::core::TaskManager manager(std::move(*config));

    int exit_code = 0;
    std::vector<tether::core::TaskId> added;
    for (const auto& url : args.urls) {
        auto cfg = manager.config().defaults;
        cfg.url = url;
        auto id = manager.add_task(std::move(cfg));
        if (!id) {
            std::cerr << "Error: " << url << ": " << id.error().message() << std::endl;
            exit_code = 1;
            continue;
        }
        added.push_back(*id);
        if (auto ec = manager.start(*id)) {
            std::cerr << "Error: task " << *id << ": " << ec.message() << std::endl;
            exit_code = 1;
        }
    }

    if (args.wait) {
        if (wait_for_tasks(manager, added, std::cout) != 0) {
            exit_code = 1;
        }
    } else {
        run_console(manager, std::cin, std::cout);
    }

    manager.shutdown();
    return exit_code;
}
