// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tether/process/engine_command.hpp>
#include <tether/process/error.hpp>
#include <tether/core/error.hpp>
#include <algorithm>

using namespace tether;
using namespace tether::process;

namespace {

core::TaskConfig basic_config() {
    core::TaskConfig cfg;
    cfg.url = "https://example.com/file.iso";
    cfg.output_dir = "/data";
    cfg.output_name = "file.iso";
    return cfg;
}

bool has_arg(const EngineCommand& cmd, const std::string& arg) {
    return std::find(cmd.args.begin(), cmd.args.end(), arg) != cmd.args.end();
}

} // namespace

TEST_CASE("resolve_executable", "[engine_command]") {
    SECTION("Absolute path") {
        auto exe = resolve_executable("/bin/sh");
        REQUIRE(exe.has_value());
        CHECK(*exe == "/bin/sh");
    }

    SECTION("Found on PATH") {
        auto exe = resolve_executable("sh");
        REQUIRE(exe.has_value());
        CHECK(exe->ends_with("/sh"));
    }

    SECTION("Missing") {
        auto exe = resolve_executable("definitely-not-an-engine-7f3a");
        REQUIRE(!exe.has_value());
        CHECK(exe.error() == ProcessErrc::executable_not_found);
        CHECK(!resolve_executable("/nonexistent/aria2c").has_value());
        CHECK(!resolve_executable("").has_value());
    }

    SECTION("Directory is not an executable") {
        CHECK(!resolve_executable("/tmp").has_value());
    }
}

TEST_CASE("split_arguments", "[engine_command]") {
    SECTION("Plain words") {
        auto words = split_arguments("  --a=1   --b  ");
        REQUIRE(words.has_value());
        CHECK(*words == std::vector<std::string>{"--a=1", "--b"});
    }

    SECTION("Quotes and escapes") {
        auto words = split_arguments(R"(--header="X-A: b c" 'single quoted' back\ slash "esc\"aped")");
        REQUIRE(words.has_value());
        CHECK(*words == std::vector<std::string>{"--header=X-A: b c", "single quoted", "back slash", "esc\"aped"});
    }

    SECTION("Empty") {
        auto words = split_arguments("");
        REQUIRE(words.has_value());
        CHECK(words->empty());
    }

    SECTION("Errors") {
        CHECK(split_arguments("\"unterminated").error() == core::TaskErrc::invalid_config);
        CHECK(!split_arguments("trailing\\").has_value());
    }
}

TEST_CASE("EngineCommand::build", "[engine_command]") {
    auto cfg = basic_config();

    SECTION("Fresh download") {
        auto cmd = EngineCommand::build(cfg, "/bin/sh", false);
        REQUIRE(cmd.has_value());
        CHECK(cmd->executable == "/bin/sh");
        CHECK(!has_arg(*cmd, "-c"));
        CHECK(has_arg(*cmd, "--split=4"));
        CHECK(has_arg(*cmd, "--max-connection-per-server=16"));
        CHECK(has_arg(*cmd, "--max-tries=5"));
        CHECK(has_arg(*cmd, "--file-allocation=none"));
        CHECK(has_arg(*cmd, "--dir=/data"));
        CHECK(has_arg(*cmd, "--out=file.iso"));
        CHECK(cmd->args.back() == "https://example.com/file.iso");
    }

    SECTION("Continue starts with -c") {
        auto cmd = EngineCommand::build(cfg, "/bin/sh", true);
        REQUIRE(cmd.has_value());
        CHECK(cmd->args.front() == "-c");
    }

    SECTION("Optional settings") {
        cfg.split = 8;
        cfg.retry_wait_sec = 10;
        cfg.max_download_limit = "500K";
        cfg.referer = "https://example.com/";
        cfg.user_agent = "tether/0.1";
        cfg.headers = {"Cookie: a=b", ""};
        cfg.extra_args = "--check-certificate=false --min-split-size=1M";

        auto cmd = EngineCommand::build(cfg, "/bin/sh", false);
        REQUIRE(cmd.has_value());
        CHECK(has_arg(*cmd, "--split=8"));
        CHECK(has_arg(*cmd, "--retry-wait=10"));
        CHECK(has_arg(*cmd, "--max-download-limit=500K"));
        CHECK(has_arg(*cmd, "--referer=https://example.com/"));
        CHECK(has_arg(*cmd, "--user-agent=tether/0.1"));
        CHECK(has_arg(*cmd, "--header=Cookie: a=b"));
        CHECK(std::count_if(cmd->args.begin(), cmd->args.end(),
                            [](const std::string& a) { return a.starts_with("--header="); }) == 1);
        CHECK(has_arg(*cmd, "--min-split-size=1M"));
        CHECK(!has_arg(*cmd, "--max-upload-limit="));

        auto n = cmd->args.size();
        CHECK(cmd->args[n - 2] == "--min-split-size=1M");
        CHECK(cmd->args[n - 1] == cfg.url);
    }

    SECTION("Per-task engine overrides the default") {
        cfg.engine_path = "/bin/sh";
        auto cmd = EngineCommand::build(cfg, "definitely-not-an-engine-7f3a", false);
        REQUIRE(cmd.has_value());
        CHECK(cmd->executable == "/bin/sh");
    }

    SECTION("Missing engine") {
        auto cmd = EngineCommand::build(cfg, "definitely-not-an-engine-7f3a", false);
        REQUIRE(!cmd.has_value());
        CHECK(cmd.error() == ProcessErrc::executable_not_found);
    }

    SECTION("Bad extra arguments") {
        cfg.extra_args = "'oops";
        CHECK(!EngineCommand::build(cfg, "/bin/sh", false).has_value());
    }

    SECTION("to_string quotes arguments with spaces") {
        cfg.headers = {"X-Token: abc"};
        auto cmd = EngineCommand::build(cfg, "/bin/sh", false);
        REQUIRE(cmd.has_value());
        auto line = cmd->to_string();
        CHECK(line.starts_with("/bin/sh "));
        CHECK(line.find("'--header=X-Token: abc'") != std::string::npos);
    }
}
