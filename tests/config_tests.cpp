// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tether/core/config.hpp>
#include <tether/core/error.hpp>
#include "test_support.hpp"

using namespace tether::core;
using tether::test::TempDir;

TEST_CASE("Config defaults", "[config]") {
    ManagerConfig cfg;
    CHECK(cfg.engine_path == "aria2c");
    CHECK(cfg.state_dir.empty());
    CHECK(cfg.sample_interval == SAMPLE_INTERVAL);
    CHECK(cfg.stop_policy == StopPolicy::keep_partial);
    CHECK(cfg.remove_deletes_checkpoint);
    CHECK(cfg.defaults.split == DEFAULT_SPLIT);
    CHECK(cfg.defaults.allow_continue);
    CHECK(cfg.defaults.file_allocation == "none");
}

TEST_CASE("TaskConfig::output_path", "[config]") {
    TaskConfig cfg;
    cfg.output_dir = "/data/downloads";
    cfg.output_name = "file.iso";
    CHECK(cfg.output_path() == "/data/downloads/file.iso");

    cfg.output_dir = "/data/downloads/";
    CHECK(cfg.output_path() == "/data/downloads/file.iso");
}

TEST_CASE("ManagerConfig::load", "[config]") {
    TempDir dir;
    auto file = dir.path() / "tether.json";

    SECTION("Full file") {
        tether::test::write_file(file, R"({
            "engine": "/opt/aria2/bin/aria2c",
            "state_dir": "/var/lib/tether",
            "sample_interval_ms": 250,
            "terminate_grace_ms": 1500,
            "progress_log_interval_s": 30,
            "stop_policy": "discard",
            "remove_deletes_checkpoint": false,
            "output_tail_lines": 5,
            "log_level": "debug",
            "defaults": {
                "dir": "/data",
                "split": 8,
                "max_connections": 4,
                "max_download_limit": "1M",
                "continue": false,
                "headers": ["X-A: 1", "X-B: 2"],
                "extra_args": "--check-certificate=false"
            }
        })");

        auto cfg = ManagerConfig::load(file.string());
        REQUIRE(cfg.has_value());
        CHECK(cfg->engine_path == "/opt/aria2/bin/aria2c");
        CHECK(cfg->state_dir == "/var/lib/tether");
        CHECK(cfg->sample_interval == std::chrono::milliseconds(250));
        CHECK(cfg->terminate_grace == std::chrono::milliseconds(1500));
        CHECK(cfg->progress_log_interval == std::chrono::seconds(30));
        CHECK(cfg->stop_policy == StopPolicy::discard_partial);
        CHECK(!cfg->remove_deletes_checkpoint);
        CHECK(cfg->output_tail_lines == 5);
        CHECK(cfg->log_level == "debug");
        CHECK(cfg->defaults.output_dir == "/data");
        CHECK(cfg->defaults.split == 8);
        CHECK(cfg->defaults.max_connections == 4);
        CHECK(cfg->defaults.max_download_limit == "1M");
        CHECK(!cfg->defaults.allow_continue);
        CHECK(cfg->defaults.headers == std::vector<std::string>{"X-A: 1", "X-B: 2"});
        CHECK(cfg->defaults.extra_args == "--check-certificate=false");
    }

    SECTION("Missing keys keep defaults") {
        tether::test::write_file(file, R"({"engine": "aria2c-1.37"})");
        auto cfg = ManagerConfig::load(file.string());
        REQUIRE(cfg.has_value());
        CHECK(cfg->engine_path == "aria2c-1.37");
        CHECK(cfg->terminate_grace == TERMINATE_GRACE);
        CHECK(cfg->defaults.split == DEFAULT_SPLIT);
    }

    SECTION("Missing file") {
        auto cfg = ManagerConfig::load((dir.path() / "absent.json").string());
        REQUIRE(!cfg.has_value());
        CHECK(cfg.error() == std::errc::no_such_file_or_directory);
    }

    SECTION("Invalid content") {
        auto rejects = [&](const std::string& text) {
            tether::test::write_file(file, text);
            auto cfg = ManagerConfig::load(file.string());
            return !cfg.has_value() && cfg.error() == TaskErrc::invalid_config;
        };

        CHECK(rejects("{ broken"));
        CHECK(rejects("[1, 2]"));
        CHECK(rejects(R"({"split": "many", "defaults": {"split": "many"}})"));
        CHECK(rejects(R"({"stop_policy": "shred"})"));
        CHECK(rejects(R"({"sample_interval_ms": 0})"));
        CHECK(rejects(R"({"log_level": "chatty"})"));
    }
}
