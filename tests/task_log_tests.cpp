// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tether/core/task_log.hpp>
#include "test_support.hpp"
#include <fstream>
#include <thread>

using namespace tether::core;
using tether::test::TempDir;

TEST_CASE("LogKind names", "[task_log]") {
    for (auto kind : {LogKind::transition, LogKind::error, LogKind::progress, LogKind::engine, LogKind::info}) {
        auto back = log_kind_from_string(to_string(kind));
        REQUIRE(back.has_value());
        CHECK(*back == kind);
    }
    CHECK(!log_kind_from_string("warning").has_value());
}

TEST_CASE("TaskLogStore in memory", "[task_log]") {
    TaskLogStore log;
    CHECK(!log.persistent());

    SECTION("Entries keep their order and kind") {
        log.append(1, LogKind::info, "added");
        log.append(1, LogKind::transition, "queued -> running: engine started");
        log.append(2, LogKind::info, "other task");

        auto history = log.read(1);
        REQUIRE(history.size() == 2);
        CHECK(history[0].message == "added");
        CHECK(history[1].kind == LogKind::transition);
        CHECK(log.read(2).size() == 1);
        CHECK(log.read(3).empty());
    }

    SECTION("Timestamps strictly increase even in a burst") {
        for (int i = 0; i < 500; ++i) {
            log.append(7, LogKind::engine, "line " + std::to_string(i));
        }
        auto history = log.read(7);
        REQUIRE(history.size() == 500);
        for (std::size_t i = 1; i < history.size(); ++i) {
            CHECK(history[i - 1].timestamp < history[i].timestamp);
        }
    }

    SECTION("Concurrent writers keep per-task order") {
        std::thread a([&] { for (int i = 0; i < 200; ++i) log.append(1, LogKind::info, "a"); });
        std::thread b([&] { for (int i = 0; i < 200; ++i) log.append(1, LogKind::info, "b"); });
        a.join();
        b.join();

        auto history = log.read(1);
        REQUIRE(history.size() == 400);
        for (std::size_t i = 1; i < history.size(); ++i) {
            CHECK(history[i - 1].timestamp < history[i].timestamp);
        }
    }

    SECTION("tail") {
        for (int i = 0; i < 10; ++i) {
            log.append(1, LogKind::info, std::to_string(i));
        }
        auto last = log.tail(1, 3);
        REQUIRE(last.size() == 3);
        CHECK(last[0].message == "7");
        CHECK(last[2].message == "9");
        CHECK(log.tail(1, 100).size() == 10);
    }

    SECTION("erase") {
        log.append(1, LogKind::info, "x");
        log.erase(1);
        CHECK(log.read(1).empty());
    }
}

TEST_CASE("TaskLogStore on disk", "[task_log]") {
    TempDir dir;

    std::vector<LogEntry> written;
    {
        TaskLogStore log(dir.path());
        CHECK(log.persistent());
        written.push_back(log.append(4, LogKind::info, "added"));
        written.push_back(log.append(4, LogKind::error, "failed to spawn engine 'aria2c': \"quoted\""));
        written.push_back(log.append(4, LogKind::engine, "multi\nline"));
    }
    REQUIRE(std::filesystem::exists(dir.path() / "4.jsonl"));

    SECTION("A new store sees the same history") {
        TaskLogStore log(dir.path());
        auto history = log.read(4);
        REQUIRE(history.size() == written.size());
        for (std::size_t i = 0; i < history.size(); ++i) {
            CHECK(history[i].timestamp == written[i].timestamp);
            CHECK(history[i].kind == written[i].kind);
            CHECK(history[i].message == written[i].message);
        }
    }

    SECTION("Appending after a reload stays ordered") {
        TaskLogStore log(dir.path());
        log.append(4, LogKind::info, "after restart");
        auto history = log.read(4);
        REQUIRE(history.size() == 4);
        CHECK(history[2].timestamp < history[3].timestamp);
    }

    SECTION("Torn last line is skipped") {
        {
            std::ofstream f(dir.path() / "4.jsonl", std::ios::app);
            f << "{\"ts\":17";
        }
        TaskLogStore log(dir.path());
        CHECK(log.read(4).size() == 3);
    }

    SECTION("erase removes the file") {
        TaskLogStore log(dir.path());
        log.erase(4);
        CHECK(!std::filesystem::exists(dir.path() / "4.jsonl"));
        CHECK(log.read(4).empty());
    }
}
