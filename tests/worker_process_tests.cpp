// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tether/process/worker_process.hpp>
#include <tether/process/error.hpp>
#include "test_support.hpp"
#include <signal.h>

using namespace tether::process;
using namespace std::chrono_literals;

namespace {

EngineCommand shell(std::string script) {
    return EngineCommand{"/bin/sh", {"-c", std::move(script)}};
}

std::string read_all(WorkerProcess& worker) {
    std::string out;
    tether::test::wait_until([&] {
        worker.read_output(out);
        return worker.poll() != WorkerStatus::alive;
    });
    worker.read_output(out);
    return out;
}

} // namespace

TEST_CASE("WorkerProcess exit status", "[worker_process]") {
    SECTION("Success") {
        auto worker = WorkerProcess::spawn(shell("exit 0"));
        REQUIRE(worker.has_value());
        auto& w = **worker;
        CHECK(w.pid() > 0);
        REQUIRE(tether::test::wait_until([&] { return w.poll() != WorkerStatus::alive; }));
        CHECK(w.poll() == WorkerStatus::exited_ok);
        CHECK(w.exit_code() == 0);
    }

    SECTION("Non-zero exit") {
        auto worker = WorkerProcess::spawn(shell("exit 3"));
        REQUIRE(worker.has_value());
        auto& w = **worker;
        REQUIRE(tether::test::wait_until([&] { return w.poll() != WorkerStatus::alive; }));
        CHECK(w.poll() == WorkerStatus::exited_error);
        CHECK(w.exit_code() == 3);
    }

    SECTION("Killed by a signal") {
        auto worker = WorkerProcess::spawn(shell("kill -9 $$"));
        REQUIRE(worker.has_value());
        auto& w = **worker;
        REQUIRE(tether::test::wait_until([&] { return w.poll() != WorkerStatus::alive; }));
        CHECK(w.exit_code() == 128 + SIGKILL);
    }
}

TEST_CASE("WorkerProcess output capture", "[worker_process]") {
    auto worker = WorkerProcess::spawn(shell("echo to-stdout; echo to-stderr >&2; printf 'no newline'"));
    REQUIRE(worker.has_value());

    auto out = read_all(**worker);
    CHECK(out.find("to-stdout\n") != std::string::npos);
    CHECK(out.find("to-stderr\n") != std::string::npos);
    CHECK(out.ends_with("no newline"));
}

TEST_CASE("WorkerProcess stdin is closed", "[worker_process]") {
    // cat would block forever on an inherited terminal
    auto worker = WorkerProcess::spawn(shell("cat; echo done"));
    REQUIRE(worker.has_value());
    auto out = read_all(**worker);
    CHECK(out == "done\n");
}

TEST_CASE("WorkerProcess spawn failure", "[worker_process]") {
    auto worker = WorkerProcess::spawn(EngineCommand{"/nonexistent/aria2c", {}});
    REQUIRE(!worker.has_value());
    CHECK(worker.error() == ProcessErrc::executable_not_found);
}

TEST_CASE("WorkerProcess terminate", "[worker_process]") {
    SECTION("Exits on SIGTERM") {
        auto worker = WorkerProcess::spawn(shell("sleep 30"));
        REQUIRE(worker.has_value());
        auto& w = **worker;
        CHECK(w.poll() == WorkerStatus::alive);
        CHECK(w.terminate(2000ms) == TerminateOutcome::graceful);
        CHECK(w.poll() == WorkerStatus::exited_error);
        CHECK(w.exit_code() == 128 + SIGTERM);
    }

    SECTION("Escalates to SIGKILL") {
        auto worker = WorkerProcess::spawn(shell("trap '' TERM; while :; do sleep 0.05; done"));
        REQUIRE(worker.has_value());
        auto& w = **worker;
        std::this_thread::sleep_for(100ms);

        auto start = std::chrono::steady_clock::now();
        CHECK(w.terminate(300ms) == TerminateOutcome::forced);
        CHECK(std::chrono::steady_clock::now() - start >= 300ms);
        CHECK(w.exit_code() == 128 + SIGKILL);
    }

    SECTION("Already exited") {
        auto worker = WorkerProcess::spawn(shell("exit 0"));
        REQUIRE(worker.has_value());
        auto& w = **worker;
        REQUIRE(tether::test::wait_until([&] { return w.poll() != WorkerStatus::alive; }));
        CHECK(w.terminate(100ms) == TerminateOutcome::already_exited);
    }

    SECTION("Destructor does not leave the process behind") {
        pid_t pid;
        {
            auto worker = WorkerProcess::spawn(shell("sleep 30"));
            REQUIRE(worker.has_value());
            pid = (*worker)->pid();
        }
        CHECK(::kill(pid, 0) != 0);
    }
}
