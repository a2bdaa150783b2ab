/**
 * @file worker_supervisor_test.cpp
 * @brief Unit tests for WorkerSupervisor lifecycle, restart and shutdown.
 *
 * Tests:
 * - start() spawns and waits for health; a second start() is a no-op
 * - Crashed workers are respawned with doubling backoff until the budget is spent
 * - shutdown() interrupts a pending backoff and never lets a respawn through
 * - Spawn failure, health timeout and cancelled startup are reported
 * - Stable uptime resets the restart count when configured
 * - Failed respawns and orphans holding the log pipes do not stall the monitor
 *
 * `sleep 60` stands in for the worker; crashes are simulated with SIGKILL.
 * Health is mocked except for one test against a live httplib server.
 */

#include "worker/worker_supervisor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mocks/mock_health_probe.hpp"

using namespace pulse;
using namespace pulse::worker;
using namespace pulse::tests;
using namespace testing;
using std::chrono::milliseconds;
namespace fs = std::filesystem;

namespace {

bool wait_until(const std::function<bool()> &predicate, milliseconds timeout = milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(10));
    }
    return predicate();
}

WorkerConfig make_test_config() {
    WorkerConfig config;
    config.command = "sleep";
    config.args = {"60"};
    config.max_restarts = 2;
    config.initial_restart_delay_ms = 100;
    config.poll_interval_ms = 20;
    config.health_check_url = "http://127.0.0.1:1/health";
    config.health_check_timeout_ms = 500;
    config.health_check_max_retries = 3;
    config.health_check_retry_delay_ms = 100;
    return config;
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - since).count();
}

}  // namespace

class WorkerSupervisorTest : public Test {
protected:
    void SetUp() override {
        probe_ = std::make_shared<NiceMock<MockHealthProbe>>();
        ON_CALL(*probe_, probe(_, _)).WillByDefault(Return(ready_result({{"status", "ok"}})));
    }

    // SIGKILL the current worker; returns its pid, or -1 when none is held
    static int kill_current_worker(WorkerSupervisor &supervisor) {
        auto snap = supervisor.snapshot();
        if (!snap.pid) {
            return -1;
        }
        kill(*snap.pid, SIGKILL);
        return *snap.pid;
    }

    std::shared_ptr<NiceMock<MockHealthProbe>> probe_;
};

// ---------------------------------------------------------------------------
// Startup
// ---------------------------------------------------------------------------

TEST_F(WorkerSupervisorTest, StartSpawnsAndBecomesRunning) {
    WorkerSupervisor supervisor(make_test_config(), probe_);

    WorkerStatus status = supervisor.start();
    ASSERT_TRUE(status.ok()) << status.message;

    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.state, LifecycleState::RUNNING);
    EXPECT_EQ(snap.spawn_count, 1);
    EXPECT_EQ(snap.restart_count, 0);
    EXPECT_EQ(snap.max_restarts, 2);
    ASSERT_TRUE(snap.pid.has_value());
    EXPECT_GT(*snap.pid, 0);
    ASSERT_TRUE(snap.uptime_ms.has_value());
    EXPECT_GE(*snap.uptime_ms, 0);
    EXPECT_FALSE(snap.shutting_down);

    EXPECT_EQ(supervisor.last_diagnostics()["status"], "ok");
    EXPECT_TRUE(supervisor.shutdown().ok());
}

TEST_F(WorkerSupervisorTest, SecondStartIsNoOp) {
    WorkerSupervisor supervisor(make_test_config(), probe_);

    ASSERT_TRUE(supervisor.start().ok());
    int pid = *supervisor.snapshot().pid;

    ASSERT_TRUE(supervisor.start().ok());
    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.spawn_count, 1);
    EXPECT_EQ(*snap.pid, pid);
}

TEST_F(WorkerSupervisorTest, StartSucceedsOnThirdProbeWithDiagnostics) {
    nlohmann::json body = {{"status", "ok"}, {"libraries", {{"transformers", "4.40"}}}};
    EXPECT_CALL(*probe_, probe(_, _))
        .WillOnce(Return(failed_result(500, "Health check failed with HTTP status 500")))
        .WillOnce(Return(failed_result(500, "Health check failed with HTTP status 500")))
        .WillOnce(Return(ready_result(body)));

    WorkerConfig config = make_test_config();
    config.health_check_max_retries = 5;
    WorkerSupervisor supervisor(config, probe_);

    WorkerStatus status = supervisor.start();
    ASSERT_TRUE(status.ok()) << status.message;
    EXPECT_EQ(supervisor.last_diagnostics(), body);
    EXPECT_EQ(supervisor.snapshot().state, LifecycleState::RUNNING);
}

TEST_F(WorkerSupervisorTest, SpawnFailureIsReported) {
    WorkerConfig config = make_test_config();
    config.command = "/nonexistent/pulse-analysis-worker";
    WorkerSupervisor supervisor(config, probe_);

    EXPECT_CALL(*probe_, probe(_, _)).Times(0);

    WorkerStatus status = supervisor.start();
    EXPECT_EQ(status.code, WorkerError::SPAWN_FAILED);
    EXPECT_NE(status.message.find("/nonexistent/pulse-analysis-worker"), std::string::npos);

    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.state, LifecycleState::NOT_STARTED);
    EXPECT_EQ(snap.spawn_count, 0);
    EXPECT_FALSE(snap.pid.has_value());
}

TEST_F(WorkerSupervisorTest, HealthTimeoutLeavesWorkerSupervised) {
    ON_CALL(*probe_, probe(_, _)).WillByDefault(Return(failed_result(0, "Connection refused")));
    EXPECT_CALL(*probe_, probe(_, _)).Times(3);

    WorkerSupervisor supervisor(make_test_config(), probe_);
    WorkerStatus status = supervisor.start();

    EXPECT_EQ(status.code, WorkerError::HEALTH_CHECK_TIMEOUT);
    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.state, LifecycleState::AWAITING_HEALTH);
    EXPECT_TRUE(snap.pid.has_value());
    EXPECT_TRUE(supervisor.last_diagnostics().is_null());

    EXPECT_TRUE(supervisor.shutdown().ok());
    EXPECT_FALSE(supervisor.snapshot().pid.has_value());
}

TEST_F(WorkerSupervisorTest, StartAfterHealthTimeoutWaitsAgainWithoutRespawning) {
    EXPECT_CALL(*probe_, probe(_, _))
        .WillOnce(Return(failed_result(0, "Connection refused")))
        .WillOnce(Return(failed_result(0, "Connection refused")))
        .WillOnce(Return(failed_result(0, "Connection refused")))
        .WillRepeatedly(Return(ready_result()));

    WorkerSupervisor supervisor(make_test_config(), probe_);
    EXPECT_EQ(supervisor.start().code, WorkerError::HEALTH_CHECK_TIMEOUT);

    ASSERT_TRUE(supervisor.start().ok());
    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.spawn_count, 1);
    EXPECT_EQ(snap.state, LifecycleState::RUNNING);
}

TEST_F(WorkerSupervisorTest, ShutdownCancelsPendingStart) {
    ON_CALL(*probe_, probe(_, _)).WillByDefault(Return(failed_result(0, "Connection refused")));

    WorkerConfig config = make_test_config();
    config.health_check_max_retries = 12;
    config.health_check_retry_delay_ms = 30000;
    WorkerSupervisor supervisor(config, probe_);

    std::thread stopper([&supervisor]() {
        std::this_thread::sleep_for(milliseconds(100));
        supervisor.shutdown();
    });

    auto start = std::chrono::steady_clock::now();
    WorkerStatus status = supervisor.start();
    EXPECT_LT(elapsed_ms(start), 2000);

    stopper.join();

    EXPECT_EQ(status.code, WorkerError::CANCELLED);
    EXPECT_EQ(supervisor.snapshot().state, LifecycleState::TERMINATED);
}

TEST_F(WorkerSupervisorTest, StartAfterShutdownIsCancelled) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.shutdown().ok());

    EXPECT_EQ(supervisor.start().code, WorkerError::CANCELLED);
    EXPECT_EQ(supervisor.snapshot().spawn_count, 0);
}

TEST_F(WorkerSupervisorTest, StartWithLiveHttpHealthEndpoint) {
    httplib::Server server;
    server.Get("/health", [](const httplib::Request &, httplib::Response &res) {
        res.set_content(R"({"status":"ok","primary_detector":"yolo"})", "application/json");
    });
    int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread server_thread([&server]() { server.listen_after_bind(); });
    server.wait_until_ready();

    WorkerConfig config = make_test_config();
    config.health_check_url = "http://127.0.0.1:" + std::to_string(port) + "/health";

    {
        WorkerSupervisor supervisor(config);
        WorkerStatus status = supervisor.start();
        EXPECT_TRUE(status.ok()) << status.message;
        EXPECT_EQ(supervisor.last_diagnostics()["primary_detector"], "yolo");
        EXPECT_TRUE(supervisor.is_healthy());
    }

    server.stop();
    server_thread.join();
}

// ---------------------------------------------------------------------------
// Health queries
// ---------------------------------------------------------------------------

TEST_F(WorkerSupervisorTest, IsHealthyProbesEachCall) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.start().ok());

    EXPECT_CALL(*probe_, probe(_, _))
        .WillOnce(Return(ready_result()))
        .WillOnce(Return(failed_result(500, "Health check failed with HTTP status 500")));

    EXPECT_TRUE(supervisor.is_healthy());
    EXPECT_FALSE(supervisor.is_healthy());
}

TEST_F(WorkerSupervisorTest, IsHealthyFalseAfterShutdownWithoutProbing) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.start().ok());
    ASSERT_TRUE(supervisor.shutdown().ok());

    EXPECT_CALL(*probe_, probe(_, _)).Times(0);
    EXPECT_FALSE(supervisor.is_healthy());
}

// ---------------------------------------------------------------------------
// Crash recovery
// ---------------------------------------------------------------------------

TEST_F(WorkerSupervisorTest, CrashedWorkerIsRespawned) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.start().ok());

    int old_pid = kill_current_worker(supervisor);
    ASSERT_GT(old_pid, 0);

    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().spawn_count == 2; }));

    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.restart_count, 1);
    EXPECT_EQ(snap.last_backoff_ms, 100);
    EXPECT_EQ(snap.state, LifecycleState::RUNNING);
    ASSERT_TRUE(snap.pid.has_value());
    EXPECT_NE(*snap.pid, old_pid);
}

TEST_F(WorkerSupervisorTest, BackoffDoublesUntilRestartBudgetIsSpent) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.start().ok());

    // Crash 1 -> restart after 100ms
    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().spawn_count == 2; }));
    EXPECT_EQ(supervisor.snapshot().last_backoff_ms, 100);

    // Crash 2 -> restart after 200ms
    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().spawn_count == 3; }));
    EXPECT_EQ(supervisor.snapshot().last_backoff_ms, 200);
    EXPECT_EQ(supervisor.snapshot().restart_count, 2);

    // Crash 3 -> budget spent, no further spawn
    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().state == LifecycleState::FAILED; }));

    std::this_thread::sleep_for(milliseconds(300));
    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.state, LifecycleState::FAILED);
    EXPECT_EQ(snap.spawn_count, 3);
    EXPECT_EQ(snap.restart_count, 2);
    EXPECT_FALSE(snap.pid.has_value());

    EXPECT_TRUE(supervisor.shutdown().ok());
}

TEST_F(WorkerSupervisorTest, ZeroRestartBudgetFailsOnFirstCrash) {
    WorkerConfig config = make_test_config();
    config.max_restarts = 0;
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().state == LifecycleState::FAILED; }));
    EXPECT_EQ(supervisor.snapshot().spawn_count, 1);
    EXPECT_EQ(supervisor.snapshot().restart_count, 0);
}

TEST_F(WorkerSupervisorTest, FailedRespawnsSpendTheRestartBudget) {
    // A launcher script that disappears after the first spawn makes every respawn fail
    fs::path script = fs::temp_directory_path() / ("pulse_worker_" + std::to_string(getpid()) + ".sh");
    {
        std::ofstream out(script);
        out << "#!/bin/sh\nexec sleep 60\n";
    }
    fs::permissions(script, fs::perms::owner_all);

    WorkerConfig config = make_test_config();
    config.command = script.string();
    config.args.clear();
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    ASSERT_GT(kill_current_worker(supervisor), 0);
    fs::remove(script);

    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().state == LifecycleState::FAILED; }));
    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.spawn_count, 1);
    EXPECT_EQ(snap.restart_count, 2);
    EXPECT_EQ(snap.last_backoff_ms, 200);
    EXPECT_FALSE(snap.pid.has_value());

    EXPECT_TRUE(supervisor.shutdown().ok());
}

TEST_F(WorkerSupervisorTest, CrashWithChattyOrphanStillRestartsAndShutsDown) {
    // The background loop inherits stdout and outlives the shell
    WorkerConfig config = make_test_config();
    config.command = "/bin/sh";
    config.args = {"-c", "(while :; do echo tick; sleep 0.01; done) & sleep 0.3; exit 1"};
    config.initial_restart_delay_ms = 50;
    config.max_restarts = 5;
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().spawn_count >= 2; }, milliseconds(3000)));

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(supervisor.shutdown().ok());
    EXPECT_LT(elapsed_ms(start), 3000);
    EXPECT_EQ(supervisor.snapshot().state, LifecycleState::TERMINATED);
}

TEST_F(WorkerSupervisorTest, RunningSnapshotAlwaysCarriesPid) {
    WorkerConfig config = make_test_config();
    config.initial_restart_delay_ms = 10;
    config.max_restarts = 5;
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    std::atomic<bool> done{false};
    std::atomic<int> violations{0};
    std::thread sampler([&]() {
        while (!done.load()) {
            auto snap = supervisor.snapshot();
            if (snap.state == LifecycleState::RUNNING && !snap.pid) {
                violations.fetch_add(1);
            }
        }
    });

    for (int crash = 0; crash < 3; ++crash) {
        int spawns = supervisor.snapshot().spawn_count;
        ASSERT_GT(kill_current_worker(supervisor), 0);
        ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().spawn_count == spawns + 1; }));
    }

    done.store(true);
    sampler.join();
    EXPECT_EQ(violations.load(), 0);
}

TEST_F(WorkerSupervisorTest, StableUptimeResetsRestartCountWhenConfigured) {
    WorkerConfig config = make_test_config();
    config.initial_restart_delay_ms = 10;
    config.restart_count_reset_ms = 200;
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().spawn_count == 2; }));
    EXPECT_EQ(supervisor.snapshot().restart_count, 1);

    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().restart_count == 0; }));
    EXPECT_EQ(supervisor.snapshot().state, LifecycleState::RUNNING);
}

TEST_F(WorkerSupervisorTest, RestartCountIsMonotonicByDefault) {
    WorkerConfig config = make_test_config();
    config.initial_restart_delay_ms = 10;
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().spawn_count == 2; }));

    std::this_thread::sleep_for(milliseconds(300));
    EXPECT_EQ(supervisor.snapshot().restart_count, 1);
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------

TEST_F(WorkerSupervisorTest, ShutdownKillsWorker) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.start().ok());
    int pid = *supervisor.snapshot().pid;

    ASSERT_TRUE(supervisor.shutdown().ok());

    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.state, LifecycleState::TERMINATED);
    EXPECT_TRUE(snap.shutting_down);
    EXPECT_FALSE(snap.pid.has_value());

    // Reaped: the pid no longer names our child
    EXPECT_NE(kill(pid, 0), 0);
}

TEST_F(WorkerSupervisorTest, ShutdownInterruptsLongBackoff) {
    WorkerConfig config = make_test_config();
    config.initial_restart_delay_ms = 60000;
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(wait_until([&]() { return supervisor.snapshot().state == LifecycleState::RESTARTING; }));
    EXPECT_EQ(supervisor.snapshot().last_backoff_ms, 60000);

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(supervisor.shutdown().ok());
    EXPECT_LT(elapsed_ms(start), 1000);

    EXPECT_EQ(supervisor.snapshot().spawn_count, 1);
}

TEST_F(WorkerSupervisorTest, NoSpawnAfterShutdown) {
    WorkerConfig config = make_test_config();
    config.initial_restart_delay_ms = 50;
    WorkerSupervisor supervisor(config, probe_);
    ASSERT_TRUE(supervisor.start().ok());

    // Crash and shut down while the restart is pending
    ASSERT_GT(kill_current_worker(supervisor), 0);
    ASSERT_TRUE(supervisor.shutdown().ok());
    int spawns = supervisor.snapshot().spawn_count;

    std::this_thread::sleep_for(milliseconds(300));
    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.spawn_count, spawns);
    EXPECT_FALSE(snap.pid.has_value());
    EXPECT_FALSE(supervisor.is_healthy());
}

TEST_F(WorkerSupervisorTest, ShutdownIsIdempotent) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.start().ok());

    EXPECT_TRUE(supervisor.shutdown().ok());
    EXPECT_TRUE(supervisor.shutdown().ok());
    EXPECT_EQ(supervisor.snapshot().state, LifecycleState::TERMINATED);
}

TEST_F(WorkerSupervisorTest, ShutdownBeforeStartSucceeds) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    EXPECT_TRUE(supervisor.shutdown().ok());
    EXPECT_EQ(supervisor.snapshot().state, LifecycleState::TERMINATED);
}

TEST_F(WorkerSupervisorTest, ConcurrentShutdownCallsAllReturn) {
    WorkerSupervisor supervisor(make_test_config(), probe_);
    ASSERT_TRUE(supervisor.start().ok());

    std::vector<std::thread> callers;
    std::atomic<int> ok_count{0};
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&]() {
            if (supervisor.shutdown().ok()) {
                ok_count.fetch_add(1);
            }
        });
    }
    for (auto &t : callers) {
        t.join();
    }

    EXPECT_EQ(ok_count.load(), 4);
    EXPECT_EQ(supervisor.snapshot().state, LifecycleState::TERMINATED);
}

TEST(LifecycleStateTest, NamesAreStable) {
    EXPECT_STREQ(lifecycle_state_to_string(LifecycleState::NOT_STARTED), "NOT_STARTED");
    EXPECT_STREQ(lifecycle_state_to_string(LifecycleState::RUNNING), "RUNNING");
    EXPECT_STREQ(lifecycle_state_to_string(LifecycleState::RESTARTING), "RESTARTING");
    EXPECT_STREQ(lifecycle_state_to_string(LifecycleState::FAILED), "FAILED");
    EXPECT_STREQ(lifecycle_state_to_string(LifecycleState::TERMINATED), "TERMINATED");
}
