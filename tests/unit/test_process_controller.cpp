/**
 * @file test_process_controller.cpp
 * @brief Unit tests for spawning, signalling and reaping the child.
 */

#include "executor/process_controller.hpp"
#include "limiter/limiter.hpp"

#include <gtest/gtest.h>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace runexec;
using namespace std::chrono_literals;

class ProcessControllerTest : public ::testing::Test {
protected:
    int fds_[2]{-1, -1};

    void SetUp() override {
        ASSERT_EQ(::pipe2(fds_, O_CLOEXEC), 0);
    }

    void TearDown() override {
        close_write_end();
        if (fds_[0] >= 0) ::close(fds_[0]);
    }

    void close_write_end() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

    Result<std::unique_ptr<ProcessController>> spawn(const Command& command,
                                                     ILimiterContext* limiter = nullptr,
                                                     std::chrono::milliseconds grace = 1000ms) {
        auto controller = ProcessController::spawn(command, fds_[1], limiter, grace);
        close_write_end();
        return controller;
    }

    std::string read_output() {
        std::string out;
        char buffer[4096];
        ssize_t n;
        while ((n = ::read(fds_[0], buffer, sizeof(buffer))) > 0) {
            out.append(buffer, static_cast<size_t>(n));
        }
        return out;
    }
};

TEST(ReconcileExitStatusTest, NormalExit) {
    auto status = reconcile_exit_status(3 << 8);
    EXPECT_EQ(status.exit_code, 3);
    EXPECT_FALSE(status.signal.has_value());
}

TEST(ReconcileExitStatusTest, SignalNumberIsTheExitCode) {
    auto killed = reconcile_exit_status(SIGKILL);
    EXPECT_EQ(killed.exit_code, 9);
    ASSERT_TRUE(killed.signal.has_value());
    EXPECT_EQ(*killed.signal, SIGKILL);

    auto terminated = reconcile_exit_status(SIGTERM);
    EXPECT_EQ(terminated.exit_code, 15);
}

TEST_F(ProcessControllerTest, CapturesStdoutAndStderr) {
    auto controller = spawn({"/bin/sh", "-c", "echo out; echo err >&2"});
    ASSERT_TRUE(controller.has_value()) << controller.error().message;

    auto status = (*controller)->wait();
    ASSERT_TRUE(status.has_value()) << status.error().message;
    EXPECT_EQ(status->exit_code, 0);
    EXPECT_FALSE(status->signal.has_value());
    EXPECT_EQ(read_output(), "out\nerr\n");
}

TEST_F(ProcessControllerTest, StdinIsDevNull) {
    auto controller = spawn({"/bin/cat"});
    ASSERT_TRUE(controller.has_value());
    auto status = (*controller)->wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 0);
    EXPECT_EQ(read_output(), "");
}

TEST_F(ProcessControllerTest, PropagatesExitCode) {
    auto controller = spawn({"/bin/sh", "-c", "exit 3"});
    ASSERT_TRUE(controller.has_value());
    auto status = (*controller)->wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 3);
}

TEST_F(ProcessControllerTest, SearchesPath) {
    auto controller = spawn({"true"});
    ASSERT_TRUE(controller.has_value()) << controller.error().message;
    auto status = (*controller)->wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 0);
}

TEST_F(ProcessControllerTest, MissingExecutableIsSpawnError) {
    auto controller = spawn({"/nonexistent/runexec_no_such_binary"});
    ASSERT_FALSE(controller.has_value());
    EXPECT_EQ(controller.error().code, ErrorCode::Spawn);
    EXPECT_NE(controller.error().message.find("Cannot execute"), std::string::npos);
    EXPECT_EQ(read_output(), "");
}

TEST_F(ProcessControllerTest, EmptyCommandIsSpawnError) {
    auto controller = spawn({});
    ASSERT_FALSE(controller.has_value());
    EXPECT_EQ(controller.error().code, ErrorCode::Spawn);
}

TEST_F(ProcessControllerTest, ForcefulKill) {
    auto controller = spawn({"/bin/sleep", "10"});
    ASSERT_TRUE(controller.has_value());

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE((*controller)->request_kill(KillMode::Forceful));

    auto status = (*controller)->wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 9);
    EXPECT_EQ(status->signal.value_or(0), SIGKILL);
}

TEST_F(ProcessControllerTest, GracefulKill) {
    auto controller = spawn({"/bin/sleep", "10"});
    ASSERT_TRUE(controller.has_value());

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE((*controller)->request_kill(KillMode::Graceful));

    auto status = (*controller)->wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 15);
}

TEST_F(ProcessControllerTest, GracefulKillEscalatesWhenTermIsIgnored) {
    auto controller = spawn({"/bin/sh", "-c", "trap '' TERM; sleep 10"}, nullptr, 200ms);
    ASSERT_TRUE(controller.has_value());

    std::this_thread::sleep_for(100ms);
    auto start = std::chrono::steady_clock::now();
    (*controller)->request_kill(KillMode::Graceful);

    auto status = (*controller)->wait();
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 9);
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(ProcessControllerTest, KillAfterExitIsRefused) {
    auto controller = spawn({"/bin/true"});
    ASSERT_TRUE(controller.has_value());
    ASSERT_TRUE((*controller)->wait().has_value());

    EXPECT_TRUE((*controller)->exited());
    EXPECT_FALSE((*controller)->request_kill(KillMode::Forceful));
    EXPECT_FALSE((*controller)->wait().has_value());
}

TEST_F(ProcessControllerTest, BeforeReapSeesZombie) {
    auto controller = spawn({"/bin/true"});
    ASSERT_TRUE(controller.has_value());
    pid_t pid = (*controller)->pid();

    bool proc_entry_present = false;
    pid_t group = 0;
    auto status = (*controller)->wait([&] {
        proc_entry_present = std::filesystem::exists("/proc/" + std::to_string(pid));
        group = ::getpgid(pid);
    });
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(proc_entry_present);
    EXPECT_EQ(group, pid);
    EXPECT_FALSE(std::filesystem::exists("/proc/" + std::to_string(pid)));
}

TEST_F(ProcessControllerTest, KillsWholeProcessGroup) {
    // The grandchild would keep the pipe open for 10 s if it survived.
    auto controller = spawn({"/bin/sh", "-c", "sleep 10 & wait"});
    ASSERT_TRUE(controller.has_value());
    std::this_thread::sleep_for(100ms);
    (*controller)->request_kill(KillMode::Forceful);
    ASSERT_TRUE((*controller)->wait().has_value());

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(read_output(), "");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(ProcessControllerTest, AttachesToLimiterBeforeExec) {
    MockLimiter limiter;
    auto context = limiter.create(RunLimits{});
    ASSERT_TRUE(context.has_value());

    auto controller = spawn({"/bin/true"}, context->get());
    ASSERT_TRUE(controller.has_value());
    EXPECT_EQ(limiter.last_attached_pid(), (*controller)->pid());
    EXPECT_FALSE((*controller)->attach_error().has_value());
    ASSERT_TRUE((*controller)->wait().has_value());
}

TEST_F(ProcessControllerTest, RusageIsCollected) {
    auto controller = spawn({"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do i=$((i+1)); done"});
    ASSERT_TRUE(controller.has_value());
    auto status = (*controller)->wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_GT(status->cpu_time.count(), 0);
    ASSERT_TRUE(status->max_rss_bytes.has_value());
    EXPECT_GT(*status->max_rss_bytes, 0u);
}

TEST_F(ProcessControllerTest, DestructorKillsRunningChild) {
    pid_t pid = 0;
    {
        auto controller = spawn({"/bin/sleep", "10"});
        ASSERT_TRUE(controller.has_value());
        pid = (*controller)->pid();
    }
    EXPECT_FALSE(std::filesystem::exists("/proc/" + std::to_string(pid)));
}
