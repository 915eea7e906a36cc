/**
 * @file test_process.cpp
 * @brief Unit tests for the host process runner.
 */

#include "core/process.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace vm_sandbox;

TEST(ProcessTest, CapturesStdout) {
    auto result = run_process(ProcessSpec{.program = "echo", .args = {"hello", "world"}});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_FALSE(result->timed_out);
    EXPECT_EQ(result->stdout_text, "hello world\n");
}

TEST(ProcessTest, CapturesStderrAndExitCode) {
    auto result = run_process(ProcessSpec{.program = "sh", .args = {"-c", "echo oops >&2; exit 3"}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_EQ(result->stderr_text, "oops\n");
    EXPECT_TRUE(result->stdout_text.empty());
}

TEST(ProcessTest, MissingProgramExits127) {
    auto result = run_process(ProcessSpec{.program = "/nonexistent/vm_sandbox_tool"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 127);
}

TEST(ProcessTest, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto result = run_process(ProcessSpec{.program = "sleep", .args = {"5"}, .timeout_ms = 200});
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->timed_out);
    EXPECT_EQ(result->exit_code, 124);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessTest, OutputIsCapped) {
    auto result = run_process(ProcessSpec{
        .program = "sh", .args = {"-c", "yes x | head -c 4096"},
        .max_output_bytes = 100});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_text.size(), 100u);
}

TEST(ProcessTest, ConcurrentChildrenDoNotInheritPipes) {
    const ProcessSpec list_fds{.program = "sh", .args = {"-c", "ls /proc/$$/fd"}, .timeout_ms = 5000};
    auto alone = run_process(list_fds);
    ASSERT_TRUE(alone.has_value());

    std::thread other([] {
        auto slow = run_process(ProcessSpec{.program = "sleep", .args = {"1"}, .timeout_ms = 5000});
        EXPECT_TRUE(slow.has_value());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto concurrent = run_process(list_fds);
    other.join();

    // The sleeping child's pipe ends must not show up in the second child
    ASSERT_TRUE(concurrent.has_value());
    EXPECT_EQ(concurrent->stdout_text, alone->stdout_text);
}
