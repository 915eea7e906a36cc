/**
 * @file test_mock_ssh.cpp
 * @brief Unit tests for SSH sessions against the in-memory host.
 */

#include "ssh/mock_ssh.hpp"
#include "ssh/remote_command.hpp"

#include "support/sandbox_fixture.hpp"

#include <gtest/gtest.h>

using namespace vm_sandbox;
using namespace vm_sandbox::testing;

class MockSshTest : public ::testing::Test {
protected:
    TempDir dir_;
    std::shared_ptr<MockSshHost> host_ = std::make_shared<MockSshHost>();
    SshEndpoint endpoint_{.host = "192.168.122.10", .kill_after_s = 5, .channel_grace_s = 5};

    std::unique_ptr<SshSession> connect() {
        auto session = host_->connector()(endpoint_);
        EXPECT_TRUE(session.has_value());
        return std::move(*session);
    }
};

TEST_F(MockSshTest, CommandsAreWrappedWithTimeout) {
    auto session = connect();
    auto out = session->run_command("echo hi", 7);
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.stdout_text, "hi\n");

    auto commands = host_->executed_commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], "timeout --kill-after=5s 7s sh -c 'echo hi'");
}

TEST_F(MockSshTest, PythonScriptWritesLogs) {
    host_->put_file("/tmp/s.py", "print('hello')\nprint(\"world\")\n");
    auto session = connect();
    auto out = session->run_command("python3 /tmp/s.py > /tmp/out.log 2> /tmp/err.log", 10);

    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(host_->file("/tmp/out.log"), "hello\nworld\n");
    EXPECT_EQ(host_->file("/tmp/err.log"), "");
}

TEST_F(MockSshTest, SleepBeyondTimeoutIsAnnotated) {
    host_->put_file("/tmp/s.py", "import time\ntime.sleep(20)\n");
    auto session = connect();
    auto out = session->run_command("python3 /tmp/s.py > /tmp/o 2> /tmp/e", 3);
    EXPECT_EQ(out.exit_code, kExitTimedOut);
    EXPECT_NE(out.stderr_text.find(kTimedOutNote), std::string::npos);
}

TEST_F(MockSshTest, ExceptionsProduceTraceback) {
    host_->put_file("/tmp/s.py", "print('before')\nraise ValueError('bad input')\nprint('after')\n");
    auto session = connect();
    auto out = session->run_command("python3 /tmp/s.py > /tmp/o 2> /tmp/e", 10);
    EXPECT_EQ(out.exit_code, 1);
    EXPECT_EQ(host_->file("/tmp/o"), "before\n");
    auto err = host_->file("/tmp/e");
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("ValueError: bad input"), std::string::npos);
}

TEST_F(MockSshTest, MissingScript) {
    auto session = connect();
    auto out = session->run_command("python3 /tmp/none.py > /tmp/o 2> /tmp/e", 10);
    EXPECT_EQ(out.exit_code, 2);
    EXPECT_NE(host_->file("/tmp/e")->find("can't open file"), std::string::npos);
}

TEST_F(MockSshTest, ChannelHangBecomesExitMinusOne) {
    host_->set_channel_hang(true);
    auto session = connect();
    auto out = session->run_command("echo hi", 10);
    EXPECT_EQ(out.exit_code, kExitChannelError);
    EXPECT_NE(out.stderr_text.find("SSH Execution Error"), std::string::npos);
    EXPECT_NE(out.stderr_text.find("20s"), std::string::npos);
}

TEST_F(MockSshTest, UploadDownloadRoundTrip) {
    auto session = connect();
    const auto local = dir_.path() / "script.py";
    write_file(local, "print('x')\n");

    ASSERT_TRUE(session->upload_file(local, "/tmp/script.py").has_value());
    EXPECT_EQ(host_->file("/tmp/script.py"), "print('x')\n");

    const auto back = dir_.path() / "back.py";
    ASSERT_TRUE(session->download_file("/tmp/script.py", back).has_value());
    EXPECT_EQ(read_file(back), "print('x')\n");
}

TEST_F(MockSshTest, DownloadOfMissingFileIsEmpty) {
    auto session = connect();
    const auto local = dir_.path() / "empty.log";
    ASSERT_TRUE(session->download_file("/tmp/never-written.log", local).has_value());
    ASSERT_TRUE(std::filesystem::exists(local));
    EXPECT_EQ(std::filesystem::file_size(local), 0u);
}

TEST_F(MockSshTest, DownloadIntoMissingDirectoryFails) {
    host_->put_file("/tmp/x", "x");
    auto session = connect();
    auto result = session->download_file("/tmp/x", dir_.path() / "no" / "such" / "dir" / "x");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SSHTransferError);
}

TEST_F(MockSshTest, ConnectFailuresThenSuccess) {
    host_->fail_next_connects(2);
    auto connector = host_->connector();

    auto first = connector(endpoint_);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::SSHConnectError);
    EXPECT_FALSE(connector(endpoint_).has_value());
    EXPECT_TRUE(connector(endpoint_).has_value());
    EXPECT_EQ(host_->connect_attempts(), 3u);
}

TEST_F(MockSshTest, AuthFailure) {
    host_->set_auth_failure(true);
    auto result = host_->connector()(endpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SSHAuthError);
}

TEST_F(MockSshTest, SessionCountTracksClose) {
    auto session = connect();
    EXPECT_EQ(host_->open_sessions(), 1u);
    session->close();
    session->close();
    EXPECT_EQ(host_->open_sessions(), 0u);
    EXPECT_FALSE(session->is_connected());
}

TEST_F(MockSshTest, ShellEchoesAndExits) {
    auto session = connect();
    auto shell = session->open_shell("xterm-256color", 100, 30);
    ASSERT_TRUE(shell.has_value());
    EXPECT_EQ(host_->last_pty_size(), std::make_pair(100u, 30u));

    auto banner = (*shell)->read(100);
    ASSERT_TRUE(banner.has_value());
    EXPECT_NE(banner->find("$ "), std::string::npos);

    ASSERT_TRUE((*shell)->write("echo hello\r").has_value());
    auto echoed = (*shell)->read(100);
    ASSERT_TRUE(echoed.has_value());
    EXPECT_NE(echoed->find("hello\r\n$ "), std::string::npos);

    ASSERT_TRUE((*shell)->write("exit\n").has_value());
    auto bye = (*shell)->read(100);
    ASSERT_TRUE(bye.has_value());
    EXPECT_NE(bye->find("logout"), std::string::npos);
    EXPECT_FALSE((*shell)->read(10).has_value());
    EXPECT_FALSE((*shell)->is_open());
}

TEST_F(MockSshTest, HangUpClosesShells) {
    auto session = connect();
    auto shell = session->open_shell("xterm", 80, 24);
    ASSERT_TRUE(shell.has_value());
    EXPECT_EQ(host_->open_shells(), 1u);

    host_->hang_up_shells();
    (void)(*shell)->read(10);   // banner
    EXPECT_FALSE((*shell)->read(10).has_value());
    EXPECT_FALSE((*shell)->write("ls\n").has_value());

    (*shell)->close();
    EXPECT_EQ(host_->open_shells(), 0u);
}
