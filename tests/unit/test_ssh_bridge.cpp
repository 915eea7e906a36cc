/**
 * @file test_ssh_bridge.cpp
 * @brief Unit tests for interactive terminal sessions.
 */

#include "terminal/ssh_bridge.hpp"
#include "orchestrator/workspace_service.hpp"

#include "support/sandbox_fixture.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <optional>
#include <vector>

using namespace vm_sandbox;
using namespace vm_sandbox::testing;

namespace {

/// Thread-safe record of everything the bridge sent.
class MessageLog {
public:
    TerminalSink sink() {
        return [this](const ConnectionId& connection, const TerminalMessage& message) {
            std::lock_guard lock(mutex_);
            messages_.emplace_back(connection, message);
        };
    }

    size_t count(const ConnectionId& connection, TerminalMessageType type) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& [conn, msg] : messages_) {
            if (conn == connection && msg.type == type) ++n;
        }
        return n;
    }

    std::string output(const ConnectionId& connection) const {
        std::lock_guard lock(mutex_);
        std::string out;
        for (const auto& [conn, msg] : messages_) {
            if (conn == connection && msg.type == TerminalMessageType::Output) out += msg.payload;
        }
        return out;
    }

    std::optional<TerminalMessage> first(const ConnectionId& connection) const {
        std::lock_guard lock(mutex_);
        for (const auto& [conn, msg] : messages_) {
            if (conn == connection) return msg;
        }
        return std::nullopt;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ConnectionId, TerminalMessage>> messages_;
};

}  // namespace

class SshBridgeTest : public ::testing::Test {
protected:
    VmStack stack_;
    WorkspaceService workspaces_{stack_.config, stack_.domains, stack_.images, stack_.logger};
    MessageLog log_;
    SshBridge bridge_{stack_.config, stack_.domains, stack_.ssh->connector(), log_.sink(),
                      stack_.logger, &stack_.metrics};

    void SetUp() override {
        ASSERT_TRUE(workspaces_.create(WorkspaceRequest{.name = "dev"}).has_value());
    }

    void TearDown() override { bridge_.detach_all(); }
};

TEST_F(SshBridgeTest, AttachSendsReadyThenBanner) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    EXPECT_TRUE(bridge_.is_active("c1"));
    EXPECT_EQ(bridge_.session_count(), 1u);

    auto first = log_.first("c1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->type, TerminalMessageType::Ready);

    EXPECT_TRUE(wait_until([&] { return log_.output("c1").find("$ ") != std::string::npos; }));
    auto pty = stack_.ssh->last_pty_size();
    ASSERT_TRUE(pty.has_value());
    EXPECT_EQ(pty->first, stack_.config.terminal.cols);
    EXPECT_EQ(pty->second, stack_.config.terminal.rows);
}

TEST_F(SshBridgeTest, InputIsEchoed) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    ASSERT_TRUE(bridge_.send_input("c1", "echo hello-vm\r").has_value());
    EXPECT_TRUE(wait_until([&] { return log_.output("c1").find("hello-vm\r\n$ ") != std::string::npos; }));
}

TEST_F(SshBridgeTest, ResizeForwardsToPty) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    ASSERT_TRUE(bridge_.resize("c1", 132, 43).has_value());
    auto pty = stack_.ssh->last_pty_size();
    ASSERT_TRUE(pty.has_value());
    EXPECT_EQ(pty->first, 132u);
    EXPECT_EQ(pty->second, 43u);
}

TEST_F(SshBridgeTest, ResizeRejectsNonPositive) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    for (auto [cols, rows] : {std::pair{0, 24}, std::pair{80, 0}, std::pair{-1, -1}}) {
        auto r = bridge_.resize("c1", cols, rows);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, BridgeErrorCode::InvalidSize);
    }
}

TEST_F(SshBridgeTest, NoSessionErrors) {
    auto sent = bridge_.send_input("ghost", "ls\n");
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, BridgeErrorCode::NoActiveSession);

    auto resized = bridge_.resize("ghost", 80, 24);
    ASSERT_FALSE(resized.has_value());
    EXPECT_EQ(resized.error().code, BridgeErrorCode::NoActiveSession);
}

TEST_F(SshBridgeTest, StoppedWorkspaceFailsBeforeSsh) {
    ASSERT_TRUE(workspaces_.stop("dev").has_value());

    auto attached = bridge_.attach("c1", "dev");
    ASSERT_FALSE(attached.has_value());
    EXPECT_EQ(attached.error().code, BridgeErrorCode::NotRunning);
    EXPECT_EQ(stack_.ssh->connect_attempts(), 0u);
    EXPECT_EQ(log_.count("c1", TerminalMessageType::Error), 1u);
    EXPECT_EQ(log_.count("c1", TerminalMessageType::Ready), 0u);
}

TEST_F(SshBridgeTest, UnknownOrEphemeralIsNotFound) {
    auto missing = bridge_.attach("c1", "nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, BridgeErrorCode::NotFound);

    auto disk = stack_.images.create_overlay("vm-job", stack_.config.images.base_image,
                                             stack_.config.images.ephemeral_dir);
    ASSERT_TRUE(disk.has_value());
    ASSERT_TRUE(stack_.domains.define(DefineRequest{.name = "vm-job", .disk_path = *disk}).has_value());
    auto ephemeral = bridge_.attach("c2", "vm-job");
    ASSERT_FALSE(ephemeral.has_value());
    EXPECT_EQ(ephemeral.error().code, BridgeErrorCode::NotFound);
    EXPECT_EQ(stack_.ssh->connect_attempts(), 0u);
}

TEST_F(SshBridgeTest, SshFailureReported) {
    stack_.ssh->set_auth_failure(true);
    auto attached = bridge_.attach("c1", "dev");
    ASSERT_FALSE(attached.has_value());
    EXPECT_EQ(attached.error().code, BridgeErrorCode::SshFailed);
    EXPECT_EQ(bridge_.session_count(), 0u);
    EXPECT_EQ(log_.count("c1", TerminalMessageType::Error), 1u);
}

TEST_F(SshBridgeTest, SecondAttachOnSameConnectionRejected) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    auto again = bridge_.attach("c1", "dev");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, BridgeErrorCode::AlreadyAttached);
    EXPECT_EQ(stack_.ssh->open_shells(), 1u);
}

TEST_F(SshBridgeTest, RemoteHangUpSendsSingleClosed) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    stack_.ssh->hang_up_shells();

    EXPECT_TRUE(wait_until([&] { return log_.count("c1", TerminalMessageType::Closed) == 1; }));
    EXPECT_FALSE(bridge_.is_active("c1"));

    // The dead session is released without the client detaching
    EXPECT_EQ(bridge_.session_count(), 0u);
    EXPECT_EQ(stack_.ssh->open_shells(), 0u);
    EXPECT_EQ(stack_.ssh->open_sessions(), 0u);

    bridge_.detach("c1");
    EXPECT_EQ(log_.count("c1", TerminalMessageType::Closed), 1u);
}

TEST_F(SshBridgeTest, SinkMayDetachOnClosed) {
    SshBridge* bridge = nullptr;
    std::atomic<size_t> closed{0};
    SshBridge local(stack_.config, stack_.domains, stack_.ssh->connector(),
                    [&](const ConnectionId& connection, const TerminalMessage& message) {
                        if (message.type != TerminalMessageType::Closed) return;
                        ++closed;
                        bridge->detach(connection);
                    },
                    stack_.logger, &stack_.metrics);
    bridge = &local;

    ASSERT_TRUE(local.attach("c1", "dev").has_value());
    stack_.ssh->hang_up_shells();

    EXPECT_TRUE(wait_until([&] { return closed.load() == 1; }));
    EXPECT_TRUE(wait_until([&] { return stack_.ssh->open_sessions() == 0; }));
    EXPECT_EQ(local.session_count(), 0u);
    EXPECT_EQ(closed.load(), 1u);
}

TEST_F(SshBridgeTest, SinkMayDetachOnOutput) {
    SshBridge* bridge = nullptr;
    std::atomic<size_t> closed{0};
    SshBridge local(stack_.config, stack_.domains, stack_.ssh->connector(),
                    [&](const ConnectionId& connection, const TerminalMessage& message) {
                        if (message.type == TerminalMessageType::Output) bridge->detach(connection);
                        if (message.type == TerminalMessageType::Closed) ++closed;
                    },
                    stack_.logger, &stack_.metrics);
    bridge = &local;

    ASSERT_TRUE(local.attach("c1", "dev").has_value());

    EXPECT_TRUE(wait_until([&] { return closed.load() == 1; }));
    EXPECT_TRUE(wait_until([&] { return stack_.ssh->open_sessions() == 0; }));
    EXPECT_EQ(local.session_count(), 0u);
    EXPECT_EQ(stack_.ssh->open_shells(), 0u);
    EXPECT_EQ(closed.load(), 1u);
}

TEST_F(SshBridgeTest, ExitCommandClosesSession) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    ASSERT_TRUE(bridge_.send_input("c1", "exit\r").has_value());
    EXPECT_TRUE(wait_until([&] { return log_.count("c1", TerminalMessageType::Closed) == 1; }));
    EXPECT_NE(log_.output("c1").find("logout"), std::string::npos);
}

TEST_F(SshBridgeTest, ReattachAfterHangUp) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    stack_.ssh->hang_up_shells();
    ASSERT_TRUE(wait_until([&] { return !bridge_.is_active("c1"); }));

    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    EXPECT_TRUE(bridge_.is_active("c1"));
    EXPECT_EQ(log_.count("c1", TerminalMessageType::Ready), 2u);
}

TEST_F(SshBridgeTest, DetachIsIdempotent) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    bridge_.detach("c1");
    bridge_.detach("c1");
    bridge_.detach("never-attached");

    EXPECT_EQ(bridge_.session_count(), 0u);
    EXPECT_EQ(log_.count("c1", TerminalMessageType::Closed), 1u);
    EXPECT_EQ(stack_.ssh->open_shells(), 0u);
}

TEST_F(SshBridgeTest, IndependentConnections) {
    ASSERT_TRUE(bridge_.attach("c1", "dev").has_value());
    ASSERT_TRUE(bridge_.attach("c2", "dev").has_value());
    EXPECT_EQ(bridge_.session_count(), 2u);

    bridge_.detach("c1");
    EXPECT_FALSE(bridge_.is_active("c1"));
    EXPECT_TRUE(bridge_.is_active("c2"));
    ASSERT_TRUE(bridge_.send_input("c2", "echo still-here\r").has_value());
    EXPECT_TRUE(wait_until([&] { return log_.output("c2").find("still-here\r\n") != std::string::npos; }));
}

TEST(TerminalMessageTest, JsonShapes) {
    EXPECT_EQ(to_json(TerminalMessage{TerminalMessageType::Ready, {}}), R"({"type":"terminal_ready"})");
    EXPECT_EQ(to_json(TerminalMessage{TerminalMessageType::Output, "a\"b\r\n"}),
              R"({"type":"terminal_out","output":"a\"b\r\n"})");
    EXPECT_EQ(to_json(TerminalMessage{TerminalMessageType::Error, "nope"}),
              R"({"type":"terminal_error","error":"nope"})");
    EXPECT_EQ(to_json(TerminalMessage{TerminalMessageType::Closed, {}}), R"({"type":"terminal_closed"})");
}

TEST(BridgeErrorCodeTest, Names) {
    EXPECT_EQ(to_string(BridgeErrorCode::NotRunning), "not-running");
    EXPECT_EQ(to_string(BridgeErrorCode::NoActiveSession), "no-active-session");
}
