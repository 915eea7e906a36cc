/**
 * @file test_sandbox_pipeline.cpp
 * @brief Integration tests driving the full service in mock mode.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/sandbox_service.hpp"
#include "core/json.hpp"
#include "telemetry/json_sink.hpp"

#include "support/sandbox_fixture.hpp"

#include <gtest/gtest.h>
#include <mutex>
#include <vector>

using namespace vm_sandbox;
using namespace vm_sandbox::testing;

namespace fs = std::filesystem;

class SandboxPipeline : public ::testing::Test {
protected:
    TempDir dir_;
    std::mutex messages_mutex_;
    std::vector<std::string> messages_;
    std::unique_ptr<SandboxService> svc_;

    void SetUp() override {
        Config config = make_test_config(dir_.path());
        config.hypervisor.mock = true;
        config.telemetry.log_dir = (dir_.path() / "logs").string();

        SandboxService::Options opts{
            .config = std::move(config),
            .log_sink = std::make_unique<JsonFileSink>(dir_.path() / "logs", "vm_sandbox", 1, 2),
            .metrics_sink = std::make_unique<JsonFileSink>(dir_.path() / "logs", "vm_sandbox_events", 1, 2),
            .hypervisor = nullptr,
            .connector = {},
            .terminal_sink = [this](const ConnectionId&, const TerminalMessage& message) {
                std::lock_guard lock(messages_mutex_);
                messages_.push_back(to_json(message));
            },
        };
        auto created = SandboxService::create(std::move(opts));
        ASSERT_TRUE(created.has_value()) << created.error().message;
        svc_ = std::move(*created);
        ASSERT_NE(svc_->mock_ssh(), nullptr);
    }

    void TearDown() override {
        if (svc_) svc_->shutdown();
    }

    MockHypervisor& hypervisor() { return dynamic_cast<MockHypervisor&>(svc_->hypervisor()); }

    std::optional<JobSnapshot> wait_terminal(const JobId& id) {
        std::optional<JobSnapshot> snap;
        wait_until([&] {
            snap = svc_->jobs().get_status(id);
            return snap && is_terminal(snap->status);
        });
        return snap;
    }

    bool saw_message(const std::string& needle) {
        std::lock_guard lock(messages_mutex_);
        for (const auto& m : messages_) {
            if (m.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

// ═══════════════════════════════════════════════
// Code execution
// ═══════════════════════════════════════════════

TEST_F(SandboxPipeline, JobRunsEndToEnd) {
    auto id = svc_->jobs().submit("print('integration')", "python", 5);
    ASSERT_TRUE(id.has_value()) << id.error().message;

    auto snap = wait_terminal(*id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, JobStatus::Completed) << snap->error_message;
    ASSERT_TRUE(snap->result.has_value());
    EXPECT_EQ(snap->result->stdout_text, "integration\n");
    EXPECT_EQ(snap->result->exit_code, 0);

    // The ephemeral VM and its disk are gone once the job is settled
    EXPECT_TRUE(wait_until([&] {
        return hypervisor().domain_count() == 0 && fs::is_empty(svc_->config().images.ephemeral_dir);
    }));

    auto json = to_json(*svc_->jobs().get_status(*id));
    EXPECT_NE(json.find(R"("status":"completed")"), std::string::npos);
}

TEST_F(SandboxPipeline, ConcurrentJobsAllSettle) {
    svc_->mock_ssh()->set_exec_delay(std::chrono::milliseconds(50));
    std::vector<JobId> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = svc_->jobs().submit("print(" + std::to_string(i) + ")", "python", 5,
                                      i % 2 ? "small" : "large");
        ASSERT_TRUE(id.has_value());
        ids.push_back(*id);
    }
    for (const auto& id : ids) {
        auto snap = wait_terminal(id);
        ASSERT_TRUE(snap.has_value());
        EXPECT_EQ(snap->status, JobStatus::Completed) << snap->error_message;
    }
    EXPECT_LE(hypervisor().peak_active_count(), svc_->config().orchestrator.max_concurrent_vms);
    EXPECT_TRUE(wait_until([&] { return svc_->metrics().jobs_finished() == 5; }));
    EXPECT_EQ(svc_->metrics().jobs_failed(), 0u);
}

// ═══════════════════════════════════════════════
// Workspaces and terminals
// ═══════════════════════════════════════════════

TEST_F(SandboxPipeline, WorkspaceWithTerminal) {
    auto id = svc_->workspaces().create(WorkspaceRequest{.name = "devbox"});
    ASSERT_TRUE(id.has_value()) << id.error().message;

    ASSERT_TRUE(svc_->terminals().attach("conn-1", *id).has_value());
    ASSERT_TRUE(svc_->terminals().send_input("conn-1", "echo from-terminal\r").has_value());
    EXPECT_TRUE(wait_until([&] { return saw_message("from-terminal\\r\\n"); }));
    EXPECT_TRUE(saw_message(R"({"type":"terminal_ready"})"));

    svc_->terminals().detach("conn-1");
    EXPECT_TRUE(saw_message(R"({"type":"terminal_closed"})"));

    ASSERT_TRUE(svc_->workspaces().stop(*id).has_value());
    auto details = svc_->workspaces().get(*id);
    ASSERT_TRUE(details.has_value() && details->has_value());
    EXPECT_EQ((*details)->summary.status, DomainStatus::Stopped);

    ASSERT_TRUE(svc_->workspaces().remove(*id).has_value());
    auto listed = svc_->workspaces().list();
    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed->empty());
    EXPECT_FALSE(fs::exists(svc_->config().images.workspace_dir / "devbox.qcow2"));
}

TEST_F(SandboxPipeline, JobsDoNotTouchWorkspaces) {
    ASSERT_TRUE(svc_->workspaces().create(WorkspaceRequest{.name = "keep"}).has_value());

    auto id = svc_->jobs().submit("print('x')", "python", 5);
    ASSERT_TRUE(id.has_value());
    auto snap = wait_terminal(*id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, JobStatus::Completed);

    EXPECT_TRUE(wait_until([&] { return hypervisor().domain_count() == 1; }));
    EXPECT_TRUE(*hypervisor().is_active("keep"));
}

// ═══════════════════════════════════════════════
// Telemetry
// ═══════════════════════════════════════════════

TEST_F(SandboxPipeline, EventsWrittenToFile) {
    auto id = svc_->jobs().submit("print('logged')", "python", 5);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_terminal(*id).has_value());
    ASSERT_TRUE(wait_until([&] { return svc_->metrics().jobs_finished() == 1; }));
    svc_->shutdown();

    const auto events = read_file(dir_.path() / "logs" / "vm_sandbox_events.ndjson");
    EXPECT_NE(events.find(R"("event":"job_state_change")"), std::string::npos);
    EXPECT_NE(events.find(R"("state":"completed")"), std::string::npos);
    EXPECT_NE(events.find(*id), std::string::npos);

    const auto log = read_file(dir_.path() / "logs" / "vm_sandbox.ndjson");
    EXPECT_NE(log.find("Sandbox service ready"), std::string::npos);
}

TEST_F(SandboxPipeline, ShutdownIsIdempotent) {
    ASSERT_TRUE(svc_->workspaces().create(WorkspaceRequest{.name = "ws"}).has_value());
    ASSERT_TRUE(svc_->terminals().attach("c", "ws").has_value());
    svc_->shutdown();
    svc_->shutdown();
    EXPECT_EQ(svc_->terminals().session_count(), 0u);

    auto rejected = svc_->jobs().submit("print(1)", "python", 5);
    if (rejected) {
        auto snap = svc_->jobs().get_status(*rejected);
        ASSERT_TRUE(snap.has_value());
        EXPECT_EQ(snap->status, JobStatus::Failed);
    }
}
