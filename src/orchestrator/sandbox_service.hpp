/**
 * @file sandbox_service.hpp
 * @brief Top-level facade that wires all sandbox components together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Submitting and polling code-execution jobs
 *   2. Workspace CRUD
 *   3. Interactive terminals on workspaces
 *
 * The hypervisor and SSH transport are injected; tests pass a
 * MockHypervisor and a MockSshHost connector.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "hypervisor/hypervisor.hpp"
#include "orchestrator/job_orchestrator.hpp"
#include "orchestrator/workspace_service.hpp"
#include "ssh/mock_ssh.hpp"
#include "ssh/ssh_session.hpp"
#include "telemetry/metrics_collector.hpp"
#include "terminal/ssh_bridge.hpp"
#include "vm/domain_manager.hpp"
#include "vm/image_manager.hpp"
#include "vm/ip_resolver.hpp"

#include <memory>

namespace vm_sandbox {

class SandboxService {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> metrics_sink;          ///< NullSink when absent
        std::unique_ptr<IHypervisor> hypervisor;         ///< Built from config when absent
        SshConnector connector;                          ///< libssh, or a MockSshHost in mock mode
        TerminalSink terminal_sink;
    };

    /// Build every component; fails if the hypervisor cannot be reached.
    static Result<std::unique_ptr<SandboxService>> create(Options opts);
    ~SandboxService();

    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;

    /// Drain the job pool and close every terminal. Idempotent.
    void shutdown();

    JobOrchestrator& jobs() { return *jobs_; }
    WorkspaceService& workspaces() { return *workspaces_; }
    SshBridge& terminals() { return *bridge_; }
    DomainManager& domains() { return *domains_; }
    IHypervisor& hypervisor() { return *hypervisor_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }
    /// The in-memory SSH host created for mock mode, if any.
    std::shared_ptr<MockSshHost> mock_ssh() const { return mock_ssh_; }

private:
    SandboxService(Config config, std::unique_ptr<ILogSink> log_sink,
                   std::unique_ptr<ILogSink> metrics_sink);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;

    std::unique_ptr<IHypervisor> hypervisor_;
    std::shared_ptr<MockSshHost> mock_ssh_;
    std::unique_ptr<ImageManager> images_;
    std::unique_ptr<IpResolver> resolver_;
    std::unique_ptr<DomainManager> domains_;
    std::unique_ptr<JobOrchestrator> jobs_;
    std::unique_ptr<WorkspaceService> workspaces_;
    std::unique_ptr<SshBridge> bridge_;
};

}  // namespace vm_sandbox
