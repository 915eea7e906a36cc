/**
 * @file sandbox_service.cpp
 * @brief SandboxService wiring.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/sandbox_service.hpp"
#include "telemetry/json_sink.hpp"

namespace vm_sandbox {

namespace {

std::unique_ptr<ILogSink> or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // namespace

SandboxService::SandboxService(Config config, std::unique_ptr<ILogSink> log_sink,
                               std::unique_ptr<ILogSink> metrics_sink)
    : config_(std::move(config))
    , logger_(or_null(std::move(log_sink)),
              parse_log_level(config_.telemetry.log_level).value_or(LogLevel::Info))
    , metrics_(or_null(std::move(metrics_sink))) {}

Result<std::unique_ptr<SandboxService>> SandboxService::create(Options opts) {
    std::unique_ptr<SandboxService> svc{
        new SandboxService(std::move(opts.config), std::move(opts.log_sink), std::move(opts.metrics_sink))};
    Logger& logger = svc->logger_;
    const Config& config = svc->config_;

    if (opts.hypervisor) {
        svc->hypervisor_ = std::move(opts.hypervisor);
    } else {
        auto hv = make_hypervisor(config.hypervisor, logger);
        if (!hv) return hv.error();
        svc->hypervisor_ = std::move(*hv);
    }

    SshConnector connector = std::move(opts.connector);
    if (!connector) {
        if (config.hypervisor.mock) {
            svc->mock_ssh_ = std::make_shared<MockSshHost>();
            connector = svc->mock_ssh_->connector();
            logger.warn("Using in-memory SSH host");
        } else {
            connector = make_libssh_connector(logger);
        }
    }

    svc->images_ = std::make_unique<ImageManager>(config.images, logger);
    svc->resolver_ = std::make_unique<IpResolver>(
        *svc->hypervisor_, logger, config.hypervisor.network,
        std::chrono::milliseconds(config.orchestrator.ip_poll_interval_ms));
    svc->domains_ = std::make_unique<DomainManager>(config, *svc->hypervisor_, *svc->images_,
                                                    *svc->resolver_, logger, &svc->metrics_);
    svc->jobs_ = std::make_unique<JobOrchestrator>(config, *svc->domains_, *svc->images_,
                                                   *svc->resolver_, connector, logger, &svc->metrics_);
    svc->workspaces_ = std::make_unique<WorkspaceService>(config, *svc->domains_, *svc->images_, logger);
    svc->bridge_ = std::make_unique<SshBridge>(config, *svc->domains_, connector,
                                               std::move(opts.terminal_sink), logger, &svc->metrics_);

    logger.info("Sandbox service ready (hypervisor=" + std::string{config.hypervisor.mock ? "mock" : config.hypervisor.uri}
                + ", max_concurrent_vms=" + std::to_string(config.orchestrator.max_concurrent_vms) + ")");
    return std::move(svc);
}

SandboxService::~SandboxService() {
    shutdown();
}

void SandboxService::shutdown() {
    if (bridge_) bridge_->detach_all();
    if (jobs_) jobs_->shutdown();
    metrics_.flush();
    logger_.flush();
}

}  // namespace vm_sandbox
