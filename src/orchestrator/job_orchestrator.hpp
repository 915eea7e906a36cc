/**
 * @file job_orchestrator.hpp
 * @brief Runs submitted code inside single-use VMs on a bounded worker pool.
 * @author Dimitris Kafetzis
 *
 * Each job moves through:
 *   queued → provisioning_vm → uploading_code → running_code
 *          → downloading_results → {completed | failed | execution_timeout
 *                                   | vm_timeout | orchestration_timeout}
 *
 * The pool size is the hard cap on simultaneously provisioned VMs. The job
 * map is the only state shared between callers, workers and the reaper.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "ssh/ssh_session.hpp"
#include "telemetry/metrics_collector.hpp"
#include "vm/domain_manager.hpp"
#include "vm/image_manager.hpp"
#include "vm/ip_resolver.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

namespace vm_sandbox {

/**
 * @brief Terminal outcome of a pipeline that did not run to completion.
 */
struct JobFailure {
    JobStatus status{JobStatus::Failed};
    std::string message;
    std::optional<JobResult> result;   ///< Set when the script ran but the outcome is not a success
};

class JobOrchestrator {
public:
    static constexpr uint32_t kMinTimeoutS = 1;
    static constexpr uint32_t kMaxTimeoutS = 300;

    JobOrchestrator(const Config& config,
                    DomainManager& domains,
                    ImageManager& images,
                    IpResolver& resolver,
                    SshConnector connector,
                    Logger& logger,
                    MetricsCollector* metrics = nullptr);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    /**
     * @brief Queue a job.
     *
     * Fails with InvalidArgument for unsupported languages or a timeout
     * outside [1, 300]. A saturated or stopped pool does not fail the call:
     * the job is recorded as failed and its id returned.
     */
    Result<JobId> submit(const std::string& code,
                         const std::string& language,
                         uint32_t timeout_s,
                         const std::string& profile = "default");

    /// Snapshot with the orchestration watchdog applied; nullopt if unknown.
    [[nodiscard]] std::optional<JobSnapshot> get_status(const JobId& id);

    /// Stop accepting jobs and wait for in-flight pipelines. Idempotent.
    void shutdown();

    [[nodiscard]] size_t job_count() const;
    [[nodiscard]] size_t active_pipelines() const noexcept { return pool_.active_count(); }
    [[nodiscard]] size_t peak_active_pipelines() const noexcept { return pool_.peak_active_count(); }

private:
    struct JobRecord {
        JobSnapshot snapshot;
        std::stop_source stop;
        SteadyTime submitted_steady{};
        std::optional<SteadyTime> started_steady;
    };

    struct PipelineContext;

    void run_pipeline(const JobId& id, std::stop_token stop);
    Result<JobResult, JobFailure> execute_stages(const JobId& id, const std::string& code,
                                                 std::stop_token stop, PipelineContext& ctx);
    Result<std::unique_ptr<SshSession>, JobFailure> wait_for_ssh(const JobId& id,
                                                                const std::string& ip,
                                                                SteadyTime deadline,
                                                                std::stop_token stop);
    void release_resources(const JobId& id, PipelineContext& ctx);

    /// Apply a forward transition; false if the job is already terminal.
    bool advance(const JobId& id, JobStatus next);
    void finish(const JobId& id, JobStatus status, std::optional<JobResult> result,
                std::string error_message);

    void apply_watchdog_locked(JobRecord& record, SteadyTime now);
    void reaper_loop(std::stop_token stop);
    void sweep();

    const Config& config_;
    DomainManager& domains_;
    ImageManager& images_;
    IpResolver& resolver_;
    SshConnector connector_;
    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex jobs_mutex_;
    std::unordered_map<JobId, std::shared_ptr<JobRecord>> jobs_;

    ThreadPool pool_;
    std::jthread reaper_;
    std::mutex shutdown_mutex_;
    std::atomic<bool> stopped_{false};
};

}  // namespace vm_sandbox
