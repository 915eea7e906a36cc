/**
 * @file job_orchestrator.cpp
 * @brief JobOrchestrator implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/job_orchestrator.hpp"
#include "core/clock.hpp"
#include "core/ids.hpp"
#include "ssh/remote_command.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace vm_sandbox {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kQueueFailure = "Failed to queue job for execution.";
constexpr std::string_view kExecutionTimeout = "Code execution timed out inside the VM.";

/// Supported languages: name → interpreter.
std::optional<std::string_view> interpreter_for(std::string_view language) {
    if (language == "python") return "python3";
    return std::nullopt;
}

JobFailure classify(const Error& error) {
    if (error.is_vm_error()) return {JobStatus::Failed, "VM Error: " + error.message, {}};
    if (error.is_ssh_error()) return {JobStatus::Failed, "SSH Error: " + error.message, {}};
    return {JobStatus::Failed, "Unexpected Orchestrator Error: " + error.message, {}};
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

}  // namespace

// ─────────────────────────────────────────────
// Per-pipeline resources released in the finally step
// ─────────────────────────────────────────────

struct JobOrchestrator::PipelineContext {
    std::optional<DomainHandle> domain;
    std::unique_ptr<SshSession> session;
    fs::path local_dir;
};

JobOrchestrator::JobOrchestrator(const Config& config,
                                 DomainManager& domains,
                                 ImageManager& images,
                                 IpResolver& resolver,
                                 SshConnector connector,
                                 Logger& logger,
                                 MetricsCollector* metrics)
    : config_(config)
    , domains_(domains)
    , images_(images)
    , resolver_(resolver)
    , connector_(std::move(connector))
    , logger_(logger)
    , metrics_(metrics)
    , pool_(config.orchestrator.max_concurrent_vms, config.orchestrator.max_queued_jobs) {
    if (config_.orchestrator.reaper_interval_ms > 0) {
        reaper_ = std::jthread([this](std::stop_token st) { reaper_loop(st); });
    }
    logger_.info("Job orchestrator ready: max_concurrent_vms="
                 + std::to_string(config_.orchestrator.max_concurrent_vms));
}

JobOrchestrator::~JobOrchestrator() {
    shutdown();
}

// ─────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────

Result<JobId> JobOrchestrator::submit(const std::string& code,
                                      const std::string& language,
                                      uint32_t timeout_s,
                                      const std::string& profile) {
    if (!interpreter_for(language)) {
        return Error{ErrorCode::InvalidArgument, "Unsupported language: " + language};
    }
    if (timeout_s < kMinTimeoutS || timeout_s > kMaxTimeoutS) {
        return Error{ErrorCode::InvalidArgument,
                     "timeout_seconds must be between " + std::to_string(kMinTimeoutS)
                     + " and " + std::to_string(kMaxTimeoutS)};
    }

    auto record = std::make_shared<JobRecord>();
    record->snapshot.id = generate_uuid();
    record->snapshot.status = JobStatus::Queued;
    record->snapshot.code = code;
    record->snapshot.language = language;
    record->snapshot.requested_timeout_s = timeout_s;
    record->snapshot.resource_profile = profile;
    record->snapshot.submitted_at = std::chrono::system_clock::now();
    record->submitted_steady = std::chrono::steady_clock::now();
    const JobId id = record->snapshot.id;

    {
        std::lock_guard lock(jobs_mutex_);
        jobs_.emplace(id, record);
    }
    logger_.info("Job " + id + " queued (language=" + language + ", timeout="
                 + std::to_string(timeout_s) + "s, profile=" + profile + ")");
    if (metrics_) metrics_->record_job_event(id, JobStatus::Queued, std::chrono::milliseconds{0});

    auto queued = pool_.submit([this, id, token = record->stop.get_token()] {
        run_pipeline(id, token);
    });
    if (!queued) {
        logger_.error("Job " + id + " rejected by worker pool: " + queued.error().message);
        finish(id, JobStatus::Failed, std::nullopt, std::string{kQueueFailure});
        std::lock_guard lock(jobs_mutex_);
        record->snapshot.completed_at = std::chrono::system_clock::now();
    }
    return id;
}

std::optional<JobSnapshot> JobOrchestrator::get_status(const JobId& id) {
    std::lock_guard lock(jobs_mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    apply_watchdog_locked(*it->second, std::chrono::steady_clock::now());
    return it->second->snapshot;
}

void JobOrchestrator::shutdown() {
    std::lock_guard guard(shutdown_mutex_);
    if (stopped_.exchange(true)) return;

    logger_.info("Job orchestrator shutting down; waiting for in-flight jobs");
    pool_.shutdown();
    if (reaper_.joinable()) {
        reaper_.request_stop();
        reaper_.join();
    }
    logger_.info("Job orchestrator stopped");
}

size_t JobOrchestrator::job_count() const {
    std::lock_guard lock(jobs_mutex_);
    return jobs_.size();
}

// ─────────────────────────────────────────────
// State machine
// ─────────────────────────────────────────────

bool JobOrchestrator::advance(const JobId& id, JobStatus next) {
    std::chrono::milliseconds elapsed{0};
    {
        std::lock_guard lock(jobs_mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return false;
        JobRecord& record = *it->second;
        if (!is_valid_transition(record.snapshot.status, next)) return false;
        record.snapshot.status = next;
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - record.submitted_steady);
    }
    logger_.info("Job " + id + " -> " + std::string{to_string(next)});
    if (metrics_) metrics_->record_job_event(id, next, elapsed);
    return true;
}

void JobOrchestrator::finish(const JobId& id, JobStatus status, std::optional<JobResult> result,
                             std::string error_message) {
    std::chrono::milliseconds elapsed{0};
    {
        std::lock_guard lock(jobs_mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return;
        JobRecord& record = *it->second;
        if (!is_valid_transition(record.snapshot.status, status)) {
            logger_.debug("Job " + id + " already " + std::string{to_string(record.snapshot.status)}
                          + "; dropping outcome " + std::string{to_string(status)});
            return;
        }
        record.snapshot.status = status;
        record.snapshot.result = std::move(result);
        record.snapshot.error_message = std::move(error_message);
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - record.submitted_steady);
    }
    if (status == JobStatus::Completed) {
        logger_.info("Job " + id + " completed");
    } else {
        logger_.warn("Job " + id + " finished with status " + std::string{to_string(status)});
    }
    if (metrics_) metrics_->record_job_event(id, status, elapsed);
}

void JobOrchestrator::apply_watchdog_locked(JobRecord& record, SteadyTime now) {
    if (is_terminal(record.snapshot.status) || !record.started_steady) return;
    const auto ceiling = std::chrono::seconds(config_.orchestrator.orchestration_timeout_s);
    if (now - *record.started_steady <= ceiling) return;

    record.snapshot.status = JobStatus::OrchestrationTimeout;
    record.snapshot.error_message = "Job exceeded the orchestration timeout of "
                                  + std::to_string(config_.orchestrator.orchestration_timeout_s) + "s.";
    record.snapshot.completed_at = std::chrono::system_clock::now();
    record.stop.request_stop();
    logger_.warn("Job " + record.snapshot.id + " hit the orchestration timeout; cancelling");
    if (metrics_) {
        metrics_->record_job_event(record.snapshot.id, JobStatus::OrchestrationTimeout,
            std::chrono::duration_cast<std::chrono::milliseconds>(now - record.submitted_steady));
    }
}

// ─────────────────────────────────────────────
// Reaper
// ─────────────────────────────────────────────

void JobOrchestrator::reaper_loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds(config_.orchestrator.reaper_interval_ms);
    while (interruptible_sleep(interval, stop)) {
        sweep();
    }
}

void JobOrchestrator::sweep() {
    const auto now = std::chrono::steady_clock::now();
    const auto wall_now = std::chrono::system_clock::now();
    const auto retention = std::chrono::seconds(config_.orchestrator.job_retention_s);

    std::lock_guard lock(jobs_mutex_);
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        JobRecord& record = *it->second;
        apply_watchdog_locked(record, now);
        const auto& snap = record.snapshot;
        if (is_terminal(snap.status) && snap.completed_at && wall_now - *snap.completed_at > retention) {
            logger_.debug("Purging job " + snap.id);
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
}

// ─────────────────────────────────────────────
// Pipeline
// ─────────────────────────────────────────────

void JobOrchestrator::run_pipeline(const JobId& id, std::stop_token stop) {
    std::string code;
    {
        std::lock_guard lock(jobs_mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return;
        code = it->second->snapshot.code;
        it->second->snapshot.started_at = std::chrono::system_clock::now();
        it->second->started_steady = std::chrono::steady_clock::now();
    }

    PipelineContext ctx;
    try {
        auto outcome = execute_stages(id, code, stop, ctx);
        if (outcome) {
            finish(id, JobStatus::Completed, std::move(*outcome), {});
        } else {
            JobFailure& failure = outcome.error();
            finish(id, failure.status, std::move(failure.result), std::move(failure.message));
        }
    } catch (const std::exception& e) {
        logger_.error("Job " + id + " pipeline raised: " + e.what());
        finish(id, JobStatus::Failed, std::nullopt,
               std::string{"Unexpected Orchestrator Error: "} + e.what());
    }

    release_resources(id, ctx);
}

Result<JobResult, JobFailure> JobOrchestrator::execute_stages(const JobId& id,
                                                              const std::string& code,
                                                              std::stop_token stop,
                                                              PipelineContext& ctx) {
    const auto cancelled = [] {
        return JobFailure{JobStatus::OrchestrationTimeout, "Job was cancelled by the orchestrator.", {}};
    };

    // ── 1. Provision ─────────────────────────
    if (!advance(id, JobStatus::ProvisioningVm) || stop.stop_requested()) return cancelled();

    std::string profile_name;
    uint32_t timeout_s = 0;
    {
        std::lock_guard lock(jobs_mutex_);
        const auto& snap = jobs_.at(id)->snapshot;
        profile_name = snap.resource_profile;
        timeout_s = snap.requested_timeout_s;
    }
    const ResourceProfile profile = config_.profile(profile_name);
    const std::string domain_name = "vm-" + id;

    auto disk = images_.create_overlay(domain_name, config_.images.base_image,
                                       config_.images.ephemeral_dir);
    if (!disk) return classify(disk.error());
    ctx.domain = DomainHandle{.name = domain_name, .uuid = {},
                              .kind = DomainKind::Ephemeral, .disk_path = *disk};

    auto handle = domains_.define(DefineRequest{
        .name = domain_name,
        .disk_path = *disk,
        .memory_mb = profile.memory_mb,
        .vcpus = profile.vcpus,
        .with_network = false,
        .kind = DomainKind::Ephemeral,
    });
    if (!handle) return classify(handle.error());
    ctx.domain = *handle;

    if (auto started = domains_.start(*handle); !started) return classify(started.error());

    // ── 2. Wait for the guest ────────────────
    const auto ready_budget = std::chrono::seconds(config_.orchestrator.vm_ready_timeout_s);
    const auto ready_deadline = std::chrono::steady_clock::now() + ready_budget;
    auto ip = resolver_.resolve_ip(domain_name, ready_budget, false, stop);
    if (stop.stop_requested()) return cancelled();
    if (!ip) {
        return JobFailure{JobStatus::VmTimeout,
                          "VM did not report an IP address within "
                          + std::to_string(config_.orchestrator.vm_ready_timeout_s) + "s."};
    }
    logger_.info("Job " + id + ": " + domain_name + " is at " + *ip);

    auto session = wait_for_ssh(id, *ip, ready_deadline, stop);
    if (!session) return session.error();
    ctx.session = std::move(*session);

    // ── 3. Upload ────────────────────────────
    if (!advance(id, JobStatus::UploadingCode) || stop.stop_requested()) return cancelled();

    ctx.local_dir = fs::temp_directory_path() / ("vm_sandbox_" + id);
    std::error_code ec;
    fs::create_directories(ctx.local_dir, ec);
    if (ec) {
        return JobFailure{JobStatus::Failed, "Unexpected Orchestrator Error: cannot create "
                                             + ctx.local_dir.string() + ": " + ec.message()};
    }
    const fs::path local_script = ctx.local_dir / "script.py";
    {
        std::ofstream out(local_script, std::ios::binary | std::ios::trunc);
        out << code;
        if (!out) {
            return JobFailure{JobStatus::Failed,
                              "Unexpected Orchestrator Error: cannot write " + local_script.string()};
        }
    }

    const std::string& remote_dir = config_.orchestrator.remote_work_dir;
    const std::string remote_script = remote_dir + "/script_" + id + ".py";
    const std::string remote_stdout = remote_dir + "/stdout_" + id + ".log";
    const std::string remote_stderr = remote_dir + "/stderr_" + id + ".log";

    if (auto uploaded = ctx.session->upload_file(local_script, remote_script); !uploaded) {
        return classify(uploaded.error());
    }

    // ── 4. Run ───────────────────────────────
    if (!advance(id, JobStatus::RunningCode) || stop.stop_requested()) return cancelled();

    const std::string command = std::string{*interpreter_for("python")} + " " + remote_script
                              + " > " + remote_stdout + " 2> " + remote_stderr;
    CommandOutput run = ctx.session->run_command(command, timeout_s);
    logger_.info("Job " + id + ": remote command exited with " + std::to_string(run.exit_code));

    // ── 5. Collect ───────────────────────────
    if (!advance(id, JobStatus::DownloadingResults)) return cancelled();

    JobResult result;
    result.exit_code = run.exit_code;
    result.stdout_text = run.stdout_text;

    const fs::path local_stdout = ctx.local_dir / "stdout.log";
    const fs::path local_stderr = ctx.local_dir / "stderr.log";
    std::string downloaded_stderr;
    if (auto got = ctx.session->download_file(remote_stdout, local_stdout); got) {
        result.stdout_text += read_file(local_stdout);
    } else {
        logger_.warn("Job " + id + ": could not retrieve stdout log: " + got.error().message);
        append_line(downloaded_stderr, "Warning: could not retrieve stdout log: " + got.error().message);
    }
    if (auto got = ctx.session->download_file(remote_stderr, local_stderr); got) {
        downloaded_stderr += read_file(local_stderr);
    } else {
        logger_.warn("Job " + id + ": could not retrieve stderr log: " + got.error().message);
        append_line(downloaded_stderr, "Warning: could not retrieve stderr log: " + got.error().message);
    }

    result.stderr_text = run.stderr_text;
    if (!downloaded_stderr.empty()) {
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') result.stderr_text += '\n';
        result.stderr_text += downloaded_stderr;
    }

    if (run.exit_code == kExitTimedOut || run.exit_code == kExitKilled) {
        return JobFailure{JobStatus::ExecutionTimeout, std::string{kExecutionTimeout}, std::move(result)};
    }
    if (run.exit_code == kExitChannelError) {
        return JobFailure{JobStatus::Failed,
                          "SSH Error: remote command channel failed before the script finished.",
                          std::move(result)};
    }
    return result;
}

Result<std::unique_ptr<SshSession>, JobFailure> JobOrchestrator::wait_for_ssh(const JobId& id,
                                                                             const std::string& ip,
                                                                             SteadyTime deadline,
                                                                             std::stop_token stop) {
    const SshEndpoint endpoint{
        .host = ip,
        .port = config_.ssh.port,
        .username = config_.ssh.username,
        .private_key = expand_home(config_.ssh.private_key),
        .connect_timeout_s = config_.ssh.connect_timeout_s,
        .kill_after_s = config_.ssh.kill_after_s,
        .channel_grace_s = config_.ssh.channel_grace_s,
    };
    // A missing key will not appear while the guest boots; fail without retrying.
    if (auto key = check_private_key(endpoint); !key) return classify(key.error());

    const auto retry = std::chrono::milliseconds(config_.orchestrator.ssh_retry_interval_ms);

    for (int attempt = 1;; ++attempt) {
        auto session = connector_(endpoint);
        if (session) {
            logger_.info("Job " + id + ": SSH ready on " + ip + " after " + std::to_string(attempt)
                         + " attempt(s)");
            return std::move(*session);
        }
        const Error& err = session.error();
        if (err.code == ErrorCode::SSHAuthError) return classify(err);

        logger_.debug("Job " + id + ": SSH not ready on " + ip + " (" + err.message + ")");
        if (std::chrono::steady_clock::now() + retry >= deadline) {
            return JobFailure{JobStatus::VmTimeout,
                              "SSH did not become available on " + ip + " within "
                              + std::to_string(config_.orchestrator.vm_ready_timeout_s)
                              + "s: " + err.message};
        }
        if (!interruptible_sleep(retry, stop)) {
            return JobFailure{JobStatus::OrchestrationTimeout, "Job was cancelled by the orchestrator.", {}};
        }
    }
}

void JobOrchestrator::release_resources(const JobId& id, PipelineContext& ctx) {
    if (!ctx.local_dir.empty()) {
        std::error_code ec;
        fs::remove_all(ctx.local_dir, ec);
        if (ec) logger_.warn("Job " + id + ": could not remove " + ctx.local_dir.string() + ": " + ec.message());
    }
    if (ctx.session) ctx.session->close();
    if (ctx.domain) domains_.cleanup_ephemeral(*ctx.domain);

    std::lock_guard lock(jobs_mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    JobSnapshot& snap = it->second->snapshot;
    if (!is_terminal(snap.status)) {
        snap.status = JobStatus::Failed;
        snap.error_message = "Unexpected Orchestrator Error: pipeline ended without a result.";
    }
    if (!snap.completed_at) snap.completed_at = std::chrono::system_clock::now();
}

}  // namespace vm_sandbox
