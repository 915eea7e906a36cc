/**
 * @file types.hpp
 * @brief Fundamental types used throughout the sandbox core.
 * @author Dimitris Kafetzis
 *
 * Defines domain and job vocabulary: kinds, statuses, the job state machine,
 * snapshots handed to pollers and the summaries returned by domain listings.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vm_sandbox {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using DomainName = std::string;
using ConnectionId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Domains
// ─────────────────────────────────────────────

enum class DomainKind : uint8_t {
    Ephemeral,     ///< Per-job, network-isolated, destroyed at job end
    Workspace      ///< Long-lived, networked, deleted only on request
};

[[nodiscard]] constexpr std::string_view to_string(DomainKind kind) noexcept {
    switch (kind) {
        case DomainKind::Ephemeral: return "ephemeral";
        case DomainKind::Workspace: return "workspace";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<DomainKind> parse_domain_kind(std::string_view s) noexcept {
    if (s == "ephemeral") return DomainKind::Ephemeral;
    if (s == "workspace") return DomainKind::Workspace;
    return std::nullopt;
}

enum class DomainStatus : uint8_t {
    Defined,       ///< Registered, never started
    Running,
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(DomainStatus status) noexcept {
    switch (status) {
        case DomainStatus::Defined: return "defined";
        case DomainStatus::Running: return "running";
        case DomainStatus::Stopped: return "stopped";
    }
    return "unknown";
}

/**
 * @brief Named preset mapping to a fixed (memory, vcpu) pair.
 */
struct ResourceProfile {
    uint32_t memory_mb{512};
    uint32_t vcpus{1};

    auto operator<=>(const ResourceProfile&) const = default;
};

/**
 * @brief One entry of a domain listing, recovered from descriptor metadata.
 */
struct DomainSummary {
    DomainName name;
    std::string uuid;
    std::optional<DomainKind> kind;    ///< Absent for domains we did not create
    DomainStatus status{DomainStatus::Defined};
    std::string disk_path;
};

/**
 * @brief Full view of a single domain, including its live address.
 */
struct DomainDetails {
    DomainSummary summary;
    uint32_t memory_mb{0};
    uint32_t vcpus{0};
    std::optional<std::string> ip_address;
    uint16_t ssh_port{22};
};

// ─────────────────────────────────────────────
// Jobs
// ─────────────────────────────────────────────

enum class JobStatus : uint8_t {
    Queued,
    ProvisioningVm,
    UploadingCode,
    RunningCode,
    DownloadingResults,
    Completed,
    Failed,
    ExecutionTimeout,      ///< Remote timeout utility fired
    VmTimeout,             ///< SSH never became reachable
    OrchestrationTimeout   ///< Exceeded the orchestrator wall-clock ceiling
};

[[nodiscard]] constexpr std::string_view to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Queued:               return "queued";
        case JobStatus::ProvisioningVm:       return "provisioning_vm";
        case JobStatus::UploadingCode:        return "uploading_code";
        case JobStatus::RunningCode:          return "running_code";
        case JobStatus::DownloadingResults:   return "downloading_results";
        case JobStatus::Completed:            return "completed";
        case JobStatus::Failed:               return "failed";
        case JobStatus::ExecutionTimeout:     return "execution_timeout";
        case JobStatus::VmTimeout:            return "vm_timeout";
        case JobStatus::OrchestrationTimeout: return "orchestration_timeout";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobStatus status) noexcept {
    return status >= JobStatus::Completed;
}

/**
 * @brief Whether the state machine permits moving from one status to another.
 *
 * Pipeline stages only move forward; any non-terminal state may exit to a
 * terminal one; terminal states are sinks.
 */
[[nodiscard]] constexpr bool is_valid_transition(JobStatus from, JobStatus to) noexcept {
    if (is_terminal(from)) return false;
    if (is_terminal(to)) return true;
    return static_cast<uint8_t>(to) > static_cast<uint8_t>(from);
}

struct JobResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{0};
};

/**
 * @brief Read-only copy of a job's state handed out to pollers.
 */
struct JobSnapshot {
    JobId id;
    JobStatus status{JobStatus::Queued};
    std::string code;
    std::string language;
    uint32_t requested_timeout_s{0};
    std::string resource_profile;
    Timestamp submitted_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<JobResult> result;
    std::string error_message;
};

}  // namespace vm_sandbox
