/**
 * @file domain_manager.hpp
 * @brief Domain lifecycle: define, start, stop, undefine, list, cleanup.
 * @author Dimitris Kafetzis
 *
 * The only component that changes domain state. Pairs each domain with the
 * disk image it references so that neither outlives the other.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "hypervisor/hypervisor.hpp"
#include "telemetry/metrics_collector.hpp"
#include "vm/image_manager.hpp"
#include "vm/ip_resolver.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vm_sandbox {

/**
 * @brief Reference to a defined domain.
 */
struct DomainHandle {
    DomainName name;
    std::string uuid;
    DomainKind kind{DomainKind::Ephemeral};
    std::filesystem::path disk_path;
};

struct DefineRequest {
    DomainName name;
    std::filesystem::path disk_path;
    uint32_t memory_mb{512};
    uint32_t vcpus{1};
    bool with_network{false};
    DomainKind kind{DomainKind::Ephemeral};
};

struct StopOptions {
    bool force{false};
    bool graceful{true};
};

class DomainManager {
public:
    DomainManager(const Config& config,
                  IHypervisor& hypervisor,
                  ImageManager& images,
                  IpResolver& resolver,
                  Logger& logger,
                  MetricsCollector* metrics = nullptr);

    /// Register the domain; on failure the referenced disk is deleted.
    Result<DomainHandle> define(const DefineRequest& request);

    /// No-op if already running.
    Result<void> start(const DomainHandle& handle);

    /**
     * @brief Stop a domain. "Already stopped" and "not found" are success.
     *
     * Graceful mode sends ACPI power-off and polls up to the configured
     * shutdown budget before escalating to a forced stop.
     */
    Result<void> stop(const DomainHandle& handle, StopOptions options = {});

    /// Remove the definition and managed-save state; "already gone" is success.
    Result<void> undefine(const DomainHandle& handle);

    Result<std::vector<DomainSummary>> list_domains(std::optional<DomainKind> kind_filter = std::nullopt);

    /// Resolve by name, then UUID; nullopt when neither matches.
    Result<std::optional<DomainDetails>> get_details(const std::string& id_or_uuid);

    /// Best-effort stop(force), undefine, delete image. Never fails.
    void cleanup_ephemeral(const DomainHandle& handle);

    /**
     * @brief Tear down a workspace domain and its disk.
     *
     * Idempotent: a domain that is already gone is success. Fails with
     * SecurityError if the disk path does not resolve under the workspace
     * root, before any destructive step.
     */
    Result<void> delete_workspace(const std::string& id);

    /// Convention path for a domain's disk inside its kind's root.
    [[nodiscard]] std::filesystem::path conventional_disk_path(const std::string& name,
                                                               DomainKind kind) const;
    [[nodiscard]] const std::filesystem::path& root_for(DomainKind kind) const;

private:
    DomainSummary summarize(const DomainRecord& record) const;

    const Config& config_;
    IHypervisor& hypervisor_;
    ImageManager& images_;
    IpResolver& resolver_;
    Logger& logger_;
    MetricsCollector* metrics_;
};

}  // namespace vm_sandbox
