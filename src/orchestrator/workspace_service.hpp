/**
 * @file workspace_service.hpp
 * @brief Long-lived, networked workspace VMs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "vm/domain_manager.hpp"
#include "vm/image_manager.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vm_sandbox {

struct WorkspaceRequest {
    std::string name;
    std::optional<uint32_t> memory_mb;   ///< Defaults to vm.workspace_memory_mb
    std::optional<uint32_t> vcpus;       ///< Defaults to vm.workspace_vcpus
};

/**
 * @brief Workspace CRUD on top of the domain and image managers.
 *
 * A workspace id is its domain name; lookups also accept the domain UUID.
 */
class WorkspaceService {
public:
    WorkspaceService(const Config& config, DomainManager& domains, ImageManager& images,
                     Logger& logger);

    /// Create the overlay, define a networked domain and start it.
    Result<std::string> create(const WorkspaceRequest& request);
    Result<std::vector<DomainSummary>> list();
    Result<std::optional<DomainDetails>> get(const std::string& id);
    /// Idempotent; fails only on a path-escape or a hypervisor error.
    Result<void> remove(const std::string& id);
    Result<void> start(const std::string& id);
    /// Graceful, escalating to forced after the shutdown budget.
    Result<void> stop(const std::string& id);

    /// `[A-Za-z0-9_-]{1,64}`
    [[nodiscard]] static bool is_valid_name(std::string_view name) noexcept;

private:
    Result<DomainHandle> resolve(const std::string& id);

    const Config& config_;
    DomainManager& domains_;
    ImageManager& images_;
    Logger& logger_;
};

}  // namespace vm_sandbox
