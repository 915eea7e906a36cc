/**
 * @file workspace_service.cpp
 * @brief WorkspaceService implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/workspace_service.hpp"

namespace vm_sandbox {

WorkspaceService::WorkspaceService(const Config& config, DomainManager& domains,
                                   ImageManager& images, Logger& logger)
    : config_(config), domains_(domains), images_(images), logger_(logger) {}

bool WorkspaceService::is_valid_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > 64) return false;
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                     || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

Result<std::string> WorkspaceService::create(const WorkspaceRequest& request) {
    if (!is_valid_name(request.name)) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid workspace name '" + request.name
                     + "': use 1-64 letters, digits, '_' or '-'"};
    }
    const uint32_t memory_mb = request.memory_mb.value_or(config_.vm.workspace_memory_mb);
    const uint32_t vcpus = request.vcpus.value_or(config_.vm.workspace_vcpus);
    if (memory_mb == 0 || vcpus == 0) {
        return Error{ErrorCode::InvalidArgument, "memory_mb and vcpus must be positive"};
    }

    auto existing = domains_.list_domains();
    if (!existing) return existing.error();
    for (const auto& domain : *existing) {
        if (domain.name == request.name) {
            return Error{ErrorCode::VMDefineError, "Domain " + request.name + " already exists"};
        }
    }

    logger_.info("Creating workspace " + request.name);
    auto disk = images_.create_overlay(request.name, config_.images.base_image,
                                       config_.images.workspace_dir);
    if (!disk) return disk.error();

    auto handle = domains_.define(DefineRequest{
        .name = request.name,
        .disk_path = *disk,
        .memory_mb = memory_mb,
        .vcpus = vcpus,
        .with_network = true,
        .kind = DomainKind::Workspace,
    });
    if (!handle) return handle.error();

    if (auto started = domains_.start(*handle); !started) {
        logger_.error("Workspace " + request.name + " defined but failed to start: "
                      + started.error().message);
        return started.error();
    }
    logger_.info("Workspace " + request.name + " is running");
    return handle->name;
}

Result<std::vector<DomainSummary>> WorkspaceService::list() {
    return domains_.list_domains(DomainKind::Workspace);
}

Result<std::optional<DomainDetails>> WorkspaceService::get(const std::string& id) {
    auto details = domains_.get_details(id);
    if (!details) return details.error();
    if (details->has_value() && (*details)->summary.kind != DomainKind::Workspace) {
        return std::optional<DomainDetails>{};
    }
    return details;
}

Result<void> WorkspaceService::remove(const std::string& id) {
    logger_.info("Deleting workspace " + id);
    return domains_.delete_workspace(id);
}

Result<DomainHandle> WorkspaceService::resolve(const std::string& id) {
    auto workspaces = domains_.list_domains(DomainKind::Workspace);
    if (!workspaces) return workspaces.error();
    for (const auto& ws : *workspaces) {
        if (ws.name == id || ws.uuid == id) {
            return DomainHandle{
                .name = ws.name,
                .uuid = ws.uuid,
                .kind = DomainKind::Workspace,
                .disk_path = ws.disk_path,
            };
        }
    }
    return Error{ErrorCode::DomainNotFound, "Workspace " + id + " not found"};
}

Result<void> WorkspaceService::start(const std::string& id) {
    auto handle = resolve(id);
    if (!handle) return handle.error();
    return domains_.start(*handle);
}

Result<void> WorkspaceService::stop(const std::string& id) {
    auto handle = resolve(id);
    if (!handle) return handle.error();
    return domains_.stop(*handle, StopOptions{.force = false, .graceful = true});
}

}  // namespace vm_sandbox
