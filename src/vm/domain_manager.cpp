/**
 * @file domain_manager.cpp
 * @brief DomainManager implementation.
 * @author Dimitris Kafetzis
 */

#include "vm/domain_manager.hpp"
#include "core/ids.hpp"
#include "hypervisor/domain_descriptor.hpp"

#include <thread>

namespace vm_sandbox {

namespace fs = std::filesystem;

namespace {

constexpr auto kDetailsIpTimeout = std::chrono::seconds(20);

}  // namespace

DomainManager::DomainManager(const Config& config,
                             IHypervisor& hypervisor,
                             ImageManager& images,
                             IpResolver& resolver,
                             Logger& logger,
                             MetricsCollector* metrics)
    : config_(config)
    , hypervisor_(hypervisor)
    , images_(images)
    , resolver_(resolver)
    , logger_(logger)
    , metrics_(metrics) {}

const fs::path& DomainManager::root_for(DomainKind kind) const {
    return kind == DomainKind::Workspace ? config_.images.workspace_dir
                                         : config_.images.ephemeral_dir;
}

fs::path DomainManager::conventional_disk_path(const std::string& name, DomainKind kind) const {
    return root_for(kind) / (name + ".qcow2");
}

// ─────────────────────────────────────────────
// Define / start / stop / undefine
// ─────────────────────────────────────────────

Result<DomainHandle> DomainManager::define(const DefineRequest& request) {
    DomainSpec spec{
        .name = request.name,
        .uuid = generate_uuid(),
        .kind = request.kind,
        .disk_path = request.disk_path.string(),
        .memory_mb = request.memory_mb,
        .vcpus = request.vcpus,
        .with_network = request.with_network,
        .network = config_.hypervisor.network,
        .mac = request.with_network ? generate_mac() : std::string{},
        .emulator = config_.hypervisor.emulator,
    };

    logger_.info("Defining " + std::string{to_string(request.kind)} + " domain " + request.name
                 + " (" + std::to_string(request.memory_mb) + " MiB, "
                 + std::to_string(request.vcpus) + " vCPU"
                 + (request.with_network ? ", network" : ", isolated") + ")");

    auto record = hypervisor_.define_domain(render_domain_xml(spec));
    if (!record) {
        logger_.error("Failed to define " + request.name + ": " + record.error().message);
        if (auto removed = images_.delete_image(request.disk_path, root_for(request.kind)); !removed) {
            logger_.error("Could not remove disk of undefined domain " + request.name + ": "
                          + removed.error().message);
        }
        return Error{ErrorCode::VMDefineError,
                     "Failed to define domain " + request.name + ": " + record.error().message};
    }

    if (metrics_) metrics_->record_vm_event(request.name, "defined");
    return DomainHandle{
        .name = record->name,
        .uuid = record->uuid.empty() ? spec.uuid : record->uuid,
        .kind = request.kind,
        .disk_path = request.disk_path,
    };
}

Result<void> DomainManager::start(const DomainHandle& handle) {
    auto active = hypervisor_.is_active(handle.name);
    if (!active) {
        return Error{ErrorCode::VMStartError,
                     "Cannot start " + handle.name + ": " + active.error().message};
    }
    if (*active) {
        logger_.info("Domain " + handle.name + " is already running");
        return {};
    }

    if (auto started = hypervisor_.create(handle.name); !started) {
        return Error{ErrorCode::VMStartError,
                     "Failed to start " + handle.name + ": " + started.error().message};
    }
    logger_.info("Started domain " + handle.name);
    if (metrics_) metrics_->record_vm_event(handle.name, "started");
    return {};
}

Result<void> DomainManager::stop(const DomainHandle& handle, StopOptions options) {
    auto record = hypervisor_.lookup_by_name(handle.name);
    if (!record) {
        return Error{ErrorCode::VMStopError,
                     "Cannot stop " + handle.name + ": " + record.error().message};
    }
    if (!record->has_value()) {
        logger_.warn("Domain " + handle.name + " not found; nothing to stop");
        return {};
    }

    auto active = hypervisor_.is_active(handle.name);
    if (!active) {
        if (active.error().code == ErrorCode::DomainNotFound) return {};
        return Error{ErrorCode::VMStopError,
                     "Cannot query " + handle.name + ": " + active.error().message};
    }
    if (!*active) {
        logger_.debug("Domain " + handle.name + " is already stopped");
        return {};
    }

    if (!options.force && options.graceful) {
        logger_.info("Requesting ACPI shutdown of " + handle.name);
        if (auto requested = hypervisor_.shutdown(handle.name); !requested) {
            logger_.warn("ACPI shutdown of " + handle.name + " failed: "
                         + requested.error().message + "; forcing");
        } else {
            const auto poll = std::chrono::milliseconds(config_.vm.shutdown_poll_ms);
            const auto deadline = std::chrono::steady_clock::now()
                                + std::chrono::seconds(config_.vm.shutdown_timeout_s);
            bool query_failed = false;
            while (std::chrono::steady_clock::now() < deadline) {
                auto still = hypervisor_.is_active(handle.name);
                if (!still && still.error().code != ErrorCode::DomainNotFound) {
                    logger_.warn("Cannot query " + handle.name + " during shutdown: "
                                 + still.error().message + "; forcing");
                    query_failed = true;
                    break;
                }
                if (!still || !*still) {
                    logger_.info("Domain " + handle.name + " shut down gracefully");
                    if (metrics_) metrics_->record_vm_event(handle.name, "stopped");
                    return {};
                }
                std::this_thread::sleep_for(poll);
            }
            if (!query_failed) {
                logger_.warn("Domain " + handle.name + " ignored ACPI shutdown for "
                             + std::to_string(config_.vm.shutdown_timeout_s) + "s; forcing");
            }
        }
    }

    if (auto destroyed = hypervisor_.destroy(handle.name); !destroyed) {
        if (destroyed.error().code == ErrorCode::DomainNotFound) return {};
        return Error{ErrorCode::VMStopError,
                     "Failed to stop " + handle.name + ": " + destroyed.error().message};
    }
    logger_.info("Domain " + handle.name + " stopped (forced)");
    if (metrics_) metrics_->record_vm_event(handle.name, "stopped");
    return {};
}

Result<void> DomainManager::undefine(const DomainHandle& handle) {
    auto record = hypervisor_.lookup_by_name(handle.name);
    if (!record) {
        return Error{ErrorCode::VMUndefineError,
                     "Cannot undefine " + handle.name + ": " + record.error().message};
    }
    if (!record->has_value()) {
        logger_.debug("Domain " + handle.name + " already undefined");
        return {};
    }

    if (auto removed = hypervisor_.undefine(handle.name); !removed) {
        if (removed.error().code == ErrorCode::DomainNotFound) return {};
        return Error{ErrorCode::VMUndefineError,
                     "Failed to undefine " + handle.name + ": " + removed.error().message};
    }
    logger_.info("Undefined domain " + handle.name);
    if (metrics_) metrics_->record_vm_event(handle.name, "undefined");
    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

DomainSummary DomainManager::summarize(const DomainRecord& record) const {
    DomainSummary summary{
        .name = record.name,
        .uuid = record.uuid,
        .kind = std::nullopt,
        .status = record.status,
        .disk_path = {},
    };
    auto desc = parse_domain_xml(record.xml);
    if (!desc) {
        logger_.debug("Could not parse metadata of " + record.name + ": " + desc.error().message);
        return summary;
    }
    summary.kind = desc->kind;
    if (desc->disk_path) summary.disk_path = *desc->disk_path;
    return summary;
}

Result<std::vector<DomainSummary>> DomainManager::list_domains(std::optional<DomainKind> kind_filter) {
    auto records = hypervisor_.list_domains();
    if (!records) return records.error();

    std::vector<DomainSummary> out;
    for (const auto& record : *records) {
        auto summary = summarize(record);
        if (kind_filter && summary.kind != kind_filter) continue;
        out.push_back(std::move(summary));
    }
    return out;
}

Result<std::optional<DomainDetails>> DomainManager::get_details(const std::string& id_or_uuid) {
    auto record = hypervisor_.lookup_by_name(id_or_uuid);
    if (!record) return record.error();
    if (!record->has_value()) {
        record = hypervisor_.lookup_by_uuid(id_or_uuid);
        if (!record) return record.error();
    }
    if (!record->has_value()) return std::optional<DomainDetails>{};

    const DomainRecord& rec = **record;
    DomainDetails details;
    details.summary = summarize(rec);
    details.ssh_port = config_.ssh.port;

    if (auto desc = parse_domain_xml(rec.xml)) {
        details.memory_mb = desc->memory_mb;
        details.vcpus = desc->vcpus;
    }

    if (rec.status == DomainStatus::Running) {
        const bool fallback = details.summary.kind == DomainKind::Workspace;
        details.ip_address = resolver_.resolve_ip(rec.name, kDetailsIpTimeout, fallback);
    }
    return std::optional<DomainDetails>{std::move(details)};
}

// ─────────────────────────────────────────────
// Teardown
// ─────────────────────────────────────────────

void DomainManager::cleanup_ephemeral(const DomainHandle& handle) {
    bool domain_leaked = false;
    bool disk_leaked = false;

    if (auto stopped = stop(handle, StopOptions{.force = true, .graceful = false}); !stopped) {
        logger_.error("Cleanup: " + stopped.error().message);
    }
    if (auto removed = undefine(handle); !removed) {
        logger_.error("Cleanup: " + removed.error().message);
        domain_leaked = true;
    }
    if (!handle.disk_path.empty()) {
        if (auto deleted = images_.delete_image(handle.disk_path, config_.images.ephemeral_dir); !deleted) {
            logger_.error("Cleanup: " + deleted.error().message);
            disk_leaked = true;
        }
    }

    if (domain_leaked || disk_leaked) {
        logger_.warn("Resource leak after cleanup of " + handle.name
                     + (domain_leaked ? " [domain still defined]" : "")
                     + (disk_leaked ? " [disk " + handle.disk_path.string() + " remains]" : ""));
        if (metrics_) metrics_->record_vm_event(handle.name, "cleanup_leak");
    } else {
        logger_.info("Cleaned up ephemeral domain " + handle.name);
    }
}

Result<void> DomainManager::delete_workspace(const std::string& id) {
    auto record = hypervisor_.lookup_by_name(id);
    if (!record) return record.error();
    if (!record->has_value()) {
        record = hypervisor_.lookup_by_uuid(id);
        if (!record) return record.error();
    }

    std::string name = id;
    fs::path disk_path;
    if (record->has_value()) {
        const DomainRecord& rec = **record;
        name = rec.name;
        auto desc = parse_domain_xml(rec.xml);
        if (desc && desc->disk_path) {
            disk_path = *desc->disk_path;
        } else {
            logger_.warn("No disk metadata on " + name + "; using naming convention");
        }
    } else {
        logger_.info("Workspace " + id + " not defined; removing leftover disk only");
    }
    if (disk_path.empty()) disk_path = conventional_disk_path(name, DomainKind::Workspace);

    if (!ImageManager::is_within_root(disk_path, config_.images.workspace_dir)) {
        logger_.error("Workspace " + name + " disk " + disk_path.string()
                      + " is outside the workspace root; refusing to delete");
        return Error{ErrorCode::SecurityError,
                     "Disk path " + disk_path.string() + " is not within "
                     + config_.images.workspace_dir.string()};
    }

    if (record->has_value()) {
        DomainHandle handle{.name = name, .uuid = (*record)->uuid,
                            .kind = DomainKind::Workspace, .disk_path = disk_path};
        if (auto stopped = stop(handle, StopOptions{.force = true, .graceful = false}); !stopped) {
            return stopped.error();
        }
        if (auto removed = undefine(handle); !removed) {
            return removed.error();
        }
    }

    return images_.delete_image(disk_path, config_.images.workspace_dir);
}

}  // namespace vm_sandbox
