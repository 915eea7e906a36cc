/**
 * @file libvirt_hypervisor.cpp
 * @brief LibvirtHypervisor implementation over the libvirt C API.
 * @author Dimitris Kafetzis
 *
 * Handles are wrapped in unique_ptr with the matching libvirt free function.
 * libvirt error codes are mapped onto ErrorCode so callers never see
 * virErrorPtr.
 */

#include "hypervisor/hypervisor.hpp"

#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>

#include <cstdlib>

namespace vm_sandbox {

namespace {

// ── RAII handles ─────────────────────────────

struct DomainDeleter {
    void operator()(virDomainPtr d) const noexcept { if (d) virDomainFree(d); }
};
struct NetworkDeleter {
    void operator()(virNetworkPtr n) const noexcept { if (n) virNetworkFree(n); }
};
struct CStringDeleter {
    void operator()(char* p) const noexcept { std::free(p); }
};

using DomainRef = std::unique_ptr<virDomain, DomainDeleter>;
using NetworkRef = std::unique_ptr<virNetwork, NetworkDeleter>;
using CString = std::unique_ptr<char, CStringDeleter>;

struct LastError {
    int code{VIR_ERR_OK};
    std::string message;
};

LastError last_error() {
    LastError out;
    if (virErrorPtr err = virGetLastError()) {
        out.code = err->code;
        out.message = err->message ? err->message : "unknown libvirt error";
    } else {
        out.message = "unknown libvirt error";
    }
    return out;
}

Error make_libvirt_error(ErrorCode fallback, const std::string& context) {
    auto err = last_error();
    ErrorCode code = fallback;
    if (err.code == VIR_ERR_NO_DOMAIN) code = ErrorCode::DomainNotFound;
    if (err.code == VIR_ERR_AGENT_UNRESPONSIVE || err.code == VIR_ERR_AGENT_UNSYNCED) {
        code = ErrorCode::AgentUnavailable;
    }
    return Error{code, context + ": " + err.message};
}

/// libvirt writes every error to stderr unless a handler is installed.
void quiet_error_handler(void* /*user_data*/, virErrorPtr /*error*/) {}

DomainStatus status_of(virDomainPtr dom) {
    int state = VIR_DOMAIN_NOSTATE;
    int reason = 0;
    if (virDomainGetState(dom, &state, &reason, 0) < 0) return DomainStatus::Stopped;
    switch (state) {
        case VIR_DOMAIN_RUNNING:
        case VIR_DOMAIN_BLOCKED:
        case VIR_DOMAIN_PAUSED:
        case VIR_DOMAIN_PMSUSPENDED:
        case VIR_DOMAIN_SHUTDOWN:
            return DomainStatus::Running;
        case VIR_DOMAIN_SHUTOFF:
            return reason == VIR_DOMAIN_SHUTOFF_UNKNOWN ? DomainStatus::Defined
                                                         : DomainStatus::Stopped;
        default:
            return DomainStatus::Stopped;
    }
}

Result<DomainRecord> make_record(virDomainPtr dom) {
    DomainRecord record;
    if (const char* name = virDomainGetName(dom)) record.name = name;

    char uuid[VIR_UUID_STRING_BUFLEN];
    if (virDomainGetUUIDString(dom, uuid) == 0) record.uuid = uuid;

    record.status = status_of(dom);

    CString xml{virDomainGetXMLDesc(dom, 0)};
    if (!xml) {
        return make_libvirt_error(ErrorCode::HypervisorError,
                                  "Failed to read descriptor for " + record.name);
    }
    record.xml = xml.get();
    return record;
}

}  // namespace

// ─────────────────────────────────────────────
// Connection
// ─────────────────────────────────────────────

LibvirtHypervisor::LibvirtHypervisor(std::string uri, Logger& logger)
    : uri_(std::move(uri)), logger_(logger) {}

LibvirtHypervisor::~LibvirtHypervisor() {
    if (conn_) {
        virConnectClose(conn_);
        conn_ = nullptr;
    }
}

Result<void> LibvirtHypervisor::connect() {
    if (conn_) return {};

    virSetErrorFunc(nullptr, quiet_error_handler);
    conn_ = virConnectOpen(uri_.c_str());
    if (!conn_) {
        return make_libvirt_error(ErrorCode::HypervisorError,
                                  "Failed to open connection to " + uri_);
    }
    logger_.info("Connected to hypervisor at " + uri_);
    return {};
}

// ─────────────────────────────────────────────
// Definitions and lookups
// ─────────────────────────────────────────────

Result<DomainRecord> LibvirtHypervisor::define_domain(const std::string& xml) {
    DomainRef dom{virDomainDefineXML(conn_, xml.c_str())};
    if (!dom) {
        return make_libvirt_error(ErrorCode::VMDefineError, "Failed to define domain");
    }
    return make_record(dom.get());
}

Result<std::optional<DomainRecord>> LibvirtHypervisor::lookup_by_name(const std::string& name) {
    DomainRef dom{virDomainLookupByName(conn_, name.c_str())};
    if (!dom) {
        auto err = last_error();
        if (err.code == VIR_ERR_NO_DOMAIN) return std::optional<DomainRecord>{};
        return Error{ErrorCode::HypervisorError, "Lookup of " + name + " failed: " + err.message};
    }
    auto record = make_record(dom.get());
    if (!record) return record.error();
    return std::optional<DomainRecord>{std::move(*record)};
}

Result<std::optional<DomainRecord>> LibvirtHypervisor::lookup_by_uuid(const std::string& uuid) {
    DomainRef dom{virDomainLookupByUUIDString(conn_, uuid.c_str())};
    if (!dom) {
        auto err = last_error();
        // Malformed UUID strings are reported as invalid args; treat as absent.
        if (err.code == VIR_ERR_NO_DOMAIN || err.code == VIR_ERR_INVALID_ARG) {
            return std::optional<DomainRecord>{};
        }
        return Error{ErrorCode::HypervisorError, "Lookup of UUID " + uuid + " failed: " + err.message};
    }
    auto record = make_record(dom.get());
    if (!record) return record.error();
    return std::optional<DomainRecord>{std::move(*record)};
}

Result<std::vector<DomainRecord>> LibvirtHypervisor::list_domains() {
    virDomainPtr* domains = nullptr;
    int count = virConnectListAllDomains(conn_, &domains, 0);
    if (count < 0) {
        return make_libvirt_error(ErrorCode::HypervisorError, "Failed to list domains");
    }

    std::vector<DomainRef> handles;
    handles.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) handles.emplace_back(domains[i]);
    std::free(domains);

    std::vector<DomainRecord> records;
    records.reserve(handles.size());
    for (auto& dom : handles) {
        auto record = make_record(dom.get());
        if (!record) {
            // Domain vanished between listing and inspection.
            logger_.debug("Skipping domain during listing: " + record.error().message);
            continue;
        }
        records.push_back(std::move(*record));
    }
    return records;
}

// ─────────────────────────────────────────────
// State changes
// ─────────────────────────────────────────────

Result<bool> LibvirtHypervisor::is_active(const std::string& name) {
    DomainRef dom{virDomainLookupByName(conn_, name.c_str())};
    if (!dom) return make_libvirt_error(ErrorCode::HypervisorError, "Lookup of " + name + " failed");
    int active = virDomainIsActive(dom.get());
    if (active < 0) {
        return make_libvirt_error(ErrorCode::HypervisorError, "Failed to query state of " + name);
    }
    return active == 1;
}

Result<void> LibvirtHypervisor::create(const std::string& name) {
    DomainRef dom{virDomainLookupByName(conn_, name.c_str())};
    if (!dom) return make_libvirt_error(ErrorCode::VMStartError, "Lookup of " + name + " failed");
    if (virDomainCreate(dom.get()) < 0) {
        return make_libvirt_error(ErrorCode::VMStartError, "Failed to start " + name);
    }
    return {};
}

Result<void> LibvirtHypervisor::shutdown(const std::string& name) {
    DomainRef dom{virDomainLookupByName(conn_, name.c_str())};
    if (!dom) return make_libvirt_error(ErrorCode::VMStopError, "Lookup of " + name + " failed");
    if (virDomainShutdown(dom.get()) < 0) {
        if (last_error().code == VIR_ERR_OPERATION_INVALID && virDomainIsActive(dom.get()) == 0) {
            return {};
        }
        return make_libvirt_error(ErrorCode::VMStopError, "Failed to request shutdown of " + name);
    }
    return {};
}

Result<void> LibvirtHypervisor::destroy(const std::string& name) {
    DomainRef dom{virDomainLookupByName(conn_, name.c_str())};
    if (!dom) return make_libvirt_error(ErrorCode::VMStopError, "Lookup of " + name + " failed");
    if (virDomainDestroy(dom.get()) < 0) {
        if (last_error().code == VIR_ERR_OPERATION_INVALID && virDomainIsActive(dom.get()) == 0) {
            return {};
        }
        return make_libvirt_error(ErrorCode::VMStopError, "Failed to destroy " + name);
    }
    return {};
}

Result<void> LibvirtHypervisor::undefine(const std::string& name) {
    DomainRef dom{virDomainLookupByName(conn_, name.c_str())};
    if (!dom) return make_libvirt_error(ErrorCode::VMUndefineError, "Lookup of " + name + " failed");
    if (virDomainUndefineFlags(dom.get(), VIR_DOMAIN_UNDEFINE_MANAGED_SAVE) < 0) {
        return make_libvirt_error(ErrorCode::VMUndefineError, "Failed to undefine " + name);
    }
    return {};
}

// ─────────────────────────────────────────────
// Addressing
// ─────────────────────────────────────────────

Result<std::vector<InterfaceAddress>> LibvirtHypervisor::guest_agent_addresses(const std::string& name) {
    DomainRef dom{virDomainLookupByName(conn_, name.c_str())};
    if (!dom) return make_libvirt_error(ErrorCode::HypervisorError, "Lookup of " + name + " failed");

    virDomainInterfacePtr* ifaces = nullptr;
    int count = virDomainInterfaceAddresses(dom.get(), &ifaces,
                                            VIR_DOMAIN_INTERFACE_ADDRESSES_SRC_AGENT, 0);
    if (count < 0) {
        auto err = last_error();
        return Error{ErrorCode::AgentUnavailable, "Guest agent query for " + name + ": " + err.message};
    }

    std::vector<InterfaceAddress> out;
    for (int i = 0; i < count; ++i) {
        virDomainInterfacePtr iface = ifaces[i];
        for (unsigned int j = 0; j < iface->naddrs; ++j) {
            const auto& addr = iface->addrs[j];
            if (!addr.addr) continue;
            out.push_back(InterfaceAddress{
                .interface_name = iface->name ? iface->name : "",
                .address = addr.addr,
                .is_ipv4 = addr.type == VIR_IP_ADDR_TYPE_IPV4,
            });
        }
        virDomainInterfaceFree(iface);
    }
    std::free(ifaces);
    return out;
}

Result<std::vector<DhcpLease>> LibvirtHypervisor::dhcp_leases(const std::string& network) {
    NetworkRef net{virNetworkLookupByName(conn_, network.c_str())};
    if (!net) {
        return make_libvirt_error(ErrorCode::HypervisorError, "Network " + network + " not found");
    }

    virNetworkDHCPLeasePtr* leases = nullptr;
    int count = virNetworkGetDHCPLeases(net.get(), nullptr, &leases, 0);
    if (count < 0) {
        return make_libvirt_error(ErrorCode::HypervisorError,
                                  "Failed to read DHCP leases of " + network);
    }

    std::vector<DhcpLease> out;
    out.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        virNetworkDHCPLeasePtr lease = leases[i];
        out.push_back(DhcpLease{
            .mac = lease->mac ? lease->mac : "",
            .ip_address = lease->ipaddr ? lease->ipaddr : "",
            .is_ipv4 = lease->type == VIR_IP_ADDR_TYPE_IPV4,
            .expiry_time = static_cast<int64_t>(lease->expirytime),
        });
        virNetworkDHCPLeaseFree(lease);
    }
    std::free(leases);
    return out;
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

Result<std::unique_ptr<IHypervisor>> make_hypervisor(const HypervisorConfig& config, Logger& logger) {
    if (config.mock) {
        logger.warn("Using mock hypervisor; no real VMs will be created");
        return std::unique_ptr<IHypervisor>{std::make_unique<MockHypervisor>()};
    }
    auto hv = std::make_unique<LibvirtHypervisor>(config.uri, logger);
    if (auto connected = hv->connect(); !connected) {
        return connected.error();
    }
    return std::unique_ptr<IHypervisor>{std::move(hv)};
}

}  // namespace vm_sandbox
