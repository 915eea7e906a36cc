/**
 * @file mock_hypervisor.cpp
 * @brief MockHypervisor implementation for testing.
 * @author Dimitris Kafetzis
 */

#include "hypervisor/hypervisor.hpp"
#include "hypervisor/domain_descriptor.hpp"

#include <algorithm>
#include <cctype>

namespace vm_sandbox {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

}  // namespace

MockHypervisor::MockDomain* MockHypervisor::find_locked(const std::string& name) {
    auto it = domains_.find(name);
    return it == domains_.end() ? nullptr : &it->second;
}

Result<DomainRecord> MockHypervisor::define_domain(const std::string& xml) {
    auto desc = parse_domain_xml(xml);
    if (!desc) return Error{ErrorCode::VMDefineError, desc.error().message};
    if (desc->name.empty()) return Error{ErrorCode::VMDefineError, "Descriptor has no <name>"};

    std::lock_guard lock(mutex_);
    if (fail_define_) {
        return Error{ErrorCode::VMDefineError, "Simulated define failure for " + desc->name};
    }
    if (domains_.contains(desc->name)) {
        return Error{ErrorCode::VMDefineError, "Domain " + desc->name + " already exists"};
    }

    MockDomain dom;
    dom.record = DomainRecord{
        .name = desc->name,
        .uuid = desc->uuid,
        .status = DomainStatus::Defined,
        .xml = xml,
    };
    dom.mac = desc->mac.value_or("");
    ++total_defined_;
    auto [it, inserted] = domains_.emplace(desc->name, std::move(dom));
    return it->second.record;
}

Result<std::optional<DomainRecord>> MockHypervisor::lookup_by_name(const std::string& name) {
    std::lock_guard lock(mutex_);
    if (auto* dom = find_locked(name)) return std::optional<DomainRecord>{dom->record};
    return std::optional<DomainRecord>{};
}

Result<std::optional<DomainRecord>> MockHypervisor::lookup_by_uuid(const std::string& uuid) {
    std::lock_guard lock(mutex_);
    for (const auto& [name, dom] : domains_) {
        if (dom.record.uuid == uuid) return std::optional<DomainRecord>{dom.record};
    }
    return std::optional<DomainRecord>{};
}

Result<std::vector<DomainRecord>> MockHypervisor::list_domains() {
    std::lock_guard lock(mutex_);
    std::vector<DomainRecord> out;
    out.reserve(domains_.size());
    for (const auto& [name, dom] : domains_) out.push_back(dom.record);
    return out;
}

Result<bool> MockHypervisor::is_active(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto* dom = find_locked(name);
    if (!dom) return Error{ErrorCode::DomainNotFound, "Domain " + name + " not found"};
    if (fail_state_after_shutdown_ && dom->shutdown_requested) {
        return Error{ErrorCode::HypervisorError, "Simulated state query failure for " + name};
    }
    return dom->record.status == DomainStatus::Running;
}

Result<void> MockHypervisor::create(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto* dom = find_locked(name);
    if (!dom) return Error{ErrorCode::DomainNotFound, "Domain " + name + " not found"};
    if (fail_start_) return Error{ErrorCode::VMStartError, "Simulated start failure for " + name};
    if (dom->record.status == DomainStatus::Running) {
        return Error{ErrorCode::VMStartError, "Domain " + name + " is already running"};
    }

    dom->record.status = DomainStatus::Running;
    if (assign_addresses_) {
        dom->ip = "192.168.122." + std::to_string(next_host_octet_);
        next_host_octet_ = next_host_octet_ >= 254 ? 10 : next_host_octet_ + 1;
    } else {
        dom->ip.clear();
    }
    ++active_;
    peak_active_ = std::max(peak_active_, active_);
    return {};
}

Result<void> MockHypervisor::shutdown(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto* dom = find_locked(name);
    if (!dom) return Error{ErrorCode::DomainNotFound, "Domain " + name + " not found"};
    ++shutdown_calls_;
    dom->shutdown_requested = true;
    if (dom->record.status != DomainStatus::Running || !honor_acpi_) return {};
    dom->record.status = DomainStatus::Stopped;
    dom->ip.clear();
    --active_;
    return {};
}

Result<void> MockHypervisor::destroy(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto* dom = find_locked(name);
    if (!dom) return Error{ErrorCode::DomainNotFound, "Domain " + name + " not found"};
    ++destroy_calls_;
    if (dom->record.status != DomainStatus::Running) return {};
    dom->record.status = DomainStatus::Stopped;
    dom->ip.clear();
    --active_;
    return {};
}

Result<void> MockHypervisor::undefine(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = domains_.find(name);
    if (it == domains_.end()) return Error{ErrorCode::DomainNotFound, "Domain " + name + " not found"};
    if (fail_undefine_) return Error{ErrorCode::VMUndefineError, "Simulated undefine failure for " + name};
    if (it->second.record.status == DomainStatus::Running) --active_;
    domains_.erase(it);
    return {};
}

Result<std::vector<InterfaceAddress>> MockHypervisor::guest_agent_addresses(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto* dom = find_locked(name);
    if (!dom) return Error{ErrorCode::DomainNotFound, "Domain " + name + " not found"};
    if (agent_silent_ || dom->record.status != DomainStatus::Running) {
        return Error{ErrorCode::AgentUnavailable, "Guest agent is not connected"};
    }

    std::vector<InterfaceAddress> out{
        {.interface_name = "lo", .address = "127.0.0.1", .is_ipv4 = true},
        {.interface_name = "lo", .address = "::1", .is_ipv4 = false},
    };
    if (!dom->ip.empty()) {
        out.push_back({.interface_name = "eth0", .address = "169.254.10.20", .is_ipv4 = true});
        out.push_back({.interface_name = "eth0", .address = dom->ip, .is_ipv4 = true});
    }
    return out;
}

Result<std::vector<DhcpLease>> MockHypervisor::dhcp_leases(const std::string& /*network*/) {
    std::lock_guard lock(mutex_);
    std::vector<DhcpLease> out;
    for (const auto& [name, dom] : domains_) {
        if (dom.mac.empty() || dom.ip.empty()) continue;
        // dnsmasq reports MACs in whatever case the guest used
        out.push_back(DhcpLease{
            .mac = to_upper(dom.mac),
            .ip_address = dom.ip,
            .is_ipv4 = true,
            .expiry_time = 0,
        });
    }
    return out;
}

void MockHypervisor::power_off(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto* dom = find_locked(name);
    if (!dom || dom->record.status != DomainStatus::Running) return;
    dom->record.status = DomainStatus::Stopped;
    dom->ip.clear();
    --active_;
}

size_t MockHypervisor::domain_count() const {
    std::lock_guard lock(mutex_);
    return domains_.size();
}

size_t MockHypervisor::active_count() const {
    std::lock_guard lock(mutex_);
    return active_;
}

size_t MockHypervisor::peak_active_count() const {
    std::lock_guard lock(mutex_);
    return peak_active_;
}

size_t MockHypervisor::total_defined() const {
    std::lock_guard lock(mutex_);
    return total_defined_;
}

size_t MockHypervisor::destroy_calls() const {
    std::lock_guard lock(mutex_);
    return destroy_calls_;
}

size_t MockHypervisor::shutdown_calls() const {
    std::lock_guard lock(mutex_);
    return shutdown_calls_;
}

std::optional<std::string> MockHypervisor::address_of(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = domains_.find(name);
    if (it == domains_.end() || it->second.ip.empty()) return std::nullopt;
    return it->second.ip;
}

}  // namespace vm_sandbox
