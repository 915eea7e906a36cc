/**
 * @file hypervisor.hpp
 * @brief Hypervisor capability interface and concrete implementations.
 * @author Dimitris Kafetzis
 *
 * Provides LibvirtHypervisor (libvirt C API) and MockHypervisor (in-memory,
 * for tests and --mock runs). The implementation is chosen once at startup
 * and injected into every component that talks to the hypervisor.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct _virConnect;

namespace vm_sandbox {

/**
 * @brief Hypervisor-side view of one defined domain.
 */
struct DomainRecord {
    DomainName name;
    std::string uuid;
    DomainStatus status{DomainStatus::Defined};
    std::string xml;                    ///< Live descriptor, parse via domain_descriptor.hpp
};

struct InterfaceAddress {
    std::string interface_name;
    std::string address;
    bool is_ipv4{true};
};

struct DhcpLease {
    std::string mac;
    std::string ip_address;
    bool is_ipv4{true};
    int64_t expiry_time{0};             ///< Unix seconds; 0 = no expiry reported
};

// ─────────────────────────────────────────────
// IHypervisor (virtual, selected at startup)
// ─────────────────────────────────────────────

/**
 * @brief Abstract hypervisor control surface.
 *
 * Lookups return an empty optional for "no such domain"; errors are reserved
 * for genuine hypervisor failures. Domains are addressed by name.
 */
class IHypervisor {
public:
    virtual ~IHypervisor() = default;

    virtual Result<DomainRecord> define_domain(const std::string& xml) = 0;
    virtual Result<std::optional<DomainRecord>> lookup_by_name(const std::string& name) = 0;
    virtual Result<std::optional<DomainRecord>> lookup_by_uuid(const std::string& uuid) = 0;
    virtual Result<std::vector<DomainRecord>> list_domains() = 0;

    virtual Result<bool> is_active(const std::string& name) = 0;
    virtual Result<void> create(const std::string& name) = 0;
    /// ACPI power-button request; returns before the guest has stopped.
    virtual Result<void> shutdown(const std::string& name) = 0;
    virtual Result<void> destroy(const std::string& name) = 0;
    /// Removes the definition together with any managed-save image.
    virtual Result<void> undefine(const std::string& name) = 0;

    /// Fails with AgentUnavailable when the in-guest agent does not answer.
    virtual Result<std::vector<InterfaceAddress>> guest_agent_addresses(const std::string& name) = 0;
    virtual Result<std::vector<DhcpLease>> dhcp_leases(const std::string& network) = 0;
};

// ─────────────────────────────────────────────
// LibvirtHypervisor
// ─────────────────────────────────────────────

/**
 * @brief libvirt-backed hypervisor over a single shared connection.
 *
 * libvirt connections are thread-safe; every call opens and frees its own
 * domain handle.
 */
class LibvirtHypervisor final : public IHypervisor {
public:
    LibvirtHypervisor(std::string uri, Logger& logger);
    ~LibvirtHypervisor() override;

    LibvirtHypervisor(const LibvirtHypervisor&) = delete;
    LibvirtHypervisor& operator=(const LibvirtHypervisor&) = delete;

    Result<void> connect();
    [[nodiscard]] bool is_connected() const noexcept { return conn_ != nullptr; }

    Result<DomainRecord> define_domain(const std::string& xml) override;
    Result<std::optional<DomainRecord>> lookup_by_name(const std::string& name) override;
    Result<std::optional<DomainRecord>> lookup_by_uuid(const std::string& uuid) override;
    Result<std::vector<DomainRecord>> list_domains() override;

    Result<bool> is_active(const std::string& name) override;
    Result<void> create(const std::string& name) override;
    Result<void> shutdown(const std::string& name) override;
    Result<void> destroy(const std::string& name) override;
    Result<void> undefine(const std::string& name) override;

    Result<std::vector<InterfaceAddress>> guest_agent_addresses(const std::string& name) override;
    Result<std::vector<DhcpLease>> dhcp_leases(const std::string& network) override;

private:
    std::string uri_;
    Logger& logger_;
    _virConnect* conn_{nullptr};
};

// ─────────────────────────────────────────────
// MockHypervisor
// ─────────────────────────────────────────────

/**
 * @brief In-memory hypervisor for testing and simulation.
 *
 * Started domains receive sequential addresses in 192.168.122.0/24. Failure
 * knobs let tests drive every error path of the lifecycle manager, and the
 * bookkeeping counters make cleanup and concurrency observable.
 */
class MockHypervisor final : public IHypervisor {
public:
    MockHypervisor() = default;

    Result<DomainRecord> define_domain(const std::string& xml) override;
    Result<std::optional<DomainRecord>> lookup_by_name(const std::string& name) override;
    Result<std::optional<DomainRecord>> lookup_by_uuid(const std::string& uuid) override;
    Result<std::vector<DomainRecord>> list_domains() override;

    Result<bool> is_active(const std::string& name) override;
    Result<void> create(const std::string& name) override;
    Result<void> shutdown(const std::string& name) override;
    Result<void> destroy(const std::string& name) override;
    Result<void> undefine(const std::string& name) override;

    Result<std::vector<InterfaceAddress>> guest_agent_addresses(const std::string& name) override;
    Result<std::vector<DhcpLease>> dhcp_leases(const std::string& network) override;

    // ── Failure knobs ────────────────────────
    void set_fail_define(bool fail) { std::lock_guard l(mutex_); fail_define_ = fail; }
    void set_fail_start(bool fail) { std::lock_guard l(mutex_); fail_start_ = fail; }
    void set_fail_undefine(bool fail) { std::lock_guard l(mutex_); fail_undefine_ = fail; }
    /// Guest agent never answers; DHCP leases still work.
    void set_agent_silent(bool silent) { std::lock_guard l(mutex_); agent_silent_ = silent; }
    /// Started domains never obtain an address on either path.
    void set_assign_addresses(bool assign) { std::lock_guard l(mutex_); assign_addresses_ = assign; }
    /// Whether an ACPI shutdown request actually powers the guest off.
    void set_honor_acpi(bool honor) { std::lock_guard l(mutex_); honor_acpi_ = honor; }
    /// State queries on a domain fail with HypervisorError once it was asked to shut down.
    void set_fail_state_after_shutdown(bool fail) { std::lock_guard l(mutex_); fail_state_after_shutdown_ = fail; }

    /// Simulate the guest powering itself off.
    void power_off(const std::string& name);

    // ── Bookkeeping ──────────────────────────
    [[nodiscard]] size_t domain_count() const;
    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] size_t peak_active_count() const;
    [[nodiscard]] size_t total_defined() const;
    [[nodiscard]] size_t destroy_calls() const;
    [[nodiscard]] size_t shutdown_calls() const;
    [[nodiscard]] std::optional<std::string> address_of(const std::string& name) const;

private:
    struct MockDomain {
        DomainRecord record;
        std::string mac;
        std::string ip;
        bool shutdown_requested{false};
    };

    MockDomain* find_locked(const std::string& name);

    mutable std::mutex mutex_;
    std::map<std::string, MockDomain> domains_;
    uint32_t next_host_octet_{10};
    size_t active_{0};
    size_t peak_active_{0};
    size_t total_defined_{0};
    size_t destroy_calls_{0};
    size_t shutdown_calls_{0};

    bool fail_define_{false};
    bool fail_start_{false};
    bool fail_undefine_{false};
    bool agent_silent_{false};
    bool assign_addresses_{true};
    bool honor_acpi_{true};
    bool fail_state_after_shutdown_{false};
};

/**
 * @brief Build the hypervisor selected by configuration.
 *
 * `hypervisor.mock = true` yields a MockHypervisor; otherwise a connected
 * LibvirtHypervisor, or an error if the connection cannot be opened.
 */
Result<std::unique_ptr<IHypervisor>> make_hypervisor(const HypervisorConfig& config, Logger& logger);

}  // namespace vm_sandbox
