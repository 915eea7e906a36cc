/**
 * @file ip_resolver.hpp
 * @brief Discovers a running domain's IPv4 address.
 * @author Dimitris Kafetzis
 *
 * Primary source is the in-guest agent. When the agent is slow or absent,
 * the resolver can fall back to the virtual network's DHCP lease table,
 * matched by the MAC address recorded in the domain descriptor.
 */

#pragma once

#include "core/logger.hpp"
#include "hypervisor/hypervisor.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace vm_sandbox {

class IpResolver {
public:
    IpResolver(IHypervisor& hypervisor, Logger& logger, std::string network,
               std::chrono::milliseconds poll_interval = std::chrono::seconds(3));

    /**
     * @brief Poll for an address until `timeout` elapses.
     *
     * Returns nullopt immediately if the domain is not running, when `stop`
     * is requested, or once the timeout expires. The DHCP fallback is tried
     * only when `allow_fallback` is set and half the timeout has passed.
     * nullopt means "not reachable yet", never an error.
     */
    [[nodiscard]] std::optional<std::string> resolve_ip(const std::string& domain,
                                                        std::chrono::milliseconds timeout,
                                                        bool allow_fallback,
                                                        std::stop_token stop = {});

    /// Single DHCP-lease lookup keyed by the domain's MAC.
    [[nodiscard]] std::optional<std::string> lookup_dhcp_lease(const std::string& domain);

    /// IPv4, not loopback (127/8) and not link-local (169.254/16).
    [[nodiscard]] static bool is_routable_ipv4(std::string_view address);

private:
    std::optional<std::string> query_agent(const std::string& domain);

    IHypervisor& hypervisor_;
    Logger& logger_;
    std::string network_;
    std::chrono::milliseconds poll_interval_;
};

}  // namespace vm_sandbox
