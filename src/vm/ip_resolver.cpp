/**
 * @file ip_resolver.cpp
 * @brief IpResolver implementation.
 * @author Dimitris Kafetzis
 */

#include "vm/ip_resolver.hpp"
#include "core/clock.hpp"
#include "hypervisor/domain_descriptor.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>

namespace vm_sandbox {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

IpResolver::IpResolver(IHypervisor& hypervisor, Logger& logger, std::string network,
                       std::chrono::milliseconds poll_interval)
    : hypervisor_(hypervisor)
    , logger_(logger)
    , network_(std::move(network))
    , poll_interval_(poll_interval) {}

bool IpResolver::is_routable_ipv4(std::string_view address) {
    std::string text{address};
    in_addr parsed{};
    if (inet_pton(AF_INET, text.c_str(), &parsed) != 1) return false;
    return !text.starts_with("127.") && !text.starts_with("169.254.");
}

std::optional<std::string> IpResolver::query_agent(const std::string& domain) {
    auto addresses = hypervisor_.guest_agent_addresses(domain);
    if (!addresses) {
        logger_.debug("Guest agent not ready for " + domain + ": " + addresses.error().message);
        return std::nullopt;
    }
    for (const auto& addr : *addresses) {
        if (addr.is_ipv4 && is_routable_ipv4(addr.address)) return addr.address;
    }
    return std::nullopt;
}

std::optional<std::string> IpResolver::lookup_dhcp_lease(const std::string& domain) {
    auto record = hypervisor_.lookup_by_name(domain);
    if (!record || !record->has_value()) return std::nullopt;

    auto desc = parse_domain_xml((*record)->xml);
    if (!desc || !desc->mac) {
        logger_.debug("No MAC address in descriptor of " + domain);
        return std::nullopt;
    }

    auto leases = hypervisor_.dhcp_leases(network_);
    if (!leases) {
        logger_.warn("DHCP lease lookup failed for " + domain + ": " + leases.error().message);
        return std::nullopt;
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    for (const auto& lease : *leases) {
        if (!iequals(lease.mac, *desc->mac) || !lease.is_ipv4) continue;
        if (lease.expiry_time != 0 && lease.expiry_time <= now) continue;
        if (!is_routable_ipv4(lease.ip_address)) continue;
        logger_.info("Resolved " + domain + " via DHCP lease: " + lease.ip_address);
        return lease.ip_address;
    }
    return std::nullopt;
}

std::optional<std::string> IpResolver::resolve_ip(const std::string& domain,
                                                  std::chrono::milliseconds timeout,
                                                  bool allow_fallback,
                                                  std::stop_token stop) {
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;
    bool fallback_logged = false;

    logger_.debug("Resolving IP for " + domain + " (timeout "
                  + std::to_string(timeout.count()) + "ms)");

    while (!stop.stop_requested()) {
        auto active = hypervisor_.is_active(domain);
        if (!active || !*active) {
            logger_.warn("Domain " + domain + " is not running; cannot resolve IP");
            return std::nullopt;
        }

        if (auto ip = query_agent(domain)) {
            logger_.info("Resolved " + domain + " via guest agent: " + *ip);
            return ip;
        }

        const auto now = std::chrono::steady_clock::now();
        if (allow_fallback && now - start >= timeout / 2) {
            if (!fallback_logged) {
                logger_.info("Guest agent slow for " + domain + "; trying DHCP leases");
                fallback_logged = true;
            }
            if (auto ip = lookup_dhcp_lease(domain)) return ip;
        }

        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!interruptible_sleep(std::min(poll_interval_, remaining), stop)) break;
    }

    logger_.warn("Could not resolve IP for " + domain);
    return std::nullopt;
}

}  // namespace vm_sandbox
