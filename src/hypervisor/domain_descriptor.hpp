/**
 * @file domain_descriptor.hpp
 * @brief Domain XML rendering and parsing.
 * @author Dimitris Kafetzis
 *
 * The only place that reads or writes hypervisor descriptor XML. Provenance
 * (domain kind and disk path) travels inside the descriptor as elements of a
 * private metadata namespace, so no side database is needed.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vm_sandbox {

inline constexpr std::string_view kMetadataNamespace =
    "https://vm-sandbox.dev/xmlns/libvirt/app/1.0";

/**
 * @brief Input for rendering a new domain definition.
 */
struct DomainSpec {
    DomainName name;
    std::string uuid;
    DomainKind kind{DomainKind::Ephemeral};
    std::string disk_path;
    uint32_t memory_mb{512};
    uint32_t vcpus{1};
    bool with_network{false};
    std::string network{"default"};
    std::string mac;                    ///< Required when with_network
    std::string emulator{"/usr/bin/qemu-system-x86_64"};
};

/**
 * @brief Fields recovered from an existing descriptor.
 */
struct DomainDescriptor {
    DomainName name;
    std::string uuid;
    std::optional<DomainKind> kind;
    std::optional<std::string> disk_path;   ///< From metadata, not the <disk> element
    uint32_t memory_mb{0};
    uint32_t vcpus{0};
    std::optional<std::string> mac;         ///< First NIC, lowercase
};

[[nodiscard]] std::string render_domain_xml(const DomainSpec& spec);

/**
 * @brief Parse the fields we care about out of a descriptor.
 *
 * Missing metadata is not an error (domains created by other tools have
 * none); a document without a <domain> root is.
 */
[[nodiscard]] Result<DomainDescriptor> parse_domain_xml(std::string_view xml);

}  // namespace vm_sandbox
