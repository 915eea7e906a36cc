/**
 * @file ids.hpp
 * @brief Random identifiers: job ids, domain UUIDs and MAC addresses.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <string>

namespace vm_sandbox {

/// RFC 4122 version-4 UUID in canonical lowercase form.
[[nodiscard]] std::string generate_uuid();

/// Locally administered KVM-range MAC, 52:54:00:xx:xx:xx.
[[nodiscard]] std::string generate_mac();

}  // namespace vm_sandbox
