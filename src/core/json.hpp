/**
 * @file json.hpp
 * @brief Minimal JSON rendering for log lines, events and CLI output.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vm_sandbox {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view str);

/// ISO 8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
[[nodiscard]] std::string format_timestamp(Timestamp ts);

[[nodiscard]] std::string to_json(const JobSnapshot& snapshot);
[[nodiscard]] std::string to_json(const DomainSummary& summary);
[[nodiscard]] std::string to_json(const DomainDetails& details);
[[nodiscard]] std::string to_json(const std::vector<DomainSummary>& summaries);

}  // namespace vm_sandbox
