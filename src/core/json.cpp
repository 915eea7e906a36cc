/**
 * @file json.cpp
 * @brief JSON rendering helpers.
 * @author Dimitris Kafetzis
 */

#include "core/json.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vm_sandbox {

std::string json_escape(std::string_view str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

std::string format_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t_ts, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

namespace {

void put_optional_ts(std::ostringstream& oss, std::string_view key,
                     const std::optional<Timestamp>& ts) {
    oss << ",\"" << key << "\":";
    if (ts) {
        oss << '"' << format_timestamp(*ts) << '"';
    } else {
        oss << "null";
    }
}

}  // namespace

std::string to_json(const JobSnapshot& snapshot) {
    std::ostringstream oss;
    oss << R"({"job_id":")" << json_escape(snapshot.id) << '"'
        << R"(,"status":")" << to_string(snapshot.status) << '"'
        << R"(,"language":")" << json_escape(snapshot.language) << '"'
        << R"(,"timeout_seconds":)" << snapshot.requested_timeout_s
        << R"(,"resource_profile":")" << json_escape(snapshot.resource_profile) << '"'
        << R"(,"submitted_at":")" << format_timestamp(snapshot.submitted_at) << '"';
    put_optional_ts(oss, "started_at", snapshot.started_at);
    put_optional_ts(oss, "completed_at", snapshot.completed_at);

    oss << R"(,"result":)";
    if (snapshot.result) {
        oss << R"({"stdout":")" << json_escape(snapshot.result->stdout_text) << '"'
            << R"(,"stderr":")" << json_escape(snapshot.result->stderr_text) << '"'
            << R"(,"exit_code":)" << snapshot.result->exit_code << '}';
    } else {
        oss << "null";
    }

    oss << R"(,"error_message":)";
    if (snapshot.error_message.empty()) {
        oss << "null";
    } else {
        oss << '"' << json_escape(snapshot.error_message) << '"';
    }
    oss << '}';
    return oss.str();
}

std::string to_json(const DomainSummary& summary) {
    std::ostringstream oss;
    oss << R"({"name":")" << json_escape(summary.name) << '"'
        << R"(,"uuid":")" << json_escape(summary.uuid) << '"'
        << R"(,"type":)";
    if (summary.kind) {
        oss << '"' << to_string(*summary.kind) << '"';
    } else {
        oss << "null";
    }
    oss << R"(,"status":")" << to_string(summary.status) << '"'
        << R"(,"disk_path":")" << json_escape(summary.disk_path) << "\"}";
    return oss.str();
}

std::string to_json(const DomainDetails& details) {
    auto base = to_json(details.summary);
    base.pop_back();  // reopen the summary object

    std::ostringstream oss;
    oss << base
        << R"(,"memory_mb":)" << details.memory_mb
        << R"(,"vcpus":)" << details.vcpus
        << R"(,"ip_address":)";
    if (details.ip_address) {
        oss << '"' << json_escape(*details.ip_address) << '"';
    } else {
        oss << "null";
    }
    oss << R"(,"ssh_port":)" << details.ssh_port << '}';
    return oss.str();
}

std::string to_json(const std::vector<DomainSummary>& summaries) {
    std::string out = "[";
    for (size_t i = 0; i < summaries.size(); ++i) {
        if (i > 0) out += ',';
        out += to_json(summaries[i]);
    }
    out += ']';
    return out;
}

}  // namespace vm_sandbox
