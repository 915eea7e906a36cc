/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>

namespace vm_sandbox {

/**
 * @brief Collects and logs structured lifecycle events as NDJSON.
 *
 * Counters are kept in memory so the daemon can print a summary at exit.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_job_event(const JobId& id, JobStatus status, std::chrono::milliseconds elapsed);
    void record_vm_event(const DomainName& domain, std::string_view event_type);
    void record_terminal_event(const ConnectionId& connection, const DomainName& domain,
                               std::string_view event_type);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] uint64_t jobs_finished() const;
    [[nodiscard]] uint64_t jobs_failed() const;
    [[nodiscard]] uint64_t cleanup_leaks() const;

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t jobs_finished_{0};
    uint64_t jobs_failed_{0};
    uint64_t cleanup_leaks_{0};

    void emit(std::string_view json_line);
};

}  // namespace vm_sandbox
