/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"
#include "core/json.hpp"

#include <sstream>

namespace vm_sandbox {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_job_event(const JobId& id, JobStatus status,
                                        std::chrono::milliseconds elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"job_state_change")"
        << R"(,"ts":")" << format_timestamp(std::chrono::system_clock::now()) << "\""
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"state":")" << to_string(status) << "\""
        << R"(,"elapsed_ms":)" << elapsed.count()
        << "}";

    std::lock_guard lock(write_mutex_);
    if (is_terminal(status)) {
        ++jobs_finished_;
        if (status != JobStatus::Completed) ++jobs_failed_;
    }
    sink_->write(oss.str());
}

void MetricsCollector::record_vm_event(const DomainName& domain, std::string_view event_type) {
    std::ostringstream oss;
    oss << R"({"event":"vm_)" << event_type << "\""
        << R"(,"ts":")" << format_timestamp(std::chrono::system_clock::now()) << "\""
        << R"(,"domain":")" << json_escape(domain) << "\""
        << "}";

    std::lock_guard lock(write_mutex_);
    if (event_type == "cleanup_leak") ++cleanup_leaks_;
    sink_->write(oss.str());
}

void MetricsCollector::record_terminal_event(const ConnectionId& connection,
                                             const DomainName& domain,
                                             std::string_view event_type) {
    std::ostringstream oss;
    oss << R"({"event":"terminal_)" << event_type << "\""
        << R"(,"ts":")" << format_timestamp(std::chrono::system_clock::now()) << "\""
        << R"(,"connection":")" << json_escape(connection) << "\""
        << R"(,"domain":")" << json_escape(domain) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

uint64_t MetricsCollector::jobs_finished() const {
    std::lock_guard lock(write_mutex_);
    return jobs_finished_;
}

uint64_t MetricsCollector::jobs_failed() const {
    std::lock_guard lock(write_mutex_);
    return jobs_failed_;
}

uint64_t MetricsCollector::cleanup_leaks() const {
    std::lock_guard lock(write_mutex_);
    return cleanup_leaks_;
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace vm_sandbox
