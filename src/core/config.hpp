/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace vm_sandbox {

struct HypervisorConfig {
    std::string uri = "qemu:///system";
    bool mock = false;                  ///< In-memory hypervisor + SSH host
    std::string network = "default";    ///< Virtual network for NICs and DHCP leases
    std::string emulator = "/usr/bin/qemu-system-x86_64";
};

struct ImageConfig {
    std::filesystem::path base_image = "/var/lib/libvirt/images/nixos-sandbox-base.qcow2";
    std::filesystem::path ephemeral_dir = "/var/lib/libvirt/images/sandbox_instances";
    std::filesystem::path workspace_dir = "/var/lib/libvirt/images/workspaces";
    std::string qemu_img = "qemu-img";
    uint32_t qemu_img_timeout_s = 60;
};

struct VmConfig {
    uint32_t ephemeral_memory_mb = 512;
    uint32_t ephemeral_vcpus = 1;
    uint32_t workspace_memory_mb = 1024;
    uint32_t workspace_vcpus = 2;
    uint32_t shutdown_timeout_s = 30;   ///< Graceful stop budget before forcing
    uint32_t shutdown_poll_ms = 1000;
};

struct OrchestratorConfig {
    uint32_t max_concurrent_vms = 2;
    uint32_t max_queued_jobs = 64;      ///< 0 = unbounded
    uint32_t vm_ready_timeout_s = 120;
    uint32_t orchestration_timeout_s = 300;
    uint32_t ip_poll_interval_ms = 3000;
    uint32_t ssh_retry_interval_ms = 5000;
    uint32_t reaper_interval_ms = 5000; ///< 0 = lazy detection only
    uint32_t job_retention_s = 3600;
    std::string remote_work_dir = "/tmp";
};

struct SshConfig {
    std::string username = "executor";
    std::string private_key = "~/.ssh/id_rsa_nixos_vm_executor";
    uint16_t port = 22;
    uint32_t connect_timeout_s = 10;
    uint32_t kill_after_s = 5;          ///< Grace window for `timeout --kill-after`
    uint32_t channel_grace_s = 5;       ///< Added on top of the kill-after window
};

struct TerminalConfig {
    std::string term = "xterm-256color";
    uint32_t cols = 80;
    uint32_t rows = 24;
    uint32_t read_timeout_ms = 50;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    HypervisorConfig hypervisor;
    ImageConfig images;
    VmConfig vm;
    OrchestratorConfig orchestrator;
    std::map<std::string, ResourceProfile> profiles = default_profiles();
    SshConfig ssh;
    TerminalConfig terminal;
    TelemetryConfig telemetry;

    /// Built-in small/default/large presets.
    static std::map<std::string, ResourceProfile> default_profiles();

    /// Resolve a profile name; unknown names map to "default".
    [[nodiscard]] ResourceProfile profile(const std::string& name) const;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Override externally supplied values from VM_SANDBOX_* variables.
 */
Result<void> apply_env_overrides(Config& config);

/**
 * @brief Expand a leading "~/" against $HOME.
 */
std::filesystem::path expand_home(const std::string& path);

}  // namespace vm_sandbox
