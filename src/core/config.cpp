/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <cstdlib>

namespace vm_sandbox {

std::map<std::string, ResourceProfile> Config::default_profiles() {
    return {
        {"small",   ResourceProfile{.memory_mb = 256,  .vcpus = 1}},
        {"default", ResourceProfile{.memory_mb = 512,  .vcpus = 1}},
        {"large",   ResourceProfile{.memory_mb = 1024, .vcpus = 2}},
    };
}

ResourceProfile Config::profile(const std::string& name) const {
    if (auto it = profiles.find(name); it != profiles.end()) return it->second;
    if (auto it = profiles.find("default"); it != profiles.end()) return it->second;
    return ResourceProfile{};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [hypervisor]
        if (auto hv = tbl["hypervisor"]; hv.is_table()) {
            config.hypervisor.uri = hv["uri"].value_or(config.hypervisor.uri);
            config.hypervisor.mock = hv["mock"].value_or(false);
            config.hypervisor.network = hv["network"].value_or(config.hypervisor.network);
            config.hypervisor.emulator = hv["emulator"].value_or(config.hypervisor.emulator);
        }

        // [images]
        if (auto images = tbl["images"]; images.is_table()) {
            config.images.base_image =
                images["base_image"].value_or(config.images.base_image.string());
            config.images.ephemeral_dir =
                images["ephemeral_dir"].value_or(config.images.ephemeral_dir.string());
            config.images.workspace_dir =
                images["workspace_dir"].value_or(config.images.workspace_dir.string());
            config.images.qemu_img = images["qemu_img"].value_or(config.images.qemu_img);
            config.images.qemu_img_timeout_s = static_cast<uint32_t>(
                images["qemu_img_timeout_s"].value_or(int64_t{60}));
        }

        // [vm]
        if (auto vm = tbl["vm"]; vm.is_table()) {
            config.vm.ephemeral_memory_mb = static_cast<uint32_t>(
                vm["ephemeral_memory_mb"].value_or(int64_t{512}));
            config.vm.ephemeral_vcpus = static_cast<uint32_t>(
                vm["ephemeral_vcpus"].value_or(int64_t{1}));
            config.vm.workspace_memory_mb = static_cast<uint32_t>(
                vm["workspace_memory_mb"].value_or(int64_t{1024}));
            config.vm.workspace_vcpus = static_cast<uint32_t>(
                vm["workspace_vcpus"].value_or(int64_t{2}));
            config.vm.shutdown_timeout_s = static_cast<uint32_t>(
                vm["shutdown_timeout_s"].value_or(int64_t{30}));
            config.vm.shutdown_poll_ms = static_cast<uint32_t>(
                vm["shutdown_poll_ms"].value_or(int64_t{1000}));
        }

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            config.orchestrator.max_concurrent_vms = static_cast<uint32_t>(
                orch["max_concurrent_vms"].value_or(int64_t{2}));
            config.orchestrator.max_queued_jobs = static_cast<uint32_t>(
                orch["max_queued_jobs"].value_or(int64_t{64}));
            config.orchestrator.vm_ready_timeout_s = static_cast<uint32_t>(
                orch["vm_ready_timeout_s"].value_or(int64_t{120}));
            config.orchestrator.orchestration_timeout_s = static_cast<uint32_t>(
                orch["orchestration_timeout_s"].value_or(int64_t{300}));
            config.orchestrator.ip_poll_interval_ms = static_cast<uint32_t>(
                orch["ip_poll_interval_ms"].value_or(int64_t{3000}));
            config.orchestrator.ssh_retry_interval_ms = static_cast<uint32_t>(
                orch["ssh_retry_interval_ms"].value_or(int64_t{5000}));
            config.orchestrator.reaper_interval_ms = static_cast<uint32_t>(
                orch["reaper_interval_ms"].value_or(int64_t{5000}));
            config.orchestrator.job_retention_s = static_cast<uint32_t>(
                orch["job_retention_s"].value_or(int64_t{3600}));
            config.orchestrator.remote_work_dir =
                orch["remote_work_dir"].value_or(config.orchestrator.remote_work_dir);
        }

        // [profiles.<name>]
        if (auto profiles = tbl["profiles"].as_table()) {
            for (const auto& [key, node] : *profiles) {
                auto* entry = node.as_table();
                if (!entry) continue;
                ResourceProfile profile;
                profile.memory_mb = static_cast<uint32_t>(
                    (*entry)["memory_mb"].value_or(int64_t{512}));
                profile.vcpus = static_cast<uint32_t>(
                    (*entry)["vcpus"].value_or(int64_t{1}));
                if (profile.memory_mb == 0 || profile.vcpus == 0) {
                    return Error{ErrorCode::ConfigError,
                                 "Profile '" + std::string{key.str()} + "' has zero memory or vcpus"};
                }
                config.profiles[std::string{key.str()}] = profile;
            }
        }

        // Without an explicit [profiles.default], "default" follows the [vm] ephemeral size.
        if (!tbl["profiles"]["default"].is_table()) {
            config.profiles["default"] = ResourceProfile{.memory_mb = config.vm.ephemeral_memory_mb,
                                                         .vcpus = config.vm.ephemeral_vcpus};
        }

        // [ssh]
        if (auto ssh = tbl["ssh"]; ssh.is_table()) {
            config.ssh.username = ssh["username"].value_or(config.ssh.username);
            config.ssh.private_key = ssh["private_key"].value_or(config.ssh.private_key);
            config.ssh.port = static_cast<uint16_t>(ssh["port"].value_or(int64_t{22}));
            config.ssh.connect_timeout_s = static_cast<uint32_t>(
                ssh["connect_timeout_s"].value_or(int64_t{10}));
            config.ssh.kill_after_s = static_cast<uint32_t>(
                ssh["kill_after_s"].value_or(int64_t{5}));
            config.ssh.channel_grace_s = static_cast<uint32_t>(
                ssh["channel_grace_s"].value_or(int64_t{5}));
        }

        // [terminal]
        if (auto term = tbl["terminal"]; term.is_table()) {
            config.terminal.term = term["term"].value_or(config.terminal.term);
            config.terminal.cols = static_cast<uint32_t>(term["cols"].value_or(int64_t{80}));
            config.terminal.rows = static_cast<uint32_t>(term["rows"].value_or(int64_t{24}));
            config.terminal.read_timeout_ms = static_cast<uint32_t>(
                term["read_timeout_ms"].value_or(int64_t{50}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (config.orchestrator.max_concurrent_vms == 0) {
            return Error{ErrorCode::ConfigError, "orchestrator.max_concurrent_vms must be positive"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

namespace {

Result<uint32_t> parse_u32(const char* name, std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return Error{ErrorCode::ConfigError,
                     std::string{name} + " must be a non-negative integer, got '"
                     + std::string{text} + "'"};
    }
    return value;
}

}  // namespace

Result<void> apply_env_overrides(Config& config) {
    if (const char* v = std::getenv("VM_SANDBOX_BASE_IMAGE")) config.images.base_image = v;
    if (const char* v = std::getenv("VM_SANDBOX_EPHEMERAL_DIR")) config.images.ephemeral_dir = v;
    if (const char* v = std::getenv("VM_SANDBOX_WORKSPACE_DIR")) config.images.workspace_dir = v;
    if (const char* v = std::getenv("VM_SANDBOX_SSH_USER")) config.ssh.username = v;
    if (const char* v = std::getenv("VM_SANDBOX_SSH_KEY_PATH")) config.ssh.private_key = v;

    struct NumericOverride {
        const char* name;
        uint32_t* target;
    };
    const NumericOverride numeric[] = {
        {"VM_SANDBOX_MAX_CONCURRENT_VMS", &config.orchestrator.max_concurrent_vms},
        {"VM_SANDBOX_VM_READY_TIMEOUT", &config.orchestrator.vm_ready_timeout_s},
        {"VM_SANDBOX_ORCHESTRATION_TIMEOUT", &config.orchestrator.orchestration_timeout_s},
    };
    for (const auto& entry : numeric) {
        const char* v = std::getenv(entry.name);
        if (!v) continue;
        auto parsed = parse_u32(entry.name, v);
        if (!parsed) return parsed.error();
        *entry.target = *parsed;
    }

    if (config.orchestrator.max_concurrent_vms == 0) {
        return Error{ErrorCode::ConfigError, "VM_SANDBOX_MAX_CONCURRENT_VMS must be positive"};
    }
    return {};
}

std::filesystem::path expand_home(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::filesystem::path{home} / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

}  // namespace vm_sandbox
