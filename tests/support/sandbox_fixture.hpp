/**
 * @file sandbox_fixture.hpp
 * @brief Shared test scaffolding: scratch directories, a fake qemu-img and
 *        a fully wired component stack on the mock hypervisor.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/ids.hpp"
#include "core/logger.hpp"
#include "hypervisor/hypervisor.hpp"
#include "ssh/mock_ssh.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "vm/domain_manager.hpp"
#include "vm/image_manager.hpp"
#include "vm/ip_resolver.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace vm_sandbox::testing {

/**
 * @brief Unique scratch directory removed on destruction.
 */
class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("vm_sandbox_test_" + generate_uuid())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Shell script standing in for `qemu-img create`.
 *
 * Writes the command line into the target image so tests can inspect the
 * backing file and size that were requested.
 */
inline std::filesystem::path write_fake_qemu_img(const std::filesystem::path& dir, bool fail = false) {
    const auto script = dir / (fail ? "qemu-img-broken" : "qemu-img");
    std::string body =
        "#!/bin/sh\n"
        "[ \"$1\" = \"create\" ] || { echo \"unsupported: $1\" >&2; exit 1; }\n";
    if (fail) {
        body += "echo \"qemu-img: Could not open backing file\" >&2\nexit 1\n";
    } else {
        body +=
            "args=\"$*\"\n"
            "shift\n"
            "disk=\"\"\n"
            "while [ $# -gt 0 ]; do\n"
            "  case \"$1\" in\n"
            "    -f|-F|-b) shift 2 ;;\n"
            "    *) [ -z \"$disk\" ] && disk=\"$1\"; shift ;;\n"
            "  esac\n"
            "done\n"
            "[ -n \"$disk\" ] || { echo \"missing image path\" >&2; exit 1; }\n"
            "echo \"$args\" > \"$disk\"\n";
    }
    write_file(script, body);
    std::filesystem::permissions(script, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);
    return script;
}

/**
 * @brief Config rooted in `root` with millisecond-scale polling.
 */
inline Config make_test_config(const std::filesystem::path& root) {
    Config config = default_config();
    config.hypervisor.mock = true;
    config.images.base_image = root / "base" / "base.qcow2";
    config.images.ephemeral_dir = root / "instances";
    config.images.workspace_dir = root / "workspaces";
    config.images.qemu_img = write_fake_qemu_img(root).string();
    config.images.qemu_img_timeout_s = 10;
    write_file(config.images.base_image, "base image");

    config.vm.shutdown_timeout_s = 1;
    config.vm.shutdown_poll_ms = 10;

    config.orchestrator.max_concurrent_vms = 2;
    config.orchestrator.max_queued_jobs = 64;
    config.orchestrator.vm_ready_timeout_s = 1;
    config.orchestrator.orchestration_timeout_s = 30;
    config.orchestrator.ip_poll_interval_ms = 10;
    config.orchestrator.ssh_retry_interval_ms = 10;
    config.orchestrator.reaper_interval_ms = 20;

    config.ssh.private_key = (root / "id_test").string();
    write_file(config.ssh.private_key, "test key\n");
    config.ssh.kill_after_s = 1;
    config.ssh.channel_grace_s = 1;
    config.terminal.read_timeout_ms = 10;
    return config;
}

/**
 * @brief Poll `pred` until it holds or `timeout` expires.
 */
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/**
 * @brief Hypervisor, image, IP and domain managers on a scratch directory.
 */
struct VmStack {
    TempDir dir;
    Config config;
    Logger logger{std::make_unique<NullSink>(), LogLevel::Debug};
    MetricsCollector metrics{std::make_unique<NullSink>()};
    MockHypervisor hypervisor;
    std::shared_ptr<MockSshHost> ssh = std::make_shared<MockSshHost>();
    ImageManager images;
    IpResolver resolver;
    DomainManager domains;

    VmStack()
        : config(make_test_config(dir.path()))
        , images(config.images, logger)
        , resolver(hypervisor, logger, config.hypervisor.network,
                   std::chrono::milliseconds(config.orchestrator.ip_poll_interval_ms))
        , domains(config, hypervisor, images, resolver, logger, &metrics) {}
};

}  // namespace vm_sandbox::testing
