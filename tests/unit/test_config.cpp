/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace vm_sandbox;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "vm_sandbox_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
        for (const char* name : {"VM_SANDBOX_BASE_IMAGE", "VM_SANDBOX_MAX_CONCURRENT_VMS",
                                 "VM_SANDBOX_SSH_USER", "VM_SANDBOX_VM_READY_TIMEOUT"}) {
            ::unsetenv(name);
        }
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.hypervisor.uri, "qemu:///system");
    EXPECT_FALSE(config.hypervisor.mock);
    EXPECT_EQ(config.orchestrator.max_concurrent_vms, 2u);
    EXPECT_EQ(config.orchestrator.vm_ready_timeout_s, 120u);
    EXPECT_EQ(config.orchestrator.orchestration_timeout_s, 300u);
    EXPECT_EQ(config.ssh.username, "executor");
    EXPECT_EQ(config.vm.workspace_memory_mb, 1024u);
    EXPECT_EQ(config.vm.workspace_vcpus, 2u);
}

TEST_F(ConfigTest, BuiltInProfiles) {
    auto config = default_config();
    EXPECT_EQ(config.profile("small"), (ResourceProfile{.memory_mb = 256, .vcpus = 1}));
    EXPECT_EQ(config.profile("default"), (ResourceProfile{.memory_mb = 512, .vcpus = 1}));
    EXPECT_EQ(config.profile("large"), (ResourceProfile{.memory_mb = 1024, .vcpus = 2}));
}

TEST_F(ConfigTest, UnknownProfileFallsBackToDefault) {
    auto config = default_config();
    EXPECT_EQ(config.profile("gigantic"), config.profile("default"));
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [hypervisor]
        uri = "qemu+ssh://host/system"
        mock = true
        network = "sandbox-net"

        [images]
        base_image = "/srv/base.qcow2"
        ephemeral_dir = "/srv/instances"
        workspace_dir = "/srv/workspaces"

        [orchestrator]
        max_concurrent_vms = 4
        vm_ready_timeout_s = 60
        orchestration_timeout_s = 600
        reaper_interval_ms = 0

        [profiles.gpu]
        memory_mb = 4096
        vcpus = 8

        [ssh]
        username = "runner"
        private_key = "/keys/id_ed25519"
        kill_after_s = 3

        [terminal]
        cols = 120
        rows = 40

        [telemetry]
        log_dir = "/tmp/vm_sandbox_logs"
        log_level = "debug"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.hypervisor.uri, "qemu+ssh://host/system");
    EXPECT_TRUE(config.hypervisor.mock);
    EXPECT_EQ(config.hypervisor.network, "sandbox-net");
    EXPECT_EQ(config.images.base_image, "/srv/base.qcow2");
    EXPECT_EQ(config.images.workspace_dir, "/srv/workspaces");
    EXPECT_EQ(config.orchestrator.max_concurrent_vms, 4u);
    EXPECT_EQ(config.orchestrator.vm_ready_timeout_s, 60u);
    EXPECT_EQ(config.orchestrator.orchestration_timeout_s, 600u);
    EXPECT_EQ(config.orchestrator.reaper_interval_ms, 0u);
    EXPECT_EQ(config.profile("gpu"), (ResourceProfile{.memory_mb = 4096, .vcpus = 8}));
    EXPECT_EQ(config.profile("small").memory_mb, 256u);
    EXPECT_EQ(config.ssh.username, "runner");
    EXPECT_EQ(config.ssh.kill_after_s, 3u);
    EXPECT_EQ(config.terminal.cols, 120u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [ssh]
        username = "someone"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->ssh.username, "someone");
    // Defaults for everything else
    EXPECT_EQ(result->ssh.port, 22);
    EXPECT_EQ(result->orchestrator.max_concurrent_vms, 2u);
}

TEST_F(ConfigTest, DefaultProfileFollowsEphemeralSize) {
    auto path = write_toml(R"(
        [vm]
        ephemeral_memory_mb = 768
        ephemeral_vcpus = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->profile("default"), (ResourceProfile{.memory_mb = 768, .vcpus = 2}));
}

TEST_F(ConfigTest, ZeroConcurrencyRejected) {
    auto path = write_toml(R"(
        [orchestrator]
        max_concurrent_vms = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv("VM_SANDBOX_BASE_IMAGE", "/images/custom.qcow2", 1);
    ::setenv("VM_SANDBOX_MAX_CONCURRENT_VMS", "6", 1);
    ::setenv("VM_SANDBOX_SSH_USER", "alt", 1);

    auto config = default_config();
    ASSERT_TRUE(apply_env_overrides(config).has_value());
    EXPECT_EQ(config.images.base_image, "/images/custom.qcow2");
    EXPECT_EQ(config.orchestrator.max_concurrent_vms, 6u);
    EXPECT_EQ(config.ssh.username, "alt");
}

TEST_F(ConfigTest, NonNumericEnvironmentOverrideRejected) {
    ::setenv("VM_SANDBOX_VM_READY_TIMEOUT", "soon", 1);
    auto config = default_config();
    auto result = apply_env_overrides(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
    EXPECT_EQ(config.orchestrator.vm_ready_timeout_s, 120u);
}

TEST_F(ConfigTest, ExpandHome) {
    const char* previous = std::getenv("HOME");
    std::string saved = previous ? previous : "";
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(expand_home("~/.ssh/key"), std::filesystem::path("/home/tester/.ssh/key"));
    EXPECT_EQ(expand_home("/abs/key"), std::filesystem::path("/abs/key"));
    if (previous) ::setenv("HOME", saved.c_str(), 1); else ::unsetenv("HOME");
}
