/**
 * @file ssh_session.hpp
 * @brief SSH control channel interface and concrete implementations.
 * @author Dimitris Kafetzis
 *
 * Provides SshSession (abstract, shared command-timeout handling),
 * LibsshSession (libssh + SFTP) and the SshConnector factory type used to
 * inject either the real transport or the in-memory mock from mock_ssh.hpp.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct ssh_session_struct;
struct ssh_channel_struct;

namespace vm_sandbox {

/**
 * @brief Where and how to connect.
 */
struct SshEndpoint {
    std::string host;
    uint16_t port{22};
    std::string username{"executor"};
    std::filesystem::path private_key;
    uint32_t connect_timeout_s{10};
    uint32_t kill_after_s{5};
    uint32_t channel_grace_s{5};
};

struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{0};
};

// ─────────────────────────────────────────────
// IShellChannel
// ─────────────────────────────────────────────

/**
 * @brief Interactive PTY shell on an open session.
 */
class IShellChannel {
public:
    virtual ~IShellChannel() = default;

    /**
     * @brief Wait up to `timeout_ms` for output.
     * @return Output (possibly empty when nothing arrived), or nullopt once
     *         the channel has closed and all output was consumed.
     */
    virtual std::optional<std::string> read(uint32_t timeout_ms) = 0;
    virtual Result<void> write(std::string_view data) = 0;
    virtual Result<void> resize(uint32_t cols, uint32_t rows) = 0;
    [[nodiscard]] virtual bool is_open() const = 0;
    /// Safe to call repeatedly.
    virtual void close() noexcept = 0;
};

// ─────────────────────────────────────────────
// SshSession
// ─────────────────────────────────────────────

/**
 * @brief Key-authenticated session to one VM.
 *
 * Instances are connected on construction (via a connector); a failed
 * connection never yields a session object.
 */
class SshSession {
public:
    explicit SshSession(SshEndpoint endpoint) : endpoint_(std::move(endpoint)) {}
    virtual ~SshSession() = default;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    virtual Result<void> upload_file(const std::filesystem::path& local,
                                     const std::string& remote) = 0;

    /**
     * @brief Copy a remote file to `local`.
     *
     * A remote file that is missing or empty produces a zero-byte local file
     * and a warning. Fails with SSHTransferError if the local file could not
     * be created.
     */
    virtual Result<void> download_file(const std::string& remote,
                                       const std::filesystem::path& local) = 0;

    /**
     * @brief Run `command` under `timeout --kill-after` with `timeout_s`.
     *
     * The channel gets its own client-side deadline slightly beyond the
     * remote one. Exit 124 and 137 are annotated in stderr. Channel failures
     * yield exit code -1 with the error text in stderr instead of an error.
     */
    CommandOutput run_command(const std::string& command, uint32_t timeout_s);

    virtual Result<std::unique_ptr<IShellChannel>> open_shell(const std::string& term,
                                                              uint32_t cols, uint32_t rows) = 0;

    /// Safe to call repeatedly.
    virtual void close() noexcept = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    [[nodiscard]] const SshEndpoint& endpoint() const noexcept { return endpoint_; }

protected:
    /// Execute an already-wrapped command with a client-side deadline.
    virtual Result<CommandOutput> exec(const std::string& command, uint32_t channel_timeout_s) = 0;

    SshEndpoint endpoint_;
};

using SshConnector = std::function<Result<std::unique_ptr<SshSession>>(const SshEndpoint&)>;

// ─────────────────────────────────────────────
// LibsshSession
// ─────────────────────────────────────────────

/**
 * @brief libssh-backed session; file transfer over SFTP.
 *
 * A libssh session is not thread-safe, so every call (including reads and
 * writes on shells opened from it) serializes on one shared mutex.
 */
class LibsshSession final : public SshSession {
public:
    static Result<std::unique_ptr<SshSession>> connect(const SshEndpoint& endpoint, Logger& logger);
    ~LibsshSession() override;

    Result<void> upload_file(const std::filesystem::path& local, const std::string& remote) override;
    Result<void> download_file(const std::string& remote, const std::filesystem::path& local) override;
    Result<std::unique_ptr<IShellChannel>> open_shell(const std::string& term,
                                                      uint32_t cols, uint32_t rows) override;
    void close() noexcept override;
    [[nodiscard]] bool is_connected() const override;

protected:
    Result<CommandOutput> exec(const std::string& command, uint32_t channel_timeout_s) override;

private:
    LibsshSession(SshEndpoint endpoint, Logger& logger, ssh_session_struct* session);

    Logger& logger_;
    ssh_session_struct* session_;
    std::shared_ptr<std::mutex> io_mutex_;
};

/// Connector that opens real libssh sessions.
SshConnector make_libssh_connector(Logger& logger);

/// SSHConnectError when the endpoint's key file does not exist.
[[nodiscard]] Result<void> check_private_key(const SshEndpoint& endpoint);

}  // namespace vm_sandbox
