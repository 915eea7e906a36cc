/**
 * @file mock_ssh.hpp
 * @brief In-memory SSH host for tests and --mock runs.
 * @author Dimitris Kafetzis
 *
 * MockSshHost stands in for every guest reachable over SSH: it owns a fake
 * remote filesystem shared by all sessions, executes commands, and serves
 * line-echoing interactive shells.
 *
 * Commands understood: `echo ...` and the job runner's
 * `python3 <script> > <out> 2> <err>` form and interprets a tiny subset of
 * Python: print('...'), time.sleep(N), sys.exit(N) and raise.
 */

#pragma once

#include "ssh/ssh_session.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vm_sandbox {

struct MockShellState;

class MockSshHost : public std::enable_shared_from_this<MockSshHost> {
public:
    // ── Behaviour knobs ──────────────────────
    /// The next `count` connection attempts fail with SSHConnectError.
    void fail_next_connects(int count) { connect_failures_ = count; }
    void set_auth_failure(bool fail) { auth_failure_ = fail; }
    /// Exec channels hang past their client-side deadline.
    void set_channel_hang(bool hang) { channel_hang_ = hang; }
    /// Wall-clock delay added to every exec (makes jobs overlap in tests).
    void set_exec_delay(std::chrono::milliseconds delay) { exec_delay_ms_ = delay.count(); }
    /// Remote log files are never written (exercises the empty-download path).
    void set_drop_output_files(bool drop) { drop_output_files_ = drop; }
    /// SFTP uploads fail with SSHTransferError.
    void set_fail_uploads(bool fail) { fail_uploads_ = fail; }

    // ── Fake remote filesystem ───────────────
    void put_file(const std::string& path, std::string content);
    [[nodiscard]] std::optional<std::string> file(const std::string& path) const;

    // ── Observation ──────────────────────────
    [[nodiscard]] size_t connect_attempts() const noexcept { return connect_attempts_.load(); }
    [[nodiscard]] size_t open_sessions() const noexcept { return open_sessions_.load(); }
    [[nodiscard]] size_t open_shells() const noexcept { return open_shells_.load(); }
    [[nodiscard]] std::vector<std::string> executed_commands() const;
    [[nodiscard]] std::optional<std::pair<uint32_t, uint32_t>> last_pty_size() const;

    /// Close every open shell from the remote side.
    void hang_up_shells();

    /// Connector producing sessions bound to this host.
    SshConnector connector();

    /// Interpret an unwrapped command with the remote timeout in seconds.
    CommandOutput run(const std::string& command, uint32_t timeout_s);

private:
    friend class MockSshSession;
    friend class MockShellChannel;

    Result<CommandOutput> execute(const std::string& wrapped, uint32_t channel_timeout_s);

    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::vector<std::string> commands_;
    std::optional<std::pair<uint32_t, uint32_t>> pty_size_;
    std::vector<std::weak_ptr<MockShellState>> shells_;

    std::atomic<int> connect_failures_{0};
    std::atomic<bool> auth_failure_{false};
    std::atomic<bool> channel_hang_{false};
    std::atomic<int64_t> exec_delay_ms_{0};
    std::atomic<bool> drop_output_files_{false};
    std::atomic<bool> fail_uploads_{false};
    std::atomic<size_t> connect_attempts_{0};
    std::atomic<size_t> open_sessions_{0};
    std::atomic<size_t> open_shells_{0};
};

}  // namespace vm_sandbox
