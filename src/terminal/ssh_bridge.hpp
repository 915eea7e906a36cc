/**
 * @file ssh_bridge.hpp
 * @brief Interactive terminal sessions bridged to workspace VMs over SSH.
 * @author Dimitris Kafetzis
 *
 * One PTY shell per client connection. A background pump per session
 * forwards guest output to the injected message sink as terminal_out and
 * ends with exactly one terminal_closed. When the guest ends the shell the
 * pump retires its own session, so the sink may call detach() from any
 * callback.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "ssh/ssh_session.hpp"
#include "telemetry/metrics_collector.hpp"
#include "vm/domain_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace vm_sandbox {

// ─────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────

enum class BridgeErrorCode : uint8_t {
    NotFound,
    NotRunning,
    NoIp,
    SshFailed,
    NoActiveSession,
    InvalidSize,
    AlreadyAttached
};

[[nodiscard]] constexpr std::string_view to_string(BridgeErrorCode code) noexcept {
    switch (code) {
        case BridgeErrorCode::NotFound:        return "not-found";
        case BridgeErrorCode::NotRunning:      return "not-running";
        case BridgeErrorCode::NoIp:            return "no-ip";
        case BridgeErrorCode::SshFailed:       return "ssh-failed";
        case BridgeErrorCode::NoActiveSession: return "no-active-session";
        case BridgeErrorCode::InvalidSize:     return "invalid-size";
        case BridgeErrorCode::AlreadyAttached: return "already-attached";
    }
    return "unknown";
}

struct BridgeError {
    BridgeErrorCode code;
    std::string message;
};

// ─────────────────────────────────────────────
// Outbound messages
// ─────────────────────────────────────────────

enum class TerminalMessageType : uint8_t {
    Ready,
    Output,
    Closed,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(TerminalMessageType type) noexcept {
    switch (type) {
        case TerminalMessageType::Ready:  return "terminal_ready";
        case TerminalMessageType::Output: return "terminal_out";
        case TerminalMessageType::Closed: return "terminal_closed";
        case TerminalMessageType::Error:  return "terminal_error";
    }
    return "unknown";
}

struct TerminalMessage {
    TerminalMessageType type;
    std::string payload;   ///< Output bytes or error text
};

/// {"type":"terminal_out","output":"..."} and friends.
[[nodiscard]] std::string to_json(const TerminalMessage& message);

/// Invoked from caller threads and from pump threads.
using TerminalSink = std::function<void(const ConnectionId&, const TerminalMessage&)>;

// ─────────────────────────────────────────────
// SshBridge
// ─────────────────────────────────────────────

class SshBridge {
public:
    SshBridge(const Config& config,
              DomainManager& domains,
              SshConnector connector,
              TerminalSink sink,
              Logger& logger,
              MetricsCollector* metrics = nullptr);
    ~SshBridge();

    SshBridge(const SshBridge&) = delete;
    SshBridge& operator=(const SshBridge&) = delete;

    /**
     * @brief Open a shell on a running workspace for `connection`.
     *
     * The workspace must exist, be running and have an address; each case
     * fails with its own code before any SSH connection is attempted. A
     * failed attach also emits terminal_error.
     */
    Result<void, BridgeError> attach(const ConnectionId& connection, const std::string& workspace_id);

    Result<void, BridgeError> send_input(const ConnectionId& connection, std::string_view data);

    /// Both dimensions must be positive.
    Result<void, BridgeError> resize(const ConnectionId& connection, int cols, int rows);

    /// Close the shell and forget the connection. Idempotent.
    void detach(const ConnectionId& connection);
    void detach_all();

    [[nodiscard]] bool is_active(const ConnectionId& connection) const;
    [[nodiscard]] size_t session_count() const;

private:
    struct Session {
        ConnectionId connection;
        DomainName domain;
        std::unique_ptr<SshSession> ssh;
        std::unique_ptr<IShellChannel> shell;
        std::atomic<bool> closed_sent{false};
        std::jthread pump;
    };

    Result<void, BridgeError> fail(const ConnectionId& connection, BridgeErrorCode code,
                                   std::string message);
    void pump_loop(const std::shared_ptr<Session>& session, std::stop_token stop);
    void pump_finished();
    void retire(const std::shared_ptr<Session>& session);
    void send_closed_once(Session& session);
    std::shared_ptr<Session> find(const ConnectionId& connection) const;
    void teardown(const std::shared_ptr<Session>& session);

    const Config& config_;
    DomainManager& domains_;
    SshConnector connector_;
    TerminalSink sink_;
    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex sessions_mutex_;
    std::map<ConnectionId, std::shared_ptr<Session>> sessions_;

    // Pumps that retired themselves run detached; the destructor waits for them.
    std::mutex pumps_mutex_;
    std::condition_variable pumps_cv_;
    size_t live_pumps_{0};
};

}  // namespace vm_sandbox
