/**
 * @file ssh_bridge.cpp
 * @brief SshBridge implementation.
 * @author Dimitris Kafetzis
 */

#include "terminal/ssh_bridge.hpp"
#include "core/json.hpp"

#include <vector>

namespace vm_sandbox {

std::string to_json(const TerminalMessage& message) {
    std::string out = "{\"type\":\"" + std::string{to_string(message.type)} + "\"";
    switch (message.type) {
        case TerminalMessageType::Output:
            out += ",\"output\":\"" + json_escape(message.payload) + "\"";
            break;
        case TerminalMessageType::Error:
            out += ",\"error\":\"" + json_escape(message.payload) + "\"";
            break;
        case TerminalMessageType::Ready:
        case TerminalMessageType::Closed:
            break;
    }
    out += "}";
    return out;
}

SshBridge::SshBridge(const Config& config,
                     DomainManager& domains,
                     SshConnector connector,
                     TerminalSink sink,
                     Logger& logger,
                     MetricsCollector* metrics)
    : config_(config)
    , domains_(domains)
    , connector_(std::move(connector))
    , sink_(std::move(sink))
    , logger_(logger)
    , metrics_(metrics) {}

SshBridge::~SshBridge() {
    detach_all();
    std::unique_lock lock(pumps_mutex_);
    pumps_cv_.wait(lock, [this] { return live_pumps_ == 0; });
}

// ─────────────────────────────────────────────
// Attach
// ─────────────────────────────────────────────

Result<void, BridgeError> SshBridge::fail(const ConnectionId& connection, BridgeErrorCode code,
                                          std::string message) {
    logger_.warn("Terminal " + connection + ": " + message);
    if (sink_) sink_(connection, TerminalMessage{TerminalMessageType::Error, message});
    return BridgeError{code, std::move(message)};
}

Result<void, BridgeError> SshBridge::attach(const ConnectionId& connection,
                                            const std::string& workspace_id) {
    if (auto existing = find(connection)) {
        if (existing->shell && existing->shell->is_open()) {
            return fail(connection, BridgeErrorCode::AlreadyAttached,
                        "Connection is already attached to " + existing->domain);
        }
        detach(connection);
    }

    auto details = domains_.get_details(workspace_id);
    if (!details) {
        return fail(connection, BridgeErrorCode::NotFound,
                    "Could not look up workspace " + workspace_id + ": " + details.error().message);
    }
    if (!details->has_value() || (*details)->summary.kind != DomainKind::Workspace) {
        return fail(connection, BridgeErrorCode::NotFound, "Workspace " + workspace_id + " not found");
    }
    const DomainDetails& info = **details;
    if (info.summary.status != DomainStatus::Running) {
        return fail(connection, BridgeErrorCode::NotRunning,
                    "Workspace " + info.summary.name + " is not running");
    }
    if (!info.ip_address) {
        return fail(connection, BridgeErrorCode::NoIp,
                    "Workspace " + info.summary.name + " has no IP address yet");
    }

    const SshEndpoint endpoint{
        .host = *info.ip_address,
        .port = info.ssh_port,
        .username = config_.ssh.username,
        .private_key = expand_home(config_.ssh.private_key),
        .connect_timeout_s = config_.ssh.connect_timeout_s,
        .kill_after_s = config_.ssh.kill_after_s,
        .channel_grace_s = config_.ssh.channel_grace_s,
    };
    auto ssh = connector_(endpoint);
    if (!ssh) {
        return fail(connection, BridgeErrorCode::SshFailed,
                    "SSH connection to " + info.summary.name + " failed: " + ssh.error().message);
    }
    auto shell = (*ssh)->open_shell(config_.terminal.term, config_.terminal.cols, config_.terminal.rows);
    if (!shell) {
        (*ssh)->close();
        return fail(connection, BridgeErrorCode::SshFailed,
                    "Could not open a shell on " + info.summary.name + ": " + shell.error().message);
    }

    auto session = std::make_shared<Session>();
    session->connection = connection;
    session->domain = info.summary.name;
    session->ssh = std::move(*ssh);
    session->shell = std::move(*shell);

    logger_.info("Terminal " + connection + " attached to " + session->domain + " ("
                 + *info.ip_address + ")");
    if (metrics_) metrics_->record_terminal_event(connection, session->domain, "attached");
    if (sink_) sink_(connection, TerminalMessage{TerminalMessageType::Ready, {}});

    {
        std::lock_guard pumps_lock(pumps_mutex_);
        ++live_pumps_;
    }
    // The pump cannot retire the session before it is registered.
    std::lock_guard lock(sessions_mutex_);
    session->pump = std::jthread([this, owner = session](std::stop_token st) mutable {
        pump_loop(owner, st);
        owner.reset();
        pump_finished();
    });
    sessions_[connection] = std::move(session);
    return {};
}

// ─────────────────────────────────────────────
// Pump
// ─────────────────────────────────────────────

void SshBridge::pump_loop(const std::shared_ptr<Session>& session, std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto chunk = session->shell->read(config_.terminal.read_timeout_ms);
        if (!chunk) {
            logger_.info("Terminal " + session->connection + ": shell on " + session->domain + " closed");
            break;
        }
        if (!chunk->empty() && sink_) {
            sink_(session->connection, TerminalMessage{TerminalMessageType::Output, std::move(*chunk)});
        }
    }
    // Stopped by detach(), which owns the teardown.
    if (stop.stop_requested()) return;
    retire(session);
}

void SshBridge::pump_finished() {
    std::lock_guard lock(pumps_mutex_);
    --live_pumps_;
    pumps_cv_.notify_all();
}

void SshBridge::retire(const std::shared_ptr<Session>& session) {
    {
        std::lock_guard lock(sessions_mutex_);
        auto it = sessions_.find(session->connection);
        if (it == sessions_.end() || it->second != session) return;
        sessions_.erase(it);
    }
    teardown(session);
}

void SshBridge::send_closed_once(Session& session) {
    if (session.closed_sent.exchange(true)) return;
    if (metrics_) metrics_->record_terminal_event(session.connection, session.domain, "closed");
    if (sink_) sink_(session.connection, TerminalMessage{TerminalMessageType::Closed, {}});
}

// ─────────────────────────────────────────────
// Input / resize / detach
// ─────────────────────────────────────────────

std::shared_ptr<SshBridge::Session> SshBridge::find(const ConnectionId& connection) const {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(connection);
    return it == sessions_.end() ? nullptr : it->second;
}

Result<void, BridgeError> SshBridge::send_input(const ConnectionId& connection, std::string_view data) {
    auto session = find(connection);
    if (!session || !session->shell->is_open()) {
        return BridgeError{BridgeErrorCode::NoActiveSession,
                           "No active terminal session for connection " + connection};
    }
    if (auto written = session->shell->write(data); !written) {
        return BridgeError{BridgeErrorCode::SshFailed, written.error().message};
    }
    return {};
}

Result<void, BridgeError> SshBridge::resize(const ConnectionId& connection, int cols, int rows) {
    if (cols <= 0 || rows <= 0) {
        return BridgeError{BridgeErrorCode::InvalidSize,
                           "Invalid terminal size " + std::to_string(cols) + "x" + std::to_string(rows)};
    }
    auto session = find(connection);
    if (!session || !session->shell->is_open()) {
        return BridgeError{BridgeErrorCode::NoActiveSession,
                           "No active terminal session for connection " + connection};
    }
    if (auto resized = session->shell->resize(static_cast<uint32_t>(cols), static_cast<uint32_t>(rows));
        !resized) {
        return BridgeError{BridgeErrorCode::SshFailed, resized.error().message};
    }
    logger_.debug("Terminal " + connection + " resized to " + std::to_string(cols) + "x"
                  + std::to_string(rows));
    return {};
}

void SshBridge::teardown(const std::shared_ptr<Session>& session) {
    if (session->pump.joinable()) {
        session->pump.request_stop();
        if (session->pump.get_id() == std::this_thread::get_id()) {
            session->pump.detach();
        } else {
            session->pump.join();
        }
    }
    session->shell->close();
    session->ssh->close();
    send_closed_once(*session);
    logger_.info("Terminal " + session->connection + " detached from " + session->domain);
    if (metrics_) metrics_->record_terminal_event(session->connection, session->domain, "detached");
}

void SshBridge::detach(const ConnectionId& connection) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(sessions_mutex_);
        auto it = sessions_.find(connection);
        if (it == sessions_.end()) return;
        session = std::move(it->second);
        sessions_.erase(it);
    }
    teardown(session);
}

void SshBridge::detach_all() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard lock(sessions_mutex_);
        for (auto& [_, session] : sessions_) all.push_back(std::move(session));
        sessions_.clear();
    }
    for (const auto& session : all) teardown(session);
}

bool SshBridge::is_active(const ConnectionId& connection) const {
    auto session = find(connection);
    return session && session->shell->is_open();
}

size_t SshBridge::session_count() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size();
}

}  // namespace vm_sandbox
