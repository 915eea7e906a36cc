/**
 * @file libssh_session.cpp
 * @brief LibsshSession implementation: public-key auth, exec, SFTP, PTY shells.
 * @author Dimitris Kafetzis
 */

#include "ssh/ssh_session.hpp"

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>

#include <chrono>
#include <fstream>
#include <system_error>
#include <vector>

namespace vm_sandbox {

namespace fs = std::filesystem;

namespace {

constexpr size_t kChunkSize = 16 * 1024;
constexpr int kReadSliceMs = 100;

struct SftpDeleter {
    void operator()(sftp_session s) const noexcept { if (s) sftp_free(s); }
};
struct SftpFileDeleter {
    void operator()(sftp_file f) const noexcept { if (f) sftp_close(f); }
};
struct ChannelDeleter {
    void operator()(ssh_channel c) const noexcept {
        if (!c) return;
        if (ssh_channel_is_open(c)) ssh_channel_close(c);
        ssh_channel_free(c);
    }
};

using SftpRef = std::unique_ptr<sftp_session_struct, SftpDeleter>;
using SftpFileRef = std::unique_ptr<sftp_file_struct, SftpFileDeleter>;
using ChannelRef = std::unique_ptr<ssh_channel_struct, ChannelDeleter>;

std::string session_error(ssh_session session) {
    const char* msg = ssh_get_error(session);
    return msg && *msg ? msg : "unknown libssh error";
}

Result<SftpRef> open_sftp(ssh_session session) {
    SftpRef sftp{sftp_new(session)};
    if (!sftp) {
        return Error{ErrorCode::SSHTransferError, "sftp_new failed: " + session_error(session)};
    }
    if (sftp_init(sftp.get()) != SSH_OK) {
        return Error{ErrorCode::SSHTransferError, "sftp_init failed: " + session_error(session)};
    }
    return sftp;
}

// ─────────────────────────────────────────────
// LibsshShellChannel
// ─────────────────────────────────────────────

class LibsshShellChannel final : public IShellChannel {
public:
    LibsshShellChannel(ChannelRef channel, std::shared_ptr<std::mutex> io_mutex)
        : channel_(std::move(channel)), io_mutex_(std::move(io_mutex)) {}

    ~LibsshShellChannel() override { close(); }

    std::optional<std::string> read(uint32_t timeout_ms) override {
        std::lock_guard lock(*io_mutex_);
        if (!channel_) return std::nullopt;

        std::vector<char> buf(4096);
        int n = ssh_channel_read_timeout(channel_.get(), buf.data(),
                                         static_cast<uint32_t>(buf.size()), 0,
                                         static_cast<int>(timeout_ms));
        if (n > 0) return std::string(buf.data(), static_cast<size_t>(n));
        if (n == SSH_ERROR || ssh_channel_is_eof(channel_.get())
            || !ssh_channel_is_open(channel_.get())) {
            return std::nullopt;
        }
        return std::string{};
    }

    Result<void> write(std::string_view data) override {
        std::lock_guard lock(*io_mutex_);
        if (!channel_ || !ssh_channel_is_open(channel_.get())) {
            return Error{ErrorCode::SSHChannelError, "Shell channel is closed"};
        }
        size_t sent = 0;
        while (sent < data.size()) {
            int n = ssh_channel_write(channel_.get(), data.data() + sent,
                                      static_cast<uint32_t>(data.size() - sent));
            if (n == SSH_ERROR) {
                return Error{ErrorCode::SSHChannelError, "Write to shell channel failed"};
            }
            sent += static_cast<size_t>(n);
        }
        return {};
    }

    Result<void> resize(uint32_t cols, uint32_t rows) override {
        std::lock_guard lock(*io_mutex_);
        if (!channel_) return Error{ErrorCode::SSHChannelError, "Shell channel is closed"};
        if (ssh_channel_change_pty_size(channel_.get(), static_cast<int>(cols),
                                        static_cast<int>(rows)) != SSH_OK) {
            return Error{ErrorCode::SSHChannelError, "PTY resize failed"};
        }
        return {};
    }

    [[nodiscard]] bool is_open() const override {
        std::lock_guard lock(*io_mutex_);
        return channel_ && ssh_channel_is_open(channel_.get())
            && !ssh_channel_is_eof(channel_.get());
    }

    void close() noexcept override {
        std::lock_guard lock(*io_mutex_);
        if (!channel_) return;
        if (ssh_channel_is_open(channel_.get())) ssh_channel_send_eof(channel_.get());
        channel_.reset();
    }

private:
    ChannelRef channel_;
    std::shared_ptr<std::mutex> io_mutex_;
};

}  // namespace

// ─────────────────────────────────────────────
// Connection
// ─────────────────────────────────────────────

LibsshSession::LibsshSession(SshEndpoint endpoint, Logger& logger, ssh_session session)
    : SshSession(std::move(endpoint))
    , logger_(logger)
    , session_(session)
    , io_mutex_(std::make_shared<std::mutex>()) {}

LibsshSession::~LibsshSession() {
    close();
}

Result<std::unique_ptr<SshSession>> LibsshSession::connect(const SshEndpoint& endpoint, Logger& logger) {
    if (auto key = check_private_key(endpoint); !key) return key.error();

    ssh_session session = ssh_new();
    if (!session) return Error{ErrorCode::SSHConnectError, "ssh_new failed"};

    int port = endpoint.port;
    long timeout = static_cast<long>(endpoint.connect_timeout_s);
    int strict = 0;
    ssh_options_set(session, SSH_OPTIONS_HOST, endpoint.host.c_str());
    ssh_options_set(session, SSH_OPTIONS_PORT, &port);
    ssh_options_set(session, SSH_OPTIONS_USER, endpoint.username.c_str());
    ssh_options_set(session, SSH_OPTIONS_TIMEOUT, &timeout);
    // Sandbox VMs are recreated constantly; their host keys are never stable.
    ssh_options_set(session, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
    ssh_options_set(session, SSH_OPTIONS_KNOWNHOSTS, "/dev/null");

    const std::string target = endpoint.username + "@" + endpoint.host + ":" + std::to_string(port);
    if (ssh_connect(session) != SSH_OK) {
        Error err{ErrorCode::SSHConnectError, "Connection to " + target + " failed: "
                                              + session_error(session)};
        ssh_free(session);
        return err;
    }

    ssh_key key = nullptr;
    if (ssh_pki_import_privkey_file(endpoint.private_key.c_str(), nullptr, nullptr, nullptr, &key)
        != SSH_OK) {
        ssh_disconnect(session);
        ssh_free(session);
        return Error{ErrorCode::SSHAuthError,
                     "Cannot load private key " + endpoint.private_key.string()};
    }
    int auth = ssh_userauth_publickey(session, nullptr, key);
    ssh_key_free(key);
    if (auth != SSH_AUTH_SUCCESS) {
        Error err{ErrorCode::SSHAuthError, "Authentication failed for " + target + ": "
                                           + session_error(session)};
        ssh_disconnect(session);
        ssh_free(session);
        return err;
    }

    logger.info("SSH connected to " + target);
    return std::unique_ptr<SshSession>{new LibsshSession(endpoint, logger, session)};
}

void LibsshSession::close() noexcept {
    std::lock_guard lock(*io_mutex_);
    if (!session_) return;
    ssh_disconnect(session_);
    ssh_free(session_);
    session_ = nullptr;
    logger_.debug("SSH session to " + endpoint_.host + " closed");
}

bool LibsshSession::is_connected() const {
    std::lock_guard lock(*io_mutex_);
    return session_ && ssh_is_connected(session_);
}

// ─────────────────────────────────────────────
// File transfer
// ─────────────────────────────────────────────

Result<void> LibsshSession::upload_file(const fs::path& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::SSHTransferError, "Cannot read local file " + local.string()};
    }

    std::lock_guard lock(*io_mutex_);
    if (!session_) return Error{ErrorCode::SSHTransferError, "Session is closed"};

    auto sftp = open_sftp(session_);
    if (!sftp) return sftp.error();

    SftpFileRef file{sftp_open(sftp->get(), remote.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644)};
    if (!file) {
        return Error{ErrorCode::SSHTransferError,
                     "Cannot open remote " + remote + ": " + session_error(session_)};
    }

    std::vector<char> buf(kChunkSize);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = in.gcount();
        if (got <= 0) break;
        if (sftp_write(file.get(), buf.data(), static_cast<size_t>(got)) != got) {
            return Error{ErrorCode::SSHTransferError,
                         "Write to " + remote + " failed: " + session_error(session_)};
        }
    }
    logger_.debug("Uploaded " + local.string() + " -> " + endpoint_.host + ":" + remote);
    return {};
}

Result<void> LibsshSession::download_file(const std::string& remote, const fs::path& local) {
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::SSHTransferError, "Cannot create local file " + local.string()};
    }

    {
        std::lock_guard lock(*io_mutex_);
        if (!session_) return Error{ErrorCode::SSHTransferError, "Session is closed"};

        auto sftp = open_sftp(session_);
        if (!sftp) return sftp.error();

        SftpFileRef file{sftp_open(sftp->get(), remote.c_str(), O_RDONLY, 0)};
        if (!file) {
            if (sftp_get_error(sftp->get()) != SSH_FX_NO_SUCH_FILE) {
                return Error{ErrorCode::SSHTransferError,
                             "Cannot open remote " + remote + ": " + session_error(session_)};
            }
        } else {
            std::vector<char> buf(kChunkSize);
            for (;;) {
                ssize_t n = sftp_read(file.get(), buf.data(), buf.size());
                if (n == 0) break;
                if (n < 0) {
                    return Error{ErrorCode::SSHTransferError,
                                 "Read of " + remote + " failed: " + session_error(session_)};
                }
                out.write(buf.data(), n);
            }
        }
    }
    out.close();

    std::error_code ec;
    if (!fs::exists(local, ec)) {
        return Error{ErrorCode::SSHTransferError, "Local file " + local.string() + " was not created"};
    }
    if (fs::file_size(local, ec) == 0) {
        logger_.warn("Downloaded " + remote + " is empty (remote file missing or not yet flushed)");
    }
    return {};
}

// ─────────────────────────────────────────────
// Command execution and shells
// ─────────────────────────────────────────────

Result<CommandOutput> LibsshSession::exec(const std::string& command, uint32_t channel_timeout_s) {
    std::lock_guard lock(*io_mutex_);
    if (!session_) return Error{ErrorCode::SSHChannelError, "Session is closed"};

    ChannelRef channel{ssh_channel_new(session_)};
    if (!channel) return Error{ErrorCode::SSHChannelError, "ssh_channel_new failed"};
    if (ssh_channel_open_session(channel.get()) != SSH_OK) {
        return Error{ErrorCode::SSHChannelError, "Cannot open channel: " + session_error(session_)};
    }
    if (ssh_channel_request_exec(channel.get(), command.c_str()) != SSH_OK) {
        return Error{ErrorCode::SSHChannelError, "Exec request failed: " + session_error(session_)};
    }

    CommandOutput output;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(channel_timeout_s);
    std::vector<char> buf(kChunkSize);
    while (!ssh_channel_is_eof(channel.get())) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return Error{ErrorCode::SSHChannelError,
                         "Channel timed out after " + std::to_string(channel_timeout_s) + "s"};
        }
        int n = ssh_channel_read_timeout(channel.get(), buf.data(),
                                         static_cast<uint32_t>(buf.size()), 0, kReadSliceMs);
        if (n == SSH_ERROR) {
            return Error{ErrorCode::SSHChannelError, "Read failed: " + session_error(session_)};
        }
        if (n > 0) output.stdout_text.append(buf.data(), static_cast<size_t>(n));

        n = ssh_channel_read_nonblocking(channel.get(), buf.data(),
                                         static_cast<uint32_t>(buf.size()), 1);
        if (n == SSH_ERROR) {
            return Error{ErrorCode::SSHChannelError, "Read failed: " + session_error(session_)};
        }
        if (n > 0) output.stderr_text.append(buf.data(), static_cast<size_t>(n));
    }

    for (int is_stderr : {0, 1}) {
        for (;;) {
            int n = ssh_channel_read_nonblocking(channel.get(), buf.data(),
                                                 static_cast<uint32_t>(buf.size()), is_stderr);
            if (n <= 0) break;
            (is_stderr ? output.stderr_text : output.stdout_text)
                .append(buf.data(), static_cast<size_t>(n));
        }
    }

    ssh_channel_send_eof(channel.get());
    output.exit_code = ssh_channel_get_exit_status(channel.get());
    return output;
}

Result<std::unique_ptr<IShellChannel>> LibsshSession::open_shell(const std::string& term,
                                                                 uint32_t cols, uint32_t rows) {
    std::lock_guard lock(*io_mutex_);
    if (!session_) return Error{ErrorCode::SSHChannelError, "Session is closed"};

    ChannelRef channel{ssh_channel_new(session_)};
    if (!channel) return Error{ErrorCode::SSHChannelError, "ssh_channel_new failed"};
    if (ssh_channel_open_session(channel.get()) != SSH_OK) {
        return Error{ErrorCode::SSHChannelError, "Cannot open channel: " + session_error(session_)};
    }
    if (ssh_channel_request_pty_size(channel.get(), term.c_str(),
                                     static_cast<int>(cols), static_cast<int>(rows)) != SSH_OK) {
        return Error{ErrorCode::SSHChannelError, "PTY request failed: " + session_error(session_)};
    }
    if (ssh_channel_request_shell(channel.get()) != SSH_OK) {
        return Error{ErrorCode::SSHChannelError, "Shell request failed: " + session_error(session_)};
    }
    return std::unique_ptr<IShellChannel>{
        std::make_unique<LibsshShellChannel>(std::move(channel), io_mutex_)};
}

SshConnector make_libssh_connector(Logger& logger) {
    return [&logger](const SshEndpoint& endpoint) {
        return LibsshSession::connect(endpoint, logger);
    };
}

}  // namespace vm_sandbox
