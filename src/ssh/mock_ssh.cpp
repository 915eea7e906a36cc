/**
 * @file mock_ssh.cpp
 * @brief MockSshHost, MockSshSession and MockShellChannel.
 * @author Dimitris Kafetzis
 */

#include "ssh/mock_ssh.hpp"
#include "ssh/remote_command.hpp"

#include <charconv>
#include <fstream>
#include <regex>
#include <sstream>
#include <thread>

namespace vm_sandbox {

namespace fs = std::filesystem;

// ─────────────────────────────────────────────
// MockShellChannel
// ─────────────────────────────────────────────

struct MockShellState {
    std::mutex mutex;
    std::condition_variable cv;
    std::string pending;
    std::string line;
    bool closed{false};
};

class MockShellChannel final : public IShellChannel {
public:
    MockShellChannel(std::shared_ptr<MockSshHost> host, std::shared_ptr<MockShellState> state)
        : host_(std::move(host)), state_(std::move(state)) {
        ++host_->open_shells_;
    }

    ~MockShellChannel() override { close(); }

    std::optional<std::string> read(uint32_t timeout_ms) override {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return !state_->pending.empty() || state_->closed;
        });
        if (!state_->pending.empty()) {
            std::string out;
            out.swap(state_->pending);
            return out;
        }
        if (state_->closed) return std::nullopt;
        return std::string{};
    }

    Result<void> write(std::string_view data) override {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) return Error{ErrorCode::SSHChannelError, "Shell channel is closed"};
            for (char c : data) {
                if (c == '\r' || c == '\n') {
                    state_->pending += "\r\n";
                    run_line_locked();
                    if (state_->closed) break;
                } else {
                    state_->pending += c;
                    state_->line += c;
                }
            }
        }
        state_->cv.notify_all();
        return {};
    }

    Result<void> resize(uint32_t cols, uint32_t rows) override {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) return Error{ErrorCode::SSHChannelError, "Shell channel is closed"};
        }
        std::lock_guard host_lock(host_->mutex_);
        host_->pty_size_ = std::make_pair(cols, rows);
        return {};
    }

    [[nodiscard]] bool is_open() const override {
        std::lock_guard lock(state_->mutex);
        return !state_->closed;
    }

    void close() noexcept override {
        {
            std::lock_guard lock(state_->mutex);
            if (!released_) {
                released_ = true;
                --host_->open_shells_;
            }
            state_->closed = true;
        }
        state_->cv.notify_all();
    }

private:
    void run_line_locked() {
        std::string cmd;
        cmd.swap(state_->line);
        if (cmd == "exit") {
            state_->pending += "logout\r\n";
            state_->closed = true;
            return;
        }
        if (cmd.starts_with("echo ")) {
            state_->pending += cmd.substr(5) + "\r\n";
        } else if (!cmd.empty()) {
            state_->pending += "sh: " + cmd + ": command not found\r\n";
        }
        state_->pending += "$ ";
    }

    std::shared_ptr<MockSshHost> host_;
    std::shared_ptr<MockShellState> state_;
    bool released_{false};
};

// ─────────────────────────────────────────────
// MockSshSession
// ─────────────────────────────────────────────

class MockSshSession final : public SshSession {
public:
    MockSshSession(SshEndpoint endpoint, std::shared_ptr<MockSshHost> host)
        : SshSession(std::move(endpoint)), host_(std::move(host)) {
        ++host_->open_sessions_;
    }

    ~MockSshSession() override { close(); }

    Result<void> upload_file(const fs::path& local, const std::string& remote) override {
        if (!connected_) return Error{ErrorCode::SSHTransferError, "Session is closed"};
        if (host_->fail_uploads_.load()) {
            return Error{ErrorCode::SSHTransferError, "SFTP write to " + remote + " failed"};
        }
        std::ifstream in(local, std::ios::binary);
        if (!in) return Error{ErrorCode::SSHTransferError, "Cannot read local file " + local.string()};
        std::ostringstream content;
        content << in.rdbuf();
        host_->put_file(remote, content.str());
        return {};
    }

    Result<void> download_file(const std::string& remote, const fs::path& local) override {
        if (!connected_) return Error{ErrorCode::SSHTransferError, "Session is closed"};
        std::ofstream out(local, std::ios::binary | std::ios::trunc);
        if (!out) return Error{ErrorCode::SSHTransferError, "Cannot create local file " + local.string()};
        if (auto content = host_->file(remote)) out << *content;
        return {};
    }

    Result<std::unique_ptr<IShellChannel>> open_shell(const std::string& /*term*/,
                                                      uint32_t cols, uint32_t rows) override {
        if (!connected_) return Error{ErrorCode::SSHChannelError, "Session is closed"};
        auto state = std::make_shared<MockShellState>();
        state->pending = "Welcome to the sandbox workspace\r\n$ ";
        {
            std::lock_guard lock(host_->mutex_);
            host_->pty_size_ = std::make_pair(cols, rows);
            host_->shells_.push_back(state);
        }
        return std::unique_ptr<IShellChannel>{std::make_unique<MockShellChannel>(host_, state)};
    }

    void close() noexcept override {
        if (connected_.exchange(false)) --host_->open_sessions_;
    }

    [[nodiscard]] bool is_connected() const override { return connected_.load(); }

protected:
    Result<CommandOutput> exec(const std::string& command, uint32_t channel_timeout_s) override {
        if (!connected_) return Error{ErrorCode::SSHChannelError, "Session is closed"};
        return host_->execute(command, channel_timeout_s);
    }

private:
    std::shared_ptr<MockSshHost> host_;
    std::atomic<bool> connected_{true};
};

// ─────────────────────────────────────────────
// MockSshHost
// ─────────────────────────────────────────────

void MockSshHost::put_file(const std::string& path, std::string content) {
    std::lock_guard lock(mutex_);
    files_[path] = std::move(content);
}

std::optional<std::string> MockSshHost::file(const std::string& path) const {
    std::lock_guard lock(mutex_);
    if (auto it = files_.find(path); it != files_.end()) return it->second;
    return std::nullopt;
}

std::vector<std::string> MockSshHost::executed_commands() const {
    std::lock_guard lock(mutex_);
    return commands_;
}

std::optional<std::pair<uint32_t, uint32_t>> MockSshHost::last_pty_size() const {
    std::lock_guard lock(mutex_);
    return pty_size_;
}

void MockSshHost::hang_up_shells() {
    std::vector<std::shared_ptr<MockShellState>> live;
    {
        std::lock_guard lock(mutex_);
        for (auto& weak : shells_) {
            if (auto state = weak.lock()) live.push_back(std::move(state));
        }
        shells_.clear();
    }
    for (auto& state : live) {
        {
            std::lock_guard lock(state->mutex);
            state->closed = true;
        }
        state->cv.notify_all();
    }
}

SshConnector MockSshHost::connector() {
    auto self = shared_from_this();
    return [self](const SshEndpoint& endpoint) -> Result<std::unique_ptr<SshSession>> {
        ++self->connect_attempts_;
        if (self->connect_failures_.load() > 0) {
            --self->connect_failures_;
            return Error{ErrorCode::SSHConnectError,
                         "Connection to " + endpoint.host + " refused"};
        }
        if (self->auth_failure_.load()) {
            return Error{ErrorCode::SSHAuthError,
                         "Authentication failed for " + endpoint.username + "@" + endpoint.host};
        }
        return std::unique_ptr<SshSession>{std::make_unique<MockSshSession>(endpoint, self)};
    };
}

Result<CommandOutput> MockSshHost::execute(const std::string& wrapped, uint32_t channel_timeout_s) {
    {
        std::lock_guard lock(mutex_);
        commands_.push_back(wrapped);
    }

    if (auto delay = exec_delay_ms_.load(); delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    if (channel_hang_.load()) {
        return Error{ErrorCode::SSHChannelError,
                     "Channel timed out after " + std::to_string(channel_timeout_s) + "s"};
    }

    auto parsed = parse_timeout_command(wrapped);
    if (!parsed) return run(wrapped, channel_timeout_s);
    return run(parsed->inner, parsed->timeout_s);
}

namespace {

double parse_seconds(const std::string& text) {
    double value = 0.0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

}  // namespace

CommandOutput MockSshHost::run(const std::string& command, uint32_t timeout_s) {
    static const std::regex kPython(R"(^python3\s+(\S+)\s*>\s*(\S+)\s+2>\s*(\S+)\s*$)");
    std::smatch m;
    if (!std::regex_match(command, m, kPython)) {
        if (command.starts_with("echo ")) return CommandOutput{command.substr(5) + "\n", "", 0};
        return CommandOutput{"", "sh: 1: " + command + ": not found\n", 127};
    }

    const std::string script_path = m[1].str();
    const std::string stdout_path = m[2].str();
    const std::string stderr_path = m[3].str();

    std::string out;
    std::string err;
    int exit_code = 0;

    auto script = file(script_path);
    if (!script) {
        err = "python3: can't open file '" + script_path + "': [Errno 2] No such file or directory\n";
        exit_code = 2;
    } else {
        static const std::regex kPrint(R"re(^\s*print\((['"])(.*)\1\)\s*$)re");
        static const std::regex kSleep(R"(^\s*time\.sleep\(\s*([0-9.]+)\s*\)\s*$)");
        static const std::regex kExit(R"(^\s*sys\.exit\(\s*(\d+)\s*\)\s*$)");
        static const std::regex kRaise(R"re(^\s*raise\s+(\w+)\((['"])(.*)\2\)\s*$)re");

        double elapsed = 0.0;
        std::istringstream lines(*script);
        std::string line;
        int line_no = 0;
        while (std::getline(lines, line)) {
            ++line_no;
            std::smatch lm;
            if (std::regex_match(line, lm, kPrint)) {
                out += lm[2].str() + "\n";
            } else if (std::regex_match(line, lm, kSleep)) {
                elapsed += parse_seconds(lm[1].str());
                if (timeout_s > 0 && elapsed > static_cast<double>(timeout_s)) {
                    exit_code = kExitTimedOut;
                    break;
                }
            } else if (std::regex_match(line, lm, kExit)) {
                exit_code = std::stoi(lm[1].str());
                break;
            } else if (std::regex_match(line, lm, kRaise)) {
                err += "Traceback (most recent call last):\n  File \"" + script_path + "\", line "
                     + std::to_string(line_no) + ", in <module>\n"
                     + lm[1].str() + ": " + lm[3].str() + "\n";
                exit_code = 1;
                break;
            }
        }
    }

    // Output is redirected into the log files; only the exit status travels back.
    if (!drop_output_files_.load()) {
        put_file(stdout_path, out);
        put_file(stderr_path, err);
    }
    return CommandOutput{"", "", exit_code};
}

}  // namespace vm_sandbox
