/**
 * @file remote_command.cpp
 * @brief Remote command helpers.
 * @author Dimitris Kafetzis
 */

#include "ssh/remote_command.hpp"
#include "ssh/ssh_session.hpp"

#include <charconv>
#include <system_error>

namespace vm_sandbox {

std::string shell_quote(std::string_view text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string wrap_with_timeout(std::string_view command, uint32_t timeout_s, uint32_t kill_after_s) {
    return "timeout --kill-after=" + std::to_string(kill_after_s) + "s "
         + std::to_string(timeout_s) + "s sh -c " + shell_quote(command);
}

namespace {

bool consume(std::string_view& s, std::string_view prefix) {
    if (!s.starts_with(prefix)) return false;
    s.remove_prefix(prefix.size());
    return true;
}

bool consume_seconds(std::string_view& s, uint32_t& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr == s.data()) return false;
    s.remove_prefix(static_cast<size_t>(ptr - s.data()));
    return consume(s, "s");
}

}  // namespace

std::optional<TimeoutCommand> parse_timeout_command(std::string_view wrapped) {
    TimeoutCommand out;
    if (!consume(wrapped, "timeout --kill-after=")) return std::nullopt;
    if (!consume_seconds(wrapped, out.kill_after_s)) return std::nullopt;
    if (!consume(wrapped, " ")) return std::nullopt;
    if (!consume_seconds(wrapped, out.timeout_s)) return std::nullopt;
    if (!consume(wrapped, " sh -c '")) return std::nullopt;
    if (!wrapped.ends_with('\'')) return std::nullopt;
    wrapped.remove_suffix(1);

    // Undo shell_quote: '\'' sequences become a single quote.
    std::string inner;
    for (size_t i = 0; i < wrapped.size(); ++i) {
        if (wrapped.substr(i).starts_with("'\\''")) {
            inner += '\'';
            i += 3;
        } else {
            inner += wrapped[i];
        }
    }
    out.inner = std::move(inner);
    return out;
}

void append_line(std::string& text, std::string_view note) {
    if (!text.empty() && text.back() != '\n') text += '\n';
    text += note;
}

void annotate_exit_status(CommandOutput& output) {
    if (output.exit_code == kExitTimedOut) {
        append_line(output.stderr_text, kTimedOutNote);
    } else if (output.exit_code == kExitKilled) {
        append_line(output.stderr_text, kKilledNote);
    }
}

Result<void> check_private_key(const SshEndpoint& endpoint) {
    std::error_code ec;
    if (!std::filesystem::exists(endpoint.private_key, ec)) {
        return Error{ErrorCode::SSHConnectError,
                     "SSH private key not found: " + endpoint.private_key.string()};
    }
    return {};
}

CommandOutput SshSession::run_command(const std::string& command, uint32_t timeout_s) {
    const auto wrapped = wrap_with_timeout(command, timeout_s, endpoint_.kill_after_s);
    auto result = exec(wrapped, channel_timeout_s(timeout_s, endpoint_.kill_after_s,
                                                  endpoint_.channel_grace_s));
    if (!result) {
        return CommandOutput{
            .stdout_text = {},
            .stderr_text = "SSH Execution Error: " + result.error().message,
            .exit_code = kExitChannelError,
        };
    }
    auto output = std::move(*result);
    annotate_exit_status(output);
    return output;
}

}  // namespace vm_sandbox
