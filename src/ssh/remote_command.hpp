/**
 * @file remote_command.hpp
 * @brief Remote command construction and exit-status interpretation.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vm_sandbox {

struct CommandOutput;

inline constexpr int kExitTimedOut = 124;      ///< `timeout` sent the first signal
inline constexpr int kExitKilled = 137;        ///< killed after the grace window
inline constexpr int kExitChannelError = -1;   ///< client-side failure, no remote status

inline constexpr std::string_view kTimedOutNote =
    "Execution timed out by 'timeout' utility.";
inline constexpr std::string_view kKilledNote =
    "Execution forcefully terminated by 'timeout --kill-after'.";

/// POSIX single-quote a string for `sh -c`.
[[nodiscard]] std::string shell_quote(std::string_view text);

/// `timeout --kill-after=<k>s <t>s sh -c '<command>'`
[[nodiscard]] std::string wrap_with_timeout(std::string_view command, uint32_t timeout_s,
                                            uint32_t kill_after_s);

/**
 * @brief Pieces of a command produced by wrap_with_timeout.
 */
struct TimeoutCommand {
    uint32_t timeout_s{0};
    uint32_t kill_after_s{0};
    std::string inner;
};

/// Inverse of wrap_with_timeout; nullopt for anything else.
[[nodiscard]] std::optional<TimeoutCommand> parse_timeout_command(std::string_view wrapped);

/// Client-side channel deadline: remote timeout + kill-after + grace.
[[nodiscard]] constexpr uint32_t channel_timeout_s(uint32_t timeout_s, uint32_t kill_after_s,
                                                   uint32_t grace_s) noexcept {
    return timeout_s + kill_after_s + grace_s;
}

/// Append the explanatory note for exit codes 124 and 137.
void annotate_exit_status(CommandOutput& output);

/// Append `note` to `text` on its own line.
void append_line(std::string& text, std::string_view note);

}  // namespace vm_sandbox
