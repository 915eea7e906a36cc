/**
 * @file process.hpp
 * @brief Run a host helper binary (qemu-img) with captured output and a deadline.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vm_sandbox {

struct ProcessSpec {
    std::string program;                ///< Resolved through PATH
    std::vector<std::string> args;
    uint32_t timeout_ms{60000};
    size_t max_output_bytes{64 * 1024};
};

struct ProcessResult {
    int exit_code{0};
    bool timed_out{false};
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * @brief Fork/exec the program and wait for it.
 *
 * Returns an error only when the process could not be spawned. A non-zero
 * exit or a timeout is reported in ProcessResult; a timed-out child is
 * killed and reports exit code 124. Exit code 127 means exec failed.
 */
Result<ProcessResult> run_process(const ProcessSpec& spec);

}  // namespace vm_sandbox
