/**
 * @file process.cpp
 * @brief POSIX process runner: fork, non-blocking pipes, WNOHANG polling.
 * @author Dimitris Kafetzis
 */

#include "core/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace vm_sandbox {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, size_t limit) {
    if (n <= 0) return;
    const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    dst.append(src, std::min<size_t>(static_cast<size_t>(n), avail));
}

void drain(int fd, std::string& dst, size_t limit) {
    char buf[512];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        append_limited(dst, buf, n, limit);
    }
}

}  // namespace

Result<ProcessResult> run_process(const ProcessSpec& spec) {
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Internal, std::string{"pipe failed: "} + std::strerror(errno)};
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return Error{ErrorCode::Internal, std::string{"pipe failed: "} + std::strerror(errno)};
    }

    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<std::string> all{spec.program};
    all.insert(all.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(all.size() + 1);
    for (auto& s : all) argv.push_back(s.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return Error{ErrorCode::Internal, std::string{"fork failed: "} + std::strerror(saved)};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now()
                        + std::chrono::milliseconds(spec.timeout_ms);
    int status = 0;
    bool wait_failed = false;
    for (;;) {
        drain(out_pipe[0], result.stdout_text, spec.max_output_bytes);
        drain(err_pipe[0], result.stderr_text, spec.max_output_bytes);

        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            wait_failed = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes);
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    if (wait_failed) {
        return Error{ErrorCode::Internal, "waitpid failed for " + spec.program};
    }
    if (result.timed_out) {
        result.exit_code = 124;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

}  // namespace vm_sandbox
