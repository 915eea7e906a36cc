/**
 * @file clock.hpp
 * @brief Stop-token aware sleeping for polling loops.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace vm_sandbox {

/**
 * @brief Sleep for `duration` or until `stop` is requested.
 * @return false if woken by a stop request.
 */
template <typename Rep, typename Period>
bool interruptible_sleep(std::chrono::duration<Rep, Period> duration, std::stop_token stop) {
    if (stop.stop_requested()) return false;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

}  // namespace vm_sandbox
