/**
 * @file ids.cpp
 * @brief Identifier generation backed by a per-thread Mersenne Twister.
 * @author Dimitris Kafetzis
 */

#include "core/ids.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>

namespace vm_sandbox {

namespace {

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

}  // namespace

std::string generate_uuid() {
    std::array<uint8_t, 16> bytes{};
    std::uniform_int_distribution<uint32_t> dist(0, 255);
    for (auto& b : bytes) b = static_cast<uint8_t>(dist(rng()));

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant 10xx

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                  bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                  bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

std::string generate_mac() {
    std::uniform_int_distribution<uint32_t> dist(0, 255);
    char buf[18];
    std::snprintf(buf, sizeof(buf), "52:54:00:%02x:%02x:%02x",
                  dist(rng()), dist(rng()), dist(rng()));
    return buf;
}

}  // namespace vm_sandbox
