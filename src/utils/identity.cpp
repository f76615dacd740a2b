// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/identity.h"

#include <ctime>
#include <random>

namespace waypoint {

std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_utc);
    return std::string(buf, n);
}

std::string iso8601_now() {
    return format_utc(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%SZ");
}

std::string random_hex(size_t length) {
    static const char digits[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);

    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out += digits[dist(rng)];
    }
    return out;
}

std::string generate_uuid() {
    std::string hex = random_hex(32);
    hex[12] = '4'; // version nibble
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace waypoint
