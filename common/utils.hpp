#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <random>
#include <mutex>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Current time in nanoseconds since epoch
inline u64 now_ns() {
    using namespace std::chrono;
    return (u64)duration_cast<nanoseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
        return ss.str();
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
        return ss.str();
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
        return ss.str();
    }
}

// Progress percentage string
inline std::string format_percent(u64 done, u64 total) {
    if (total == 0) return "100%";
    double pct = (double)done / (double)total * 100.0;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << pct << "%";
    return ss.str();
}

// ISO-8601 UTC timestamp with milliseconds, e.g. "2024-05-01T12:00:00.123Z"
inline std::string format_iso8601(u64 ns_since_epoch) {
    time_t secs = (time_t)(ns_since_epoch / 1000000000ULL);
    u64 ms = (ns_since_epoch / 1000000ULL) % 1000;
    std::tm tm_buf{};
    gmtime_r(&secs, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Length of session/stream tokens (hex characters)
static constexpr size_t TOKEN_LEN = 32;

// Generate a 128-bit random token as 32 lowercase hex chars
inline std::string generate_token() {
    static std::mutex gen_mutex;
    static std::mt19937_64 gen{std::random_device{}()};
    static const char* hex = "0123456789abcdef";

    u64 words[2];
    {
        std::lock_guard<std::mutex> lk(gen_mutex);
        words[0] = gen();
        words[1] = gen();
    }
    std::string out;
    out.reserve(TOKEN_LEN);
    for (u64 w : words) {
        for (int shift = 60; shift >= 0; shift -= 4) {
            out.push_back(hex[(w >> shift) & 0xF]);
        }
    }
    return out;
}

// True if s looks like a token from generate_token().
// Tokens become directory names, so anything else is rejected outright.
inline bool is_token(const std::string& s) {
    if (s.size() != TOKEN_LEN) return false;
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

// Replace every byte outside [A-Za-z0-9._-] with '_'
inline std::string sanitize_name(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
        if (!ok) c = '_';
    }
    return out;
}

} // namespace utils
