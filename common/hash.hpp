#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for StreamSaver
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 streaming state type
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// 16-byte (128-bit) hash result
using Hash128 = std::array<u8, 16>;

// Store as big-endian for determinism
inline Hash128 from_xxh128(XXH128_hash_t h) {
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[8 + i] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

// Compute xxh3_128 of a memory buffer
inline Hash128 xxh3_128(const void* data, size_t len) {
    return from_xxh128(XXH3_128bits(data, len));
}

// Compute xxh3_32 (lower 32 bits of xxh3_64) of a memory buffer.
// Used as the per-chunk checksum on the wire.
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

// Streaming hasher for xxh3_128 (artifact digest while merging)
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return from_xxh128(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

inline std::string to_hex(const Hash128& h) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (u8 b : h) {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0xF]);
    }
    return out;
}

} // namespace hash
