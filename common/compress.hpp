#pragma once

// ============================================================
// compress.hpp -- zstd helpers
//   Staged chunks (optional) and large list replies are stored
//   or sent as single zstd frames that carry their content size.
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

inline std::vector<u8> compress_to_vec(const void* src, size_t src_len) {
    size_t cap = ZSTD_compressBound(src_len);
    std::vector<u8> buf(cap);
    size_t result = ZSTD_compress(buf.data(), cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(result));
    }
    buf.resize(result);
    return buf;
}

// Decompress a single zstd frame produced by compress_to_vec()
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len) {
    unsigned long long original = ZSTD_getFrameContentSize(src, src_len);
    if (original == ZSTD_CONTENTSIZE_ERROR) {
        throw std::runtime_error("ZSTD decompress error: not a zstd frame");
    }
    if (original == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw std::runtime_error("ZSTD decompress error: frame has no content size");
    }
    std::vector<u8> buf((size_t)original);
    size_t result = ZSTD_decompress(buf.data(), buf.size(), src, src_len);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(result));
    }
    buf.resize(result);
    return buf;
}

// False for media and archive formats, which zstd cannot shrink.
// 'name' is the upload's sanitized file name.
inline bool should_compress(const std::string& name) {
    static const char* const no_compress[] = {
        ".gz", ".bz2", ".xz", ".zst", ".lz4", ".br",
        ".zip", ".7z", ".rar",
        ".jpg", ".jpeg", ".png", ".gif", ".webp", ".avif", ".heic",
        ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm", ".m4v",
        ".mp3", ".aac", ".ogg", ".flac", ".opus", ".m4a",
        ".pdf",
        nullptr
    };

    auto dot_pos = name.rfind('.');
    if (dot_pos == std::string::npos) return true;

    std::string ext = name.substr(dot_pos);
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }

    for (int i = 0; no_compress[i]; ++i) {
        if (ext == no_compress[i]) return false;
    }
    return true;
}

} // namespace compress
